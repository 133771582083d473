#include "transport/httplib_transport.hpp"

#include "core/string_utils.hpp"

#include <httplib.h>

#include <utility>

namespace isapisync::transport {

namespace {

constexpr const char* kXmlContentType = "application/xml";

std::string BuildBaseUrl(const HttpEndpointConfig& config) {
  return std::string(config.use_https ? "https://" : "http://") + config.host + ":" +
         std::to_string(config.port);
}

} // namespace

bool ParseAuthScheme(std::string_view raw, AuthScheme& scheme, std::string& error) {
  const std::string normalized = core::ToLower(core::Trim(raw));
  if (normalized == "digest") {
    scheme = AuthScheme::kDigest;
    return true;
  }
  if (normalized == "basic") {
    scheme = AuthScheme::kBasic;
    return true;
  }
  error = "invalid auth scheme '" + std::string(raw) + "' (expected digest|basic)";
  return false;
}

struct HttplibTransport::ClientState {
  explicit ClientState(const std::string& base_url) : client(base_url) {}

  httplib::Client client;
};

HttplibTransport::HttplibTransport(HttpEndpointConfig config)
    : config_(std::move(config)), state_(std::make_unique<ClientState>(BuildBaseUrl(config_))) {
  httplib::Client& client = state_->client;
  client.set_connection_timeout(config_.timeout);
  client.set_read_timeout(config_.timeout);
  client.set_write_timeout(config_.timeout);
  client.set_keep_alive(true);
  client.enable_server_certificate_verification(false);

  if (!config_.username.empty()) {
    if (config_.auth == AuthScheme::kBasic) {
      client.set_basic_auth(config_.username, config_.password);
    } else {
      client.set_digest_auth(config_.username, config_.password);
    }
  }
}

HttplibTransport::~HttplibTransport() = default;

bool HttplibTransport::Send(const HttpRequest& request, HttpResponse& response,
                            std::string& error) {
  std::lock_guard<std::mutex> lock(mu_);
  httplib::Client& client = state_->client;

  httplib::Result result = [&]() {
    switch (request.method) {
    case HttpMethod::kPut:
      return client.Put(request.path, request.body, kXmlContentType);
    case HttpMethod::kDelete:
      return client.Delete(request.path);
    case HttpMethod::kGet:
    default:
      return client.Get(request.path);
    }
  }();

  if (!result) {
    error = std::string(ToString(request.method)) + " " + request.path +
            " failed: " + httplib::to_string(result.error());
    return false;
  }

  response.status = result->status;
  response.body = result->body;
  return true;
}

} // namespace isapisync::transport
