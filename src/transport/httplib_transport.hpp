#pragma once

#include "transport/http_transport.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

namespace isapisync::transport {

enum class AuthScheme {
  kDigest,
  kBasic,
};

bool ParseAuthScheme(std::string_view raw, AuthScheme& scheme, std::string& error);

struct HttpEndpointConfig {
  std::string host;
  std::uint16_t port = 80;
  bool use_https = false;
  std::string username;
  std::string password;
  AuthScheme auth = AuthScheme::kDigest;
  std::chrono::milliseconds timeout{5000};
};

// cpp-httplib backed transport for one camera. One client connection is
// reused across requests; the mutex keeps requests from different threads
// from interleaving on it.
//
// Cameras ship self-signed certificates, so server certificate verification
// is disabled for HTTPS.
class HttplibTransport final : public IHttpTransport {
public:
  explicit HttplibTransport(HttpEndpointConfig config);
  ~HttplibTransport() override;

  HttplibTransport(const HttplibTransport&) = delete;
  HttplibTransport& operator=(const HttplibTransport&) = delete;

  bool Send(const HttpRequest& request, HttpResponse& response, std::string& error) override;

  const HttpEndpointConfig& config() const {
    return config_;
  }

private:
  struct ClientState;

  HttpEndpointConfig config_;
  std::mutex mu_;
  std::unique_ptr<ClientState> state_;
};

} // namespace isapisync::transport
