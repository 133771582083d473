#pragma once

#include <string>
#include <string_view>

namespace isapisync::transport {

enum class HttpMethod {
  kGet,
  kPut,
  kDelete,
};

inline const char* ToString(HttpMethod method) {
  switch (method) {
  case HttpMethod::kGet:
    return "GET";
  case HttpMethod::kPut:
    return "PUT";
  case HttpMethod::kDelete:
    return "DELETE";
  }
  return "GET";
}

struct HttpRequest {
  HttpMethod method = HttpMethod::kGet;
  std::string path;
  std::string body;
};

struct HttpResponse {
  int status = 0;
  std::string body;

  bool ok() const {
    return status >= 200 && status < 300;
  }
};

// Device wire boundary. Implementations own authentication and connection
// handling; callers only see paths and XML bodies.
//
// `Send` returns false only when no HTTP response was obtained (connect
// failure, timeout, TLS error). HTTP error statuses come back as responses so
// callers can classify them.
class IHttpTransport {
public:
  virtual ~IHttpTransport() = default;

  virtual bool Send(const HttpRequest& request, HttpResponse& response, std::string& error) = 0;

  bool Get(std::string_view path, HttpResponse& response, std::string& error) {
    return Send(HttpRequest{.method = HttpMethod::kGet, .path = std::string(path)}, response, error);
  }

  bool Put(std::string_view path, std::string_view body, HttpResponse& response,
           std::string& error) {
    return Send(HttpRequest{.method = HttpMethod::kPut,
                            .path = std::string(path),
                            .body = std::string(body)},
                response, error);
  }

  bool Delete(std::string_view path, HttpResponse& response, std::string& error) {
    return Send(HttpRequest{.method = HttpMethod::kDelete, .path = std::string(path)}, response,
                error);
  }
};

} // namespace isapisync::transport
