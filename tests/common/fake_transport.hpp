#ifndef ISAPISYNC_TESTS_COMMON_FAKE_TRANSPORT_HPP_
#define ISAPISYNC_TESTS_COMMON_FAKE_TRANSPORT_HPP_

#include "transport/http_transport.hpp"

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace isapisync::tests::common {

inline constexpr std::string_view kResponseOk =
    "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
    "<ResponseStatus version=\"2.0\" xmlns=\"http://www.isapi.org/ver20/XMLSchema\">"
    "<requestURL>/</requestURL><statusCode>1</statusCode><statusString>OK</statusString>"
    "<subStatusCode>ok</subStatusCode></ResponseStatus>";

inline constexpr std::string_view kResponseInvalidContent =
    "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
    "<ResponseStatus version=\"2.0\" xmlns=\"http://www.isapi.org/ver20/XMLSchema\">"
    "<requestURL>/</requestURL><statusCode>6</statusCode>"
    "<statusString>Invalid Content</statusString><subStatusCode>badParameters</subStatusCode>"
    "</ResponseStatus>";

// State shared between a test and the transport it handed to an engine.
//
// GET answers with the document stored at the path (404 otherwise). PUT
// stores the body so the next GET sees it, unless the path is listed as
// rejected, in which case the device answers 200 with a refusing
// ResponseStatus. DELETE removes the document. Every request is recorded.
class FakeDeviceState {
public:
  void SetDocument(std::string path, std::string body) {
    std::lock_guard<std::mutex> lock(mu_);
    documents_[std::move(path)] = std::move(body);
  }

  void RemoveDocument(const std::string& path) {
    std::lock_guard<std::mutex> lock(mu_);
    documents_.erase(path);
  }

  std::string Document(const std::string& path) const {
    std::lock_guard<std::mutex> lock(mu_);
    const auto it = documents_.find(path);
    return it == documents_.end() ? std::string() : it->second;
  }

  void RejectPut(std::string path) {
    std::lock_guard<std::mutex> lock(mu_);
    rejected_puts_.insert(std::move(path));
  }

  void SetUnreachable(bool unreachable) {
    std::lock_guard<std::mutex> lock(mu_);
    unreachable_ = unreachable;
  }

  std::vector<transport::HttpRequest> Requests() const {
    std::lock_guard<std::mutex> lock(mu_);
    return requests_;
  }

  std::vector<transport::HttpRequest> Requests(transport::HttpMethod method) const {
    std::lock_guard<std::mutex> lock(mu_);
    std::vector<transport::HttpRequest> matched;
    for (const transport::HttpRequest& request : requests_) {
      if (request.method == method) {
        matched.push_back(request);
      }
    }
    return matched;
  }

  std::size_t CountRequests(transport::HttpMethod method, std::string_view path) const {
    std::lock_guard<std::mutex> lock(mu_);
    std::size_t count = 0;
    for (const transport::HttpRequest& request : requests_) {
      if (request.method == method && request.path == path) {
        ++count;
      }
    }
    return count;
  }

  void ClearRequests() {
    std::lock_guard<std::mutex> lock(mu_);
    requests_.clear();
  }

  bool Handle(const transport::HttpRequest& request, transport::HttpResponse& response,
              std::string& error) {
    std::lock_guard<std::mutex> lock(mu_);
    requests_.push_back(request);
    if (unreachable_) {
      error = "Connection refused";
      return false;
    }

    switch (request.method) {
    case transport::HttpMethod::kGet: {
      const auto it = documents_.find(request.path);
      if (it == documents_.end()) {
        response = transport::HttpResponse{.status = 404, .body = "Not Found"};
      } else {
        response = transport::HttpResponse{.status = 200, .body = it->second};
      }
      return true;
    }
    case transport::HttpMethod::kPut:
      if (rejected_puts_.count(request.path) != 0U) {
        response = transport::HttpResponse{.status = 200,
                                           .body = std::string(kResponseInvalidContent)};
        return true;
      }
      if (request.path.size() < 5U ||
          request.path.compare(request.path.size() - 5U, 5U, "/goto") != 0) {
        documents_[request.path] = request.body;
      }
      response = transport::HttpResponse{.status = 200, .body = std::string(kResponseOk)};
      return true;
    case transport::HttpMethod::kDelete:
      documents_.erase(request.path);
      response = transport::HttpResponse{.status = 200, .body = std::string(kResponseOk)};
      return true;
    }
    error = "unsupported method";
    return false;
  }

private:
  mutable std::mutex mu_;
  std::map<std::string, std::string> documents_;
  std::set<std::string> rejected_puts_;
  std::vector<transport::HttpRequest> requests_;
  bool unreachable_ = false;
};

class FakeTransport final : public transport::IHttpTransport {
public:
  explicit FakeTransport(std::shared_ptr<FakeDeviceState> state) : state_(std::move(state)) {}

  bool Send(const transport::HttpRequest& request, transport::HttpResponse& response,
            std::string& error) override {
    return state_->Handle(request, response, error);
  }

private:
  std::shared_ptr<FakeDeviceState> state_;
};

} // namespace isapisync::tests::common

#endif // ISAPISYNC_TESTS_COMMON_FAKE_TRANSPORT_HPP_
