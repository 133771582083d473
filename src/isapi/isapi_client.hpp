#pragma once

#include "transport/http_transport.hpp"

#include <pugixml.hpp>

#include <string>
#include <string_view>

namespace isapisync::isapi {

// Request helpers shared by the fetcher and the writer. Every failure is
// reported through `error` in the stable "<CODE>: <message> detail: <raw>"
// form produced by the transport error mapper.
class IsapiClient {
public:
  explicit IsapiClient(transport::IHttpTransport& transport) : transport_(&transport) {}

  bool GetText(std::string_view path, std::string_view operation, std::string& raw,
               std::string& error);

  // GET followed by a parse. `raw` keeps the exact bytes for textual patching.
  bool GetDocument(std::string_view path, std::string_view operation, pugi::xml_document& doc,
                   std::string& raw, std::string& error);

  // 2xx answers that carry a ResponseStatus with a non-OK statusCode are
  // treated as rejections.
  bool PutText(std::string_view path, std::string_view body, std::string_view operation,
               std::string& error);

  bool DeleteResource(std::string_view path, std::string_view operation, std::string& error);

  transport::IHttpTransport& transport() const {
    return *transport_;
  }

private:
  bool Exchange(const transport::HttpRequest& request, std::string_view operation,
                transport::HttpResponse& response, std::string& error);

  transport::IHttpTransport* transport_ = nullptr;
};

} // namespace isapisync::isapi
