#include "isapi/isapi_client.hpp"

#include "transport/error_mapper.hpp"
#include "wire/xml_document.hpp"

#include <string>
#include <utility>

namespace isapisync::isapi {

namespace {

// ResponseStatus statusCode 1 means OK; anything else is a device-side refusal
// even when the HTTP status is 200.
bool IsRejectedResponseStatus(const std::string& body) {
  if (body.find("ResponseStatus") == std::string::npos) {
    return false;
  }
  pugi::xml_document doc;
  std::string parse_error;
  if (!wire::ParseDocument(body, doc, parse_error)) {
    return false;
  }
  const pugi::xml_node root = wire::RootElement(doc);
  if (std::string_view(root.name()) != "ResponseStatus") {
    return false;
  }
  const wire::LeafValue status_code = wire::ReadLeaf(root, "statusCode");
  return status_code.present && status_code.AsInt(1) != 1;
}

} // namespace

bool IsapiClient::Exchange(const transport::HttpRequest& request, std::string_view operation,
                           transport::HttpResponse& response, std::string& error) {
  std::string transport_error;
  if (!transport_->Send(request, response, transport_error)) {
    error = transport::FormatDeviceError(operation, 0, transport_error);
    return false;
  }
  if (!response.ok()) {
    error = transport::FormatDeviceError(operation, response.status, response.body);
    return false;
  }
  return true;
}

bool IsapiClient::GetText(std::string_view path, std::string_view operation, std::string& raw,
                          std::string& error) {
  transport::HttpResponse response;
  if (!Exchange(transport::HttpRequest{.method = transport::HttpMethod::kGet,
                                       .path = std::string(path)},
                operation, response, error)) {
    return false;
  }
  raw = std::move(response.body);
  return true;
}

bool IsapiClient::GetDocument(std::string_view path, std::string_view operation,
                              pugi::xml_document& doc, std::string& raw, std::string& error) {
  if (!GetText(path, operation, raw, error)) {
    return false;
  }
  std::string parse_error;
  if (!wire::ParseDocument(raw, doc, parse_error)) {
    error = transport::FormatDeviceError(operation, 0, parse_error);
    return false;
  }
  return true;
}

bool IsapiClient::PutText(std::string_view path, std::string_view body,
                          std::string_view operation, std::string& error) {
  transport::HttpResponse response;
  if (!Exchange(transport::HttpRequest{.method = transport::HttpMethod::kPut,
                                       .path = std::string(path),
                                       .body = std::string(body)},
                operation, response, error)) {
    return false;
  }
  if (IsRejectedResponseStatus(response.body)) {
    transport::DeviceErrorMapping mapped =
        transport::MapDeviceError(operation, response.status, response.body);
    if (mapped.code == transport::DeviceErrorCode::kUnknown) {
      // Classify an unrecognized status string as a plain rejection.
      const transport::DeviceErrorMapping rejected =
          transport::MapDeviceError(operation, 400, response.body);
      mapped.code = rejected.code;
      mapped.actionable_message = rejected.actionable_message;
    }
    error = transport::FormatDeviceError(mapped);
    return false;
  }
  return true;
}

bool IsapiClient::DeleteResource(std::string_view path, std::string_view operation,
                                 std::string& error) {
  transport::HttpResponse response;
  return Exchange(transport::HttpRequest{.method = transport::HttpMethod::kDelete,
                                         .path = std::string(path)},
                  operation, response, error);
}

} // namespace isapisync::isapi
