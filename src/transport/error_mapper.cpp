#include "transport/error_mapper.hpp"

#include "core/string_utils.hpp"

#include <cctype>
#include <initializer_list>
#include <string>

namespace isapisync::transport {

namespace {

constexpr std::size_t kMaxDetailLength = 240;

std::string CollapseWhitespace(std::string_view text) {
  std::string normalized;
  normalized.reserve(text.size());
  bool previous_was_space = false;
  for (const char c : text) {
    if (std::isspace(static_cast<unsigned char>(c)) != 0) {
      if (!previous_was_space) {
        normalized.push_back(' ');
      }
      previous_was_space = true;
      continue;
    }
    normalized.push_back(c);
    previous_was_space = false;
  }
  return core::Trim(normalized);
}

// Pulls the text of `<tag>` out of a device ResponseStatus body without a
// full parse; error bodies are not always well-formed.
std::string ExtractTagText(std::string_view body, std::string_view tag) {
  const std::string open = "<" + std::string(tag) + ">";
  const std::string close = "</" + std::string(tag) + ">";
  const std::size_t begin = body.find(open);
  if (begin == std::string_view::npos) {
    return "";
  }
  const std::size_t value_begin = begin + open.size();
  const std::size_t end = body.find(close, value_begin);
  if (end == std::string_view::npos) {
    return "";
  }
  return core::Trim(body.substr(value_begin, end - value_begin));
}

std::string SummarizeDetail(const int http_status, std::string_view detail) {
  std::string summary;
  const std::string status_string = ExtractTagText(detail, "statusString");
  const std::string sub_status = ExtractTagText(detail, "subStatusCode");
  if (!status_string.empty() || !sub_status.empty()) {
    summary = status_string;
    if (!sub_status.empty()) {
      summary += summary.empty() ? sub_status : " (" + sub_status + ")";
    }
  } else {
    summary = CollapseWhitespace(detail);
  }

  if (summary.size() > kMaxDetailLength) {
    summary.resize(kMaxDetailLength);
    summary += "...";
  }
  if (http_status > 0) {
    summary = "http " + std::to_string(http_status) + (summary.empty() ? "" : ": " + summary);
  }
  return summary;
}

bool ContainsAny(std::string_view haystack, std::initializer_list<std::string_view> needles) {
  for (const std::string_view needle : needles) {
    if (!needle.empty() && haystack.find(needle) != std::string_view::npos) {
      return true;
    }
  }
  return false;
}

DeviceErrorCode Classify(const int http_status, const std::string& normalized_detail) {
  if (http_status == 401 || http_status == 403) {
    return DeviceErrorCode::kAuthFailed;
  }
  if (http_status == 404 || http_status == 501 ||
      ContainsAny(normalized_detail, {"notsupport", "not supported", "invalid operation"})) {
    return DeviceErrorCode::kNotSupported;
  }
  if (http_status == 408 || http_status == 504) {
    return DeviceErrorCode::kTimeout;
  }
  if (http_status >= 400) {
    return DeviceErrorCode::kDeviceRejected;
  }

  if (ContainsAny(normalized_detail, {"xml parse", "parse failed", "no root element"})) {
    return DeviceErrorCode::kParseFailed;
  }
  if (ContainsAny(normalized_detail, {"timeout", "timed out", "read error", "write error"})) {
    return DeviceErrorCode::kTimeout;
  }
  if (ContainsAny(normalized_detail, {"unauthorized", "authentication"})) {
    return DeviceErrorCode::kAuthFailed;
  }
  if (ContainsAny(normalized_detail, {"connection", "refused", "unreachable", "resolve",
                                      "no route", "ssl", "host"})) {
    return DeviceErrorCode::kUnreachable;
  }
  if (ContainsAny(normalized_detail, {"rejected", "invalid xml content", "invalid content"})) {
    return DeviceErrorCode::kDeviceRejected;
  }
  return DeviceErrorCode::kUnknown;
}

std::string BuildActionableMessage(const DeviceErrorCode code, std::string_view operation) {
  const std::string operation_label =
      operation.empty() ? "requested operation" : std::string(operation);

  switch (code) {
  case DeviceErrorCode::kAuthFailed:
    return "Camera refused credentials during " + operation_label +
           "; verify username/password in the config file.";
  case DeviceErrorCode::kTimeout:
    return "Camera did not answer in time during " + operation_label +
           "; check network latency and timeout_ms.";
  case DeviceErrorCode::kUnreachable:
    return "Camera is unreachable during " + operation_label +
           "; verify host, http_port and use_https.";
  case DeviceErrorCode::kNotSupported:
    return "Camera does not support " + operation_label +
           "; the related settings stay hidden for this model.";
  case DeviceErrorCode::kDeviceRejected:
    return "Camera rejected " + operation_label +
           "; the value may be out of range for the current mode.";
  case DeviceErrorCode::kParseFailed:
    return "Camera response for " + operation_label +
           " could not be parsed; the firmware may use an unexpected schema.";
  case DeviceErrorCode::kUnknown:
  default:
    return "Unexpected failure during " + operation_label + "; enable debug logging and retry.";
  }
}

} // namespace

std::string_view ToStableErrorCode(const DeviceErrorCode code) {
  switch (code) {
  case DeviceErrorCode::kAuthFailed:
    return "AUTH_FAILED";
  case DeviceErrorCode::kTimeout:
    return "TIMEOUT";
  case DeviceErrorCode::kUnreachable:
    return "UNREACHABLE";
  case DeviceErrorCode::kNotSupported:
    return "NOT_SUPPORTED";
  case DeviceErrorCode::kDeviceRejected:
    return "DEVICE_REJECTED";
  case DeviceErrorCode::kParseFailed:
    return "PARSE_FAILED";
  case DeviceErrorCode::kUnknown:
  default:
    return "UNKNOWN";
  }
}

DeviceErrorMapping MapDeviceError(std::string_view operation, const int http_status,
                                  std::string_view detail) {
  DeviceErrorMapping mapped;
  mapped.detail = SummarizeDetail(http_status, detail);
  mapped.code = Classify(http_status, core::ToLower(CollapseWhitespace(detail)));
  mapped.actionable_message = BuildActionableMessage(mapped.code, operation);
  return mapped;
}

std::string FormatDeviceError(const DeviceErrorMapping& mapped) {
  std::string formatted =
      std::string(ToStableErrorCode(mapped.code)) + ": " + mapped.actionable_message;
  if (!mapped.detail.empty()) {
    formatted += " detail: " + mapped.detail;
  }
  return formatted;
}

std::string FormatDeviceError(std::string_view operation, const int http_status,
                              std::string_view detail) {
  return FormatDeviceError(MapDeviceError(operation, http_status, detail));
}

} // namespace isapisync::transport
