#include "../common/assertions.hpp"
#include "transport/error_mapper.hpp"

#include <string>
#include <string_view>

int main() {
  using isapisync::tests::common::AssertContains;
  using isapisync::tests::common::AssertNotContains;
  using isapisync::tests::common::Fail;
  using isapisync::transport::DeviceErrorCode;
  using isapisync::transport::FormatDeviceError;
  using isapisync::transport::MapDeviceError;
  using isapisync::transport::ToStableErrorCode;

  {
    const auto mapped = MapDeviceError("fetch motion detection", 401, "Unauthorized");
    if (mapped.code != DeviceErrorCode::kAuthFailed) {
      Fail("expected auth classification for http 401");
    }
    if (ToStableErrorCode(mapped.code) != "AUTH_FAILED") {
      Fail("unexpected stable code for auth classification");
    }
  }

  {
    const auto mapped = MapDeviceError("fetch ptz capabilities", 404, "Not Found");
    if (mapped.code != DeviceErrorCode::kNotSupported) {
      Fail("expected not-supported classification for http 404");
    }
    AssertContains(mapped.detail, "http 404: Not Found");
  }

  {
    const auto mapped = MapDeviceError("fetch time", 0, "Connection refused");
    if (mapped.code != DeviceErrorCode::kUnreachable) {
      Fail("expected unreachable classification for refused connection");
    }
    if (ToStableErrorCode(mapped.code) != "UNREACHABLE") {
      Fail("unexpected stable code for unreachable classification");
    }
  }

  {
    const auto mapped = MapDeviceError("fetch overlays", 0, "Read timed out");
    if (mapped.code != DeviceErrorCode::kTimeout) {
      Fail("expected timeout classification for timed out read");
    }
  }

  {
    const auto mapped = MapDeviceError("fetch device info", 0, "xml parse failed: no root element");
    if (mapped.code != DeviceErrorCode::kParseFailed) {
      Fail("expected parse classification for unparseable body");
    }
  }

  {
    // ResponseStatus bodies collapse to statusString and subStatusCode.
    const std::string body =
        "<ResponseStatus><requestURL>/ISAPI/Streaming/channels/101</requestURL>\n"
        "  <statusCode>6</statusCode>\n"
        "  <statusString>Invalid Content</statusString>\n"
        "  <subStatusCode>badParameters</subStatusCode></ResponseStatus>";
    const auto mapped = MapDeviceError("update streaming channel", 400, body);
    if (mapped.code != DeviceErrorCode::kDeviceRejected) {
      Fail("expected rejection classification for http 400");
    }
    if (mapped.detail != "http 400: Invalid Content (badParameters)") {
      Fail("unexpected response status summary: " + mapped.detail);
    }
  }

  {
    const std::string formatted =
        FormatDeviceError("update motion detection", 403, "Forbidden");
    AssertContains(formatted, "AUTH_FAILED: ");
    AssertContains(formatted, "during update motion detection");
    AssertContains(formatted, " detail: http 403: Forbidden");
  }

  {
    const std::string formatted = FormatDeviceError("", 0, "");
    AssertContains(formatted, "UNKNOWN: ");
    AssertContains(formatted, "requested operation");
    AssertNotContains(formatted, "detail:");
  }

  {
    const std::string long_detail(1000, 'x');
    const auto mapped = MapDeviceError("fetch streaming channels", 500, long_detail);
    if (mapped.detail.size() > 300U) {
      Fail("long device detail was not truncated");
    }
    AssertContains(mapped.detail, "...");
  }

  return 0;
}
