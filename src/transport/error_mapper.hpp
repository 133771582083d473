#pragma once

#include <string>
#include <string_view>

namespace isapisync::transport {

// Stable classification for device request failures.
//
// Raw transport errors and device status strings vary across firmware
// builds. Logs and CLI output carry these codes instead so operators can grep
// for one failure class across cameras.
enum class DeviceErrorCode {
  kAuthFailed,
  kTimeout,
  kUnreachable,
  kNotSupported,
  kDeviceRejected,
  kParseFailed,
  kUnknown,
};

std::string_view ToStableErrorCode(DeviceErrorCode code);

struct DeviceErrorMapping {
  DeviceErrorCode code = DeviceErrorCode::kUnknown;
  std::string actionable_message;
  std::string detail;
};

// Maps one failed request to a stable code and an actionable message.
// `http_status` is 0 when no HTTP response was received; `detail` is the raw
// transport error text or the device response body.
// `operation` is a human label like "fetch motion capabilities".
DeviceErrorMapping MapDeviceError(std::string_view operation, int http_status,
                                  std::string_view detail);

// Returns single-line contract text:
//   "<STABLE_CODE>: <actionable_message> detail: <raw_detail>"
// The detail suffix is omitted when raw detail is empty.
std::string FormatDeviceError(std::string_view operation, int http_status, std::string_view detail);

// Same format for an already-classified failure.
std::string FormatDeviceError(const DeviceErrorMapping& mapped);

} // namespace isapisync::transport
