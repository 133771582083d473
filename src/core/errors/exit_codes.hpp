#pragma once

namespace isapisync::core::errors {

// Process-exit contract for the CLI host.
//
// 0/1/2 keep their conventional meanings (success, command failure, usage).
// The remaining values let wrappers tell a bad config file from an
// unreachable camera or a rejected setting without parsing stderr.
enum class ExitCode : int {
  kSuccess = 0,
  kFailure = 1,
  kUsage = 2,
  kConfigInvalid = 10,
  kDeviceUnreachable = 20,
  kSettingRejected = 30,
};

constexpr int ToInt(ExitCode code) {
  return static_cast<int>(code);
}

} // namespace isapisync::core::errors
