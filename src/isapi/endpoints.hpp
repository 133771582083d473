#pragma once

#include <string>
#include <string_view>

namespace isapisync::isapi::endpoints {

constexpr std::string_view kDefaultStreamChannel = "101";

// Video input channel derived from the stream channel: "101" -> "1".
inline std::string VideoInputChannel(std::string_view stream_channel) {
  if (stream_channel.empty() || stream_channel.front() < '1' || stream_channel.front() > '9') {
    return "1";
  }
  return std::string(1, stream_channel.front());
}

inline std::string MotionDetection(std::string_view input_channel) {
  return "/ISAPI/System/Video/inputs/channels/" + std::string(input_channel) + "/motionDetection";
}

inline std::string MotionCapabilities(std::string_view input_channel) {
  return MotionDetection(input_channel) + "/capabilities";
}

constexpr std::string_view kMotionTrigger = "/ISAPI/Event/triggers/VMD-1";

constexpr std::string_view kStreamingChannels = "/ISAPI/Streaming/channels";

inline std::string StreamingChannel(std::string_view channel_id) {
  return std::string(kStreamingChannels) + "/" + std::string(channel_id);
}

inline std::string DynamicCap(std::string_view channel_id) {
  return StreamingChannel(channel_id) + "/dynamicCap";
}

constexpr std::string_view kTwoWayAudio = "/ISAPI/System/TwoWayAudio/channels/1";
constexpr std::string_view kTwoWayAudioCapabilities =
    "/ISAPI/System/TwoWayAudio/channels/1/capabilities";

constexpr std::string_view kTime = "/ISAPI/System/time";
constexpr std::string_view kTimeCapabilities = "/ISAPI/System/time/capabilities";
constexpr std::string_view kNtpServer = "/ISAPI/System/time/ntpServers/1";

constexpr std::string_view kOverlays = "/ISAPI/System/Video/inputs/channels/1/overlays";
constexpr std::string_view kOverlayCapabilities =
    "/ISAPI/System/Video/inputs/channels/1/overlays/capabilities";

inline std::string VideoInput(std::string_view input_channel) {
  return "/ISAPI/System/Video/inputs/channels/" + std::string(input_channel);
}

constexpr std::string_view kPtzCapabilities = "/ISAPI/PTZCtrl/channels/1/capabilities";
constexpr std::string_view kPtzPresets = "/ISAPI/PTZCtrl/channels/1/presets";

inline std::string PtzPreset(std::string_view preset_id) {
  return std::string(kPtzPresets) + "/" + std::string(preset_id);
}

inline std::string PtzPresetGoto(std::string_view preset_id) {
  return PtzPreset(preset_id) + "/goto";
}

constexpr std::string_view kDeviceInfo = "/ISAPI/System/deviceInfo";

} // namespace isapisync::isapi::endpoints
