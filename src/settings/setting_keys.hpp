#pragma once

#include <cstdint>
#include <string>
#include <string_view>

// Setting keys shared by the schema synthesizer, value seeding and the update
// handlers. Keys are part of the persisted settings file format.
namespace isapisync::settings::keys {

inline constexpr std::string_view kMotionEnabled = "motionEnabled";
inline constexpr std::string_view kMotionSensitivity = "motionSensitivity";
inline constexpr std::string_view kMotionCenterNotification = "motionCenterNotification";
inline constexpr std::string_view kMotionRefetch = "motionRefetch";

inline constexpr std::string_view kStreamsRefetch = "streamsRefetch";

inline constexpr std::string_view kAudioCodec = "audioCodec";
inline constexpr std::string_view kSpeakerVolume = "speakerVolume";
inline constexpr std::string_view kNoiseReduction = "noiseReduction";
inline constexpr std::string_view kAudioInputType = "audioInputType";
inline constexpr std::string_view kAudioRefetch = "audioRefetch";

inline constexpr std::string_view kTimeMode = "timeMode";
inline constexpr std::string_view kNtpServer = "ntpServer";
inline constexpr std::string_view kNtpPort = "ntpPort";
inline constexpr std::string_view kNtpSyncInterval = "ntpSyncInterval";
inline constexpr std::string_view kTimeZone = "timeZone";
inline constexpr std::string_view kDaylightSaving = "daylightSaving";
inline constexpr std::string_view kTimeRefetch = "timeRefetch";

inline constexpr std::string_view kOsdDateTimeEnabled = "osdDateTimeEnabled";
inline constexpr std::string_view kOsdDateStyle = "osdDateStyle";
inline constexpr std::string_view kOsdTimeStyle = "osdTimeStyle";
inline constexpr std::string_view kOsdDisplayWeek = "osdDisplayWeek";
inline constexpr std::string_view kOsdDateTimeX = "osdDateTimeX";
inline constexpr std::string_view kOsdDateTimeY = "osdDateTimeY";
inline constexpr std::string_view kOsdChannelNameEnabled = "osdChannelNameEnabled";
inline constexpr std::string_view kOsdChannelName = "osdChannelName";
inline constexpr std::string_view kOsdChannelNameX = "osdChannelNameX";
inline constexpr std::string_view kOsdChannelNameY = "osdChannelNameY";
inline constexpr std::string_view kOsdRefetch = "refetchOSD";

inline constexpr std::string_view kPtzRefetch = "refetchPTZ";

inline constexpr std::string_view kInfoPrefix = "info_";
inline constexpr std::string_view kInfoDeviceName = "info_deviceName";

// `<streamId>:<field>`, e.g. `101:maxFrameRate`.
inline std::string Stream(std::string_view stream_id, std::string_view field) {
  return std::string(stream_id) + ":" + std::string(field);
}

// `osdText<id><Field>`, e.g. `osdText3Content`.
inline std::string OsdText(std::string_view overlay_id, std::string_view field) {
  return "osdText" + std::string(overlay_id) + std::string(field);
}

// `ptzPreset<id><Field>`, e.g. `ptzPreset4Name`.
inline std::string PtzPreset(std::int64_t preset_id, std::string_view field) {
  return "ptzPreset" + std::to_string(preset_id) + std::string(field);
}

inline std::string Info(std::string_view field) {
  return std::string(kInfoPrefix) + std::string(field);
}

} // namespace isapisync::settings::keys
