#pragma once

#include "isapi/capabilities.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace isapisync::settings {

enum class SettingKind {
  kBoolean,
  kString,
  kNumber,
  kButton,
  kReadonlyText,
};

inline const char* ToString(SettingKind kind) {
  switch (kind) {
  case SettingKind::kBoolean:
    return "boolean";
  case SettingKind::kString:
    return "string";
  case SettingKind::kNumber:
    return "number";
  case SettingKind::kButton:
    return "button";
  case SettingKind::kReadonlyText:
    return "readonly-text";
  }
  return "string";
}

// Update handlers, resolved through a stateless dispatch table in
// update_handlers.cpp. `kNone` marks display-only settings.
enum class HandlerId {
  kNone,
  kMotionEnabled,
  kMotionSensitivity,
  kMotionCenterNotification,
  kStreamResolution,
  kStreamFrameRate,
  kStreamQualityControl,
  kStreamBitrate,
  kStreamCodec,
  kStreamGovLength,
  kStreamFixedQuality,
  kStreamAudioEnabled,
  kStreamSmartCodec,
  kAudioCodec,
  kAudioSpeakerVolume,
  kAudioNoiseReduction,
  kAudioInputType,
  kTimeMode,
  kTimeZone,
  kDaylightSaving,
  kNtpAddress,
  kNtpPort,
  kNtpInterval,
  kOsdDateTimeEnabled,
  kOsdDateStyle,
  kOsdTimeStyle,
  kOsdDisplayWeek,
  kOsdDateTimeX,
  kOsdDateTimeY,
  kOsdChannelNameEnabled,
  kOsdChannelName,
  kOsdChannelNameX,
  kOsdChannelNameY,
  kOsdTextEnabled,
  kOsdTextContent,
  kOsdTextX,
  kOsdTextY,
  kOverlaySlotBinding,
  kPtzPresetEnabled,
  kPtzPresetName,
  kPtzPresetGoto,
  kDeviceName,
  kRefetch,
};

// Visible when the current stored value of `depends_on_key` is one of
// `any_of`. `fallback` stands in for a missing stored value. An empty
// `depends_on_key` means always visible.
struct VisibilityRule {
  std::string depends_on_key;
  std::vector<std::string> any_of;
  std::string fallback;

  bool Always() const {
    return depends_on_key.empty();
  }
};

struct SettingDefinition {
  std::string key;
  std::string title;
  std::string description;
  std::string subgroup;
  SettingKind kind = SettingKind::kString;
  std::vector<std::string> choices;
  bool readonly = false;
  HandlerId handler = HandlerId::kNone;
  // Stream id, overlay id or preset id the handler acts on.
  std::string target_id;
  // Subsystem re-read after a successful put, and the one a refetch button reloads.
  std::optional<isapi::Subsystem> refetch;
  VisibilityRule visibility;
  bool regenerates_schema = false;
};

// What the settings boundary hands to the host.
struct SettingView {
  std::string key;
  std::string title;
  std::string description;
  std::string subgroup;
  SettingKind kind = SettingKind::kString;
  std::vector<std::string> choices;
  std::string value;
  bool readonly = false;
};

} // namespace isapisync::settings
