#pragma once

#include <string>
#include <string_view>

namespace isapisync::overlay {

enum class OverlayType {
  kText,
  kDevice,
  kFaceDetection,
};

inline const char* ToString(OverlayType type) {
  switch (type) {
  case OverlayType::kText:
    return "Text";
  case OverlayType::kDevice:
    return "Device";
  case OverlayType::kFaceDetection:
    return "FaceDetection";
  }
  return "Text";
}

// Unknown or missing values fall back to Text.
inline OverlayType ParseOverlayType(std::string_view raw) {
  if (raw == "Device") {
    return OverlayType::kDevice;
  }
  if (raw == "FaceDetection") {
    return OverlayType::kFaceDetection;
  }
  return OverlayType::kText;
}

enum class SourceKind {
  kTemperature,
  kHumidity,
  kFace,
};

inline const char* ToString(SourceKind kind) {
  switch (kind) {
  case SourceKind::kTemperature:
    return "Temperature";
  case SourceKind::kHumidity:
    return "Humidity";
  case SourceKind::kFace:
    return "Face";
  }
  return "Temperature";
}

// Settings-store keys for one overlay slot.
struct SlotKeys {
  std::string text;
  std::string type;
  std::string prefix;
  std::string device;
};

inline SlotKeys KeysForSlot(std::string_view slot_id) {
  const std::string base = "overlay:" + std::string(slot_id) + ":";
  return SlotKeys{
      .text = base + "text",
      .type = base + "type",
      .prefix = base + "prefix",
      .device = base + "device",
  };
}

// One on-screen text region. `last_resolved_text` is the last value pushed
// to (or read from) the device and suppresses redundant writes.
struct OverlaySlot {
  std::string id;
  OverlayType type = OverlayType::kText;
  std::string source_device_id;
  std::string prefix;
  std::string text;
  std::string last_resolved_text;
  bool has_resolved_text = false;
};

} // namespace isapisync::overlay
