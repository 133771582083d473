#ifndef ISAPISYNC_ISAPI_CAPABILITIES_HPP_
#define ISAPISYNC_ISAPI_CAPABILITIES_HPP_

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace isapisync::isapi {

enum class Subsystem {
  kMotion,
  kStreams,
  kAudio,
  kTime,
  kOsd,
  kPtz,
  kDeviceInfo,
};

const char* ToString(Subsystem subsystem);
bool ParseSubsystem(std::string_view raw, Subsystem& subsystem, std::string& error);
std::vector<Subsystem> AllSubsystems();

// Current value plus the device-reported bounds for it.
struct RangedValue {
  std::int64_t value = 0;
  std::int64_t min = 0;
  std::int64_t max = 0;
};

struct MotionCapabilities {
  bool enabled = false;
  std::int64_t sensitivity_level = 0;
  std::int64_t sensitivity_min = 0;
  std::int64_t sensitivity_max = 100;
  std::int64_t sensitivity_step = 20;
  std::vector<std::string> sensitivity_choices;
  bool center_notification_enabled = false;
};

struct ResolutionOption {
  std::int64_t width = 0;
  std::int64_t height = 0;
  // Centesimal frame rates supported at this resolution.
  std::vector<std::int64_t> frame_rates;
};

struct CodecOption {
  std::string type;
  bool supports_profile = false;
  bool cbr_supported = false;
  bool vbr_supported = false;
  bool smart_codec = false;
};

struct StreamDynamicCap {
  std::vector<ResolutionOption> resolutions;
  std::vector<CodecOption> codecs;
  // Unique centesimal frame rates across all resolutions, descending.
  std::vector<std::int64_t> all_frame_rates;
  // VBR before CBR in discovery order.
  std::vector<std::string> quality_control_types;
};

struct StreamAudio {
  bool enabled = false;
  std::int64_t input_channel_id = 0;
  std::string compression;
};

struct StreamVideo {
  bool enabled = false;
  std::string codec;
  std::int64_t width = 0;
  std::int64_t height = 0;
  std::int64_t max_frame_rate = 0;
  std::string quality_control_type;
  RangedValue constant_bit_rate{.value = 0, .min = 32, .max = 16384};
  RangedValue vbr_upper_cap{.value = 0, .min = 32, .max = 16384};
  std::int64_t fixed_quality = 0;
  RangedValue gov_length{.value = 0, .min = 1, .max = 400};
  std::int64_t smoothing = 0;
  std::string h264_profile;
  std::string h265_profile;
  bool smart_codec_enabled = false;
};

struct StreamChannel {
  std::string id;
  std::string name;
  bool enabled = false;
  StreamAudio audio;
  StreamVideo video;
  // Absent when the per-channel dynamicCap request failed.
  std::optional<StreamDynamicCap> caps;
};

struct AudioCapabilities {
  std::vector<std::string> codecs;
  std::vector<std::string> input_types;
  std::int64_t volume_min = 0;
  std::int64_t volume_max = 100;
  bool supports_noise_reduction = false;

  bool enabled = false;
  std::string codec;
  std::int64_t speaker_volume = 0;
  bool noise_reduction = false;
  std::string input_type;
};

struct TimeCapabilities {
  std::vector<std::string> time_modes;
  std::string time_mode;
  std::string local_time;
  std::string time_zone;

  bool has_ntp = false;
  std::string ntp_address;
  std::int64_t ntp_port = 123;
  std::int64_t ntp_interval_minutes = 60;
};

struct TextOverlay {
  std::string id;
  bool enabled = false;
  std::string display_text;
  std::int64_t position_x = 0;
  std::int64_t position_y = 0;
};

struct DateTimeOverlay {
  bool enabled = false;
  std::string date_style;
  std::string time_style;
  bool display_week = false;
  std::int64_t position_x = 0;
  std::int64_t position_y = 0;
};

struct ChannelNameOverlay {
  bool enabled = false;
  std::int64_t position_x = 0;
  std::int64_t position_y = 0;
};

struct OsdCapabilities {
  std::int64_t overlay_capacity = 8;
  std::int64_t screen_width = 704;
  std::int64_t screen_height = 576;
  std::vector<TextOverlay> text_overlays;
  std::optional<DateTimeOverlay> date_time;
  std::optional<ChannelNameOverlay> channel_name;
  std::string video_input_name;

  const TextOverlay* FindTextOverlay(std::string_view id) const {
    for (const TextOverlay& overlay : text_overlays) {
      if (overlay.id == id) {
        return &overlay;
      }
    }
    return nullptr;
  }
};

struct PtzPreset {
  std::int64_t id = 0;
  std::string name;
};

struct PtzCapabilities {
  std::int64_t max_preset_number = 0;
  std::vector<std::int64_t> special_numbers;
  std::vector<PtzPreset> presets;
};

struct DeviceInfo {
  std::string device_name;
  std::string model;
  std::string serial_number;
  std::string mac_address;
  std::string firmware_version;
  std::string firmware_released_date;
  std::string device_type;
};

// Aggregate of every subsystem snapshot. A member is empty when its subsystem
// failed to fetch or is unsupported by the camera. Instances are never mutated
// after publication; a refetch builds a new set.
struct CapabilitySet {
  std::optional<MotionCapabilities> motion;
  std::optional<std::vector<StreamChannel>> streams;
  std::optional<AudioCapabilities> audio;
  std::optional<TimeCapabilities> time;
  std::optional<OsdCapabilities> osd;
  std::optional<PtzCapabilities> ptz;
  std::optional<DeviceInfo> device_info;

  bool Has(Subsystem subsystem) const;
  const StreamChannel* FindStream(std::string_view id) const;
};

} // namespace isapisync::isapi

#endif // ISAPISYNC_ISAPI_CAPABILITIES_HPP_
