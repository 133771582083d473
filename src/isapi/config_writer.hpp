#pragma once

#include "core/logging/logger.hpp"
#include "isapi/isapi_client.hpp"
#include "wire/text_patch.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace isapisync::isapi {

// Field sets for the write operations. Only engaged optionals are sent.

struct MotionDetectionUpdate {
  std::optional<bool> enabled;
  std::optional<std::int64_t> sensitivity_level;
};

struct StreamingChannelUpdate {
  std::string channel_id;
  std::optional<std::string> codec;
  std::optional<std::int64_t> width;
  std::optional<std::int64_t> height;
  std::optional<std::int64_t> max_frame_rate;
  std::optional<std::int64_t> vbr_upper_cap;
  std::optional<std::int64_t> constant_bit_rate;
  std::optional<std::int64_t> gov_length;
  std::optional<std::int64_t> fixed_quality;
  std::optional<std::string> quality_control_type;
  std::optional<std::int64_t> smoothing;
  std::optional<std::string> h264_profile;
  std::optional<std::string> h265_profile;
  std::optional<bool> audio_enabled;
  std::optional<bool> smart_codec_enabled;
};

struct TwoWayAudioUpdate {
  std::optional<std::string> codec;
  std::optional<std::int64_t> speaker_volume;
  std::optional<bool> noise_reduction;
  std::optional<std::string> input_type;
};

struct TimeUpdate {
  std::optional<std::string> time_mode;
  std::optional<std::string> local_time;
  std::optional<std::string> time_zone;
};

struct NtpServerUpdate {
  std::optional<std::string> address;
  std::optional<std::int64_t> port;
  std::optional<std::int64_t> interval_minutes;
};

struct DateTimeOverlayUpdate {
  std::optional<bool> enabled;
  std::optional<std::string> date_style;
  std::optional<std::string> time_style;
  std::optional<bool> display_week;
  std::optional<std::int64_t> position_x;
  std::optional<std::int64_t> position_y;
};

struct ChannelNameOverlayUpdate {
  std::optional<bool> enabled;
  std::optional<std::int64_t> position_x;
  std::optional<std::int64_t> position_y;
};

struct TextOverlayUpdate {
  std::string id;
  std::optional<bool> enabled;
  std::optional<std::string> display_text;
  std::optional<std::int64_t> position_x;
  std::optional<std::int64_t> position_y;
};

struct OsdUpdate {
  std::optional<DateTimeOverlayUpdate> date_time;
  std::optional<ChannelNameOverlayUpdate> channel_name;
  std::vector<TextOverlayUpdate> text_overlays;
};

// Applies partial configuration updates.
//
// Every update reads the current document, changes only the requested
// fields and writes it back. Plain leaf edits go through the textual patcher
// so unknown vendor elements survive byte for byte. Edits that add or remove
// sub-elements (motion trigger notifications, new text overlay blocks) rebuild
// the document tree instead.
//
// When none of the requested fields exist in the fetched document the write
// is skipped with a warning and the call still succeeds.
class ConfigWriter {
public:
  ConfigWriter(IsapiClient& client, std::string stream_channel, core::logging::CameraLog log);

  bool UpdateMotionDetection(const MotionDetectionUpdate& update, std::string& error);
  bool UpdateMotionTrigger(bool center_notification_enabled, std::string& error);
  bool UpdateStreamingChannel(const StreamingChannelUpdate& update, std::string& error);
  bool UpdateTwoWayAudio(const TwoWayAudioUpdate& update, std::string& error);
  bool UpdateTime(const TimeUpdate& update, std::string& error);
  bool UpdateNtpServer(const NtpServerUpdate& update, std::string& error);
  bool UpdateOsd(const OsdUpdate& update, std::string& error);

  // Pushes one overlay's displayText. Falls back to a tree edit when the
  // overlay block does not exist yet.
  bool UpdateOverlayText(const std::string& overlay_id, const std::string& text,
                         std::string& error);

  bool UpdateVideoInputName(const std::string& name, std::string& error);
  bool UpdateDeviceName(const std::string& name, std::string& error);

  bool PutPtzPreset(std::int64_t preset_id, const std::string& name, std::string& error);
  bool DeletePtzPreset(std::int64_t preset_id, std::string& error);
  bool GotoPtzPreset(std::int64_t preset_id, std::string& error);

  bool FetchOverlayDocument(std::string& raw, std::string& error);
  bool PutOverlayDocument(const std::string& raw, std::string& error);

private:
  bool PatchAndPut(const std::string& get_path, const std::string& put_path,
                   std::string_view operation, const std::vector<wire::PatchTarget>& targets,
                   std::string& error);
  bool PutLogged(const std::string& path, const std::string& body, std::string_view operation,
                 std::string_view fields, std::string& error);

  IsapiClient* client_ = nullptr;
  std::string stream_channel_;
  std::string input_channel_;
  core::logging::CameraLog log_;
};

} // namespace isapisync::isapi
