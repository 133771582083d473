#include "settings/update_handlers.hpp"

#include "core/string_utils.hpp"
#include "core/time_utils.hpp"
#include "settings/setting_keys.hpp"
#include "settings/value_seeding.hpp"
#include "transcode/value_transcoder.hpp"

#include <algorithm>
#include <array>
#include <cstdint>
#include <utility>

namespace isapisync::settings {

namespace {

using HandlerFn = bool (*)(const SettingDefinition& definition, const std::string& value,
                           HandlerContext& ctx, std::string& error);

// Values reach the handlers after NormalizeSettingValue, so booleans are
// already "true" or "false".
bool ToBool(const std::string& value) {
  bool parsed = false;
  return core::ParseBoolText(value, parsed) && parsed;
}

bool ToInt(const std::string& value, std::int64_t& parsed, std::string& error) {
  if (!core::ParseInt64(value, parsed)) {
    error = "expected an integer, got '" + value + "'";
    return false;
  }
  return true;
}

// Motion.

bool HandleMotionEnabled(const SettingDefinition&, const std::string& value, HandlerContext& ctx,
                         std::string& error) {
  return ctx.writer.UpdateMotionDetection(isapi::MotionDetectionUpdate{.enabled = ToBool(value)},
                                          error);
}

bool HandleMotionSensitivity(const SettingDefinition&, const std::string& value,
                             HandlerContext& ctx, std::string& error) {
  std::int64_t level = 0;
  if (!ToInt(value, level, error)) {
    return false;
  }
  return ctx.writer.UpdateMotionDetection(
      isapi::MotionDetectionUpdate{.sensitivity_level = level}, error);
}

bool HandleMotionCenterNotification(const SettingDefinition&, const std::string& value,
                                    HandlerContext& ctx, std::string& error) {
  return ctx.writer.UpdateMotionTrigger(ToBool(value), error);
}

// Streams.

isapi::StreamingChannelUpdate StreamUpdate(const SettingDefinition& definition) {
  isapi::StreamingChannelUpdate update;
  update.channel_id = definition.target_id;
  return update;
}

// Labels truncate fractional rates (2997 shows as "29"), so a label maps back
// to the first offered wire rate that renders the same. Parsing the label is
// the fallback when the stream has no dynamic capabilities.
bool FrameRateForLabel(const SettingDefinition& definition, const HandlerContext& ctx,
                       const std::string& label, std::int64_t& centi_fps) {
  const isapi::StreamChannel* channel = ctx.caps.FindStream(definition.target_id);
  if (channel != nullptr && channel->caps.has_value()) {
    for (const std::int64_t rate : channel->caps->all_frame_rates) {
      if (transcode::FrameRateToLabel(rate) == label) {
        centi_fps = rate;
        return true;
      }
    }
  }
  return transcode::ParseFrameRateLabel(label, centi_fps);
}

// Stored frame rate first: it tracks puts made since the last refetch.
std::int64_t CurrentFrameRate(const SettingDefinition& definition, const HandlerContext& ctx) {
  std::int64_t centi_fps = 0;
  const std::optional<std::string> label =
      ctx.store.Get(keys::Stream(definition.target_id, "maxFrameRate"));
  if (label.has_value() && FrameRateForLabel(definition, ctx, *label, centi_fps) &&
      centi_fps > 0) {
    return centi_fps;
  }
  const isapi::StreamChannel* channel = ctx.caps.FindStream(definition.target_id);
  return channel != nullptr ? channel->video.max_frame_rate : 0;
}

bool HandleStreamResolution(const SettingDefinition& definition, const std::string& value,
                            HandlerContext& ctx, std::string& error) {
  isapi::StreamingChannelUpdate update = StreamUpdate(definition);
  std::int64_t width = 0;
  std::int64_t height = 0;
  if (!transcode::ParseResolutionLabel(value, width, height)) {
    error = "invalid resolution '" + value + "' (expected WIDTHxHEIGHT)";
    return false;
  }
  update.width = width;
  update.height = height;
  return ctx.writer.UpdateStreamingChannel(update, error);
}

bool HandleStreamFrameRate(const SettingDefinition& definition, const std::string& value,
                           HandlerContext& ctx, std::string& error) {
  isapi::StreamingChannelUpdate update = StreamUpdate(definition);
  std::int64_t centi_fps = 0;
  if (!FrameRateForLabel(definition, ctx, value, centi_fps)) {
    error = "invalid frame rate '" + value + "'";
    return false;
  }
  update.max_frame_rate = centi_fps;
  return ctx.writer.UpdateStreamingChannel(update, error);
}

bool HandleStreamQualityControl(const SettingDefinition& definition, const std::string& value,
                                HandlerContext& ctx, std::string& error) {
  isapi::StreamingChannelUpdate update = StreamUpdate(definition);
  update.quality_control_type = value;
  return ctx.writer.UpdateStreamingChannel(update, error);
}

bool HandleStreamBitrate(const SettingDefinition& definition, const std::string& value,
                         HandlerContext& ctx, std::string& error) {
  std::int64_t kbps = 0;
  if (!ToInt(value, kbps, error)) {
    return false;
  }
  const isapi::StreamChannel* channel = ctx.caps.FindStream(definition.target_id);
  const std::string snapshot_mode = channel != nullptr ? channel->video.quality_control_type : "";
  const std::string mode =
      ctx.store.GetOr(keys::Stream(definition.target_id, "videoQualityControlType"), snapshot_mode);

  isapi::StreamingChannelUpdate update = StreamUpdate(definition);
  if (mode == "VBR") {
    update.vbr_upper_cap = kbps;
  } else {
    update.constant_bit_rate = kbps;
  }
  return ctx.writer.UpdateStreamingChannel(update, error);
}

bool HandleStreamCodec(const SettingDefinition& definition, const std::string& value,
                       HandlerContext& ctx, std::string& error) {
  isapi::StreamingChannelUpdate update = StreamUpdate(definition);
  update.codec = value;
  return ctx.writer.UpdateStreamingChannel(update, error);
}

bool HandleStreamGovLength(const SettingDefinition& definition, const std::string& value,
                           HandlerContext& ctx, std::string& error) {
  std::int64_t seconds = 0;
  if (!ToInt(value, seconds, error)) {
    return false;
  }
  const std::int64_t centi_fps = CurrentFrameRate(definition, ctx);
  if (centi_fps <= 0) {
    error = "stream " + definition.target_id + " has no frame rate to convert the interval with";
    return false;
  }
  isapi::StreamingChannelUpdate update = StreamUpdate(definition);
  update.gov_length = transcode::SecondsToGovLength(seconds, centi_fps);
  return ctx.writer.UpdateStreamingChannel(update, error);
}

bool HandleStreamFixedQuality(const SettingDefinition& definition, const std::string& value,
                              HandlerContext& ctx, std::string& error) {
  std::int64_t quality = 0;
  if (!transcode::ParseFixedQualityLabel(value, quality)) {
    error = "invalid fixed quality '" + value + "'";
    return false;
  }
  isapi::StreamingChannelUpdate update = StreamUpdate(definition);
  update.fixed_quality = quality;
  return ctx.writer.UpdateStreamingChannel(update, error);
}

bool HandleStreamAudioEnabled(const SettingDefinition& definition, const std::string& value,
                              HandlerContext& ctx, std::string& error) {
  isapi::StreamingChannelUpdate update = StreamUpdate(definition);
  update.audio_enabled = ToBool(value);
  return ctx.writer.UpdateStreamingChannel(update, error);
}

bool HandleStreamSmartCodec(const SettingDefinition& definition, const std::string& value,
                            HandlerContext& ctx, std::string& error) {
  isapi::StreamingChannelUpdate update = StreamUpdate(definition);
  update.smart_codec_enabled = ToBool(value);
  return ctx.writer.UpdateStreamingChannel(update, error);
}

// Two-way audio.

bool HandleAudioCodec(const SettingDefinition&, const std::string& value, HandlerContext& ctx,
                      std::string& error) {
  return ctx.writer.UpdateTwoWayAudio(isapi::TwoWayAudioUpdate{.codec = value}, error);
}

bool HandleAudioSpeakerVolume(const SettingDefinition&, const std::string& value,
                              HandlerContext& ctx, std::string& error) {
  std::int64_t volume = 0;
  if (!ToInt(value, volume, error)) {
    return false;
  }
  return ctx.writer.UpdateTwoWayAudio(isapi::TwoWayAudioUpdate{.speaker_volume = volume}, error);
}

bool HandleAudioNoiseReduction(const SettingDefinition&, const std::string& value,
                               HandlerContext& ctx, std::string& error) {
  return ctx.writer.UpdateTwoWayAudio(
      isapi::TwoWayAudioUpdate{.noise_reduction = ToBool(value)}, error);
}

bool HandleAudioInputType(const SettingDefinition&, const std::string& value, HandlerContext& ctx,
                          std::string& error) {
  return ctx.writer.UpdateTwoWayAudio(isapi::TwoWayAudioUpdate{.input_type = value}, error);
}

// Time.

bool HandleTimeMode(const SettingDefinition&, const std::string& value, HandlerContext& ctx,
                    std::string& error) {
  isapi::TimeUpdate update{.time_mode = value};
  if (value == "manual") {
    update.local_time = core::FormatIsoSeconds(ctx.now);
  }
  return ctx.writer.UpdateTime(update, error);
}

bool HandleTimeZone(const SettingDefinition&, const std::string& value, HandlerContext& ctx,
                    std::string& error) {
  std::string wire;
  if (!transcode::HumanToWireTimezone(value, ctx.store.GetBool(keys::kDaylightSaving), wire)) {
    error = "invalid time zone '" + value + "' (expected UTC+H:00:00)";
    return false;
  }
  return ctx.writer.UpdateTime(isapi::TimeUpdate{.time_zone = wire}, error);
}

bool HandleDaylightSaving(const SettingDefinition&, const std::string& value, HandlerContext& ctx,
                          std::string& error) {
  const bool enabled = ToBool(value);
  std::string wire;
  const std::optional<std::string> human = ctx.store.Get(keys::kTimeZone);
  if (human.has_value() && transcode::HumanToWireTimezone(*human, enabled, wire)) {
    return ctx.writer.UpdateTime(isapi::TimeUpdate{.time_zone = wire}, error);
  }
  if (ctx.caps.time.has_value() && !ctx.caps.time->time_zone.empty()) {
    wire = transcode::SetWireTimezoneDst(ctx.caps.time->time_zone, enabled);
    return ctx.writer.UpdateTime(isapi::TimeUpdate{.time_zone = wire}, error);
  }
  error = "no time zone known to apply daylight saving to";
  return false;
}

bool HandleNtpAddress(const SettingDefinition&, const std::string& value, HandlerContext& ctx,
                      std::string& error) {
  return ctx.writer.UpdateNtpServer(isapi::NtpServerUpdate{.address = value}, error);
}

bool HandleNtpPort(const SettingDefinition&, const std::string& value, HandlerContext& ctx,
                   std::string& error) {
  std::int64_t port = 0;
  if (!ToInt(value, port, error)) {
    return false;
  }
  if (port <= 0 || port > 65535) {
    error = "NTP port out of range: " + value;
    return false;
  }
  return ctx.writer.UpdateNtpServer(isapi::NtpServerUpdate{.port = port}, error);
}

bool HandleNtpInterval(const SettingDefinition&, const std::string& value, HandlerContext& ctx,
                       std::string& error) {
  std::int64_t minutes = 0;
  if (!transcode::ParseNtpIntervalLabel(value, minutes)) {
    error = "invalid sync interval '" + value + "'";
    return false;
  }
  return ctx.writer.UpdateNtpServer(isapi::NtpServerUpdate{.interval_minutes = minutes}, error);
}

// On-screen display.

bool PutDateTime(HandlerContext& ctx, isapi::DateTimeOverlayUpdate date_time, std::string& error) {
  isapi::OsdUpdate update;
  update.date_time = std::move(date_time);
  return ctx.writer.UpdateOsd(update, error);
}

bool PutChannelName(HandlerContext& ctx, isapi::ChannelNameOverlayUpdate channel_name,
                    std::string& error) {
  isapi::OsdUpdate update;
  update.channel_name = std::move(channel_name);
  return ctx.writer.UpdateOsd(update, error);
}

bool PutTextOverlay(HandlerContext& ctx, isapi::TextOverlayUpdate text, std::string& error) {
  isapi::OsdUpdate update;
  update.text_overlays.push_back(std::move(text));
  return ctx.writer.UpdateOsd(update, error);
}

bool HandleOsdDateTimeEnabled(const SettingDefinition&, const std::string& value,
                              HandlerContext& ctx, std::string& error) {
  return PutDateTime(ctx, isapi::DateTimeOverlayUpdate{.enabled = ToBool(value)}, error);
}

bool HandleOsdDateStyle(const SettingDefinition&, const std::string& value, HandlerContext& ctx,
                        std::string& error) {
  return PutDateTime(ctx, isapi::DateTimeOverlayUpdate{.date_style = value}, error);
}

bool HandleOsdTimeStyle(const SettingDefinition&, const std::string& value, HandlerContext& ctx,
                        std::string& error) {
  return PutDateTime(ctx, isapi::DateTimeOverlayUpdate{.time_style = value}, error);
}

bool HandleOsdDisplayWeek(const SettingDefinition&, const std::string& value, HandlerContext& ctx,
                          std::string& error) {
  return PutDateTime(ctx, isapi::DateTimeOverlayUpdate{.display_week = ToBool(value)}, error);
}

bool HandleOsdDateTimeX(const SettingDefinition&, const std::string& value, HandlerContext& ctx,
                        std::string& error) {
  std::int64_t x = 0;
  return ToInt(value, x, error) &&
         PutDateTime(ctx, isapi::DateTimeOverlayUpdate{.position_x = x}, error);
}

bool HandleOsdDateTimeY(const SettingDefinition&, const std::string& value, HandlerContext& ctx,
                        std::string& error) {
  std::int64_t y = 0;
  return ToInt(value, y, error) &&
         PutDateTime(ctx, isapi::DateTimeOverlayUpdate{.position_y = y}, error);
}

bool HandleOsdChannelNameEnabled(const SettingDefinition&, const std::string& value,
                                 HandlerContext& ctx, std::string& error) {
  return PutChannelName(ctx, isapi::ChannelNameOverlayUpdate{.enabled = ToBool(value)}, error);
}

bool HandleOsdChannelName(const SettingDefinition&, const std::string& value, HandlerContext& ctx,
                          std::string& error) {
  return ctx.writer.UpdateVideoInputName(value, error);
}

bool HandleOsdChannelNameX(const SettingDefinition&, const std::string& value,
                           HandlerContext& ctx, std::string& error) {
  std::int64_t x = 0;
  return ToInt(value, x, error) &&
         PutChannelName(ctx, isapi::ChannelNameOverlayUpdate{.position_x = x}, error);
}

bool HandleOsdChannelNameY(const SettingDefinition&, const std::string& value,
                           HandlerContext& ctx, std::string& error) {
  std::int64_t y = 0;
  return ToInt(value, y, error) &&
         PutChannelName(ctx, isapi::ChannelNameOverlayUpdate{.position_y = y}, error);
}

bool HandleOsdTextEnabled(const SettingDefinition& definition, const std::string& value,
                          HandlerContext& ctx, std::string& error) {
  return PutTextOverlay(
      ctx, isapi::TextOverlayUpdate{.id = definition.target_id, .enabled = ToBool(value)}, error);
}

bool HandleOsdTextContent(const SettingDefinition& definition, const std::string& value,
                          HandlerContext& ctx, std::string& error) {
  return ctx.writer.UpdateOverlayText(definition.target_id, value, error);
}

bool HandleOsdTextX(const SettingDefinition& definition, const std::string& value,
                    HandlerContext& ctx, std::string& error) {
  std::int64_t x = 0;
  return ToInt(value, x, error) &&
         PutTextOverlay(ctx, isapi::TextOverlayUpdate{.id = definition.target_id, .position_x = x},
                        error);
}

bool HandleOsdTextY(const SettingDefinition& definition, const std::string& value,
                    HandlerContext& ctx, std::string& error) {
  std::int64_t y = 0;
  return ToInt(value, y, error) &&
         PutTextOverlay(ctx, isapi::TextOverlayUpdate{.id = definition.target_id, .position_y = y},
                        error);
}

// Overlay slot bindings live only in the store; the sync runner picks them up.
bool HandleOverlaySlotBinding(const SettingDefinition&, const std::string&, HandlerContext&,
                              std::string&) {
  return true;
}

// PTZ.

bool PresetId(const SettingDefinition& definition, std::int64_t& id, std::string& error) {
  if (!core::ParseInt64(definition.target_id, id) || id <= 0) {
    error = "invalid preset id '" + definition.target_id + "'";
    return false;
  }
  return true;
}

bool HandlePtzPresetEnabled(const SettingDefinition& definition, const std::string& value,
                            HandlerContext& ctx, std::string& error) {
  std::int64_t id = 0;
  if (!PresetId(definition, id, error)) {
    return false;
  }
  if (!ToBool(value)) {
    return ctx.writer.DeletePtzPreset(id, error);
  }
  const std::string name =
      ctx.store.GetOr(keys::PtzPreset(id, "Name"), "Preset " + definition.target_id);
  return ctx.writer.PutPtzPreset(id, name.empty() ? "Preset " + definition.target_id : name,
                                 error);
}

bool HandlePtzPresetName(const SettingDefinition& definition, const std::string& value,
                         HandlerContext& ctx, std::string& error) {
  std::int64_t id = 0;
  return PresetId(definition, id, error) && ctx.writer.PutPtzPreset(id, value, error);
}

bool HandlePtzPresetGoto(const SettingDefinition& definition, const std::string&,
                         HandlerContext& ctx, std::string& error) {
  std::int64_t id = 0;
  return PresetId(definition, id, error) && ctx.writer.GotoPtzPreset(id, error);
}

bool HandleDeviceName(const SettingDefinition&, const std::string& value, HandlerContext& ctx,
                      std::string& error) {
  return ctx.writer.UpdateDeviceName(value, error);
}

// The refetch itself is driven by the caller through HandlerOutcome.
bool HandleRefetch(const SettingDefinition&, const std::string&, HandlerContext&, std::string&) {
  return true;
}

struct HandlerEntry {
  HandlerId id;
  HandlerFn fn;
};

constexpr std::array<HandlerEntry, 42> kHandlers = {{
    {HandlerId::kMotionEnabled, &HandleMotionEnabled},
    {HandlerId::kMotionSensitivity, &HandleMotionSensitivity},
    {HandlerId::kMotionCenterNotification, &HandleMotionCenterNotification},
    {HandlerId::kStreamResolution, &HandleStreamResolution},
    {HandlerId::kStreamFrameRate, &HandleStreamFrameRate},
    {HandlerId::kStreamQualityControl, &HandleStreamQualityControl},
    {HandlerId::kStreamBitrate, &HandleStreamBitrate},
    {HandlerId::kStreamCodec, &HandleStreamCodec},
    {HandlerId::kStreamGovLength, &HandleStreamGovLength},
    {HandlerId::kStreamFixedQuality, &HandleStreamFixedQuality},
    {HandlerId::kStreamAudioEnabled, &HandleStreamAudioEnabled},
    {HandlerId::kStreamSmartCodec, &HandleStreamSmartCodec},
    {HandlerId::kAudioCodec, &HandleAudioCodec},
    {HandlerId::kAudioSpeakerVolume, &HandleAudioSpeakerVolume},
    {HandlerId::kAudioNoiseReduction, &HandleAudioNoiseReduction},
    {HandlerId::kAudioInputType, &HandleAudioInputType},
    {HandlerId::kTimeMode, &HandleTimeMode},
    {HandlerId::kTimeZone, &HandleTimeZone},
    {HandlerId::kDaylightSaving, &HandleDaylightSaving},
    {HandlerId::kNtpAddress, &HandleNtpAddress},
    {HandlerId::kNtpPort, &HandleNtpPort},
    {HandlerId::kNtpInterval, &HandleNtpInterval},
    {HandlerId::kOsdDateTimeEnabled, &HandleOsdDateTimeEnabled},
    {HandlerId::kOsdDateStyle, &HandleOsdDateStyle},
    {HandlerId::kOsdTimeStyle, &HandleOsdTimeStyle},
    {HandlerId::kOsdDisplayWeek, &HandleOsdDisplayWeek},
    {HandlerId::kOsdDateTimeX, &HandleOsdDateTimeX},
    {HandlerId::kOsdDateTimeY, &HandleOsdDateTimeY},
    {HandlerId::kOsdChannelNameEnabled, &HandleOsdChannelNameEnabled},
    {HandlerId::kOsdChannelName, &HandleOsdChannelName},
    {HandlerId::kOsdChannelNameX, &HandleOsdChannelNameX},
    {HandlerId::kOsdChannelNameY, &HandleOsdChannelNameY},
    {HandlerId::kOsdTextEnabled, &HandleOsdTextEnabled},
    {HandlerId::kOsdTextContent, &HandleOsdTextContent},
    {HandlerId::kOsdTextX, &HandleOsdTextX},
    {HandlerId::kOsdTextY, &HandleOsdTextY},
    {HandlerId::kOverlaySlotBinding, &HandleOverlaySlotBinding},
    {HandlerId::kPtzPresetEnabled, &HandlePtzPresetEnabled},
    {HandlerId::kPtzPresetName, &HandlePtzPresetName},
    {HandlerId::kPtzPresetGoto, &HandlePtzPresetGoto},
    {HandlerId::kDeviceName, &HandleDeviceName},
    {HandlerId::kRefetch, &HandleRefetch},
}};

HandlerFn FindHandler(HandlerId id) {
  const auto it = std::find_if(kHandlers.begin(), kHandlers.end(),
                               [id](const HandlerEntry& entry) { return entry.id == id; });
  return it == kHandlers.end() ? nullptr : it->fn;
}

} // namespace

bool NormalizeSettingValue(const SettingDefinition& definition, std::string_view raw,
                           std::string& normalized, std::string& error) {
  error.clear();
  switch (definition.kind) {
  case SettingKind::kBoolean: {
    bool parsed = false;
    if (!core::ParseBoolText(core::Trim(raw), parsed)) {
      error = "setting '" + definition.key + "' expects true or false, got '" + std::string(raw) +
              "'";
      return false;
    }
    normalized = core::BoolText(parsed);
    return true;
  }
  case SettingKind::kNumber: {
    std::int64_t parsed = 0;
    if (!core::ParseInt64(core::Trim(raw), parsed)) {
      error = "setting '" + definition.key + "' expects an integer, got '" + std::string(raw) + "'";
      return false;
    }
    normalized = std::to_string(parsed);
    return true;
  }
  case SettingKind::kButton:
    normalized.clear();
    return true;
  case SettingKind::kReadonlyText:
    error = "setting '" + definition.key + "' is read-only";
    return false;
  case SettingKind::kString:
    break;
  }

  normalized = std::string(raw);
  if (!definition.choices.empty() &&
      std::find(definition.choices.begin(), definition.choices.end(), normalized) ==
          definition.choices.end()) {
    error = "value '" + normalized + "' is not a valid choice for '" + definition.key + "'";
    return false;
  }
  return true;
}

bool ApplySetting(const SettingDefinition& definition, std::string_view raw, HandlerContext& ctx,
                  HandlerOutcome& outcome, std::string& error) {
  outcome = HandlerOutcome{};
  if (definition.readonly || definition.kind == SettingKind::kReadonlyText) {
    error = "setting '" + definition.key + "' is read-only";
    return false;
  }

  std::string value;
  if (!NormalizeSettingValue(definition, raw, value, error)) {
    return false;
  }

  const bool is_button = definition.kind == SettingKind::kButton;
  if (!is_button) {
    const std::optional<std::string> stored = ctx.store.Get(definition.key);
    if (stored.has_value() && *stored == value) {
      ctx.log.Debug("setting unchanged", {{"key", definition.key}});
      return true;
    }
  }

  const HandlerFn handler = FindHandler(definition.handler);
  if (handler == nullptr) {
    error = "setting '" + definition.key + "' has no update handler";
    return false;
  }
  if (!handler(definition, value, ctx, error)) {
    ctx.log.Warn("setting update failed", {{"key", definition.key}, {"error", error}});
    return false;
  }

  if (!is_button) {
    ctx.store.Set(definition.key, value);
  }
  outcome.regenerate = definition.regenerates_schema;
  outcome.refetch = definition.refetch;
  outcome.overlay_changed = definition.handler == HandlerId::kOverlaySlotBinding;
  ctx.log.Info("setting applied", {{"key", definition.key}, {"value", value}});
  return true;
}

} // namespace isapisync::settings
