#include "settings/schema_synthesizer.hpp"

#include "overlay/overlay_model.hpp"
#include "settings/setting_keys.hpp"
#include "settings/value_seeding.hpp"
#include "transcode/value_transcoder.hpp"

#include <algorithm>
#include <utility>

namespace isapisync::settings {

namespace {

constexpr std::int64_t kMaxPtzPresets = 32;
constexpr std::int64_t kDefaultOverlaySlots = 8;

const char* const kTrue = "true";

VisibilityRule WhenTrue(std::string key) {
  return VisibilityRule{.depends_on_key = std::move(key), .any_of = {kTrue}, .fallback = "false"};
}

VisibilityRule WhenOneOf(std::string key, std::vector<std::string> values, std::string fallback) {
  return VisibilityRule{
      .depends_on_key = std::move(key), .any_of = std::move(values), .fallback = std::move(fallback)};
}

SettingDefinition Define(std::string_view key, std::string title, std::string subgroup,
                         SettingKind kind, HandlerId handler) {
  SettingDefinition definition;
  definition.key = std::string(key);
  definition.title = std::move(title);
  definition.subgroup = std::move(subgroup);
  definition.kind = kind;
  definition.handler = handler;
  return definition;
}

SettingDefinition RefetchButton(std::string_view key, std::string title, std::string subgroup,
                                isapi::Subsystem subsystem) {
  SettingDefinition button =
      Define(key, std::move(title), std::move(subgroup), SettingKind::kButton, HandlerId::kRefetch);
  button.refetch = subsystem;
  button.regenerates_schema = true;
  return button;
}

void AppendInfo(const isapi::DeviceInfo&, std::vector<SettingDefinition>& out) {
  SettingDefinition name =
      Define(keys::kInfoDeviceName, "Device Name", "Info", SettingKind::kString,
             HandlerId::kDeviceName);
  out.push_back(std::move(name));

  const std::pair<const char*, const char*> readonly_fields[] = {
      {"model", "Model"},
      {"serialNumber", "Serial Number"},
      {"firmwareVersion", "Firmware Version"},
      {"firmwareReleasedDate", "Firmware Date"},
      {"macAddress", "MAC Address"},
      {"deviceType", "Device Type"},
  };
  for (const auto& [field, title] : readonly_fields) {
    SettingDefinition info =
        Define(keys::Info(field), title, "Info", SettingKind::kReadonlyText, HandlerId::kNone);
    info.readonly = true;
    out.push_back(std::move(info));
  }
}

void AppendMotion(const isapi::MotionCapabilities& motion, std::vector<SettingDefinition>& out) {
  out.push_back(Define(keys::kMotionEnabled, "Motion Enabled", "Motion", SettingKind::kBoolean,
                       HandlerId::kMotionEnabled));

  SettingDefinition sensitivity = Define(keys::kMotionSensitivity, "Motion Sensitivity", "Motion",
                                         SettingKind::kString, HandlerId::kMotionSensitivity);
  sensitivity.choices = motion.sensitivity_choices.empty()
                            ? transcode::SensitivityChoices(motion.sensitivity_min,
                                                            motion.sensitivity_max,
                                                            motion.sensitivity_step)
                            : motion.sensitivity_choices;
  sensitivity.description = "Range: " + std::to_string(motion.sensitivity_min) + "-" +
                            std::to_string(motion.sensitivity_max) + ", step " +
                            std::to_string(motion.sensitivity_step);
  out.push_back(std::move(sensitivity));

  SettingDefinition center =
      Define(keys::kMotionCenterNotification, "Send to Notification Center", "Motion",
             SettingKind::kBoolean, HandlerId::kMotionCenterNotification);
  center.description = "Adds or removes the center notification on the motion event trigger";
  out.push_back(std::move(center));

  out.push_back(RefetchButton(keys::kMotionRefetch, "Refetch", "Motion", isapi::Subsystem::kMotion));
}

// Stream settings whose put changes the channel's capability-derived ranges.
SettingDefinition StreamSetting(const std::string& stream_id, std::string_view field,
                                std::string title, SettingKind kind, HandlerId handler,
                                bool reshapes_schema) {
  SettingDefinition definition =
      Define(keys::Stream(stream_id, field), std::move(title), "Stream", kind, handler);
  definition.target_id = stream_id;
  if (reshapes_schema) {
    definition.refetch = isapi::Subsystem::kStreams;
    definition.regenerates_schema = true;
  }
  return definition;
}

void AppendStream(const isapi::StreamChannel& channel, const SettingsStore& store,
                  std::vector<SettingDefinition>& out) {
  const std::string& id = channel.id;
  const isapi::StreamVideo& video = channel.video;
  const std::string suffix = " (Stream " + id + ")";

  SettingDefinition name = StreamSetting(id, "name", "Stream name", SettingKind::kReadonlyText,
                                         HandlerId::kNone, false);
  name.description = id;
  name.readonly = true;
  out.push_back(std::move(name));

  SettingDefinition resolution =
      StreamSetting(id, "videoResolution", "Resolution" + suffix, SettingKind::kString,
                    HandlerId::kStreamResolution, true);
  SettingDefinition frame_rate = StreamSetting(id, "maxFrameRate", "FPS" + suffix,
                                               SettingKind::kString, HandlerId::kStreamFrameRate,
                                               true);
  SettingDefinition quality_control =
      StreamSetting(id, "videoQualityControlType", "Quality Control" + suffix, SettingKind::kString,
                    HandlerId::kStreamQualityControl, true);
  SettingDefinition codec = StreamSetting(id, "videoCodecType", "Video Codec" + suffix,
                                          SettingKind::kString, HandlerId::kStreamCodec, true);
  if (channel.caps.has_value()) {
    const isapi::StreamDynamicCap& caps = *channel.caps;
    for (const isapi::ResolutionOption& option : caps.resolutions) {
      resolution.choices.push_back(transcode::ResolutionLabel(option.width, option.height));
    }
    // Rates sharing a whole-fps label (1550 and 1500) are offered once.
    for (const std::int64_t rate : caps.all_frame_rates) {
      std::string label = transcode::FrameRateToLabel(rate);
      if (std::find(frame_rate.choices.begin(), frame_rate.choices.end(), label) ==
          frame_rate.choices.end()) {
        frame_rate.choices.push_back(std::move(label));
      }
    }
    quality_control.choices = caps.quality_control_types;
    for (const isapi::CodecOption& option : caps.codecs) {
      codec.choices.push_back(option.type);
    }
  }

  // The bitrate range follows the quality control mode the user last chose,
  // which may be ahead of the snapshot until the next refetch.
  const std::string active_mode =
      store.GetOr(keys::Stream(id, "videoQualityControlType"), video.quality_control_type);
  const BitrateRange bitrate_range = ActiveBitrate(video, active_mode);
  SettingDefinition bitrate = StreamSetting(id, "bitrate", "Bitrate kbps" + suffix,
                                            SettingKind::kString, HandlerId::kStreamBitrate, false);
  bitrate.choices = transcode::GenerateBitrateChoices(bitrate_range.min, bitrate_range.max);
  bitrate.description = active_mode == "VBR" ? "Upper cap for variable bitrate"
                                             : "Constant bitrate";

  SettingDefinition gov_length =
      StreamSetting(id, "govLength", "I-Frame Interval" + suffix, SettingKind::kString,
                    HandlerId::kStreamGovLength, false);
  gov_length.choices = transcode::GovLengthSecondChoices(video.gov_length.min, video.gov_length.max,
                                                         video.max_frame_rate);
  if (!gov_length.choices.empty()) {
    gov_length.description = "Min: " + gov_length.choices.front() +
                             "s, Max: " + gov_length.choices.back() + "s (GOP)";
  }

  SettingDefinition fixed_quality =
      StreamSetting(id, "fixedQuality", "Fixed Quality" + suffix, SettingKind::kString,
                    HandlerId::kStreamFixedQuality, false);
  fixed_quality.choices = transcode::FixedQualityChoices();

  SettingDefinition audio = StreamSetting(id, "audioEnabled", "Audio Enabled" + suffix,
                                          SettingKind::kBoolean, HandlerId::kStreamAudioEnabled,
                                          false);

  SettingDefinition smart_codec =
      StreamSetting(id, "smartCodecEnabled", "H.265+ Smart Codec" + suffix, SettingKind::kBoolean,
                    HandlerId::kStreamSmartCodec, false);
  smart_codec.description = "Enable H.265+ for better compression";
  smart_codec.visibility =
      WhenOneOf(keys::Stream(id, "videoCodecType"), {"H.265"}, video.codec);

  out.push_back(std::move(resolution));
  out.push_back(std::move(frame_rate));
  out.push_back(std::move(quality_control));
  out.push_back(std::move(bitrate));
  out.push_back(std::move(codec));
  out.push_back(std::move(gov_length));
  out.push_back(std::move(fixed_quality));
  out.push_back(std::move(audio));
  out.push_back(std::move(smart_codec));
}

void AppendAudio(const isapi::AudioCapabilities& audio, std::vector<SettingDefinition>& out) {
  SettingDefinition codec =
      Define(keys::kAudioCodec, "Audio Codec", "Audio", SettingKind::kString, HandlerId::kAudioCodec);
  codec.choices = audio.codecs;
  out.push_back(std::move(codec));

  SettingDefinition volume = Define(keys::kSpeakerVolume, "Speaker Volume", "Audio",
                                    SettingKind::kString, HandlerId::kAudioSpeakerVolume);
  volume.choices = transcode::SpeakerVolumeChoices(audio.volume_min, audio.volume_max);
  volume.description =
      "Range: " + std::to_string(audio.volume_min) + "-" + std::to_string(audio.volume_max);
  out.push_back(std::move(volume));

  if (audio.supports_noise_reduction) {
    out.push_back(Define(keys::kNoiseReduction, "Noise Reduction", "Audio", SettingKind::kBoolean,
                         HandlerId::kAudioNoiseReduction));
  }

  SettingDefinition input = Define(keys::kAudioInputType, "Audio Input Type", "Audio",
                                   SettingKind::kString, HandlerId::kAudioInputType);
  input.choices = audio.input_types;
  out.push_back(std::move(input));

  out.push_back(RefetchButton(keys::kAudioRefetch, "Refetch", "Audio", isapi::Subsystem::kAudio));
}

void AppendTime(const isapi::TimeCapabilities& time, std::vector<SettingDefinition>& out) {
  SettingDefinition mode =
      Define(keys::kTimeMode, "Time Mode", "Time", SettingKind::kString, HandlerId::kTimeMode);
  mode.choices = time.time_modes;
  mode.description = "Switching to manual sends the current UTC time";
  mode.refetch = isapi::Subsystem::kTime;
  mode.regenerates_schema = true;
  out.push_back(std::move(mode));

  const VisibilityRule ntp_only = WhenOneOf(std::string(keys::kTimeMode), {"NTP"}, time.time_mode);

  SettingDefinition server = Define(keys::kNtpServer, "NTP Server IP", "Time",
                                    SettingKind::kString, HandlerId::kNtpAddress);
  server.description = "IP address of NTP server";
  server.visibility = ntp_only;
  out.push_back(std::move(server));

  SettingDefinition port =
      Define(keys::kNtpPort, "NTP Server Port", "Time", SettingKind::kNumber, HandlerId::kNtpPort);
  port.description = "Port number of NTP server";
  port.visibility = ntp_only;
  out.push_back(std::move(port));

  SettingDefinition interval = Define(keys::kNtpSyncInterval, "NTP Sync Interval", "Time",
                                      SettingKind::kString, HandlerId::kNtpInterval);
  interval.description = "How often to sync with NTP server";
  interval.choices = transcode::NtpIntervalChoices();
  interval.visibility = ntp_only;
  out.push_back(std::move(interval));

  SettingDefinition zone =
      Define(keys::kTimeZone, "Time Zone", "Time", SettingKind::kString, HandlerId::kTimeZone);
  zone.description = "Select timezone offset from UTC";
  zone.choices = transcode::TimezoneChoices();
  out.push_back(std::move(zone));

  SettingDefinition dst = Define(keys::kDaylightSaving, "Daylight Saving Time", "Time",
                                 SettingKind::kBoolean, HandlerId::kDaylightSaving);
  dst.description = "Enable DST";
  out.push_back(std::move(dst));

  out.push_back(RefetchButton(keys::kTimeRefetch, "Refetch", "Time", isapi::Subsystem::kTime));
}

SettingDefinition OsdSetting(std::string_view key, std::string title, SettingKind kind,
                             HandlerId handler, VisibilityRule visibility) {
  SettingDefinition definition = Define(key, std::move(title), "OSD", kind, handler);
  definition.visibility = std::move(visibility);
  return definition;
}

void AppendOsd(const isapi::OsdCapabilities& osd, std::vector<SettingDefinition>& out) {
  const VisibilityRule always;

  out.push_back(OsdSetting(keys::kOsdDateTimeEnabled, "Show Date/Time", SettingKind::kBoolean,
                           HandlerId::kOsdDateTimeEnabled, always));
  const VisibilityRule date_time_on = WhenTrue(std::string(keys::kOsdDateTimeEnabled));

  SettingDefinition date_style = OsdSetting(keys::kOsdDateStyle, "Date Format", SettingKind::kString,
                                            HandlerId::kOsdDateStyle, date_time_on);
  date_style.choices = {"YYYY-MM-DD", "MM-DD-YYYY", "DD-MM-YYYY"};
  out.push_back(std::move(date_style));

  SettingDefinition time_style = OsdSetting(keys::kOsdTimeStyle, "Time Format", SettingKind::kString,
                                            HandlerId::kOsdTimeStyle, date_time_on);
  time_style.choices = {"12hour", "24hour"};
  out.push_back(std::move(time_style));

  out.push_back(OsdSetting(keys::kOsdDisplayWeek, "Show Week Day", SettingKind::kBoolean,
                           HandlerId::kOsdDisplayWeek, date_time_on));
  out.push_back(OsdSetting(keys::kOsdDateTimeX, "Date/Time X Position", SettingKind::kNumber,
                           HandlerId::kOsdDateTimeX, date_time_on));
  out.push_back(OsdSetting(keys::kOsdDateTimeY, "Date/Time Y Position", SettingKind::kNumber,
                           HandlerId::kOsdDateTimeY, date_time_on));

  SettingDefinition channel_enabled =
      OsdSetting(keys::kOsdChannelNameEnabled, "Show Channel Name", SettingKind::kBoolean,
                 HandlerId::kOsdChannelNameEnabled, always);
  channel_enabled.refetch = isapi::Subsystem::kOsd;
  channel_enabled.regenerates_schema = true;
  out.push_back(std::move(channel_enabled));
  const VisibilityRule channel_on = WhenTrue(std::string(keys::kOsdChannelNameEnabled));

  SettingDefinition channel_name = OsdSetting(keys::kOsdChannelName, "Channel Name",
                                              SettingKind::kString, HandlerId::kOsdChannelName,
                                              channel_on);
  channel_name.description =
      "Updates the video input channel name which is used as channel name overlay";
  out.push_back(std::move(channel_name));
  out.push_back(OsdSetting(keys::kOsdChannelNameX, "Channel Name X Position", SettingKind::kNumber,
                           HandlerId::kOsdChannelNameX, channel_on));
  out.push_back(OsdSetting(keys::kOsdChannelNameY, "Channel Name Y Position", SettingKind::kNumber,
                           HandlerId::kOsdChannelNameY, channel_on));

  const std::int64_t capacity = osd.overlay_capacity > 0 ? osd.overlay_capacity : kDefaultOverlaySlots;
  for (std::int64_t index = 1; index <= capacity; ++index) {
    const std::string id = std::to_string(index);
    const std::string label = "Text Overlay " + id;

    SettingDefinition enabled = OsdSetting(keys::OsdText(id, "Enabled"), label + " Enabled",
                                           SettingKind::kBoolean, HandlerId::kOsdTextEnabled,
                                           always);
    enabled.target_id = id;
    enabled.refetch = isapi::Subsystem::kOsd;
    enabled.regenerates_schema = true;
    out.push_back(std::move(enabled));

    const VisibilityRule text_on = WhenTrue(keys::OsdText(id, "Enabled"));
    SettingDefinition content = OsdSetting(keys::OsdText(id, "Content"), label + " Content",
                                           SettingKind::kString, HandlerId::kOsdTextContent,
                                           text_on);
    content.target_id = id;
    out.push_back(std::move(content));

    SettingDefinition x = OsdSetting(keys::OsdText(id, "X"), label + " X", SettingKind::kNumber,
                                     HandlerId::kOsdTextX, text_on);
    x.target_id = id;
    out.push_back(std::move(x));

    SettingDefinition y = OsdSetting(keys::OsdText(id, "Y"), label + " Y", SettingKind::kNumber,
                                     HandlerId::kOsdTextY, text_on);
    y.target_id = id;
    out.push_back(std::move(y));
  }

  out.push_back(
      RefetchButton(keys::kOsdRefetch, "Refetch OSD Settings", "OSD", isapi::Subsystem::kOsd));
}

void AppendOverlaySlots(const std::vector<std::string>& slot_ids, const SettingsStore& store,
                        const SchemaOptions& options, std::vector<SettingDefinition>& out) {
  const std::string text_type = overlay::ToString(overlay::OverlayType::kText);
  const std::string device_type = overlay::ToString(overlay::OverlayType::kDevice);
  const std::string face_type = overlay::ToString(overlay::OverlayType::kFaceDetection);

  for (const std::string& id : slot_ids) {
    const overlay::SlotKeys slot_keys = overlay::KeysForSlot(id);
    const std::string subgroup = "Overlay " + id;
    const overlay::OverlayType type = overlay::ParseOverlayType(store.GetOr(slot_keys.type, text_type));

    SettingDefinition text = Define(slot_keys.text, "Text", subgroup, SettingKind::kString,
                                    HandlerId::kOverlaySlotBinding);
    text.target_id = id;
    text.readonly = type != overlay::OverlayType::kText;
    out.push_back(std::move(text));

    SettingDefinition type_setting = Define(slot_keys.type, "Overlay type", subgroup,
                                            SettingKind::kString, HandlerId::kOverlaySlotBinding);
    type_setting.target_id = id;
    type_setting.choices = {text_type, device_type, face_type};
    type_setting.regenerates_schema = true;
    out.push_back(std::move(type_setting));

    SettingDefinition device = Define(slot_keys.device, "Device", subgroup, SettingKind::kString,
                                      HandlerId::kOverlaySlotBinding);
    device.target_id = id;
    device.choices = options.overlay_device_choices;
    device.visibility = WhenOneOf(slot_keys.type, {device_type}, text_type);
    out.push_back(std::move(device));

    SettingDefinition prefix = Define(slot_keys.prefix, "Value prefix", subgroup,
                                      SettingKind::kString, HandlerId::kOverlaySlotBinding);
    prefix.target_id = id;
    prefix.visibility = WhenOneOf(slot_keys.type, {device_type, face_type}, text_type);
    out.push_back(std::move(prefix));
  }
}

void AppendPtz(const isapi::PtzCapabilities& ptz, std::vector<SettingDefinition>& out) {
  for (const std::int64_t preset_id : VisiblePresetIds(ptz)) {
    const std::string id = std::to_string(preset_id);

    SettingDefinition enabled =
        Define(keys::PtzPreset(preset_id, "Enabled"), "Preset " + id + " Enabled", "PTZ",
               SettingKind::kBoolean, HandlerId::kPtzPresetEnabled);
    enabled.target_id = id;
    enabled.refetch = isapi::Subsystem::kPtz;
    enabled.regenerates_schema = true;
    out.push_back(std::move(enabled));

    const VisibilityRule preset_on = WhenTrue(keys::PtzPreset(preset_id, "Enabled"));

    SettingDefinition name = Define(keys::PtzPreset(preset_id, "Name"), "Preset " + id + " Name",
                                    "PTZ", SettingKind::kString, HandlerId::kPtzPresetName);
    name.description = "Updating name also sets preset to CURRENT position";
    name.target_id = id;
    name.visibility = preset_on;
    out.push_back(std::move(name));

    SettingDefinition go = Define(keys::PtzPreset(preset_id, "Go"), "Go to Preset " + id, "PTZ",
                                  SettingKind::kButton, HandlerId::kPtzPresetGoto);
    go.target_id = id;
    go.visibility = preset_on;
    out.push_back(std::move(go));
  }

  out.push_back(
      RefetchButton(keys::kPtzRefetch, "Refetch PTZ Settings", "PTZ", isapi::Subsystem::kPtz));
}

} // namespace

std::vector<std::string> OverlaySlotIds(const isapi::CapabilitySet& caps) {
  std::int64_t capacity = kDefaultOverlaySlots;
  if (caps.osd.has_value() && caps.osd->overlay_capacity > 0) {
    capacity = caps.osd->overlay_capacity;
  }
  std::vector<std::string> ids;
  ids.reserve(static_cast<std::size_t>(capacity));
  for (std::int64_t id = 1; id <= capacity; ++id) {
    ids.push_back(std::to_string(id));
  }
  return ids;
}

std::vector<std::int64_t> VisiblePresetIds(const isapi::PtzCapabilities& ptz) {
  const std::int64_t limit = std::min<std::int64_t>(
      ptz.max_preset_number > 0 ? ptz.max_preset_number : kMaxPtzPresets, kMaxPtzPresets);
  std::vector<std::int64_t> ids;
  for (std::int64_t id = 1; id <= limit; ++id) {
    if (std::find(ptz.special_numbers.begin(), ptz.special_numbers.end(), id) !=
        ptz.special_numbers.end()) {
      continue;
    }
    ids.push_back(id);
  }
  return ids;
}

std::vector<SettingDefinition> SynthesizeSchema(const isapi::CapabilitySet& caps,
                                                const SettingsStore& store,
                                                const SchemaOptions& options) {
  std::vector<SettingDefinition> out;

  if (caps.device_info.has_value()) {
    AppendInfo(*caps.device_info, out);
  }
  if (caps.motion.has_value()) {
    AppendMotion(*caps.motion, out);
  }
  if (caps.streams.has_value()) {
    for (const isapi::StreamChannel& channel : *caps.streams) {
      AppendStream(channel, store, out);
    }
    out.push_back(
        RefetchButton(keys::kStreamsRefetch, "Refetch", "Stream", isapi::Subsystem::kStreams));
  }
  if (caps.audio.has_value()) {
    AppendAudio(*caps.audio, out);
  }
  if (caps.time.has_value()) {
    AppendTime(*caps.time, out);
  }
  if (caps.osd.has_value()) {
    AppendOsd(*caps.osd, out);
  }
  AppendOverlaySlots(OverlaySlotIds(caps), store, options, out);
  if (caps.ptz.has_value()) {
    AppendPtz(*caps.ptz, out);
  }
  return out;
}

bool IsVisible(const SettingDefinition& definition, const SettingsStore& store) {
  const VisibilityRule& rule = definition.visibility;
  if (rule.Always()) {
    return true;
  }
  const std::string current = store.GetOr(rule.depends_on_key, rule.fallback);
  return std::find(rule.any_of.begin(), rule.any_of.end(), current) != rule.any_of.end();
}

SettingView MakeView(const SettingDefinition& definition, const SettingsStore& store) {
  return SettingView{
      .key = definition.key,
      .title = definition.title,
      .description = definition.description,
      .subgroup = definition.subgroup,
      .kind = definition.kind,
      .choices = definition.choices,
      .value = definition.kind == SettingKind::kButton ? std::string() : store.GetOr(definition.key, ""),
      .readonly = definition.readonly || definition.kind == SettingKind::kReadonlyText,
  };
}

} // namespace isapisync::settings
