#include "settings/value_seeding.hpp"

#include "settings/schema_synthesizer.hpp"
#include "settings/setting_keys.hpp"
#include "transcode/value_transcoder.hpp"

namespace isapisync::settings {

namespace {

void SeedMotion(const isapi::MotionCapabilities& motion, SettingsStore& store) {
  store.SetBool(keys::kMotionEnabled, motion.enabled);
  store.Set(keys::kMotionSensitivity, std::to_string(motion.sensitivity_level));
  store.SetBool(keys::kMotionCenterNotification, motion.center_notification_enabled);
}

void SeedStreams(const std::vector<isapi::StreamChannel>& streams, SettingsStore& store) {
  for (const isapi::StreamChannel& channel : streams) {
    const isapi::StreamVideo& video = channel.video;
    const std::string& id = channel.id;
    store.Set(keys::Stream(id, "name"), channel.name);
    store.Set(keys::Stream(id, "videoResolution"),
              transcode::ResolutionLabel(video.width, video.height));
    store.Set(keys::Stream(id, "maxFrameRate"), transcode::FrameRateToLabel(video.max_frame_rate));
    store.Set(keys::Stream(id, "videoQualityControlType"), video.quality_control_type);
    store.Set(keys::Stream(id, "bitrate"),
              std::to_string(ActiveBitrate(video, video.quality_control_type).value));
    store.Set(keys::Stream(id, "videoCodecType"), video.codec);
    store.Set(keys::Stream(id, "govLength"),
              std::to_string(
                  transcode::GovLengthToSeconds(video.gov_length.value, video.max_frame_rate)));
    store.Set(keys::Stream(id, "fixedQuality"), transcode::FixedQualityToLabel(video.fixed_quality));
    store.SetBool(keys::Stream(id, "audioEnabled"), channel.audio.enabled);
    if (video.codec == "H.265") {
      store.SetBool(keys::Stream(id, "smartCodecEnabled"), video.smart_codec_enabled);
    }
  }
}

void SeedAudio(const isapi::AudioCapabilities& audio, SettingsStore& store) {
  store.Set(keys::kAudioCodec, audio.codec);
  store.Set(keys::kSpeakerVolume, std::to_string(audio.speaker_volume));
  store.SetBool(keys::kNoiseReduction, audio.noise_reduction);
  store.Set(keys::kAudioInputType, audio.input_type);
}

void SeedTime(const isapi::TimeCapabilities& time, SettingsStore& store) {
  store.Set(keys::kTimeMode, time.time_mode);
  if (time.time_mode == "NTP" && time.has_ntp) {
    store.Set(keys::kNtpServer, time.ntp_address);
    store.Set(keys::kNtpPort, std::to_string(time.ntp_port));
    store.Set(keys::kNtpSyncInterval, transcode::NtpIntervalLabel(time.ntp_interval_minutes));
  }
  if (!time.time_zone.empty()) {
    std::string human;
    if (transcode::WireToHumanTimezone(time.time_zone, human)) {
      store.Set(keys::kTimeZone, human);
    }
  }
  store.SetBool(keys::kDaylightSaving, transcode::WireTimezoneHasDst(time.time_zone));
}

void SeedOsd(const isapi::OsdCapabilities& osd, SettingsStore& store) {
  if (osd.date_time.has_value()) {
    const isapi::DateTimeOverlay& date_time = *osd.date_time;
    store.SetBool(keys::kOsdDateTimeEnabled, date_time.enabled);
    store.Set(keys::kOsdDateStyle, date_time.date_style);
    store.Set(keys::kOsdTimeStyle, date_time.time_style);
    store.SetBool(keys::kOsdDisplayWeek, date_time.display_week);
    store.Set(keys::kOsdDateTimeX, std::to_string(date_time.position_x));
    store.Set(keys::kOsdDateTimeY, std::to_string(date_time.position_y));
  }
  if (osd.channel_name.has_value()) {
    const isapi::ChannelNameOverlay& channel_name = *osd.channel_name;
    store.SetBool(keys::kOsdChannelNameEnabled, channel_name.enabled);
    store.Set(keys::kOsdChannelName, osd.video_input_name);
    store.Set(keys::kOsdChannelNameX, std::to_string(channel_name.position_x));
    store.Set(keys::kOsdChannelNameY, std::to_string(channel_name.position_y));
  }
  for (const isapi::TextOverlay& overlay : osd.text_overlays) {
    store.SetBool(keys::OsdText(overlay.id, "Enabled"), overlay.enabled);
    store.Set(keys::OsdText(overlay.id, "Content"), overlay.display_text);
    store.Set(keys::OsdText(overlay.id, "X"), std::to_string(overlay.position_x));
    store.Set(keys::OsdText(overlay.id, "Y"), std::to_string(overlay.position_y));
  }
}

void SeedPtz(const isapi::PtzCapabilities& ptz, SettingsStore& store) {
  // Presets missing from the device list are reported as disabled.
  for (const std::int64_t id : VisiblePresetIds(ptz)) {
    store.SetBool(keys::PtzPreset(id, "Enabled"), false);
  }
  for (const isapi::PtzPreset& preset : ptz.presets) {
    store.SetBool(keys::PtzPreset(preset.id, "Enabled"), true);
    store.Set(keys::PtzPreset(preset.id, "Name"),
              preset.name.empty() ? "Preset " + std::to_string(preset.id) : preset.name);
  }
}

void SeedDeviceInfo(const isapi::DeviceInfo& info, SettingsStore& store) {
  store.Set(keys::Info("deviceName"), info.device_name);
  store.Set(keys::Info("model"), info.model);
  store.Set(keys::Info("serialNumber"), info.serial_number);
  store.Set(keys::Info("firmwareVersion"), info.firmware_version);
  store.Set(keys::Info("firmwareReleasedDate"), info.firmware_released_date);
  store.Set(keys::Info("macAddress"), info.mac_address);
  store.Set(keys::Info("deviceType"), info.device_type);
}

} // namespace

BitrateRange ActiveBitrate(const isapi::StreamVideo& video,
                           std::string_view quality_control_type) {
  const isapi::RangedValue& source =
      quality_control_type == "VBR" ? video.vbr_upper_cap : video.constant_bit_rate;
  return BitrateRange{.value = source.value, .min = source.min, .max = source.max};
}

void SeedSubsystem(const isapi::Subsystem subsystem, const isapi::CapabilitySet& caps,
                   SettingsStore& store) {
  switch (subsystem) {
  case isapi::Subsystem::kMotion:
    if (caps.motion.has_value()) {
      SeedMotion(*caps.motion, store);
    }
    break;
  case isapi::Subsystem::kStreams:
    if (caps.streams.has_value()) {
      SeedStreams(*caps.streams, store);
    }
    break;
  case isapi::Subsystem::kAudio:
    if (caps.audio.has_value()) {
      SeedAudio(*caps.audio, store);
    }
    break;
  case isapi::Subsystem::kTime:
    if (caps.time.has_value()) {
      SeedTime(*caps.time, store);
    }
    break;
  case isapi::Subsystem::kOsd:
    if (caps.osd.has_value()) {
      SeedOsd(*caps.osd, store);
    }
    break;
  case isapi::Subsystem::kPtz:
    if (caps.ptz.has_value()) {
      SeedPtz(*caps.ptz, store);
    }
    break;
  case isapi::Subsystem::kDeviceInfo:
    if (caps.device_info.has_value()) {
      SeedDeviceInfo(*caps.device_info, store);
    }
    break;
  }
}

void SeedValuesFromCapabilities(const isapi::CapabilitySet& caps, SettingsStore& store) {
  for (const isapi::Subsystem subsystem : isapi::AllSubsystems()) {
    SeedSubsystem(subsystem, caps, store);
  }
}

} // namespace isapisync::settings
