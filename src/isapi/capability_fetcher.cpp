#include "isapi/capability_fetcher.hpp"

#include "core/string_utils.hpp"
#include "isapi/endpoints.hpp"
#include "transcode/value_transcoder.hpp"
#include "wire/xml_document.hpp"

#include <algorithm>
#include <functional>
#include <type_traits>
#include <utility>

namespace isapisync::isapi {

namespace {

constexpr std::int64_t kDefaultOverlayCapacity = 8;

RangedValue ReadRanged(const pugi::xml_node& parent, std::string_view tag,
                       const RangedValue& defaults) {
  const wire::LeafValue leaf = wire::ReadLeaf(parent, tag);
  if (!leaf.present) {
    return defaults;
  }
  return RangedValue{
      .value = leaf.AsInt(0),
      .min = leaf.min.value_or(defaults.min),
      .max = leaf.max.value_or(defaults.max),
  };
}

bool OptContains(const wire::LeafValue& leaf, std::string_view wanted) {
  return std::find(leaf.opt.begin(), leaf.opt.end(), wanted) != leaf.opt.end();
}

template <typename Fn>
void ForEachChild(const pugi::xml_node& parent, const char* tag, Fn&& fn) {
  if (!parent) {
    return;
  }
  for (pugi::xml_node node = parent.child(tag); node; node = node.next_sibling(tag)) {
    fn(node);
  }
}

} // namespace

void DecodeMotionCapabilities(const pugi::xml_node& caps_root, MotionCapabilities& motion) {
  motion.enabled = wire::ChildBool(caps_root, "enabled");
  const wire::LeafValue level =
      wire::ReadLeaf(caps_root.child("MotionDetectionLayout"), "sensitivityLevel");
  motion.sensitivity_min = level.min.value_or(0);
  motion.sensitivity_max = level.max.value_or(100);
  motion.sensitivity_step = level.step.value_or(20);
  motion.sensitivity_level = level.AsInt(0);
  motion.sensitivity_choices = transcode::SensitivityChoices(
      motion.sensitivity_min, motion.sensitivity_max, motion.sensitivity_step);
}

void DecodeMotionDetection(const pugi::xml_node& value_root, MotionCapabilities& motion) {
  const wire::LeafValue enabled = wire::ReadLeaf(value_root, "enabled");
  if (enabled.present) {
    motion.enabled = enabled.AsBool();
  }
  const wire::LeafValue level =
      wire::ReadLeaf(value_root.child("MotionDetectionLayout"), "sensitivityLevel");
  if (level.present) {
    motion.sensitivity_level = level.AsInt(motion.sensitivity_level);
  }
}

bool HasCenterNotification(const pugi::xml_node& trigger_root) {
  bool found = false;
  ForEachChild(trigger_root.child("EventTriggerNotificationList"), "EventTriggerNotification",
               [&](const pugi::xml_node& notification) {
                 if (wire::ChildText(notification, "notificationMethod") == "center") {
                   found = true;
                 }
               });
  return found;
}

std::vector<StreamChannel> DecodeStreamingChannelList(const pugi::xml_node& list_root) {
  std::vector<StreamChannel> channels;
  ForEachChild(list_root, "StreamingChannel", [&](const pugi::xml_node& node) {
    StreamChannel channel;
    channel.id = wire::ChildText(node, "id");
    channel.name = wire::ChildText(node, "channelName");
    channel.enabled = wire::ChildBool(node, "enabled");

    const pugi::xml_node audio = node.child("Audio");
    channel.audio.enabled = wire::ChildBool(audio, "enabled");
    channel.audio.input_channel_id = wire::ChildInt(audio, "audioInputChannelID", 0);
    channel.audio.compression = wire::ChildText(audio, "audioCompressionType");

    const pugi::xml_node video = node.child("Video");
    StreamVideo& out = channel.video;
    out.enabled = wire::ChildBool(video, "enabled");
    out.codec = wire::ChildText(video, "videoCodecType");
    out.width = wire::ChildInt(video, "videoResolutionWidth", 0);
    out.height = wire::ChildInt(video, "videoResolutionHeight", 0);
    out.max_frame_rate = wire::ChildInt(video, "maxFrameRate", 0);
    out.quality_control_type = wire::ChildText(video, "videoQualityControlType");
    out.constant_bit_rate = ReadRanged(video, "constantBitRate", out.constant_bit_rate);
    out.vbr_upper_cap = ReadRanged(video, "vbrUpperCap", out.vbr_upper_cap);
    out.fixed_quality = wire::ChildInt(video, "fixedQuality", 0);
    out.gov_length = ReadRanged(video, "GovLength", out.gov_length);
    out.smoothing = wire::ChildInt(video, "smoothing", 0);
    out.h264_profile = wire::ChildText(video, "H264Profile");
    out.h265_profile = wire::ChildText(video, "H265Profile");
    out.smart_codec_enabled = wire::ChildBool(video.child("SmartCodec"), "enabled");

    if (!channel.id.empty()) {
      channels.push_back(std::move(channel));
    }
  });
  return channels;
}

StreamDynamicCap DecodeDynamicCap(const pugi::xml_node& cap_root) {
  StreamDynamicCap cap;
  ForEachChild(cap_root.child("ResolutionAvailableDscriptorList"),
               "ResolutionAvailableDscriptor", [&](const pugi::xml_node& node) {
                 ResolutionOption option;
                 option.width = wire::ChildInt(node, "videoResolutionWidth", 0);
                 option.height = wire::ChildInt(node, "videoResolutionHeight", 0);
                 for (const std::string& item :
                      wire::SplitOptList(wire::ChildText(node, "supportedFrameRate"))) {
                   std::int64_t rate = 0;
                   if (core::ParseInt64(item, rate)) {
                     option.frame_rates.push_back(rate);
                   }
                 }
                 cap.resolutions.push_back(std::move(option));
               });

  ForEachChild(cap_root.child("CodecParamDscriptorList"), "CodecParamDscriptor",
               [&](const pugi::xml_node& node) {
                 CodecOption codec;
                 codec.type = wire::ChildText(node, "videoCodecType");
                 codec.supports_profile = wire::ChildBool(node, "isSupportProfile");
                 codec.cbr_supported = wire::ChildBool(node.child("CBRCap"), "isSupportSmooth");
                 codec.vbr_supported = wire::ChildBool(node.child("VBRCap"), "isSupportSmooth");
                 codec.smart_codec = static_cast<bool>(node.child("SmartCodecCap"));
                 cap.codecs.push_back(std::move(codec));
               });

  for (const ResolutionOption& option : cap.resolutions) {
    cap.all_frame_rates.insert(cap.all_frame_rates.end(), option.frame_rates.begin(),
                               option.frame_rates.end());
  }
  std::sort(cap.all_frame_rates.begin(), cap.all_frame_rates.end(), std::greater<>());
  cap.all_frame_rates.erase(std::unique(cap.all_frame_rates.begin(), cap.all_frame_rates.end()),
                            cap.all_frame_rates.end());

  auto add_type = [&](const char* type) {
    if (std::find(cap.quality_control_types.begin(), cap.quality_control_types.end(), type) ==
        cap.quality_control_types.end()) {
      cap.quality_control_types.emplace_back(type);
    }
  };
  for (const CodecOption& codec : cap.codecs) {
    if (codec.vbr_supported) {
      add_type("VBR");
    }
    if (codec.cbr_supported) {
      add_type("CBR");
    }
  }
  return cap;
}

void DecodeTwoWayAudioCapabilities(const pugi::xml_node& caps_root, AudioCapabilities& audio) {
  audio.codecs = wire::ReadLeaf(caps_root, "audioCompressionType").opt;
  audio.input_types = wire::ReadLeaf(caps_root, "audioInputType").opt;
  const wire::LeafValue volume = wire::ReadLeaf(caps_root, "speakerVolume");
  audio.volume_min = volume.min.value_or(0);
  audio.volume_max = volume.max.value_or(100);
  audio.supports_noise_reduction = OptContains(wire::ReadLeaf(caps_root, "noisereduce"), "true");
}

void DecodeTwoWayAudio(const pugi::xml_node& value_root, AudioCapabilities& audio) {
  audio.enabled = wire::ChildBool(value_root, "enabled");
  audio.codec = wire::ChildText(value_root, "audioCompressionType");
  audio.speaker_volume = wire::ChildInt(value_root, "speakerVolume", 0);
  audio.noise_reduction = wire::ChildBool(value_root, "noisereduce");
  audio.input_type = wire::ChildText(value_root, "audioInputType");
}

void DecodeTimeCapabilities(const pugi::xml_node& caps_root, TimeCapabilities& time) {
  time.time_modes = wire::ReadLeaf(caps_root, "timeMode").opt;
}

void DecodeTime(const pugi::xml_node& value_root, TimeCapabilities& time) {
  time.time_mode = wire::ChildText(value_root, "timeMode");
  time.local_time = wire::ChildText(value_root, "localTime");
  time.time_zone = wire::ChildText(value_root, "timeZone");
}

void DecodeNtpServer(const pugi::xml_node& ntp_root, TimeCapabilities& time) {
  time.has_ntp = true;
  time.ntp_address = wire::ChildText(ntp_root, "ipAddress");
  if (time.ntp_address.empty()) {
    time.ntp_address = wire::ChildText(ntp_root, "hostName");
  }
  time.ntp_port = wire::ChildInt(ntp_root, "portNo", 123);
  time.ntp_interval_minutes = wire::ChildInt(ntp_root, "synchronizeInterval", 60);
}

void DecodeOverlayCapabilities(const pugi::xml_node& caps_root, OsdCapabilities& osd) {
  const pugi::xml_node list = caps_root.child("TextOverlayList");
  const long long size = list ? list.attribute("size").as_llong(0) : 0;
  osd.overlay_capacity = size > 0 ? size : kDefaultOverlayCapacity;
}

void DecodeOverlays(const pugi::xml_node& value_root, OsdCapabilities& osd) {
  const pugi::xml_node screen = value_root.child("normalizedScreenSize");
  osd.screen_width = wire::ChildInt(screen, "normalizedScreenWidth", 704);
  osd.screen_height = wire::ChildInt(screen, "normalizedScreenHeight", 576);

  osd.text_overlays.clear();
  ForEachChild(value_root.child("TextOverlayList"), "TextOverlay",
               [&](const pugi::xml_node& node) {
                 TextOverlay overlay;
                 overlay.id = wire::ChildText(node, "id");
                 overlay.enabled = wire::ChildBool(node, "enabled");
                 overlay.display_text = wire::ChildText(node, "displayText");
                 overlay.position_x = wire::ChildInt(node, "positionX", 0);
                 overlay.position_y = wire::ChildInt(node, "positionY", 0);
                 if (!overlay.id.empty()) {
                   osd.text_overlays.push_back(std::move(overlay));
                 }
               });

  if (const pugi::xml_node date_time = value_root.child("DateTimeOverlay")) {
    osd.date_time = DateTimeOverlay{
        .enabled = wire::ChildBool(date_time, "enabled"),
        .date_style = wire::ChildText(date_time, "dateStyle"),
        .time_style = wire::ChildText(date_time, "timeStyle"),
        .display_week = wire::ChildBool(date_time, "displayWeek"),
        .position_x = wire::ChildInt(date_time, "positionX", 0),
        .position_y = wire::ChildInt(date_time, "positionY", 0),
    };
  } else {
    osd.date_time.reset();
  }

  if (const pugi::xml_node channel_name = value_root.child("channelNameOverlay")) {
    osd.channel_name = ChannelNameOverlay{
        .enabled = wire::ChildBool(channel_name, "enabled"),
        .position_x = wire::ChildInt(channel_name, "positionX", 0),
        .position_y = wire::ChildInt(channel_name, "positionY", 0),
    };
  } else {
    osd.channel_name.reset();
  }
}

void DecodePtzCapabilities(const pugi::xml_node& caps_root, PtzCapabilities& ptz) {
  ptz.max_preset_number = wire::ChildInt(caps_root, "maxPresetNum", 0);
  ptz.special_numbers.clear();
  for (const std::string& item :
       wire::ReadLeaf(caps_root.child("PresetNameCap"), "specialNo").opt) {
    std::int64_t number = 0;
    if (core::ParseInt64(item, number)) {
      ptz.special_numbers.push_back(number);
    }
  }
}

void DecodePtzPresets(const pugi::xml_node& list_root, PtzCapabilities& ptz) {
  ptz.presets.clear();
  ForEachChild(list_root, "PTZPreset", [&](const pugi::xml_node& node) {
    const std::int64_t id = wire::ChildInt(node, "id", 0);
    if (id > 0) {
      ptz.presets.push_back(PtzPreset{.id = id, .name = wire::ChildText(node, "presetName")});
    }
  });
}

DeviceInfo DecodeDeviceInfo(const pugi::xml_node& info_root) {
  return DeviceInfo{
      .device_name = wire::ChildText(info_root, "deviceName"),
      .model = wire::ChildText(info_root, "model"),
      .serial_number = wire::ChildText(info_root, "serialNumber"),
      .mac_address = wire::ChildText(info_root, "macAddress"),
      .firmware_version = wire::ChildText(info_root, "firmwareVersion"),
      .firmware_released_date = wire::ChildText(info_root, "firmwareReleasedDate"),
      .device_type = wire::ChildText(info_root, "deviceType"),
  };
}

CapabilityFetcher::CapabilityFetcher(IsapiClient& client, std::string stream_channel,
                                     core::logging::CameraLog log)
    : client_(&client),
      stream_channel_(stream_channel.empty() ? std::string(endpoints::kDefaultStreamChannel)
                                             : std::move(stream_channel)),
      input_channel_(endpoints::VideoInputChannel(stream_channel_)),
      log_(std::move(log)) {}

bool CapabilityFetcher::FetchMotion(MotionCapabilities& motion, std::string& error) {
  pugi::xml_document caps_doc;
  std::string raw;
  if (!client_->GetDocument(endpoints::MotionCapabilities(input_channel_),
                            "fetch motion capabilities", caps_doc, raw, error)) {
    return false;
  }
  MotionCapabilities decoded;
  DecodeMotionCapabilities(wire::RootElement(caps_doc), decoded);

  pugi::xml_document value_doc;
  if (!client_->GetDocument(endpoints::MotionDetection(input_channel_), "fetch motion detection",
                            value_doc, raw, error)) {
    return false;
  }
  DecodeMotionDetection(wire::RootElement(value_doc), decoded);

  pugi::xml_document trigger_doc;
  std::string trigger_error;
  if (client_->GetDocument(endpoints::kMotionTrigger, "fetch motion trigger", trigger_doc, raw,
                           trigger_error)) {
    decoded.center_notification_enabled = HasCenterNotification(wire::RootElement(trigger_doc));
  } else {
    log_.Warn("motion trigger unavailable", {{"error", trigger_error}});
  }

  motion = std::move(decoded);
  return true;
}

bool CapabilityFetcher::FetchDynamicCap(const std::string& channel_id, StreamDynamicCap& cap,
                                        std::string& error) {
  pugi::xml_document doc;
  std::string raw;
  if (!client_->GetDocument(endpoints::DynamicCap(channel_id), "fetch stream dynamic capability",
                            doc, raw, error)) {
    return false;
  }
  cap = DecodeDynamicCap(wire::RootElement(doc));
  return true;
}

bool CapabilityFetcher::FetchStreams(std::vector<StreamChannel>& streams, std::string& error) {
  pugi::xml_document doc;
  std::string raw;
  if (!client_->GetDocument(endpoints::kStreamingChannels, "fetch streaming channels", doc, raw,
                            error)) {
    return false;
  }

  std::vector<StreamChannel> decoded = DecodeStreamingChannelList(wire::RootElement(doc));
  for (StreamChannel& channel : decoded) {
    StreamDynamicCap cap;
    std::string cap_error;
    if (FetchDynamicCap(channel.id, cap, cap_error)) {
      channel.caps = std::move(cap);
    } else {
      log_.Warn("stream dynamic capability unavailable",
                {{"stream", channel.id}, {"error", cap_error}});
    }
  }
  streams = std::move(decoded);
  return true;
}

bool CapabilityFetcher::FetchAudio(AudioCapabilities& audio, std::string& error) {
  pugi::xml_document caps_doc;
  std::string raw;
  if (!client_->GetDocument(endpoints::kTwoWayAudioCapabilities,
                            "fetch two-way audio capabilities", caps_doc, raw, error)) {
    return false;
  }
  AudioCapabilities decoded;
  DecodeTwoWayAudioCapabilities(wire::RootElement(caps_doc), decoded);

  pugi::xml_document value_doc;
  if (!client_->GetDocument(endpoints::kTwoWayAudio, "fetch two-way audio", value_doc, raw,
                            error)) {
    return false;
  }
  DecodeTwoWayAudio(wire::RootElement(value_doc), decoded);
  audio = std::move(decoded);
  return true;
}

bool CapabilityFetcher::FetchTime(TimeCapabilities& time, std::string& error) {
  pugi::xml_document caps_doc;
  std::string raw;
  if (!client_->GetDocument(endpoints::kTimeCapabilities, "fetch time capabilities", caps_doc,
                            raw, error)) {
    return false;
  }
  TimeCapabilities decoded;
  DecodeTimeCapabilities(wire::RootElement(caps_doc), decoded);

  pugi::xml_document value_doc;
  if (!client_->GetDocument(endpoints::kTime, "fetch time", value_doc, raw, error)) {
    return false;
  }
  DecodeTime(wire::RootElement(value_doc), decoded);

  pugi::xml_document ntp_doc;
  std::string ntp_error;
  if (client_->GetDocument(endpoints::kNtpServer, "fetch ntp server", ntp_doc, raw, ntp_error)) {
    DecodeNtpServer(wire::RootElement(ntp_doc), decoded);
  } else {
    log_.Warn("ntp server unavailable", {{"error", ntp_error}});
  }

  time = std::move(decoded);
  return true;
}

bool CapabilityFetcher::FetchOsd(OsdCapabilities& osd, std::string& error) {
  pugi::xml_document caps_doc;
  std::string raw;
  if (!client_->GetDocument(endpoints::kOverlayCapabilities, "fetch overlay capabilities",
                            caps_doc, raw, error)) {
    return false;
  }
  OsdCapabilities decoded;
  DecodeOverlayCapabilities(wire::RootElement(caps_doc), decoded);

  pugi::xml_document value_doc;
  if (!client_->GetDocument(endpoints::kOverlays, "fetch overlays", value_doc, raw, error)) {
    return false;
  }
  DecodeOverlays(wire::RootElement(value_doc), decoded);

  pugi::xml_document input_doc;
  std::string input_error;
  if (client_->GetDocument(endpoints::VideoInput(input_channel_), "fetch video input channel",
                           input_doc, raw, input_error)) {
    decoded.video_input_name = wire::ChildText(wire::RootElement(input_doc), "name");
  } else {
    log_.Warn("video input channel unavailable", {{"error", input_error}});
  }

  osd = std::move(decoded);
  return true;
}

bool CapabilityFetcher::FetchPtz(PtzCapabilities& ptz, std::string& error) {
  pugi::xml_document caps_doc;
  std::string raw;
  if (!client_->GetDocument(endpoints::kPtzCapabilities, "fetch ptz capabilities", caps_doc, raw,
                            error)) {
    return false;
  }
  PtzCapabilities decoded;
  DecodePtzCapabilities(wire::RootElement(caps_doc), decoded);

  pugi::xml_document presets_doc;
  if (!client_->GetDocument(endpoints::kPtzPresets, "fetch ptz presets", presets_doc, raw,
                            error)) {
    return false;
  }
  DecodePtzPresets(wire::RootElement(presets_doc), decoded);
  ptz = std::move(decoded);
  return true;
}

bool CapabilityFetcher::FetchDeviceInfo(DeviceInfo& info, std::string& error) {
  pugi::xml_document doc;
  std::string raw;
  if (!client_->GetDocument(endpoints::kDeviceInfo, "fetch device info", doc, raw, error)) {
    return false;
  }
  info = DecodeDeviceInfo(wire::RootElement(doc));
  return true;
}

bool CapabilityFetcher::Fetch(const Subsystem subsystem, CapabilitySet& set, std::string& error) {
  // Decodes into a fresh value and publishes it only on success.
  auto load = [&](auto& member, auto fetch_fn) {
    typename std::decay_t<decltype(member)>::value_type value{};
    if (!(this->*fetch_fn)(value, error)) {
      member.reset();
      return false;
    }
    member = std::move(value);
    return true;
  };

  bool ok = false;
  switch (subsystem) {
  case Subsystem::kMotion:
    ok = load(set.motion, &CapabilityFetcher::FetchMotion);
    break;
  case Subsystem::kStreams:
    ok = load(set.streams, &CapabilityFetcher::FetchStreams);
    break;
  case Subsystem::kAudio:
    ok = load(set.audio, &CapabilityFetcher::FetchAudio);
    break;
  case Subsystem::kTime:
    ok = load(set.time, &CapabilityFetcher::FetchTime);
    break;
  case Subsystem::kOsd:
    ok = load(set.osd, &CapabilityFetcher::FetchOsd);
    break;
  case Subsystem::kPtz:
    ok = load(set.ptz, &CapabilityFetcher::FetchPtz);
    break;
  case Subsystem::kDeviceInfo:
    ok = load(set.device_info, &CapabilityFetcher::FetchDeviceInfo);
    break;
  }

  if (!ok) {
    LogFetchFailure(subsystem, error);
  }
  return ok;
}

int CapabilityFetcher::FetchAll(CapabilitySet& set) {
  int loaded = 0;
  for (const Subsystem subsystem : AllSubsystems()) {
    std::string error;
    if (Fetch(subsystem, set, error)) {
      ++loaded;
    }
  }
  log_.Info("capabilities fetched", {{"loaded", std::to_string(loaded)},
                                     {"total", std::to_string(AllSubsystems().size())}});
  return loaded;
}

bool CapabilityFetcher::Refresh(const Subsystem subsystem, const CapabilitySet& current,
                                CapabilitySet& next, std::string& error) {
  next = current;
  if (Fetch(subsystem, next, error)) {
    return true;
  }
  if (subsystem != Subsystem::kPtz) {
    // Keep the last-known snapshot for everything but PTZ.
    next = current;
  }
  return false;
}

void CapabilityFetcher::LogFetchFailure(const Subsystem subsystem,
                                        const std::string& error) const {
  if (subsystem == Subsystem::kPtz) {
    log_.Info("ptz not available", {{"subsystem", ToString(subsystem)}, {"error", error}});
    return;
  }
  log_.Warn("capability fetch failed", {{"subsystem", ToString(subsystem)}, {"error", error}});
}

} // namespace isapisync::isapi
