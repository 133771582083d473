#include "isapi/config_writer.hpp"

#include "core/string_utils.hpp"
#include "isapi/endpoints.hpp"
#include "transport/error_mapper.hpp"
#include "wire/xml_document.hpp"

#include <utility>

namespace isapisync::isapi {

namespace {

constexpr const char* kOverlayListCapacity = "8";
constexpr const char* kPtzPresetNamespace = "http://www.isapi.org/ver20/XMLSchema";

using Scopes = std::vector<wire::PatchScope>;

class TargetList {
public:
  void Add(const Scopes& scopes, std::string leaf, const std::optional<std::string>& value) {
    if (value.has_value()) {
      targets_.push_back(wire::PatchTarget{
          .path = wire::FieldPath{.scopes = scopes, .leaf = std::move(leaf)},
          .value = *value,
      });
    }
  }

  void Add(const Scopes& scopes, std::string leaf, const std::optional<std::int64_t>& value) {
    if (value.has_value()) {
      Add(scopes, std::move(leaf), std::optional<std::string>(std::to_string(*value)));
    }
  }

  void Add(const Scopes& scopes, std::string leaf, const std::optional<bool>& value) {
    if (value.has_value()) {
      Add(scopes, std::move(leaf), std::optional<std::string>(core::BoolText(*value)));
    }
  }

  const std::vector<wire::PatchTarget>& targets() const {
    return targets_;
  }

private:
  std::vector<wire::PatchTarget> targets_;
};

std::string JoinList(const std::vector<std::string>& items) {
  std::string joined;
  for (const std::string& item : items) {
    if (!joined.empty()) {
      joined += ",";
    }
    joined += item;
  }
  return joined;
}

void SetBool(pugi::xml_node& node, const char* tag, const std::optional<bool>& value) {
  if (value.has_value()) {
    wire::SetChildText(node, tag, core::BoolText(*value));
  }
}

void SetInt(pugi::xml_node& node, const char* tag, const std::optional<std::int64_t>& value) {
  if (value.has_value()) {
    wire::SetChildText(node, tag, std::to_string(*value));
  }
}

void SetString(pugi::xml_node& node, const char* tag, const std::optional<std::string>& value) {
  if (value.has_value()) {
    wire::SetChildText(node, tag, *value);
  }
}

void StripRootAttributes(pugi::xml_node& root) {
  root.remove_attribute("version");
  root.remove_attribute("xmlns");
}

// Applies the OSD field set to a parsed VideoOverlay tree.
void ApplyOsdUpdate(pugi::xml_node& root, const OsdUpdate& update) {
  if (update.date_time.has_value()) {
    if (pugi::xml_node node = root.child("DateTimeOverlay")) {
      const DateTimeOverlayUpdate& fields = *update.date_time;
      SetBool(node, "enabled", fields.enabled);
      SetString(node, "dateStyle", fields.date_style);
      SetString(node, "timeStyle", fields.time_style);
      SetBool(node, "displayWeek", fields.display_week);
      SetInt(node, "positionX", fields.position_x);
      SetInt(node, "positionY", fields.position_y);
    }
  }

  if (update.channel_name.has_value()) {
    if (pugi::xml_node node = root.child("channelNameOverlay")) {
      const ChannelNameOverlayUpdate& fields = *update.channel_name;
      SetBool(node, "enabled", fields.enabled);
      SetInt(node, "positionX", fields.position_x);
      SetInt(node, "positionY", fields.position_y);
    }
  }

  if (!update.text_overlays.empty()) {
    pugi::xml_node list = root.child("TextOverlayList");
    if (!list) {
      list = root.append_child("TextOverlayList");
      list.append_attribute("size").set_value(kOverlayListCapacity);
    }
    for (const TextOverlayUpdate& fields : update.text_overlays) {
      pugi::xml_node overlay = wire::FindChildByKey(list, "TextOverlay", "id", fields.id);
      if (!overlay) {
        overlay = list.append_child("TextOverlay");
        wire::SetChildText(overlay, "id", fields.id);
        wire::SetChildText(overlay, "enabled", "false");
        wire::SetChildText(overlay, "positionX", "0");
        wire::SetChildText(overlay, "positionY", "0");
        wire::SetChildText(overlay, "displayText", "");
        wire::SetChildText(overlay, "isPersistentText", "true");
      }
      SetBool(overlay, "enabled", fields.enabled);
      SetString(overlay, "displayText", fields.display_text);
      SetInt(overlay, "positionX", fields.position_x);
      SetInt(overlay, "positionY", fields.position_y);
    }
  }

  StripRootAttributes(root);
}

} // namespace

ConfigWriter::ConfigWriter(IsapiClient& client, std::string stream_channel,
                           core::logging::CameraLog log)
    : client_(&client),
      stream_channel_(stream_channel.empty() ? std::string(endpoints::kDefaultStreamChannel)
                                             : std::move(stream_channel)),
      input_channel_(endpoints::VideoInputChannel(stream_channel_)),
      log_(std::move(log)) {}

bool ConfigWriter::PutLogged(const std::string& path, const std::string& body,
                             std::string_view operation, std::string_view fields,
                             std::string& error) {
  log_.Info("device write", {{"operation", operation}, {"endpoint", path}, {"fields", fields}});
  if (!client_->PutText(path, body, operation, error)) {
    log_.Warn("device write failed", {{"operation", operation}, {"error", error}});
    return false;
  }
  return true;
}

bool ConfigWriter::PatchAndPut(const std::string& get_path, const std::string& put_path,
                               std::string_view operation,
                               const std::vector<wire::PatchTarget>& targets, std::string& error) {
  if (targets.empty()) {
    return true;
  }

  std::string raw;
  if (!client_->GetText(get_path, operation, raw, error)) {
    return false;
  }

  wire::PatchResult result;
  std::string patch_error;
  if (!wire::PatchText(raw, targets, result, patch_error)) {
    error = transport::FormatDeviceError(operation, 0, "xml parse failed: " + patch_error);
    return false;
  }
  if (!result.missed.empty()) {
    log_.Warn("patch targets not found", {{"operation", operation},
                                          {"endpoint", get_path},
                                          {"missed", JoinList(result.missed)}});
  }
  if (!result.AnyApplied()) {
    log_.Warn("write skipped, no field matched", {{"operation", operation}});
    return true;
  }
  return PutLogged(put_path, result.text, operation, JoinList(result.applied), error);
}

bool ConfigWriter::UpdateMotionDetection(const MotionDetectionUpdate& update,
                                         std::string& error) {
  TargetList targets;
  targets.Add({{.block_tag = "MotionDetection"}}, "enabled", update.enabled);
  targets.Add({{.block_tag = "MotionDetectionLayout"}}, "sensitivityLevel",
              update.sensitivity_level);
  const std::string path = endpoints::MotionDetection(input_channel_);
  return PatchAndPut(path, path, "update motion detection", targets.targets(), error);
}

bool ConfigWriter::UpdateMotionTrigger(const bool center_notification_enabled,
                                       std::string& error) {
  constexpr std::string_view kOperation = "update motion trigger";
  const std::string path(endpoints::kMotionTrigger);

  pugi::xml_document doc;
  std::string raw;
  if (!client_->GetDocument(path, kOperation, doc, raw, error)) {
    return false;
  }

  pugi::xml_node root = wire::RootElement(doc);
  pugi::xml_node list = root.child("EventTriggerNotificationList");
  if (!list) {
    list = root.append_child("EventTriggerNotificationList");
  }

  for (pugi::xml_node notification = list.child("EventTriggerNotification"); notification;) {
    pugi::xml_node next = notification.next_sibling("EventTriggerNotification");
    if (wire::ChildText(notification, "notificationMethod") == "center") {
      list.remove_child(notification);
    } else {
      notification.remove_child("notificationRecurrence");
    }
    notification = next;
  }

  if (center_notification_enabled) {
    pugi::xml_node center = list.append_child("EventTriggerNotification");
    wire::SetChildText(center, "id", "center");
    wire::SetChildText(center, "notificationMethod", "center");
  }

  StripRootAttributes(root);
  root.remove_child("eventDescription");
  root.remove_child("dynVideoInputChannelID");

  return PutLogged(path, wire::SerializeDocument(doc), kOperation,
                   center_notification_enabled ? "center=true" : "center=false", error);
}

bool ConfigWriter::UpdateStreamingChannel(const StreamingChannelUpdate& update,
                                          std::string& error) {
  const std::string channel_id = update.channel_id.empty() ? stream_channel_ : update.channel_id;
  const Scopes video{{.block_tag = "Video"}};
  const Scopes audio{{.block_tag = "Audio"}};
  const Scopes smart_codec{{.block_tag = "Video"}, {.block_tag = "SmartCodec"}};

  TargetList targets;
  targets.Add(video, "videoCodecType", update.codec);
  targets.Add(video, "videoResolutionWidth", update.width);
  targets.Add(video, "videoResolutionHeight", update.height);
  targets.Add(video, "maxFrameRate", update.max_frame_rate);
  targets.Add(video, "vbrUpperCap", update.vbr_upper_cap);
  targets.Add(video, "constantBitRate", update.constant_bit_rate);
  targets.Add(video, "GovLength", update.gov_length);
  targets.Add(video, "fixedQuality", update.fixed_quality);
  targets.Add(video, "videoQualityControlType", update.quality_control_type);
  targets.Add(video, "smoothing", update.smoothing);
  targets.Add(video, "H264Profile", update.h264_profile);
  targets.Add(video, "H265Profile", update.h265_profile);
  targets.Add(audio, "enabled", update.audio_enabled);
  targets.Add(smart_codec, "enabled", update.smart_codec_enabled);

  const std::string path = endpoints::StreamingChannel(channel_id);
  return PatchAndPut(path, path, "update streaming channel", targets.targets(), error);
}

bool ConfigWriter::UpdateTwoWayAudio(const TwoWayAudioUpdate& update, std::string& error) {
  TargetList targets;
  targets.Add({}, "audioCompressionType", update.codec);
  targets.Add({}, "speakerVolume", update.speaker_volume);
  targets.Add({}, "noisereduce", update.noise_reduction);
  targets.Add({}, "audioInputType", update.input_type);
  const std::string path(endpoints::kTwoWayAudio);
  return PatchAndPut(path, path, "update two-way audio", targets.targets(), error);
}

bool ConfigWriter::UpdateTime(const TimeUpdate& update, std::string& error) {
  constexpr std::string_view kOperation = "update time";
  const std::string path(endpoints::kTime);

  TargetList targets;
  targets.Add({}, "timeMode", update.time_mode);
  targets.Add({}, "timeZone", update.time_zone);
  if (targets.targets().empty() && !update.local_time.has_value()) {
    return true;
  }

  std::string raw;
  if (!client_->GetText(path, kOperation, raw, error)) {
    return false;
  }

  std::vector<std::string> changed;
  std::string body = raw;
  if (!targets.targets().empty()) {
    wire::PatchResult result;
    std::string patch_error;
    if (!wire::PatchText(raw, targets.targets(), result, patch_error)) {
      error = transport::FormatDeviceError(kOperation, 0, "xml parse failed: " + patch_error);
      return false;
    }
    if (!result.missed.empty()) {
      log_.Warn("patch targets not found",
                {{"operation", kOperation}, {"missed", JoinList(result.missed)}});
    }
    body = std::move(result.text);
    changed = std::move(result.applied);
  }

  if (update.local_time.has_value()) {
    // localTime is re-inserted right after timeMode, where the device expects it.
    wire::RemoveElement(body, "localTime");
    const std::string fragment =
        "<localTime>" + wire::EscapeXmlText(*update.local_time) + "</localTime>";
    if (wire::InsertAfterElement(body, "timeMode", fragment) ||
        wire::UpsertElement(body, "Time", "localTime", *update.local_time)) {
      changed.emplace_back("localTime");
    }
  }

  if (changed.empty()) {
    log_.Warn("write skipped, no field matched", {{"operation", kOperation}});
    return true;
  }
  return PutLogged(path, body, kOperation, JoinList(changed), error);
}

bool ConfigWriter::UpdateNtpServer(const NtpServerUpdate& update, std::string& error) {
  TargetList targets;
  targets.Add({}, "ipAddress", update.address);
  targets.Add({}, "portNo", update.port);
  targets.Add({}, "synchronizeInterval", update.interval_minutes);
  const std::string path(endpoints::kNtpServer);
  return PatchAndPut(path, path, "update ntp server", targets.targets(), error);
}

bool ConfigWriter::UpdateOsd(const OsdUpdate& update, std::string& error) {
  constexpr std::string_view kOperation = "update overlays";
  const std::string path(endpoints::kOverlays);

  pugi::xml_document doc;
  std::string raw;
  if (!client_->GetDocument(path, kOperation, doc, raw, error)) {
    return false;
  }
  pugi::xml_node root = wire::RootElement(doc);
  ApplyOsdUpdate(root, update);

  std::string fields;
  if (update.date_time.has_value()) {
    fields += "DateTimeOverlay";
  }
  if (update.channel_name.has_value()) {
    fields += fields.empty() ? "channelNameOverlay" : ",channelNameOverlay";
  }
  for (const TextOverlayUpdate& text : update.text_overlays) {
    fields += (fields.empty() ? "TextOverlay[" : ",TextOverlay[") + text.id + "]";
  }
  return PutLogged(path, wire::SerializeDocument(doc), kOperation, fields, error);
}

bool ConfigWriter::UpdateOverlayText(const std::string& overlay_id, const std::string& text,
                                     std::string& error) {
  constexpr std::string_view kOperation = "update overlay text";
  const std::string path(endpoints::kOverlays);

  std::string raw;
  if (!client_->GetText(path, kOperation, raw, error)) {
    return false;
  }

  const std::vector<wire::PatchTarget> targets{wire::PatchTarget{
      .path =
          wire::FieldPath{
              .scopes = {{.block_tag = "TextOverlayList"},
                         {.block_tag = "TextOverlay", .key_tag = "id", .key_value = overlay_id}},
              .leaf = "displayText",
          },
      .value = text,
  }};
  wire::PatchResult result;
  std::string patch_error;
  if (!wire::PatchText(raw, targets, result, patch_error)) {
    error = transport::FormatDeviceError(kOperation, 0, "xml parse failed: " + patch_error);
    return false;
  }
  if (result.AnyApplied()) {
    return PutLogged(path, result.text, kOperation, JoinList(result.applied), error);
  }

  log_.Debug("overlay block missing, creating it", {{"overlay", overlay_id}});
  OsdUpdate update;
  update.text_overlays.push_back(TextOverlayUpdate{.id = overlay_id, .display_text = text});
  return UpdateOsd(update, error);
}

bool ConfigWriter::UpdateVideoInputName(const std::string& name, std::string& error) {
  constexpr std::string_view kOperation = "update video input name";
  const std::string path = endpoints::VideoInput(input_channel_);
  std::string raw;
  if (!client_->GetText(path, kOperation, raw, error)) {
    return false;
  }
  if (!wire::UpsertElement(raw, "VideoInputChannel", "name", name)) {
    log_.Warn("write skipped, no field matched", {{"operation", kOperation}});
    return true;
  }
  return PutLogged(path, raw, kOperation, "name", error);
}

bool ConfigWriter::UpdateDeviceName(const std::string& name, std::string& error) {
  constexpr std::string_view kOperation = "update device name";
  const std::string path(endpoints::kDeviceInfo);
  std::string raw;
  if (!client_->GetText(path, kOperation, raw, error)) {
    return false;
  }
  if (!wire::UpsertElement(raw, "DeviceInfo", "deviceName", name)) {
    log_.Warn("write skipped, no field matched", {{"operation", kOperation}});
    return true;
  }
  return PutLogged(path, raw, kOperation, "deviceName", error);
}

bool ConfigWriter::PutPtzPreset(const std::int64_t preset_id, const std::string& name,
                                std::string& error) {
  const std::string id = std::to_string(preset_id);
  const std::string body = std::string("<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n") +
                           "<PTZPreset xmlns=\"" + kPtzPresetNamespace + "\" version=\"2.0\">\n" +
                           "    <id>" + id + "</id>\n" + "    <presetName>" +
                           wire::EscapeXmlText(name) + "</presetName>\n" + "</PTZPreset>";
  return PutLogged(endpoints::PtzPreset(id), body, "save ptz preset", "id,presetName", error);
}

bool ConfigWriter::DeletePtzPreset(const std::int64_t preset_id, std::string& error) {
  const std::string path = endpoints::PtzPreset(std::to_string(preset_id));
  log_.Info("device delete", {{"operation", "delete ptz preset"}, {"endpoint", path}});
  return client_->DeleteResource(path, "delete ptz preset", error);
}

bool ConfigWriter::GotoPtzPreset(const std::int64_t preset_id, std::string& error) {
  return PutLogged(endpoints::PtzPresetGoto(std::to_string(preset_id)), "", "goto ptz preset",
                   "", error);
}

bool ConfigWriter::FetchOverlayDocument(std::string& raw, std::string& error) {
  return client_->GetText(endpoints::kOverlays, "fetch overlays", raw, error);
}

bool ConfigWriter::PutOverlayDocument(const std::string& raw, std::string& error) {
  return PutLogged(std::string(endpoints::kOverlays), raw, "copy overlays", "VideoOverlay",
                   error);
}

} // namespace isapisync::isapi
