#pragma once

#include "core/logging/logger.hpp"
#include "isapi/capabilities.hpp"
#include "isapi/isapi_client.hpp"

#include <pugixml.hpp>

#include <string>
#include <vector>

namespace isapisync::isapi {

// Document decoders. Each takes the root element of one device document and
// fills the matching snapshot fields; missing elements leave defaults.
void DecodeMotionCapabilities(const pugi::xml_node& caps_root, MotionCapabilities& motion);
void DecodeMotionDetection(const pugi::xml_node& value_root, MotionCapabilities& motion);
bool HasCenterNotification(const pugi::xml_node& trigger_root);
std::vector<StreamChannel> DecodeStreamingChannelList(const pugi::xml_node& list_root);
StreamDynamicCap DecodeDynamicCap(const pugi::xml_node& cap_root);
void DecodeTwoWayAudioCapabilities(const pugi::xml_node& caps_root, AudioCapabilities& audio);
void DecodeTwoWayAudio(const pugi::xml_node& value_root, AudioCapabilities& audio);
void DecodeTimeCapabilities(const pugi::xml_node& caps_root, TimeCapabilities& time);
void DecodeTime(const pugi::xml_node& value_root, TimeCapabilities& time);
void DecodeNtpServer(const pugi::xml_node& ntp_root, TimeCapabilities& time);
void DecodeOverlayCapabilities(const pugi::xml_node& caps_root, OsdCapabilities& osd);
void DecodeOverlays(const pugi::xml_node& value_root, OsdCapabilities& osd);
void DecodePtzCapabilities(const pugi::xml_node& caps_root, PtzCapabilities& ptz);
void DecodePtzPresets(const pugi::xml_node& list_root, PtzCapabilities& ptz);
DeviceInfo DecodeDeviceInfo(const pugi::xml_node& info_root);

// Reads capability and current-value documents for one camera.
//
// Subsystems are fetched independently: a failing subsystem is logged and left
// absent without affecting the others. Secondary documents (motion trigger,
// NTP server, per-channel dynamicCap, video input name) are optional; their
// failure is logged and the primary snapshot is still produced.
class CapabilityFetcher {
public:
  CapabilityFetcher(IsapiClient& client, std::string stream_channel,
                    core::logging::CameraLog log);

  bool FetchMotion(MotionCapabilities& motion, std::string& error);
  bool FetchStreams(std::vector<StreamChannel>& streams, std::string& error);
  bool FetchDynamicCap(const std::string& channel_id, StreamDynamicCap& cap, std::string& error);
  bool FetchAudio(AudioCapabilities& audio, std::string& error);
  bool FetchTime(TimeCapabilities& time, std::string& error);
  bool FetchOsd(OsdCapabilities& osd, std::string& error);
  bool FetchPtz(PtzCapabilities& ptz, std::string& error);
  bool FetchDeviceInfo(DeviceInfo& info, std::string& error);

  // Fetches one subsystem into `set`. On failure the member is reset, except
  // that callers refreshing a snapshot use `Refresh` to keep last-known values.
  bool Fetch(Subsystem subsystem, CapabilitySet& set, std::string& error);

  // Returns the number of subsystems that loaded.
  int FetchAll(CapabilitySet& set);

  // Builds `next` from `current` with one subsystem refetched. A failed
  // refetch keeps the last-known snapshot, except PTZ which becomes absent.
  bool Refresh(Subsystem subsystem, const CapabilitySet& current, CapabilitySet& next,
               std::string& error);

private:
  void LogFetchFailure(Subsystem subsystem, const std::string& error) const;

  IsapiClient* client_ = nullptr;
  std::string stream_channel_;
  std::string input_channel_;
  core::logging::CameraLog log_;
};

} // namespace isapisync::isapi
