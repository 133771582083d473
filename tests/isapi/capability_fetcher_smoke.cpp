#include "../common/assertions.hpp"
#include "../common/fake_transport.hpp"
#include "../common/isapi_fixtures.hpp"
#include "core/logging/logger.hpp"
#include "isapi/capability_fetcher.hpp"
#include "isapi/endpoints.hpp"

#include <cstdint>
#include <sstream>
#include <string>
#include <vector>

namespace {

using isapisync::isapi::CapabilityFetcher;
using isapisync::isapi::CapabilitySet;
using isapisync::isapi::IsapiClient;
using isapisync::isapi::Subsystem;
using isapisync::tests::common::AssertContains;
using isapisync::tests::common::AssertEq;
using isapisync::tests::common::AssertTrue;
using isapisync::tests::common::FakeDeviceState;
using isapisync::tests::common::FakeTransport;
namespace ep = isapisync::isapi::endpoints;
namespace fixtures = isapisync::tests::common::fixtures;

void CheckFixedCameraSnapshot(const CapabilitySet& set) {
  AssertTrue(set.motion.has_value(), "motion snapshot missing");
  AssertTrue(set.motion->enabled, "motion should be enabled");
  AssertTrue(set.motion->sensitivity_level == 20, "unexpected motion sensitivity");
  AssertTrue(set.motion->sensitivity_choices ==
                 std::vector<std::string>{"0", "20", "40", "60", "80", "100"},
             "unexpected sensitivity choices");
  AssertTrue(!set.motion->center_notification_enabled,
             "email-only trigger must not report center notification");

  AssertTrue(set.streams.has_value() && set.streams->size() == 1U, "expected one stream");
  const auto* stream = set.FindStream("101");
  AssertTrue(stream != nullptr, "stream 101 missing");
  AssertEq(stream->video.codec, "H.264", "stream codec");
  AssertEq(stream->video.quality_control_type, "VBR", "stream quality control");
  AssertTrue(stream->video.width == 1920 && stream->video.height == 1080, "stream resolution");
  AssertTrue(stream->video.max_frame_rate == 2500, "stream frame rate");
  AssertTrue(stream->video.constant_bit_rate.value == 2048 &&
                 stream->video.constant_bit_rate.min == 32 &&
                 stream->video.constant_bit_rate.max == 8192,
             "constant bitrate with bounds");
  AssertTrue(stream->video.vbr_upper_cap.value == 4096, "vbr upper cap");
  AssertTrue(stream->video.gov_length.value == 50 && stream->video.gov_length.max == 400,
             "gov length");
  AssertTrue(stream->caps.has_value(), "dynamic capability missing");
  AssertTrue(stream->caps->resolutions.size() == 2U, "dynamic capability resolutions");
  AssertTrue(stream->caps->all_frame_rates == std::vector<std::int64_t>{2500, 1500, 100, 50},
             "merged frame rates must be unique and descending");
  AssertTrue(stream->caps->quality_control_types == std::vector<std::string>{"VBR", "CBR"},
             "quality control types");
  AssertTrue(stream->caps->codecs.size() == 2U && stream->caps->codecs[1].smart_codec &&
                 !stream->caps->codecs[0].smart_codec,
             "smart codec only on H.265");

  AssertTrue(set.audio.has_value(), "audio snapshot missing");
  AssertTrue(set.audio->codecs.size() == 3U, "audio codec options");
  AssertTrue(set.audio->input_types.size() == 2U, "audio input options");
  AssertTrue(set.audio->supports_noise_reduction, "noise reduction support");
  AssertTrue(set.audio->speaker_volume == 50, "speaker volume");

  AssertTrue(set.time.has_value(), "time snapshot missing");
  AssertTrue(set.time->time_modes == std::vector<std::string>{"NTP", "manual"}, "time modes");
  AssertEq(set.time->time_zone, "CST-1:00:00", "time zone");
  AssertTrue(set.time->has_ntp, "ntp server missing");
  AssertEq(set.time->ntp_address, "192.168.1.1", "ntp address");
  AssertTrue(set.time->ntp_interval_minutes == 60, "ntp interval");

  AssertTrue(set.osd.has_value(), "osd snapshot missing");
  AssertTrue(set.osd->overlay_capacity == 4, "overlay capacity");
  AssertTrue(set.osd->text_overlays.size() == 2U, "text overlays");
  const auto* slot1 = set.osd->FindTextOverlay("1");
  AssertTrue(slot1 != nullptr, "text overlay 1 missing");
  AssertEq(slot1->display_text, "Lobby", "text overlay 1");
  AssertTrue(set.osd->date_time.has_value() && set.osd->date_time->position_y == 544,
             "date time overlay");
  AssertTrue(set.osd->channel_name.has_value(), "channel name overlay");
  AssertEq(set.osd->video_input_name, "Camera 01", "video input name");

  AssertTrue(set.device_info.has_value(), "device info missing");
  AssertEq(set.device_info->device_name, "Front Door", "device name");
  AssertEq(set.device_info->model, "DS-2CD2143G2-I", "device model");

  AssertTrue(!set.ptz.has_value(), "fixed camera must not report ptz");
}

} // namespace

int main() {
  std::ostringstream log_sink;
  isapisync::core::logging::Logger logger(isapisync::core::logging::LogLevel::kDebug, log_sink);

  auto device = fixtures::MakeFixedCamera();
  FakeTransport transport(device);
  IsapiClient client(transport);
  CapabilityFetcher fetcher(client, "101", isapisync::core::logging::CameraLog(logger, "cam1"));

  // A fixed camera loads everything except PTZ.
  CapabilitySet set;
  AssertTrue(fetcher.FetchAll(set) == 6, "fixed camera should load six subsystems");
  CheckFixedCameraSnapshot(set);
  AssertContains(log_sink.str(), "ptz not available");
  AssertContains(log_sink.str(), "NOT_SUPPORTED");

  // PTZ answers decode into presets and reserved numbers.
  fixtures::InstallPtz(*device);
  std::string error;
  AssertTrue(fetcher.Fetch(Subsystem::kPtz, set, error), "ptz fetch failed: " + error);
  AssertTrue(set.ptz.has_value() && set.ptz->max_preset_number == 8, "ptz preset capacity");
  AssertTrue(set.ptz->special_numbers == std::vector<std::int64_t>{3, 33, 34},
             "ptz special numbers");
  AssertTrue(set.ptz->presets.size() == 1U && set.ptz->presets[0].name == "Gate", "ptz presets");

  // A failed refresh keeps the last-known snapshot.
  device->SetUnreachable(true);
  CapabilitySet next;
  AssertTrue(!fetcher.Refresh(Subsystem::kMotion, set, next, error),
             "refresh should fail while unreachable");
  AssertContains(error, "UNREACHABLE");
  AssertTrue(next.motion.has_value() && next.motion->sensitivity_level == 20,
             "failed motion refresh must keep last-known values");
  AssertTrue(next.osd.has_value(), "unrelated subsystems must be carried over");

  // PTZ is the exception: a failed refresh drops it.
  AssertTrue(!fetcher.Refresh(Subsystem::kPtz, set, next, error),
             "ptz refresh should fail while unreachable");
  AssertTrue(!next.ptz.has_value(), "failed ptz refresh must leave ptz absent");
  AssertTrue(set.ptz.has_value(), "refresh must not mutate the current snapshot");
  device->SetUnreachable(false);

  // A successful refresh picks up new device state.
  device->SetDocument(ep::MotionDetection("1"), fixtures::MotionDetectionXml("80"));
  AssertTrue(fetcher.Refresh(Subsystem::kMotion, set, next, error), "motion refresh failed");
  AssertTrue(next.motion->sensitivity_level == 80, "refresh should see the new sensitivity");
  AssertTrue(set.motion->sensitivity_level == 20, "old snapshot must stay untouched");

  // Secondary documents are optional.
  device->RemoveDocument(ep::DynamicCap("101"));
  device->RemoveDocument(std::string(ep::kNtpServer));
  AssertTrue(fetcher.Fetch(Subsystem::kStreams, next, error), "streams need no dynamicCap");
  AssertTrue(!next.FindStream("101")->caps.has_value(), "missing dynamicCap leaves caps absent");
  AssertTrue(fetcher.Fetch(Subsystem::kTime, next, error), "time needs no ntp server");
  AssertTrue(!next.time->has_ntp, "missing ntp server leaves ntp absent");
  AssertContains(log_sink.str(), "stream dynamic capability unavailable");

  // Fetch resets the member when the primary document fails.
  device->RemoveDocument(std::string(ep::kTwoWayAudioCapabilities));
  AssertTrue(!fetcher.Fetch(Subsystem::kAudio, next, error), "audio fetch should fail");
  AssertTrue(!next.audio.has_value(), "failed fetch resets the subsystem");

  return 0;
}
