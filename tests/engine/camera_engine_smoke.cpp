#include "../common/assertions.hpp"
#include "../common/fake_devices.hpp"
#include "../common/fake_transport.hpp"
#include "../common/isapi_fixtures.hpp"
#include "../common/temp_dir.hpp"
#include "core/logging/logger.hpp"
#include "engine/camera_engine.hpp"
#include "engine/camera_registry.hpp"
#include "isapi/endpoints.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace {

using isapisync::settings::SettingView;

const SettingView* FindView(const std::vector<SettingView>& views, const std::string& key) {
  const auto it = std::find_if(views.begin(), views.end(),
                               [&key](const SettingView& view) { return view.key == key; });
  return it == views.end() ? nullptr : &*it;
}

isapisync::config::CameraConfig MakeCamera(const std::string& id) {
  isapisync::config::CameraConfig camera;
  camera.id = id;
  camera.host = "192.0.2.10";
  return camera;
}

} // namespace

int main() {
  using isapisync::engine::CameraEngine;
  using isapisync::engine::CameraRegistry;
  using isapisync::tests::common::AssertContains;
  using isapisync::tests::common::AssertEq;
  using isapisync::tests::common::AssertTrue;
  using isapisync::tests::common::FakeDevices;
  using isapisync::tests::common::FakeTransport;
  using isapisync::tests::common::ScopedTempDir;
  using isapisync::transport::HttpMethod;
  namespace ep = isapisync::isapi::endpoints;
  namespace fixtures = isapisync::tests::common::fixtures;

  const ScopedTempDir temp("isapisync-engine");
  std::ostringstream log_sink;
  isapisync::core::logging::Logger logger(isapisync::core::logging::LogLevel::kDebug, log_sink);
  FakeDevices devices;
  devices.AddTemperatureSensor("t1", "C", 20.0);

  auto device1 = fixtures::MakeFixedCamera();
  auto cam1 = std::make_shared<CameraEngine>(MakeCamera("cam1"),
                                             std::make_unique<FakeTransport>(device1),
                                             temp / "cam1.json", devices, devices, logger);
  std::string error;
  AssertTrue(cam1->Initialize(error), "cam1 initialize failed: " + error);
  AssertTrue(std::filesystem::exists(temp / "cam1.json"), "settings persisted on initialize");
  AssertContains(log_sink.str(), "camera initialized");
  AssertTrue(cam1->capabilities()->motion.has_value(), "motion published");
  AssertTrue(!cam1->capabilities()->ptz.has_value(), "fixed camera has no PTZ");

  // Motion sensitivity end to end: discrete choices, one PUT, value reflected.
  {
    const auto views = cam1->GetSettings();
    const SettingView* sensitivity = FindView(views, "motionSensitivity");
    AssertTrue(sensitivity != nullptr, "motionSensitivity listed");
    AssertTrue(sensitivity->choices ==
                   std::vector<std::string>{"0", "20", "40", "60", "80", "100"},
               "sensitivity choices");
    AssertEq(sensitivity->value, std::string("20"), "seeded sensitivity");

    device1->ClearRequests();
    AssertTrue(cam1->PutSetting("motionSensitivity", "60", error), "put failed: " + error);
    const auto puts = device1->Requests(HttpMethod::kPut);
    AssertTrue(puts.size() == 1U, "exactly one PUT for a sensitivity change");
    AssertEq(puts[0].path, ep::MotionDetection("1"), "sensitivity PUT path");
    AssertContains(puts[0].body, "<sensitivityLevel>60</sensitivityLevel>");
    AssertEq(FindView(cam1->GetSettings(), "motionSensitivity")->value, std::string("60"),
             "stored sensitivity");
  }

  // Unknown and hidden keys are refused before any request.
  {
    device1->ClearRequests();
    AssertTrue(!cam1->PutSetting("noSuchSetting", "1", error), "unknown key accepted");
    AssertContains(error, "unknown setting 'noSuchSetting'");
    AssertTrue(!cam1->PutSetting("overlay:1:device", "t1", error), "hidden key accepted");
    AssertContains(error, "not available in the current configuration");
    AssertTrue(FindView(cam1->GetSettings(), "overlay:1:device") == nullptr,
               "hidden setting not listed");
    AssertTrue(device1->Requests().empty(), "refused puts send nothing");
  }

  // Overlay bindings only touch the store; the next tick pushes the text.
  {
    AssertTrue(cam1->PutSetting("overlay:1:text", "Hello", error), "binding put: " + error);
    AssertTrue(device1->Requests(HttpMethod::kPut).empty(), "binding put sends nothing");
    const isapisync::overlay::TickReport report = cam1->RunOverlayTick();
    AssertTrue(report.writes == 1U, "tick pushes the new text");
    AssertContains(device1->Document(std::string(ep::kOverlays)),
                   "<displayText>Hello</displayText>");
  }

  // Refetch rebuilds the snapshot from the device.
  {
    device1->SetDocument(ep::MotionDetection("1"), fixtures::MotionDetectionXml("80"));
    const auto before = cam1->capabilities();
    AssertTrue(cam1->Refetch(isapisync::isapi::Subsystem::kMotion, error),
               "refetch failed: " + error);
    AssertTrue(cam1->capabilities() != before, "refetch publishes a new snapshot");
    AssertEq(FindView(cam1->GetSettings(), "motionSensitivity")->value, std::string("80"),
             "refetched sensitivity");
  }

  // A camera that answers nothing fails to initialize.
  {
    auto dead = std::make_shared<isapisync::tests::common::FakeDeviceState>();
    dead->SetUnreachable(true);
    CameraEngine engine(MakeCamera("dead"), std::make_unique<FakeTransport>(dead),
                        temp / "dead.json", devices, devices, logger);
    AssertTrue(!engine.Initialize(error), "unreachable camera initialized");
    AssertContains(error, "answered no capability request");
  }

  // Overlay duplication copies the document and the bindings.
  auto device2 = std::make_shared<isapisync::tests::common::FakeDeviceState>();
  fixtures::InstallFixedCamera(*device2);
  device2->SetDocument(std::string(ep::kOverlays), fixtures::OverlaysXml("Yard"));
  auto cam2 = std::make_shared<CameraEngine>(MakeCamera("cam2"),
                                             std::make_unique<FakeTransport>(device2),
                                             temp / "cam2.json", devices, devices, logger);
  AssertTrue(cam2->Initialize(error), "cam2 initialize failed: " + error);
  {
    AssertTrue(cam2->DuplicateOverlaysFrom(*cam1, error), "duplicate failed: " + error);
    AssertEq(device2->Document(std::string(ep::kOverlays)),
             device1->Document(std::string(ep::kOverlays)), "overlay document copied");
    const auto bindings = cam2->ExportOverlayBindings();
    const auto text = bindings.find("overlay:1:text");
    AssertTrue(text != bindings.end() && text->second == "Hello", "binding copied");
    AssertContains(log_sink.str(), "overlays duplicated");

    AssertTrue(!cam1->DuplicateOverlaysFrom(*cam1, error), "self duplicate accepted");
    AssertContains(error, "onto itself");
  }

  // Registry bookkeeping.
  CameraRegistry registry;
  {
    AssertTrue(registry.Register(cam1, error), "register cam1: " + error);
    AssertTrue(registry.Register(cam2, error), "register cam2: " + error);
    AssertTrue(!registry.Register(cam1, error), "duplicate registration accepted");
    AssertContains(error, "already registered");
    AssertTrue(!registry.Register(nullptr, error), "null registration accepted");
    AssertTrue(registry.Find("cam2") == cam2, "find cam2");
    AssertTrue(registry.Find("cam9") == nullptr, "unknown camera found");
    AssertTrue(registry.Ids() == std::vector<std::string>{"cam1", "cam2"}, "registered ids");
    AssertTrue(registry.Unregister("cam2") == cam2, "unregister returns the engine");
    AssertTrue(registry.Unregister("cam2") == nullptr, "second unregister is empty");
    AssertTrue(registry.Register(cam2, error), "re-register cam2: " + error);
  }

  // Background sync runs until shutdown.
  {
    cam1->StartOverlaySync(std::chrono::milliseconds(50));
    AssertTrue(cam1->overlay_sync_running(), "overlay sync running");
    registry.ShutdownAll();
    AssertTrue(!cam1->overlay_sync_running(), "overlay sync stopped by shutdown");
    AssertTrue(registry.Ids().empty(), "registry emptied by shutdown");
  }

  return 0;
}
