#include "../common/assertions.hpp"
#include "../common/fake_devices.hpp"
#include "../common/fake_transport.hpp"
#include "../common/isapi_fixtures.hpp"
#include "core/logging/logger.hpp"
#include "isapi/config_writer.hpp"
#include "isapi/endpoints.hpp"
#include "overlay/overlay_sync_engine.hpp"
#include "settings/settings_store.hpp"

#include <optional>
#include <sstream>
#include <string>

namespace {

using isapisync::overlay::EventQueue;
using isapisync::overlay::SlotEvent;
using isapisync::tests::common::AssertEq;
using isapisync::tests::common::AssertTrue;

void CheckFormatReading() {
  using isapisync::overlay::FormatReading;
  AssertEq(FormatReading(21.5), std::string("21.5"), "one decimal");
  AssertEq(FormatReading(21.0), std::string("21"), "whole number");
  AssertEq(FormatReading(21.04), std::string("21"), "rounded to whole");
  AssertEq(FormatReading(-0.01), std::string("0"), "negative zero");
}

void CheckQueueDropsOldest() {
  EventQueue queue(2);
  int notified = 0;
  queue.SetNotify([&notified]() { ++notified; });
  for (const char* slot : {"a", "b", "c"}) {
    queue.Push(SlotEvent{.slot_id = slot, .generation = 1, .timestamp = {}, .event = {}});
  }
  AssertTrue(queue.size() == 2U, "queue keeps its capacity");
  AssertTrue(queue.dropped() == 1U, "one event dropped");
  AssertTrue(notified == 3, "every push notifies");

  const auto drained = queue.Drain();
  AssertTrue(drained.size() == 2U, "drain returns everything");
  AssertEq(drained.front().slot_id, std::string("b"), "oldest event was dropped");
  AssertTrue(queue.size() == 0U, "drain empties the queue");
}

} // namespace

int main() {
  using isapisync::isapi::ConfigWriter;
  using isapisync::isapi::IsapiClient;
  using isapisync::overlay::KeysForSlot;
  using isapisync::overlay::OverlaySyncEngine;
  using isapisync::overlay::SourceKind;
  using isapisync::overlay::TickReport;
  using isapisync::settings::SettingsStore;
  using isapisync::tests::common::AssertContains;
  using isapisync::tests::common::FakeDevices;
  using isapisync::tests::common::FakeTransport;
  using isapisync::transport::HttpMethod;
  namespace ep = isapisync::isapi::endpoints;
  namespace fixtures = isapisync::tests::common::fixtures;

  CheckFormatReading();
  CheckQueueDropsOldest();

  std::ostringstream log_sink;
  isapisync::core::logging::Logger logger(isapisync::core::logging::LogLevel::kDebug, log_sink);
  const isapisync::core::logging::CameraLog log(logger, "cam1");
  auto device = fixtures::MakeFixedCamera();
  FakeTransport transport(device);
  IsapiClient client(transport);
  ConfigWriter writer(client, "101", log);
  SettingsStore store;
  FakeDevices devices;
  devices.AddTemperatureSensor("t1", "C", 21.5);
  devices.AddHumiditySensor("h1", 40.0);

  OverlaySyncEngine engine(store, writer, devices, devices, "cam1", log);

  isapisync::isapi::OsdCapabilities osd;
  osd.text_overlays.push_back({.id = "1", .enabled = true, .display_text = "Lobby"});
  osd.text_overlays.push_back({.id = "2", .enabled = true, .display_text = ""});
  engine.SyncSlots({"1", "2", "3"}, &osd);

  const std::string overlays_path(ep::kOverlays);
  const auto slot1 = KeysForSlot("1");
  const auto slot2 = KeysForSlot("2");
  const auto slot3 = KeysForSlot("3");

  // Text already on screen is not pushed again; empty text is never pushed.
  {
    store.Set(slot1.text, "Lobby");
    const TickReport report = engine.Tick();
    AssertTrue(report.writes == 0U, "matching text must not be written");
    AssertTrue(device->Requests(HttpMethod::kPut).empty(), "no PUT on a settled tick");
  }

  // A changed text is written once; the next tick is a no-op.
  {
    store.Set(slot1.text, "Reception");
    TickReport report = engine.Tick();
    AssertTrue(report.writes == 1U, "changed text is written");
    AssertTrue(device->CountRequests(HttpMethod::kPut, overlays_path) == 1U, "one overlay PUT");
    AssertContains(device->Document(overlays_path), "<displayText>Reception</displayText>");

    report = engine.Tick();
    AssertTrue(report.writes == 0U, "second tick is idempotent");
    AssertTrue(device->CountRequests(HttpMethod::kPut, overlays_path) == 1U,
               "no extra PUT after reconciliation");
  }

  // Device slots render prefix, reading and unit.
  {
    store.Set(slot2.type, "Device");
    store.Set(slot2.device, "t1");
    store.Set(slot2.prefix, "Temp: ");
    const TickReport report = engine.Tick();
    AssertTrue(report.writes == 1U, "device slot written");
    AssertTrue(devices.LiveListenerCount("t1") == 1U, "one listener on t1");
    AssertEq(engine.LastResolvedText("2").value_or(""), std::string("Temp: 21.5 C"),
             "temperature text");
    AssertContains(device->Document(overlays_path), "<displayText>Temp: 21.5 C</displayText>");
  }

  // Events are drained on the next tick.
  {
    devices.SetReading("t1", 22.0);
    devices.Emit("t1", SourceKind::kTemperature, 22.0);
    const TickReport report = engine.Tick();
    AssertTrue(report.events_consumed == 1U, "queued reading consumed");
    AssertEq(engine.LastResolvedText("2").value_or(""), std::string("Temp: 22 C"),
             "whole reading drops the decimal");
  }

  // An unchanged reading leaves the device slot alone.
  {
    const std::size_t puts_before = device->CountRequests(HttpMethod::kPut, overlays_path);
    const TickReport report = engine.Tick();
    AssertTrue(report.writes == 0U, "settled device slot must not be written");
    AssertTrue(report.events_consumed == 0U, "no queued readings");
    AssertTrue(device->CountRequests(HttpMethod::kPut, overlays_path) == puts_before,
               "no extra PUT for an unchanged reading");
  }

  // Switching source devices leaves exactly one live listener.
  {
    store.Set(slot2.device, "h1");
    engine.Tick();
    AssertTrue(devices.LiveListenerCount("t1") == 0U, "old listener cancelled");
    AssertTrue(devices.LiveListenerCount("h1") == 1U, "new listener started");
    AssertTrue(devices.LiveListenerCount() == 1U, "no leaked listener");
    AssertTrue(engine.ActiveSubscriptionCount() == 1U, "engine tracks one subscription");
    AssertEq(engine.LastResolvedText("2").value_or(""), std::string("Temp: 40 %"),
             "humidity text");
  }

  // Events from a replaced binding are stale.
  {
    engine.queue().Push(SlotEvent{.slot_id = "2", .generation = 999, .timestamp = {}, .event = {}});
    engine.queue().Push(SlotEvent{.slot_id = "9", .generation = 1, .timestamp = {}, .event = {}});
    const TickReport report = engine.Tick();
    AssertTrue(report.events_stale == 2U, "stale events discarded");
    AssertTrue(report.events_consumed == 0U, "nothing consumed");
  }

  // Face detection binds to the camera itself and shows a dash until a face.
  {
    store.Set(slot3.type, "FaceDetection");
    store.Set(slot3.prefix, "Seen: ");
    TickReport report = engine.Tick();
    AssertTrue(report.writes == 1U, "face slot written");
    AssertTrue(devices.LiveListenerCount("cam1") == 1U, "face listener on the camera");
    AssertEq(engine.LastResolvedText("3").value_or(""), std::string("Seen: -"), "no face yet");
    AssertContains(device->Document(overlays_path), "<id>3</id>");

    devices.Emit("cam1", SourceKind::kFace, std::nullopt, "Alice");
    report = engine.Tick();
    AssertEq(engine.LastResolvedText("3").value_or(""), std::string("Seen: Alice"),
             "face label text");
  }

  // An unknown source clears the binding and writes nothing.
  {
    device->ClearRequests();
    store.Set(slot2.device, "ghost");
    const TickReport report = engine.Tick();
    AssertTrue(report.writes == 0U, "unknown device writes nothing");
    AssertTrue(devices.LiveListenerCount("h1") == 0U, "humidity listener cancelled");
    AssertContains(log_sink.str(), "overlay source device not found");
  }

  // A rejected push is counted and retried on the next tick.
  {
    device->RejectPut(overlays_path);
    store.Set(slot1.text, "Gate");
    TickReport report = engine.Tick();
    AssertTrue(report.write_failures == 1U, "rejected push counted");
    AssertEq(engine.LastResolvedText("1").value_or(""), std::string("Reception"),
             "failed push keeps the last resolved text");
    AssertContains(log_sink.str(), "overlay push failed");

    report = engine.Tick();
    AssertTrue(report.write_failures == 1U, "failed text retried");
  }

  // Dropping a slot cancels its listener.
  {
    engine.SyncSlots({"1", "2"}, nullptr);
    AssertTrue(devices.LiveListenerCount("cam1") == 0U, "removed slot listener cancelled");
    AssertTrue(!engine.LastResolvedText("3").has_value(), "removed slot forgotten");
    AssertContains(log_sink.str(), "overlay slot removed");

    engine.CancelAll();
    AssertTrue(engine.ActiveSubscriptionCount() == 0U, "all subscriptions cancelled");
    AssertTrue(devices.LiveListenerCount() == 0U, "no listener left");
  }

  return 0;
}
