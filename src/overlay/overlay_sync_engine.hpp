#pragma once

#include "core/logging/logger.hpp"
#include "isapi/capabilities.hpp"
#include "isapi/config_writer.hpp"
#include "overlay/device_events.hpp"
#include "overlay/event_queue.hpp"
#include "overlay/overlay_model.hpp"
#include "settings/settings_store.hpp"

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace isapisync::overlay {

// Active source for one slot. At most one exists per slot, and its
// subscription is cancelled before a replacement is created.
struct ListenerBinding {
  std::string slot_id;
  SourceKind kind = SourceKind::kTemperature;
  std::string source_device_id;
  std::unique_ptr<ISubscription> subscription;
  std::uint64_t generation = 0;
};

struct TickReport {
  bool skipped = false;
  int writes = 0;
  int write_failures = 0;
  int events_consumed = 0;
  int events_stale = 0;
};

// Keeps the camera's text overlays in line with their configured sources.
//
// Slot configuration lives in the settings store (`overlay:<id>:*`). Each tick
// re-reads it, rebinds subscriptions whose source changed, folds queued
// events and polled values into the latest reading per slot, and pushes the
// resolved text for slots whose text differs from what the device shows.
//
// The caller serializes `Tick` with every other device call of the camera.
// A reentrant `Tick` returns immediately with `skipped` set.
class OverlaySyncEngine {
public:
  OverlaySyncEngine(settings::SettingsStore& store, isapi::ConfigWriter& writer,
                    IDeviceEventSource& events, const IDeviceRegistry& registry,
                    std::string camera_device_id, core::logging::CameraLog log,
                    std::size_t queue_capacity = 256);
  ~OverlaySyncEngine();

  OverlaySyncEngine(const OverlaySyncEngine&) = delete;
  OverlaySyncEngine& operator=(const OverlaySyncEngine&) = delete;

  // Aligns the slot set with the device's overlay capacity and seeds the last
  // pushed text from what the device currently displays. Slots beyond the new
  // capacity lose their binding.
  void SyncSlots(const std::vector<std::string>& slot_ids, const isapi::OsdCapabilities* osd);

  TickReport Tick();

  // Forgets what was pushed so the next tick rewrites every resolvable slot.
  void ResetResolvedText();

  // Cancels every live subscription. Safe to call more than once.
  void CancelAll();

  EventQueue& queue() {
    return queue_;
  }

  std::size_t ActiveSubscriptionCount() const;
  std::optional<std::string> LastResolvedText(const std::string& slot_id) const;

private:
  struct SlotState {
    OverlaySlot slot;
    std::optional<ListenerBinding> binding;
    std::optional<double> latest_value;
    std::string latest_face_label;
    bool face_seen = false;
  };

  struct DesiredBinding {
    SourceKind kind = SourceKind::kTemperature;
    std::string device_id;
  };

  void LoadSlotConfig(SlotState& state) const;
  std::optional<DesiredBinding> ResolveBinding(const SlotState& state) const;
  void Rebind(SlotState& state, const std::optional<DesiredBinding>& desired);
  void ConsumeEvents(TickReport& report);
  void PollDeviceValues();
  std::optional<std::string> ResolveText(const SlotState& state) const;
  void CancelBinding(SlotState& state);

  settings::SettingsStore* store_ = nullptr;
  isapi::ConfigWriter* writer_ = nullptr;
  IDeviceEventSource* events_ = nullptr;
  const IDeviceRegistry* registry_ = nullptr;
  std::string camera_device_id_;
  core::logging::CameraLog log_;
  EventQueue queue_;
  std::map<std::string, SlotState> slots_;
  std::uint64_t next_generation_ = 1;
  std::atomic<bool> ticking_{false};
};

// `21.5` -> `21.5`, `21.0` -> `21`, one decimal at most.
std::string FormatReading(double value);

} // namespace isapisync::overlay
