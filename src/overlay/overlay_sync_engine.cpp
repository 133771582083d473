#include "overlay/overlay_sync_engine.hpp"

#include <cstdio>
#include <set>
#include <utility>

namespace isapisync::overlay {

namespace {

constexpr const char* kNoFaceText = "-";
constexpr const char* kHumidityUnit = "%";

// Clears the flag on every exit path of a tick.
class TickGuard {
public:
  explicit TickGuard(std::atomic<bool>& flag) : flag_(&flag) {}
  ~TickGuard() {
    flag_->store(false);
  }

  TickGuard(const TickGuard&) = delete;
  TickGuard& operator=(const TickGuard&) = delete;

private:
  std::atomic<bool>* flag_;
};

} // namespace

std::string FormatReading(double value) {
  char buffer[64];
  std::snprintf(buffer, sizeof(buffer), "%.1f", value);
  std::string text(buffer);
  if (text.size() > 2 && text.compare(text.size() - 2, 2, ".0") == 0) {
    text.resize(text.size() - 2);
  }
  if (text == "-0") {
    text = "0";
  }
  return text;
}

OverlaySyncEngine::OverlaySyncEngine(settings::SettingsStore& store, isapi::ConfigWriter& writer,
                                     IDeviceEventSource& events, const IDeviceRegistry& registry,
                                     std::string camera_device_id, core::logging::CameraLog log,
                                     std::size_t queue_capacity)
    : store_(&store), writer_(&writer), events_(&events), registry_(&registry),
      camera_device_id_(std::move(camera_device_id)), log_(std::move(log)),
      queue_(queue_capacity) {}

OverlaySyncEngine::~OverlaySyncEngine() {
  CancelAll();
}

void OverlaySyncEngine::SyncSlots(const std::vector<std::string>& slot_ids,
                                  const isapi::OsdCapabilities* osd) {
  const std::set<std::string> wanted(slot_ids.begin(), slot_ids.end());
  for (auto it = slots_.begin(); it != slots_.end();) {
    if (wanted.count(it->first) == 0) {
      CancelBinding(it->second);
      log_.Info("overlay slot removed", {{"slot", it->first}});
      it = slots_.erase(it);
    } else {
      ++it;
    }
  }

  for (const std::string& id : slot_ids) {
    SlotState& state = slots_[id];
    state.slot.id = id;
    if (osd == nullptr) {
      continue;
    }
    const isapi::TextOverlay* shown = osd->FindTextOverlay(id);
    if (shown != nullptr) {
      state.slot.last_resolved_text = shown->display_text;
      state.slot.has_resolved_text = true;
    }
  }
}

void OverlaySyncEngine::LoadSlotConfig(SlotState& state) const {
  const SlotKeys keys = KeysForSlot(state.slot.id);
  state.slot.type = ParseOverlayType(store_->GetOr(keys.type, ToString(OverlayType::kText)));
  state.slot.source_device_id = store_->GetOr(keys.device, "");
  state.slot.prefix = store_->GetOr(keys.prefix, "");
  state.slot.text = store_->GetOr(keys.text, "");
}

std::optional<OverlaySyncEngine::DesiredBinding>
OverlaySyncEngine::ResolveBinding(const SlotState& state) const {
  switch (state.slot.type) {
  case OverlayType::kText:
    return std::nullopt;
  case OverlayType::kFaceDetection:
    return DesiredBinding{.kind = SourceKind::kFace, .device_id = camera_device_id_};
  case OverlayType::kDevice: {
    if (state.slot.source_device_id.empty()) {
      return std::nullopt;
    }
    DeviceHandle handle;
    if (!registry_->Resolve(state.slot.source_device_id, handle)) {
      log_.Warn("overlay source device not found",
                {{"slot", state.slot.id}, {"device", state.slot.source_device_id}});
      return std::nullopt;
    }
    if (handle.has_temperature) {
      return DesiredBinding{.kind = SourceKind::kTemperature, .device_id = handle.id};
    }
    if (handle.has_humidity) {
      return DesiredBinding{.kind = SourceKind::kHumidity, .device_id = handle.id};
    }
    log_.Warn("overlay source device has no supported reading",
              {{"slot", state.slot.id}, {"device", handle.id}});
    return std::nullopt;
  }
  }
  return std::nullopt;
}

void OverlaySyncEngine::CancelBinding(SlotState& state) {
  if (!state.binding.has_value()) {
    return;
  }
  if (state.binding->subscription) {
    state.binding->subscription->Cancel();
  }
  state.binding.reset();
  state.latest_value.reset();
  state.latest_face_label.clear();
  state.face_seen = false;
}

void OverlaySyncEngine::Rebind(SlotState& state, const std::optional<DesiredBinding>& desired) {
  const bool same = state.binding.has_value() && desired.has_value() &&
                    state.binding->kind == desired->kind &&
                    state.binding->source_device_id == desired->device_id;
  if (same || (!state.binding.has_value() && !desired.has_value())) {
    return;
  }

  // The old subscription is gone before the new one exists.
  CancelBinding(state);
  if (!desired.has_value()) {
    log_.Info("overlay binding cleared", {{"slot", state.slot.id}});
    return;
  }

  const std::uint64_t generation = next_generation_++;
  const std::string slot_id = state.slot.id;
  EventQueue* queue = &queue_;
  std::unique_ptr<ISubscription> subscription = events_->Listen(
      desired->device_id, desired->kind,
      [queue, slot_id, generation](std::chrono::system_clock::time_point timestamp,
                                   const DeviceEvent& event) {
        queue->Push(SlotEvent{
            .slot_id = slot_id, .generation = generation, .timestamp = timestamp, .event = event});
      });
  if (!subscription) {
    log_.Warn("overlay subscription refused",
              {{"slot", slot_id}, {"device", desired->device_id}, {"kind", ToString(desired->kind)}});
  }

  state.binding = ListenerBinding{
      .slot_id = slot_id,
      .kind = desired->kind,
      .source_device_id = desired->device_id,
      .subscription = std::move(subscription),
      .generation = generation,
  };
  log_.Info("overlay binding started",
            {{"slot", slot_id}, {"device", desired->device_id}, {"kind", ToString(desired->kind)}});
}

void OverlaySyncEngine::ConsumeEvents(TickReport& report) {
  for (SlotEvent& queued : queue_.Drain()) {
    const auto it = slots_.find(queued.slot_id);
    if (it == slots_.end() || !it->second.binding.has_value() ||
        it->second.binding->generation != queued.generation) {
      ++report.events_stale;
      continue;
    }
    SlotState& state = it->second;
    ++report.events_consumed;
    if (queued.event.kind == SourceKind::kFace) {
      if (!queued.event.face_label.empty()) {
        state.latest_face_label = queued.event.face_label;
        state.face_seen = true;
      }
    } else if (queued.event.value.has_value()) {
      state.latest_value = queued.event.value;
    }
  }
}

void OverlaySyncEngine::PollDeviceValues() {
  for (auto& [id, state] : slots_) {
    if (!state.binding.has_value() || state.binding->kind == SourceKind::kFace) {
      continue;
    }
    DeviceHandle handle;
    if (!registry_->Resolve(state.binding->source_device_id, handle)) {
      continue;
    }
    const std::optional<double>& polled =
        state.binding->kind == SourceKind::kTemperature ? handle.temperature : handle.humidity;
    if (polled.has_value()) {
      state.latest_value = polled;
    }
  }
}

std::optional<std::string> OverlaySyncEngine::ResolveText(const SlotState& state) const {
  const OverlaySlot& slot = state.slot;
  switch (slot.type) {
  case OverlayType::kText:
    if (slot.text.empty()) {
      return std::nullopt;
    }
    return slot.text;
  case OverlayType::kFaceDetection:
    if (!state.binding.has_value()) {
      return std::nullopt;
    }
    return slot.prefix + (state.face_seen ? state.latest_face_label : std::string(kNoFaceText));
  case OverlayType::kDevice: {
    if (!state.binding.has_value() || !state.latest_value.has_value()) {
      return std::nullopt;
    }
    std::string unit = kHumidityUnit;
    if (state.binding->kind == SourceKind::kTemperature) {
      DeviceHandle handle;
      unit = registry_->Resolve(state.binding->source_device_id, handle) ? handle.temperature_unit
                                                                         : std::string();
    }
    std::string text = slot.prefix + FormatReading(*state.latest_value);
    if (!unit.empty()) {
      text += " " + unit;
    }
    return text;
  }
  }
  return std::nullopt;
}

TickReport OverlaySyncEngine::Tick() {
  TickReport report;
  if (ticking_.exchange(true)) {
    report.skipped = true;
    return report;
  }
  TickGuard guard(ticking_);

  for (auto& [id, state] : slots_) {
    LoadSlotConfig(state);
    Rebind(state, ResolveBinding(state));
  }

  ConsumeEvents(report);
  PollDeviceValues();

  for (auto& [id, state] : slots_) {
    const std::optional<std::string> text = ResolveText(state);
    if (!text.has_value()) {
      continue;
    }
    if (state.slot.has_resolved_text && state.slot.last_resolved_text == *text) {
      continue;
    }
    std::string error;
    if (!writer_->UpdateOverlayText(id, *text, error)) {
      ++report.write_failures;
      log_.Warn("overlay push failed", {{"slot", id}, {"error", error}});
      continue;
    }
    state.slot.last_resolved_text = *text;
    state.slot.has_resolved_text = true;
    ++report.writes;
  }

  if (report.writes > 0 || report.write_failures > 0) {
    log_.Debug("overlay tick",
               {{"writes", std::to_string(report.writes)},
                {"failures", std::to_string(report.write_failures)},
                {"events", std::to_string(report.events_consumed)}});
  }
  return report;
}

void OverlaySyncEngine::ResetResolvedText() {
  for (auto& [id, state] : slots_) {
    state.slot.last_resolved_text.clear();
    state.slot.has_resolved_text = false;
  }
}

void OverlaySyncEngine::CancelAll() {
  for (auto& [id, state] : slots_) {
    CancelBinding(state);
  }
}

std::size_t OverlaySyncEngine::ActiveSubscriptionCount() const {
  std::size_t count = 0;
  for (const auto& [id, state] : slots_) {
    if (state.binding.has_value() && state.binding->subscription) {
      ++count;
    }
  }
  return count;
}

std::optional<std::string> OverlaySyncEngine::LastResolvedText(const std::string& slot_id) const {
  const auto it = slots_.find(slot_id);
  if (it == slots_.end() || !it->second.slot.has_resolved_text) {
    return std::nullopt;
  }
  return it->second.slot.last_resolved_text;
}

} // namespace isapisync::overlay
