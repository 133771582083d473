#include "sensors/file_sensor_hub.hpp"

#include "core/fs_utils.hpp"
#include "core/string_utils.hpp"

#include <chrono>
#include <utility>

namespace isapisync::sensors {

namespace {

bool KindServes(config::SensorKind sensor_kind, overlay::SourceKind source_kind) {
  switch (source_kind) {
  case overlay::SourceKind::kTemperature:
    return sensor_kind == config::SensorKind::kTemperature;
  case overlay::SourceKind::kHumidity:
    return sensor_kind == config::SensorKind::kHumidity;
  case overlay::SourceKind::kFace:
    return sensor_kind == config::SensorKind::kFace;
  }
  return false;
}

overlay::SourceKind ToSourceKind(config::SensorKind kind) {
  switch (kind) {
  case config::SensorKind::kTemperature:
    return overlay::SourceKind::kTemperature;
  case config::SensorKind::kHumidity:
    return overlay::SourceKind::kHumidity;
  case config::SensorKind::kFace:
    return overlay::SourceKind::kFace;
  }
  return overlay::SourceKind::kTemperature;
}

} // namespace

// Cancel takes the listener lock, which is also held while callbacks run, so
// it waits out an in-flight delivery.
class FileSensorHub::Subscription final : public overlay::ISubscription {
public:
  Subscription(std::weak_ptr<Listeners> listeners, std::uint64_t id)
      : listeners_(std::move(listeners)), id_(id) {}

  ~Subscription() override {
    Cancel();
  }

  void Cancel() override {
    const std::shared_ptr<Listeners> listeners = listeners_.lock();
    if (!listeners) {
      return;
    }
    std::lock_guard<std::mutex> lock(listeners->mu);
    listeners->by_id.erase(id_);
    listeners_.reset();
  }

private:
  std::weak_ptr<Listeners> listeners_;
  std::uint64_t id_ = 0;
};

FileSensorHub::FileSensorHub(std::vector<config::SensorConfig> sensors,
                             core::logging::Logger& logger)
    : sensors_(std::move(sensors)), logger_(&logger), listeners_(std::make_shared<Listeners>()) {}

FileSensorHub::~FileSensorHub() {
  std::lock_guard<std::mutex> lock(listeners_->mu);
  listeners_->by_id.clear();
}

const config::SensorConfig* FileSensorHub::FindSensor(std::string_view device_id) const {
  for (const config::SensorConfig& sensor : sensors_) {
    if (sensor.id == device_id) {
      return &sensor;
    }
  }
  return nullptr;
}

bool FileSensorHub::ReadSensor(const config::SensorConfig& sensor, std::string& text) const {
  std::string raw;
  std::string error;
  if (!core::ReadTextFile(sensor.path, raw, error)) {
    logger_->Debug("sensor read failed", {{"sensor", sensor.id}, {"error", error}});
    return false;
  }
  text = core::Trim(raw);
  return true;
}

std::unique_ptr<overlay::ISubscription>
FileSensorHub::Listen(std::string_view device_id, overlay::SourceKind kind,
                      overlay::EventCallback callback) {
  const config::SensorConfig* sensor = FindSensor(device_id);
  if (sensor == nullptr || !KindServes(sensor->kind, kind) || !callback) {
    return nullptr;
  }
  std::uint64_t id = 0;
  {
    std::lock_guard<std::mutex> lock(listeners_->mu);
    id = listeners_->next_id++;
    listeners_->by_id.emplace(
        id, Listener{.device_id = sensor->id, .kind = kind, .callback = std::move(callback)});
  }
  logger_->Debug("sensor listener added",
                 {{"sensor", sensor->id}, {"kind", overlay::ToString(kind)}});
  return std::make_unique<Subscription>(listeners_, id);
}

bool FileSensorHub::Resolve(std::string_view device_id, overlay::DeviceHandle& handle) const {
  const config::SensorConfig* sensor = FindSensor(device_id);
  if (sensor == nullptr) {
    return false;
  }
  handle = overlay::DeviceHandle{};
  handle.id = sensor->id;
  handle.name = sensor->name;
  handle.has_temperature = sensor->kind == config::SensorKind::kTemperature;
  handle.has_humidity = sensor->kind == config::SensorKind::kHumidity;
  if (handle.has_temperature) {
    handle.temperature_unit = sensor->unit;
  }

  std::string text;
  double reading = 0.0;
  if (sensor->kind != config::SensorKind::kFace && ReadSensor(*sensor, text) &&
      core::ParseDouble(text, reading)) {
    if (handle.has_temperature) {
      handle.temperature = reading;
    } else {
      handle.humidity = reading;
    }
  }
  return true;
}

std::vector<std::string> FileSensorHub::DeviceIds() const {
  std::vector<std::string> ids;
  for (const config::SensorConfig& sensor : sensors_) {
    if (sensor.kind != config::SensorKind::kFace) {
      ids.push_back(sensor.id);
    }
  }
  return ids;
}

int FileSensorHub::PollOnce() {
  const auto now = std::chrono::system_clock::now();
  int delivered = 0;

  std::lock_guard<std::mutex> lock(listeners_->mu);
  for (const config::SensorConfig& sensor : sensors_) {
    std::string text;
    if (!ReadSensor(sensor, text)) {
      continue;
    }
    auto [it, inserted] = last_text_.try_emplace(sensor.id, text);
    if (!inserted) {
      if (it->second == text) {
        continue;
      }
      it->second = text;
    }

    overlay::DeviceEvent event;
    event.kind = ToSourceKind(sensor.kind);
    event.device_id = sensor.id;
    if (sensor.kind == config::SensorKind::kFace) {
      event.face_label = text;
    } else {
      double reading = 0.0;
      if (!core::ParseDouble(text, reading)) {
        logger_->Warn("sensor reading is not a number", {{"sensor", sensor.id}, {"text", text}});
        continue;
      }
      event.value = reading;
    }

    for (const auto& [id, listener] : listeners_->by_id) {
      if (listener.device_id == sensor.id && listener.kind == event.kind) {
        listener.callback(now, event);
        ++delivered;
      }
    }
  }
  return delivered;
}

std::size_t FileSensorHub::ListenerCount() const {
  std::lock_guard<std::mutex> lock(listeners_->mu);
  return listeners_->by_id.size();
}

} // namespace isapisync::sensors
