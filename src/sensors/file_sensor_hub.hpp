#pragma once

#include "config/app_config.hpp"
#include "core/logging/logger.hpp"
#include "overlay/device_events.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace isapisync::sensors {

// Device registry and event source backed by plain files, one per sensor.
//
// Each file holds the current reading: a number for temperature and humidity
// sensors, a detection label for face sensors. A face sensor is addressed by
// the id of the camera it watches. `PollOnce` re-reads every file and
// notifies subscribers of readings that changed since the previous poll.
class FileSensorHub final : public overlay::IDeviceEventSource, public overlay::IDeviceRegistry {
public:
  FileSensorHub(std::vector<config::SensorConfig> sensors, core::logging::Logger& logger);
  ~FileSensorHub() override;

  FileSensorHub(const FileSensorHub&) = delete;
  FileSensorHub& operator=(const FileSensorHub&) = delete;

  std::unique_ptr<overlay::ISubscription> Listen(std::string_view device_id,
                                                 overlay::SourceKind kind,
                                                 overlay::EventCallback callback) override;

  bool Resolve(std::string_view device_id, overlay::DeviceHandle& handle) const override;
  std::vector<std::string> DeviceIds() const override;

  // Returns the number of events delivered.
  int PollOnce();

  std::size_t ListenerCount() const;

private:
  struct Listener {
    std::string device_id;
    overlay::SourceKind kind = overlay::SourceKind::kTemperature;
    overlay::EventCallback callback;
  };

  // Shared with subscriptions so a handle outliving the hub stays harmless.
  struct Listeners {
    std::mutex mu;
    std::uint64_t next_id = 1;
    std::map<std::uint64_t, Listener> by_id;
  };

  class Subscription;

  const config::SensorConfig* FindSensor(std::string_view device_id) const;
  bool ReadSensor(const config::SensorConfig& sensor, std::string& text) const;

  std::vector<config::SensorConfig> sensors_;
  core::logging::Logger* logger_ = nullptr;
  std::shared_ptr<Listeners> listeners_;
  // Last raw text per sensor id, guarded by `listeners_->mu`.
  std::map<std::string, std::string> last_text_;
};

} // namespace isapisync::sensors
