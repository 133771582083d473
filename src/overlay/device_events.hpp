#pragma once

#include "overlay/overlay_model.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace isapisync::overlay {

// One reading or detection from an external source.
struct DeviceEvent {
  SourceKind kind = SourceKind::kTemperature;
  std::string device_id;
  // Temperature or humidity reading.
  std::optional<double> value;
  // Face detection label, empty when the detection carried none.
  std::string face_label;
};

using EventCallback =
    std::function<void(std::chrono::system_clock::time_point timestamp, const DeviceEvent& event)>;

// Live subscription handle. `Cancel` must not return while a callback for this
// subscription is still running, and no callback may start afterwards.
// Destroying the handle cancels it.
class ISubscription {
public:
  virtual ~ISubscription() = default;
  virtual void Cancel() = 0;
};

// Device-event boundary. Callbacks may arrive on any thread.
class IDeviceEventSource {
public:
  virtual ~IDeviceEventSource() = default;

  // Returns nullptr when the source cannot serve `kind` for `device_id`.
  virtual std::unique_ptr<ISubscription> Listen(std::string_view device_id, SourceKind kind,
                                                EventCallback callback) = 0;
};

// What the registry knows about an external device.
struct DeviceHandle {
  std::string id;
  std::string name;
  bool has_temperature = false;
  bool has_humidity = false;
  // Unit shown after temperature readings, e.g. `°C`.
  std::string temperature_unit;
  std::optional<double> temperature;
  std::optional<double> humidity;
};

// Device registry boundary.
class IDeviceRegistry {
public:
  virtual ~IDeviceRegistry() = default;

  virtual bool Resolve(std::string_view device_id, DeviceHandle& handle) const = 0;

  // Ids offered as overlay sources.
  virtual std::vector<std::string> DeviceIds() const = 0;
};

} // namespace isapisync::overlay
