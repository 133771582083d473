#ifndef ISAPISYNC_TESTS_COMMON_FAKE_DEVICES_HPP_
#define ISAPISYNC_TESTS_COMMON_FAKE_DEVICES_HPP_

#include "overlay/device_events.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace isapisync::tests::common {

// In-memory registry and event source. `Emit` delivers synchronously on the
// calling thread to every live listener of the device and kind.
class FakeDevices final : public overlay::IDeviceEventSource, public overlay::IDeviceRegistry {
public:
  FakeDevices() : listeners_(std::make_shared<Listeners>()) {}

  void AddTemperatureSensor(std::string id, std::string unit, std::optional<double> value) {
    overlay::DeviceHandle handle;
    handle.id = id;
    handle.name = id;
    handle.has_temperature = true;
    handle.temperature_unit = std::move(unit);
    handle.temperature = value;
    std::lock_guard<std::mutex> lock(mu_);
    devices_[std::move(id)] = std::move(handle);
  }

  void AddHumiditySensor(std::string id, std::optional<double> value) {
    overlay::DeviceHandle handle;
    handle.id = id;
    handle.name = id;
    handle.has_humidity = true;
    handle.humidity = value;
    std::lock_guard<std::mutex> lock(mu_);
    devices_[std::move(id)] = std::move(handle);
  }

  void SetReading(const std::string& id, double value) {
    std::lock_guard<std::mutex> lock(mu_);
    overlay::DeviceHandle& handle = devices_[id];
    if (handle.has_temperature) {
      handle.temperature = value;
    } else {
      handle.humidity = value;
    }
  }

  void Emit(const std::string& device_id, overlay::SourceKind kind, std::optional<double> value,
            std::string face_label = {}) {
    overlay::DeviceEvent event;
    event.kind = kind;
    event.device_id = device_id;
    event.value = value;
    event.face_label = std::move(face_label);
    std::lock_guard<std::mutex> lock(listeners_->mu);
    for (const auto& [id, listener] : listeners_->by_id) {
      if (listener.device_id == device_id && listener.kind == kind) {
        listener.callback(std::chrono::system_clock::now(), event);
      }
    }
  }

  std::size_t LiveListenerCount() const {
    std::lock_guard<std::mutex> lock(listeners_->mu);
    return listeners_->by_id.size();
  }

  std::size_t LiveListenerCount(std::string_view device_id) const {
    std::lock_guard<std::mutex> lock(listeners_->mu);
    std::size_t count = 0;
    for (const auto& [id, listener] : listeners_->by_id) {
      if (listener.device_id == device_id) {
        ++count;
      }
    }
    return count;
  }

  std::size_t listen_calls() const {
    std::lock_guard<std::mutex> lock(listeners_->mu);
    return listen_calls_;
  }

  std::unique_ptr<overlay::ISubscription> Listen(std::string_view device_id,
                                                 overlay::SourceKind kind,
                                                 overlay::EventCallback callback) override {
    std::lock_guard<std::mutex> lock(listeners_->mu);
    ++listen_calls_;
    const std::uint64_t id = listeners_->next_id++;
    listeners_->by_id.emplace(
        id, Listener{.device_id = std::string(device_id), .kind = kind,
                     .callback = std::move(callback)});
    return std::make_unique<Subscription>(listeners_, id);
  }

  bool Resolve(std::string_view device_id, overlay::DeviceHandle& handle) const override {
    std::lock_guard<std::mutex> lock(mu_);
    const auto it = devices_.find(std::string(device_id));
    if (it == devices_.end()) {
      return false;
    }
    handle = it->second;
    return true;
  }

  std::vector<std::string> DeviceIds() const override {
    std::lock_guard<std::mutex> lock(mu_);
    std::vector<std::string> ids;
    for (const auto& [id, handle] : devices_) {
      ids.push_back(id);
    }
    return ids;
  }

private:
  struct Listener {
    std::string device_id;
    overlay::SourceKind kind = overlay::SourceKind::kTemperature;
    overlay::EventCallback callback;
  };

  struct Listeners {
    std::mutex mu;
    std::uint64_t next_id = 1;
    std::map<std::uint64_t, Listener> by_id;
  };

  class Subscription final : public overlay::ISubscription {
  public:
    Subscription(std::weak_ptr<Listeners> listeners, std::uint64_t id)
        : listeners_(std::move(listeners)), id_(id) {}
    ~Subscription() override {
      Cancel();
    }
    void Cancel() override {
      if (auto listeners = listeners_.lock()) {
        std::lock_guard<std::mutex> lock(listeners->mu);
        listeners->by_id.erase(id_);
      }
      listeners_.reset();
    }

  private:
    std::weak_ptr<Listeners> listeners_;
    std::uint64_t id_ = 0;
  };

  mutable std::mutex mu_;
  std::map<std::string, overlay::DeviceHandle> devices_;
  std::shared_ptr<Listeners> listeners_;
  std::size_t listen_calls_ = 0;
};

} // namespace isapisync::tests::common

#endif // ISAPISYNC_TESTS_COMMON_FAKE_DEVICES_HPP_
