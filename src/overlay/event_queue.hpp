#pragma once

#include "overlay/device_events.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <iterator>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace isapisync::overlay {

// Event tagged with the slot binding that produced it. `generation` lets the
// consumer drop events from a binding that was replaced after they were queued.
struct SlotEvent {
  std::string slot_id;
  std::uint64_t generation = 0;
  std::chrono::system_clock::time_point timestamp;
  DeviceEvent event;
};

// Bounded multi-producer queue between subscription callbacks and the
// reconciliation tick. When full, the oldest event is discarded.
class EventQueue {
public:
  explicit EventQueue(std::size_t capacity = 256) : capacity_(capacity == 0 ? 1 : capacity) {}

  EventQueue(const EventQueue&) = delete;
  EventQueue& operator=(const EventQueue&) = delete;

  // Called after every push, outside the queue lock.
  void SetNotify(std::function<void()> notify) {
    std::lock_guard<std::mutex> lock(mu_);
    notify_ = std::move(notify);
  }

  void Push(SlotEvent event) {
    std::function<void()> notify;
    {
      std::lock_guard<std::mutex> lock(mu_);
      if (events_.size() >= capacity_) {
        events_.pop_front();
        ++dropped_;
      }
      events_.push_back(std::move(event));
      notify = notify_;
    }
    if (notify) {
      notify();
    }
  }

  std::vector<SlotEvent> Drain() {
    std::lock_guard<std::mutex> lock(mu_);
    std::vector<SlotEvent> drained(std::make_move_iterator(events_.begin()),
                                   std::make_move_iterator(events_.end()));
    events_.clear();
    return drained;
  }

  std::size_t size() const {
    std::lock_guard<std::mutex> lock(mu_);
    return events_.size();
  }

  std::uint64_t dropped() const {
    std::lock_guard<std::mutex> lock(mu_);
    return dropped_;
  }

private:
  mutable std::mutex mu_;
  std::size_t capacity_ = 256;
  std::deque<SlotEvent> events_;
  std::uint64_t dropped_ = 0;
  std::function<void()> notify_;
};

} // namespace isapisync::overlay
