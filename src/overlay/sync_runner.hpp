#pragma once

#include "core/logging/logger.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>

namespace isapisync::overlay {

// Periodic driver for one camera's reconciliation tick.
//
// The worker runs one tick right away, then waits for the interval or an
// explicit `Wake` (queued events, binding edits). Ticks run back to back on
// the single worker thread, so they never overlap. Wakes that arrive while a
// tick runs collapse into one follow-up tick.
class SyncRunner {
public:
  using TickFn = std::function<void()>;

  SyncRunner(std::chrono::milliseconds interval, TickFn tick, core::logging::CameraLog log);
  ~SyncRunner();

  SyncRunner(const SyncRunner&) = delete;
  SyncRunner& operator=(const SyncRunner&) = delete;

  void Start();
  // Wakes and joins the worker. Returns after the in-flight tick, if any.
  void Stop();
  void Wake();

  bool running() const;
  std::uint64_t tick_count() const;

private:
  void Run();

  std::chrono::milliseconds interval_;
  TickFn tick_;
  core::logging::CameraLog log_;

  mutable std::mutex mu_;
  std::condition_variable cv_;
  bool running_ = false;
  bool stop_requested_ = false;
  bool wake_requested_ = false;
  std::uint64_t ticks_ = 0;
  std::thread worker_;
};

} // namespace isapisync::overlay
