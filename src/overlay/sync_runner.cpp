#include "overlay/sync_runner.hpp"

#include <utility>

namespace isapisync::overlay {

SyncRunner::SyncRunner(std::chrono::milliseconds interval, TickFn tick,
                       core::logging::CameraLog log)
    : interval_(interval.count() > 0 ? interval : std::chrono::milliseconds(10'000)),
      tick_(std::move(tick)), log_(std::move(log)) {}

SyncRunner::~SyncRunner() {
  Stop();
}

void SyncRunner::Start() {
  std::lock_guard<std::mutex> lock(mu_);
  if (running_) {
    return;
  }
  running_ = true;
  stop_requested_ = false;
  wake_requested_ = false;
  worker_ = std::thread([this]() { Run(); });
  log_.Info("overlay runner started",
            {{"interval_ms", std::to_string(interval_.count())}});
}

void SyncRunner::Stop() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (!running_) {
      return;
    }
    stop_requested_ = true;
  }
  cv_.notify_all();
  if (worker_.joinable()) {
    worker_.join();
  }
  {
    std::lock_guard<std::mutex> lock(mu_);
    running_ = false;
  }
  log_.Info("overlay runner stopped");
}

void SyncRunner::Wake() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    wake_requested_ = true;
  }
  cv_.notify_all();
}

bool SyncRunner::running() const {
  std::lock_guard<std::mutex> lock(mu_);
  return running_;
}

std::uint64_t SyncRunner::tick_count() const {
  std::lock_guard<std::mutex> lock(mu_);
  return ticks_;
}

void SyncRunner::Run() {
  while (true) {
    tick_();
    std::unique_lock<std::mutex> lock(mu_);
    ++ticks_;
    cv_.wait_for(lock, interval_, [this]() { return stop_requested_ || wake_requested_; });
    if (stop_requested_) {
      return;
    }
    wake_requested_ = false;
  }
}

} // namespace isapisync::overlay
