#include "../common/assertions.hpp"
#include "core/logging/logger.hpp"
#include "overlay/sync_runner.hpp"

#include <atomic>
#include <chrono>
#include <sstream>
#include <thread>

namespace {

// Polls `done` for up to two seconds.
template <typename Predicate>
bool WaitFor(Predicate done) {
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
  while (std::chrono::steady_clock::now() < deadline) {
    if (done()) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return done();
}

} // namespace

int main() {
  using isapisync::overlay::SyncRunner;
  using isapisync::tests::common::AssertContains;
  using isapisync::tests::common::AssertTrue;

  std::ostringstream log_sink;
  isapisync::core::logging::Logger logger(isapisync::core::logging::LogLevel::kInfo, log_sink);
  const isapisync::core::logging::CameraLog log(logger, "cam1");

  std::atomic<int> ticks{0};
  SyncRunner runner(std::chrono::hours(1), [&ticks]() { ++ticks; }, log);
  AssertTrue(!runner.running(), "runner idle before start");

  runner.Start();
  AssertTrue(runner.running(), "runner running after start");
  AssertTrue(WaitFor([&ticks]() { return ticks.load() >= 1; }), "first tick runs immediately");
  AssertTrue(WaitFor([&runner]() { return runner.tick_count() >= 1U; }), "tick counted");

  // The interval is an hour, so only a wake can produce the second tick.
  runner.Wake();
  AssertTrue(WaitFor([&ticks]() { return ticks.load() >= 2; }), "wake triggers a tick");

  runner.Start();
  runner.Stop();
  AssertTrue(!runner.running(), "runner stopped");
  const int after_stop = ticks.load();
  runner.Wake();
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  AssertTrue(ticks.load() == after_stop, "no tick after stop");
  runner.Stop();

  AssertContains(log_sink.str(), "overlay runner started");
  AssertContains(log_sink.str(), "interval_ms=\"3600000\"");
  AssertContains(log_sink.str(), "overlay runner stopped");
  return 0;
}
