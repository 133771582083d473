#include "core/logging/logger.hpp"

#include <catch2/catch_test_macros.hpp>

#include <sstream>
#include <string>

namespace logging = isapisync::core::logging;

TEST_CASE("Records are single key=value lines with a camera id", "[core][logging]") {
  std::ostringstream out;
  logging::Logger logger(logging::LogLevel::kInfo, out);
  const logging::CameraLog log(logger, "gate");

  log.Info("setting applied", {{"key", "motionSensitivity"}, {"value", "60"}});
  const std::string line = out.str();

  REQUIRE(line.rfind("ts_utc=", 0) == 0U);
  REQUIRE(line.find(" level=INFO camera=\"gate\" msg=\"setting applied\"") != std::string::npos);
  REQUIRE(line.find(" key=\"motionSensitivity\" value=\"60\"\n") != std::string::npos);
  REQUIRE(line.find('\n') == line.size() - 1U);
}

TEST_CASE("Records below the minimum level are dropped", "[core][logging]") {
  std::ostringstream out;
  logging::Logger logger(logging::LogLevel::kWarn, out);

  logger.Debug("hidden");
  logger.Info("hidden");
  REQUIRE(out.str().empty());
  REQUIRE_FALSE(logger.ShouldLog(logging::LogLevel::kInfo));

  logger.Warn("shown");
  REQUIRE(out.str().find("level=WARN camera=\"-\" msg=\"shown\"") != std::string::npos);

  logger.SetMinLevel(logging::LogLevel::kDebug);
  REQUIRE(logger.MinLevel() == logging::LogLevel::kDebug);
  logger.Debug("now shown");
  REQUIRE(out.str().find("msg=\"now shown\"") != std::string::npos);
}

TEST_CASE("Values are quoted and escaped", "[core][logging]") {
  std::ostringstream out;
  logging::Logger logger(logging::LogLevel::kDebug, out);

  logger.Error("put failed", {{"error", "DEVICE_REJECTED: \"bad\"\nline\\2"}});
  REQUIRE(out.str().find("error=\"DEVICE_REJECTED: \\\"bad\\\"\\nline\\\\2\"") !=
          std::string::npos);
}

TEST_CASE("Log levels parse case-insensitively", "[core][logging]") {
  logging::LogLevel level = logging::LogLevel::kInfo;
  std::string error;

  REQUIRE(logging::ParseLogLevel("DEBUG", level, error));
  REQUIRE(level == logging::LogLevel::kDebug);
  REQUIRE(logging::ParseLogLevel("warning", level, error));
  REQUIRE(level == logging::LogLevel::kWarn);

  REQUIRE_FALSE(logging::ParseLogLevel("loud", level, error));
  REQUIRE(error == "invalid log level 'loud' (expected debug|info|warn|error)");
  REQUIRE_FALSE(logging::ParseLogLevel("", level, error));
  REQUIRE(error.find("missing log level") != std::string::npos);
}
