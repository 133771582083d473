#pragma once

#include "core/logging/logger.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace isapisync::config {

struct CameraConfig {
  std::string id;
  std::string host;
  std::uint16_t http_port = 80;
  std::string username;
  std::string password;
  std::string stream_channel = "101";
  bool use_https = false;
  std::chrono::milliseconds timeout{5000};
  // `digest` or `basic`.
  std::string auth = "digest";
};

enum class SensorKind {
  kTemperature,
  kHumidity,
  kFace,
};

const char* ToString(SensorKind kind);
bool ParseSensorKind(std::string_view raw, SensorKind& kind, std::string& error);

// File-backed source: the file holds the latest reading (a number, or a face
// label for `face`).
struct SensorConfig {
  std::string id;
  std::string name;
  SensorKind kind = SensorKind::kTemperature;
  std::string unit;
  std::filesystem::path path;
};

struct AppConfig {
  core::logging::LogLevel log_level = core::logging::LogLevel::kInfo;
  std::filesystem::path settings_dir = "state";
  std::chrono::milliseconds overlay_interval{10'000};
  std::vector<CameraConfig> cameras;
  std::vector<SensorConfig> sensors;

  const CameraConfig* FindCamera(std::string_view id) const;
};

// Parses and validates the JSON config. Relative `settings_dir` and sensor
// paths resolve against the config file's directory. Errors name the
// offending field, e.g. `cameras[1].host: expected a non-empty string`.
bool LoadAppConfig(const std::filesystem::path& path, AppConfig& config, std::string& error);
bool ParseAppConfig(std::string_view text, const std::filesystem::path& base_dir,
                    AppConfig& config, std::string& error);

std::filesystem::path SettingsPathFor(const AppConfig& config, std::string_view camera_id);

} // namespace isapisync::config
