#include "config/app_config.hpp"

#include "core/fs_utils.hpp"
#include "core/json_dom.hpp"

#include <cmath>
#include <limits>
#include <set>

namespace fs = std::filesystem;

namespace isapisync::config {

namespace {

using JsonValue = core::json::Value;

bool Fail(const std::string& field, std::string_view message, std::string& error) {
  error = field + ": " + std::string(message);
  return false;
}

bool ReadString(const JsonValue& object, std::string_view key, const std::string& field_prefix,
                bool required, std::string& out, std::string& error) {
  const JsonValue* value = object.Find(key);
  const std::string field = field_prefix + std::string(key);
  if (value == nullptr) {
    return required ? Fail(field, "missing required field", error) : true;
  }
  if (value->type != JsonValue::Type::kString) {
    return Fail(field, "expected a string", error);
  }
  if (required && value->string_value.empty()) {
    return Fail(field, "expected a non-empty string", error);
  }
  out = value->string_value;
  return true;
}

bool ReadInteger(const JsonValue& object, std::string_view key, const std::string& field_prefix,
                 std::int64_t min, std::int64_t max, std::int64_t& out, std::string& error) {
  const JsonValue* value = object.Find(key);
  if (value == nullptr) {
    return true;
  }
  const std::string field = field_prefix + std::string(key);
  if (value->type != JsonValue::Type::kNumber || !std::isfinite(value->number_value) ||
      std::floor(value->number_value) != value->number_value) {
    return Fail(field, "expected an integer", error);
  }
  if (value->number_value < static_cast<double>(min) ||
      value->number_value > static_cast<double>(max)) {
    return Fail(field,
                "out of range (expected " + std::to_string(min) + ".." + std::to_string(max) + ")",
                error);
  }
  out = static_cast<std::int64_t>(value->number_value);
  return true;
}

bool ReadBool(const JsonValue& object, std::string_view key, const std::string& field_prefix,
              bool& out, std::string& error) {
  const JsonValue* value = object.Find(key);
  if (value == nullptr) {
    return true;
  }
  if (value->type != JsonValue::Type::kBool) {
    return Fail(field_prefix + std::string(key), "expected true or false", error);
  }
  out = value->bool_value;
  return true;
}

fs::path Resolve(const fs::path& base_dir, const fs::path& raw) {
  if (raw.is_absolute() || base_dir.empty()) {
    return raw;
  }
  return base_dir / raw;
}

bool ParseCamera(const JsonValue& value, const std::string& prefix, CameraConfig& camera,
                 std::string& error) {
  if (!value.IsObject()) {
    return Fail(prefix.substr(0, prefix.size() - 1), "expected an object", error);
  }
  if (!ReadString(value, "id", prefix, true, camera.id, error) ||
      !ReadString(value, "host", prefix, true, camera.host, error) ||
      !ReadString(value, "username", prefix, false, camera.username, error) ||
      !ReadString(value, "password", prefix, false, camera.password, error) ||
      !ReadString(value, "stream_channel", prefix, false, camera.stream_channel, error) ||
      !ReadString(value, "auth", prefix, false, camera.auth, error) ||
      !ReadBool(value, "use_https", prefix, camera.use_https, error)) {
    return false;
  }

  std::int64_t port = camera.use_https ? 443 : 80;
  if (!ReadInteger(value, "http_port", prefix, 1, 65535, port, error)) {
    return false;
  }
  camera.http_port = static_cast<std::uint16_t>(port);

  std::int64_t timeout_ms = camera.timeout.count();
  if (!ReadInteger(value, "timeout_ms", prefix, 100, 120'000, timeout_ms, error)) {
    return false;
  }
  camera.timeout = std::chrono::milliseconds(timeout_ms);

  if (camera.stream_channel.empty() ||
      camera.stream_channel.find_first_not_of("0123456789") != std::string::npos) {
    return Fail(prefix + "stream_channel", "expected digits such as 101", error);
  }
  if (camera.auth != "digest" && camera.auth != "basic") {
    return Fail(prefix + "auth", "expected digest|basic", error);
  }
  return true;
}

bool ParseSensor(const JsonValue& value, const std::string& prefix, const fs::path& base_dir,
                 SensorConfig& sensor, std::string& error) {
  if (!value.IsObject()) {
    return Fail(prefix.substr(0, prefix.size() - 1), "expected an object", error);
  }
  std::string kind;
  std::string path;
  if (!ReadString(value, "id", prefix, true, sensor.id, error) ||
      !ReadString(value, "name", prefix, false, sensor.name, error) ||
      !ReadString(value, "kind", prefix, true, kind, error) ||
      !ReadString(value, "unit", prefix, false, sensor.unit, error) ||
      !ReadString(value, "path", prefix, true, path, error)) {
    return false;
  }
  std::string kind_error;
  if (!ParseSensorKind(kind, sensor.kind, kind_error)) {
    return Fail(prefix + "kind", kind_error, error);
  }
  if (sensor.name.empty()) {
    sensor.name = sensor.id;
  }
  if (sensor.unit.empty() && sensor.kind == SensorKind::kTemperature) {
    sensor.unit = "°C";
  }
  sensor.path = Resolve(base_dir, path);
  return true;
}

} // namespace

const char* ToString(SensorKind kind) {
  switch (kind) {
  case SensorKind::kTemperature:
    return "temperature";
  case SensorKind::kHumidity:
    return "humidity";
  case SensorKind::kFace:
    return "face";
  }
  return "temperature";
}

bool ParseSensorKind(std::string_view raw, SensorKind& kind, std::string& error) {
  if (raw == "temperature") {
    kind = SensorKind::kTemperature;
    return true;
  }
  if (raw == "humidity") {
    kind = SensorKind::kHumidity;
    return true;
  }
  if (raw == "face") {
    kind = SensorKind::kFace;
    return true;
  }
  error = "invalid sensor kind '" + std::string(raw) + "' (expected temperature|humidity|face)";
  return false;
}

const CameraConfig* AppConfig::FindCamera(std::string_view id) const {
  for (const CameraConfig& camera : cameras) {
    if (camera.id == id) {
      return &camera;
    }
  }
  return nullptr;
}

bool ParseAppConfig(std::string_view text, const fs::path& base_dir, AppConfig& config,
                    std::string& error) {
  JsonValue root;
  if (!core::json::Parse(text, root, error)) {
    return false;
  }
  if (!root.IsObject()) {
    error = "config root must be a JSON object";
    return false;
  }

  AppConfig parsed;
  std::string log_level;
  if (!ReadString(root, "log_level", "", false, log_level, error)) {
    return false;
  }
  if (!log_level.empty()) {
    std::string level_error;
    if (!core::logging::ParseLogLevel(log_level, parsed.log_level, level_error)) {
      return Fail("log_level", level_error, error);
    }
  }

  std::string settings_dir = "state";
  if (!ReadString(root, "settings_dir", "", false, settings_dir, error)) {
    return false;
  }
  if (settings_dir.empty()) {
    return Fail("settings_dir", "expected a non-empty string", error);
  }
  parsed.settings_dir = Resolve(base_dir, settings_dir);

  std::int64_t interval_ms = parsed.overlay_interval.count();
  if (!ReadInteger(root, "overlay_interval_ms", "", 500, 3'600'000, interval_ms, error)) {
    return false;
  }
  parsed.overlay_interval = std::chrono::milliseconds(interval_ms);

  const JsonValue* cameras = root.Find("cameras");
  if (cameras == nullptr || cameras->type != JsonValue::Type::kArray ||
      cameras->array_value.empty()) {
    return Fail("cameras", "expected a non-empty array", error);
  }
  std::set<std::string> camera_ids;
  for (std::size_t i = 0; i < cameras->array_value.size(); ++i) {
    const std::string prefix = "cameras[" + std::to_string(i) + "].";
    CameraConfig camera;
    if (!ParseCamera(cameras->array_value[i], prefix, camera, error)) {
      return false;
    }
    if (!camera_ids.insert(camera.id).second) {
      return Fail(prefix + "id", "duplicate camera id '" + camera.id + "'", error);
    }
    parsed.cameras.push_back(std::move(camera));
  }

  if (const JsonValue* sensors = root.Find("sensors"); sensors != nullptr) {
    if (sensors->type != JsonValue::Type::kArray) {
      return Fail("sensors", "expected an array", error);
    }
    std::set<std::string> sensor_ids;
    for (std::size_t i = 0; i < sensors->array_value.size(); ++i) {
      const std::string prefix = "sensors[" + std::to_string(i) + "].";
      SensorConfig sensor;
      if (!ParseSensor(sensors->array_value[i], prefix, base_dir, sensor, error)) {
        return false;
      }
      if (!sensor_ids.insert(sensor.id).second) {
        return Fail(prefix + "id", "duplicate sensor id '" + sensor.id + "'", error);
      }
      parsed.sensors.push_back(std::move(sensor));
    }
  }

  config = std::move(parsed);
  return true;
}

bool LoadAppConfig(const fs::path& path, AppConfig& config, std::string& error) {
  std::string text;
  if (!core::ReadTextFile(path, text, error)) {
    return false;
  }
  if (!ParseAppConfig(text, path.parent_path(), config, error)) {
    error = path.string() + ": " + error;
    return false;
  }
  return true;
}

fs::path SettingsPathFor(const AppConfig& config, std::string_view camera_id) {
  return config.settings_dir / (std::string(camera_id) + ".json");
}

} // namespace isapisync::config
