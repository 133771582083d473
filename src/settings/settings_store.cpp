#include "settings/settings_store.hpp"

#include "core/fs_utils.hpp"
#include "core/json_dom.hpp"
#include "core/string_utils.hpp"

#include <system_error>

namespace isapisync::settings {

bool SettingsStore::Load(std::string& error) {
  if (path_.empty()) {
    return true;
  }
  std::error_code ec;
  if (!std::filesystem::exists(path_, ec)) {
    return true;
  }

  std::string text;
  if (!core::ReadTextFile(path_, text, error)) {
    return false;
  }

  core::json::Value root;
  std::string parse_error;
  if (!core::json::Parse(text, root, parse_error)) {
    error = "invalid settings file " + path_.string() + ": " + parse_error;
    return false;
  }
  if (!root.IsObject()) {
    error = "invalid settings file " + path_.string() + ": expected a JSON object";
    return false;
  }

  std::map<std::string, std::string, std::less<>> loaded;
  for (const auto& [key, value] : root.object_value) {
    switch (value.type) {
    case core::json::Value::Type::kString:
      loaded[key] = value.string_value;
      break;
    case core::json::Value::Type::kBool:
      loaded[key] = core::BoolText(value.bool_value);
      break;
    case core::json::Value::Type::kNumber:
      loaded[key] = std::to_string(static_cast<long long>(value.number_value));
      break;
    default:
      break;
    }
  }

  std::lock_guard<std::mutex> lock(mu_);
  values_ = std::move(loaded);
  return true;
}

bool SettingsStore::Save(std::string& error) const {
  if (path_.empty()) {
    return true;
  }
  const std::map<std::string, std::string> snapshot = Snapshot();
  return core::WriteTextFileAtomic(path_, core::json::WriteStringObject(snapshot), error);
}

std::optional<std::string> SettingsStore::Get(std::string_view key) const {
  std::lock_guard<std::mutex> lock(mu_);
  const auto it = values_.find(key);
  if (it == values_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::string SettingsStore::GetOr(std::string_view key, std::string_view fallback) const {
  std::optional<std::string> value = Get(key);
  return value.has_value() ? std::move(*value) : std::string(fallback);
}

bool SettingsStore::GetBool(std::string_view key, const bool fallback) const {
  const std::optional<std::string> value = Get(key);
  bool parsed = fallback;
  if (!value.has_value() || !core::ParseBoolText(*value, parsed)) {
    return fallback;
  }
  return parsed;
}

void SettingsStore::Set(std::string_view key, std::string value) {
  std::lock_guard<std::mutex> lock(mu_);
  values_.insert_or_assign(std::string(key), std::move(value));
}

void SettingsStore::SetBool(std::string_view key, const bool value) {
  Set(key, core::BoolText(value));
}

void SettingsStore::Erase(std::string_view key) {
  std::lock_guard<std::mutex> lock(mu_);
  const auto it = values_.find(key);
  if (it != values_.end()) {
    values_.erase(it);
  }
}

std::map<std::string, std::string> SettingsStore::Snapshot() const {
  std::lock_guard<std::mutex> lock(mu_);
  return std::map<std::string, std::string>(values_.begin(), values_.end());
}

} // namespace isapisync::settings
