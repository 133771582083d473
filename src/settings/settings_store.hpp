#pragma once

#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace isapisync::settings {

// Persisted per-camera setting values, all stored as strings in human units.
//
// The store is shared between the settings boundary and the overlay runner
// thread, so every accessor takes the internal mutex. `Save` writes the whole
// map as a flat JSON object through a temp file and rename.
class SettingsStore {
public:
  SettingsStore() = default;
  explicit SettingsStore(std::filesystem::path path) : path_(std::move(path)) {}

  SettingsStore(const SettingsStore&) = delete;
  SettingsStore& operator=(const SettingsStore&) = delete;

  // A missing file is not an error; the store simply starts empty.
  bool Load(std::string& error);
  bool Save(std::string& error) const;

  std::optional<std::string> Get(std::string_view key) const;
  std::string GetOr(std::string_view key, std::string_view fallback) const;
  bool GetBool(std::string_view key, bool fallback = false) const;

  void Set(std::string_view key, std::string value);
  void SetBool(std::string_view key, bool value);
  void Erase(std::string_view key);

  std::map<std::string, std::string> Snapshot() const;

  const std::filesystem::path& path() const {
    return path_;
  }

private:
  std::filesystem::path path_;
  mutable std::mutex mu_;
  std::map<std::string, std::string, std::less<>> values_;
};

} // namespace isapisync::settings
