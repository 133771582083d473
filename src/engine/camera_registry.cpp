#include "engine/camera_registry.hpp"

#include <utility>

namespace isapisync::engine {

bool CameraRegistry::Register(std::shared_ptr<CameraEngine> engine, std::string& error) {
  if (!engine) {
    error = "cannot register a null camera engine";
    return false;
  }
  std::lock_guard<std::mutex> lock(mu_);
  const std::string id = engine->id();
  if (!engines_.emplace(id, std::move(engine)).second) {
    error = "camera '" + id + "' is already registered";
    return false;
  }
  return true;
}

std::shared_ptr<CameraEngine> CameraRegistry::Unregister(std::string_view id) {
  std::lock_guard<std::mutex> lock(mu_);
  const auto it = engines_.find(id);
  if (it == engines_.end()) {
    return nullptr;
  }
  std::shared_ptr<CameraEngine> removed = std::move(it->second);
  engines_.erase(it);
  return removed;
}

std::shared_ptr<CameraEngine> CameraRegistry::Find(std::string_view id) const {
  std::lock_guard<std::mutex> lock(mu_);
  const auto it = engines_.find(id);
  return it == engines_.end() ? nullptr : it->second;
}

std::vector<std::string> CameraRegistry::Ids() const {
  std::lock_guard<std::mutex> lock(mu_);
  std::vector<std::string> ids;
  ids.reserve(engines_.size());
  for (const auto& [id, engine] : engines_) {
    ids.push_back(id);
  }
  return ids;
}

void CameraRegistry::ShutdownAll() {
  std::map<std::string, std::shared_ptr<CameraEngine>, std::less<>> engines;
  {
    std::lock_guard<std::mutex> lock(mu_);
    engines.swap(engines_);
  }
  for (auto& [id, engine] : engines) {
    engine->Shutdown();
  }
}

} // namespace isapisync::engine
