#ifndef ISAPISYNC_ENGINE_CAMERA_REGISTRY_HPP_
#define ISAPISYNC_ENGINE_CAMERA_REGISTRY_HPP_

#include "engine/camera_engine.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace isapisync::engine {

// Live camera engines by id. Lookups hand out shared ownership so an engine
// stays valid for a caller even if it is unregistered concurrently.
class CameraRegistry {
public:
  bool Register(std::shared_ptr<CameraEngine> engine, std::string& error);
  // Returns the removed engine, or nullptr when the id is unknown.
  std::shared_ptr<CameraEngine> Unregister(std::string_view id);
  std::shared_ptr<CameraEngine> Find(std::string_view id) const;
  std::vector<std::string> Ids() const;

  // Shuts down and removes every engine.
  void ShutdownAll();

private:
  mutable std::mutex mu_;
  std::map<std::string, std::shared_ptr<CameraEngine>, std::less<>> engines_;
};

} // namespace isapisync::engine

#endif // ISAPISYNC_ENGINE_CAMERA_REGISTRY_HPP_
