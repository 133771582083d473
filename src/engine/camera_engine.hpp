#pragma once

#include "config/app_config.hpp"
#include "core/logging/logger.hpp"
#include "isapi/capabilities.hpp"
#include "isapi/capability_fetcher.hpp"
#include "isapi/config_writer.hpp"
#include "isapi/isapi_client.hpp"
#include "overlay/device_events.hpp"
#include "overlay/overlay_sync_engine.hpp"
#include "overlay/sync_runner.hpp"
#include "settings/setting_definition.hpp"
#include "settings/settings_store.hpp"
#include "transport/http_transport.hpp"

#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace isapisync::engine {

// Owns everything that talks to one camera and is the settings boundary the
// host sees.
//
// `mu_` serializes every device exchange of this camera, including overlay
// ticks. The capability snapshot and the synthesized definitions are
// immutable once published; readers take a shared_ptr under `snapshot_mu_`
// and never block on device I/O.
class CameraEngine {
public:
  CameraEngine(config::CameraConfig camera, std::unique_ptr<transport::IHttpTransport> transport,
               std::filesystem::path settings_path, overlay::IDeviceEventSource& events,
               const overlay::IDeviceRegistry& registry, core::logging::Logger& logger);
  ~CameraEngine();

  CameraEngine(const CameraEngine&) = delete;
  CameraEngine& operator=(const CameraEngine&) = delete;

  // Loads persisted values, fetches every subsystem, seeds current values and
  // builds the first schema. Fails only when nothing at all could be fetched
  // or the settings file is unreadable.
  bool Initialize(std::string& error);

  // Visible settings, in schema order.
  std::vector<settings::SettingView> GetSettings() const;

  bool PutSetting(std::string_view key, std::string_view value, std::string& error);

  // Re-reads one subsystem, reseeds its values and regenerates the schema.
  bool Refetch(isapi::Subsystem subsystem, std::string& error);

  overlay::TickReport RunOverlayTick();

  bool ExportOverlayDocument(std::string& raw, std::string& error);
  // Stored `overlay:*` slot configuration.
  std::map<std::string, std::string> ExportOverlayBindings() const;

  // Copies `source`'s overlay document and slot bindings onto this camera,
  // then reconciles. Duplicating from itself is an error.
  bool DuplicateOverlaysFrom(CameraEngine& source, std::string& error);

  // Starts the periodic overlay reconciliation. A second call is a no-op.
  void StartOverlaySync(std::chrono::milliseconds interval);
  bool overlay_sync_running() const;

  // Stops the runner and cancels every subscription. Safe to call twice.
  void Shutdown();

  const std::string& id() const {
    return camera_.id;
  }

  std::shared_ptr<const isapi::CapabilitySet> capabilities() const;
  std::shared_ptr<const std::vector<settings::SettingDefinition>> definitions() const;

private:
  bool RefetchLocked(isapi::Subsystem subsystem, std::string& error);
  void RegenerateLocked();
  void Publish(std::shared_ptr<const isapi::CapabilitySet> caps);
  void SyncOverlaySlotsLocked(const isapi::CapabilitySet& caps);
  void SaveLocked();
  void WakeOverlaySync();

  config::CameraConfig camera_;
  core::logging::CameraLog log_;
  std::unique_ptr<transport::IHttpTransport> transport_;
  isapi::IsapiClient client_;
  isapi::CapabilityFetcher fetcher_;
  isapi::ConfigWriter writer_;
  settings::SettingsStore store_;
  const overlay::IDeviceRegistry* registry_ = nullptr;
  overlay::OverlaySyncEngine sync_;

  mutable std::mutex mu_;

  mutable std::mutex snapshot_mu_;
  std::shared_ptr<const isapi::CapabilitySet> caps_;
  std::shared_ptr<const std::vector<settings::SettingDefinition>> definitions_;

  mutable std::mutex runner_mu_;
  std::unique_ptr<overlay::SyncRunner> runner_;
};

} // namespace isapisync::engine
