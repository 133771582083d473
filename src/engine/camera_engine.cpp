#include "engine/camera_engine.hpp"

#include "settings/schema_synthesizer.hpp"
#include "settings/update_handlers.hpp"
#include "settings/value_seeding.hpp"

#include <utility>

namespace isapisync::engine {

namespace {

constexpr std::string_view kOverlayKeyPrefix = "overlay:";

const settings::SettingDefinition*
FindDefinition(const std::vector<settings::SettingDefinition>& definitions,
               std::string_view key) {
  for (const settings::SettingDefinition& definition : definitions) {
    if (definition.key == key) {
      return &definition;
    }
  }
  return nullptr;
}

bool IsOverlayKey(std::string_view key) {
  return key.substr(0, kOverlayKeyPrefix.size()) == kOverlayKeyPrefix;
}

} // namespace

CameraEngine::CameraEngine(config::CameraConfig camera,
                           std::unique_ptr<transport::IHttpTransport> transport,
                           std::filesystem::path settings_path,
                           overlay::IDeviceEventSource& events,
                           const overlay::IDeviceRegistry& registry,
                           core::logging::Logger& logger)
    : camera_(std::move(camera)), log_(logger, camera_.id), transport_(std::move(transport)),
      client_(*transport_), fetcher_(client_, camera_.stream_channel, log_),
      writer_(client_, camera_.stream_channel, log_), store_(std::move(settings_path)),
      registry_(&registry), sync_(store_, writer_, events, registry, camera_.id, log_),
      caps_(std::make_shared<const isapi::CapabilitySet>()),
      definitions_(std::make_shared<const std::vector<settings::SettingDefinition>>()) {}

CameraEngine::~CameraEngine() {
  Shutdown();
}

std::shared_ptr<const isapi::CapabilitySet> CameraEngine::capabilities() const {
  std::lock_guard<std::mutex> lock(snapshot_mu_);
  return caps_;
}

std::shared_ptr<const std::vector<settings::SettingDefinition>> CameraEngine::definitions() const {
  std::lock_guard<std::mutex> lock(snapshot_mu_);
  return definitions_;
}

void CameraEngine::Publish(std::shared_ptr<const isapi::CapabilitySet> caps) {
  std::lock_guard<std::mutex> lock(snapshot_mu_);
  caps_ = std::move(caps);
}

void CameraEngine::RegenerateLocked() {
  const std::shared_ptr<const isapi::CapabilitySet> caps = capabilities();
  settings::SchemaOptions options;
  options.overlay_device_choices = registry_->DeviceIds();
  auto definitions = std::make_shared<const std::vector<settings::SettingDefinition>>(
      settings::SynthesizeSchema(*caps, store_, options));
  log_.Debug("schema regenerated", {{"definitions", std::to_string(definitions->size())}});

  std::lock_guard<std::mutex> lock(snapshot_mu_);
  definitions_ = std::move(definitions);
}

void CameraEngine::SyncOverlaySlotsLocked(const isapi::CapabilitySet& caps) {
  sync_.SyncSlots(settings::OverlaySlotIds(caps), caps.osd ? &*caps.osd : nullptr);
}

void CameraEngine::SaveLocked() {
  std::string error;
  if (!store_.Save(error)) {
    log_.Warn("settings not persisted", {{"path", store_.path().string()}, {"error", error}});
  }
}

bool CameraEngine::Initialize(std::string& error) {
  std::lock_guard<std::mutex> lock(mu_);
  if (!store_.Load(error)) {
    error = "settings load failed: " + error;
    return false;
  }

  auto caps = std::make_shared<isapi::CapabilitySet>();
  const int loaded = fetcher_.FetchAll(*caps);
  if (loaded == 0) {
    error = "camera '" + camera_.id + "' answered no capability request (host " + camera_.host +
            ")";
    return false;
  }

  settings::SeedValuesFromCapabilities(*caps, store_);
  SyncOverlaySlotsLocked(*caps);
  Publish(std::move(caps));
  RegenerateLocked();
  SaveLocked();
  log_.Info("camera initialized", {{"subsystems", std::to_string(loaded)}});
  return true;
}

std::vector<settings::SettingView> CameraEngine::GetSettings() const {
  const auto definitions = this->definitions();
  std::vector<settings::SettingView> views;
  views.reserve(definitions->size());
  for (const settings::SettingDefinition& definition : *definitions) {
    if (settings::IsVisible(definition, store_)) {
      views.push_back(settings::MakeView(definition, store_));
    }
  }
  return views;
}

bool CameraEngine::PutSetting(std::string_view key, std::string_view value, std::string& error) {
  bool wake_overlay = false;
  {
    std::lock_guard<std::mutex> lock(mu_);
    const auto definitions = this->definitions();
    const settings::SettingDefinition* definition = FindDefinition(*definitions, key);
    if (definition == nullptr) {
      error = "unknown setting '" + std::string(key) + "'";
      return false;
    }
    if (!settings::IsVisible(*definition, store_)) {
      error = "setting '" + std::string(key) + "' is not available in the current configuration";
      return false;
    }

    const auto caps = capabilities();
    settings::HandlerContext ctx{.writer = writer_,
                                 .caps = *caps,
                                 .store = store_,
                                 .log = log_,
                                 .now = std::chrono::system_clock::now()};
    settings::HandlerOutcome outcome;
    if (!settings::ApplySetting(*definition, value, ctx, outcome, error)) {
      log_.Warn("setting rejected", {{"key", key}, {"error", error}});
      return false;
    }

    if (outcome.refetch.has_value()) {
      std::string refetch_error;
      if (!RefetchLocked(*outcome.refetch, refetch_error)) {
        log_.Warn("refetch after put failed",
                  {{"subsystem", isapi::ToString(*outcome.refetch)}, {"error", refetch_error}});
      }
    } else if (outcome.regenerate) {
      RegenerateLocked();
    }
    SaveLocked();
    wake_overlay = outcome.overlay_changed;
  }

  if (wake_overlay) {
    WakeOverlaySync();
  }
  return true;
}

bool CameraEngine::RefetchLocked(isapi::Subsystem subsystem, std::string& error) {
  const auto current = capabilities();
  auto next = std::make_shared<isapi::CapabilitySet>();
  const bool ok = fetcher_.Refresh(subsystem, *current, *next, error);
  if (ok) {
    settings::SeedSubsystem(subsystem, *next, store_);
  }
  if (subsystem == isapi::Subsystem::kOsd) {
    SyncOverlaySlotsLocked(*next);
  }
  Publish(std::move(next));
  RegenerateLocked();
  return ok;
}

bool CameraEngine::Refetch(isapi::Subsystem subsystem, std::string& error) {
  std::lock_guard<std::mutex> lock(mu_);
  const bool ok = RefetchLocked(subsystem, error);
  SaveLocked();
  return ok;
}

overlay::TickReport CameraEngine::RunOverlayTick() {
  std::lock_guard<std::mutex> lock(mu_);
  return sync_.Tick();
}

bool CameraEngine::ExportOverlayDocument(std::string& raw, std::string& error) {
  std::lock_guard<std::mutex> lock(mu_);
  return writer_.FetchOverlayDocument(raw, error);
}

std::map<std::string, std::string> CameraEngine::ExportOverlayBindings() const {
  std::map<std::string, std::string> bindings;
  for (auto& [key, value] : store_.Snapshot()) {
    if (IsOverlayKey(key)) {
      bindings.emplace(key, value);
    }
  }
  return bindings;
}

bool CameraEngine::DuplicateOverlaysFrom(CameraEngine& source, std::string& error) {
  if (&source == this || source.id() == id()) {
    error = "cannot duplicate overlays of camera '" + id() + "' onto itself";
    return false;
  }

  // Read the source under its own lock only, so two cameras duplicating from
  // each other cannot deadlock.
  std::string document;
  if (!source.ExportOverlayDocument(document, error)) {
    error = "overlay export from '" + source.id() + "' failed: " + error;
    return false;
  }
  const std::map<std::string, std::string> bindings = source.ExportOverlayBindings();

  std::lock_guard<std::mutex> lock(mu_);
  if (!writer_.PutOverlayDocument(document, error)) {
    return false;
  }

  for (const auto& [key, value] : store_.Snapshot()) {
    if (IsOverlayKey(key) && bindings.find(key) == bindings.end()) {
      store_.Erase(key);
    }
  }
  for (const auto& [key, value] : bindings) {
    store_.Set(key, value);
  }

  sync_.ResetResolvedText();
  std::string refetch_error;
  if (!RefetchLocked(isapi::Subsystem::kOsd, refetch_error)) {
    log_.Warn("overlay refetch after duplicate failed", {{"error", refetch_error}});
  }
  SaveLocked();

  const overlay::TickReport report = sync_.Tick();
  log_.Info("overlays duplicated", {{"source", source.id()},
                                    {"bindings", std::to_string(bindings.size())},
                                    {"writes", std::to_string(report.writes)}});
  return true;
}

void CameraEngine::StartOverlaySync(std::chrono::milliseconds interval) {
  std::lock_guard<std::mutex> lock(runner_mu_);
  if (runner_) {
    return;
  }
  runner_ = std::make_unique<overlay::SyncRunner>(
      interval, [this]() { RunOverlayTick(); }, log_);
  sync_.queue().SetNotify([this]() { WakeOverlaySync(); });
  runner_->Start();
}

bool CameraEngine::overlay_sync_running() const {
  std::lock_guard<std::mutex> lock(runner_mu_);
  return runner_ && runner_->running();
}

void CameraEngine::WakeOverlaySync() {
  std::lock_guard<std::mutex> lock(runner_mu_);
  if (runner_) {
    runner_->Wake();
  }
}

void CameraEngine::Shutdown() {
  sync_.queue().SetNotify(nullptr);

  // Stop outside `runner_mu_`: a sensor callback may be waiting on it while
  // the worker's tick waits on that sensor source.
  std::unique_ptr<overlay::SyncRunner> runner;
  {
    std::lock_guard<std::mutex> lock(runner_mu_);
    runner = std::move(runner_);
  }
  if (runner) {
    runner->Stop();
  }

  std::lock_guard<std::mutex> lock(mu_);
  sync_.CancelAll();
}

} // namespace isapisync::engine
