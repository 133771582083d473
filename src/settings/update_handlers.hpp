#pragma once

#include "core/logging/logger.hpp"
#include "isapi/capabilities.hpp"
#include "isapi/config_writer.hpp"
#include "settings/setting_definition.hpp"
#include "settings/settings_store.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace isapisync::settings {

// Everything a handler may touch. Handlers are stateless; the snapshot is the
// one current when the put arrived.
struct HandlerContext {
  isapi::ConfigWriter& writer;
  const isapi::CapabilitySet& caps;
  SettingsStore& store;
  const core::logging::CameraLog& log;
  std::chrono::system_clock::time_point now;
};

// Follow-up work the caller owes after a successful put.
struct HandlerOutcome {
  bool regenerate = false;
  std::optional<isapi::Subsystem> refetch;
  bool overlay_changed = false;
};

// Checks `raw` against the definition's kind and choices and returns the
// canonical stored form (`true`/`false` for booleans, base-10 for numbers).
bool NormalizeSettingValue(const SettingDefinition& definition, std::string_view raw,
                           std::string& normalized, std::string& error);

// Runs the definition's handler and stores the new value once the device
// accepted it. A value equal to the stored one is a no-op, except for
// buttons which always fire. Readonly definitions are rejected.
bool ApplySetting(const SettingDefinition& definition, std::string_view raw, HandlerContext& ctx,
                  HandlerOutcome& outcome, std::string& error);

} // namespace isapisync::settings
