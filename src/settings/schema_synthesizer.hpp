#pragma once

#include "isapi/capabilities.hpp"
#include "settings/setting_definition.hpp"
#include "settings/settings_store.hpp"

#include <string>
#include <vector>

namespace isapisync::settings {

struct SchemaOptions {
  // Registry device ids offered for Device-type overlay slots.
  std::vector<std::string> overlay_device_choices;
};

// Builds the ordered setting list for one camera from a capability snapshot.
//
// Order by subgroup: Info, Motion, Stream, Audio, Time, OSD, overlay slots,
// PTZ. Absent subsystems contribute nothing. Stored values are consulted only
// where they change a definition itself (bitrate range for the active quality
// control mode, overlay text readonly flag); conditional visibility is left to
// the rule on each definition and evaluated when the list is read.
std::vector<SettingDefinition> SynthesizeSchema(const isapi::CapabilitySet& caps,
                                                const SettingsStore& store,
                                                const SchemaOptions& options);

bool IsVisible(const SettingDefinition& definition, const SettingsStore& store);

SettingView MakeView(const SettingDefinition& definition, const SettingsStore& store);

// Overlay slot ids for a snapshot: `1..capacity`, 8 without an OSD snapshot.
std::vector<std::string> OverlaySlotIds(const isapi::CapabilitySet& caps);

// Preset ids shown for a PTZ snapshot: `1..min(max, 32)` minus reserved numbers.
std::vector<std::int64_t> VisiblePresetIds(const isapi::PtzCapabilities& ptz);

} // namespace isapisync::settings
