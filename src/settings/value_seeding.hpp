#pragma once

#include "isapi/capabilities.hpp"
#include "settings/settings_store.hpp"

#include <cstdint>
#include <string_view>

namespace isapisync::settings {

// Copies device-reported current values into the store in human units so the
// settings list shows what the camera actually runs with. Absent subsystems
// leave their keys untouched.
void SeedValuesFromCapabilities(const isapi::CapabilitySet& caps, SettingsStore& store);

// Same, restricted to one subsystem. Used after a refetch.
void SeedSubsystem(isapi::Subsystem subsystem, const isapi::CapabilitySet& caps,
                   SettingsStore& store);

// Bitrate value and bounds for the stream's active quality control mode.
struct BitrateRange {
  std::int64_t value = 0;
  std::int64_t min = 0;
  std::int64_t max = 0;
};

BitrateRange ActiveBitrate(const isapi::StreamVideo& video, std::string_view quality_control_type);

} // namespace isapisync::settings
