#include "isapi/capabilities.hpp"

#include "core/string_utils.hpp"

namespace isapisync::isapi {

const char* ToString(const Subsystem subsystem) {
  switch (subsystem) {
  case Subsystem::kMotion:
    return "motion";
  case Subsystem::kStreams:
    return "streams";
  case Subsystem::kAudio:
    return "audio";
  case Subsystem::kTime:
    return "time";
  case Subsystem::kOsd:
    return "osd";
  case Subsystem::kPtz:
    return "ptz";
  case Subsystem::kDeviceInfo:
    return "info";
  }
  return "motion";
}

std::vector<Subsystem> AllSubsystems() {
  return {Subsystem::kDeviceInfo, Subsystem::kMotion, Subsystem::kStreams, Subsystem::kAudio,
          Subsystem::kTime,       Subsystem::kOsd,    Subsystem::kPtz};
}

bool ParseSubsystem(std::string_view raw, Subsystem& subsystem, std::string& error) {
  const std::string normalized = core::ToLower(core::Trim(raw));
  for (const Subsystem candidate : AllSubsystems()) {
    if (normalized == ToString(candidate)) {
      subsystem = candidate;
      return true;
    }
  }
  error = "invalid subsystem '" + std::string(raw) +
          "' (expected motion|streams|audio|time|osd|ptz|info)";
  return false;
}

bool CapabilitySet::Has(const Subsystem subsystem) const {
  switch (subsystem) {
  case Subsystem::kMotion:
    return motion.has_value();
  case Subsystem::kStreams:
    return streams.has_value();
  case Subsystem::kAudio:
    return audio.has_value();
  case Subsystem::kTime:
    return time.has_value();
  case Subsystem::kOsd:
    return osd.has_value();
  case Subsystem::kPtz:
    return ptz.has_value();
  case Subsystem::kDeviceInfo:
    return device_info.has_value();
  }
  return false;
}

const StreamChannel* CapabilitySet::FindStream(std::string_view id) const {
  if (!streams.has_value()) {
    return nullptr;
  }
  for (const StreamChannel& channel : *streams) {
    if (channel.id == id) {
      return &channel;
    }
  }
  return nullptr;
}

} // namespace isapisync::isapi
