#include "transcode/value_transcoder.hpp"

#include "core/string_utils.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>

namespace isapisync::transcode {

namespace {

constexpr std::int64_t kNtpMaxHours = 36;

struct FixedQualityEntry {
  std::int64_t value;
  const char* label;
};

constexpr std::array<FixedQualityEntry, 6> kFixedQualityTable = {{
    {1, "Minimum (1)"},
    {20, "Very Low (20)"},
    {40, "Low (40)"},
    {60, "Medium (60)"},
    {80, "High (80)"},
    {100, "Maximum (100)"},
}};

bool ParseUnsignedDigits(std::string_view raw, std::int64_t& value) {
  if (raw.empty()) {
    return false;
  }
  for (const char c : raw) {
    if (std::isdigit(static_cast<unsigned char>(c)) == 0) {
      return false;
    }
  }
  return core::ParseInt64(raw, value);
}

// Splits `<letters><sign><hours><rest>` such as `UTC+2:00:00` or
// `CST-2:00:00`. `rest` keeps the minute and second part verbatim.
bool SplitOffset(std::string_view text, std::string_view& prefix, char& sign, std::int64_t& hours,
                 std::string_view& rest) {
  std::size_t cursor = 0;
  while (cursor < text.size() && std::isalpha(static_cast<unsigned char>(text[cursor])) != 0) {
    ++cursor;
  }
  if (cursor == 0 || cursor >= text.size()) {
    return false;
  }
  prefix = text.substr(0, cursor);
  sign = text[cursor];
  if (sign != '+' && sign != '-') {
    return false;
  }
  ++cursor;
  const std::size_t hours_begin = cursor;
  while (cursor < text.size() && std::isdigit(static_cast<unsigned char>(text[cursor])) != 0) {
    ++cursor;
  }
  if (!ParseUnsignedDigits(text.substr(hours_begin, cursor - hours_begin), hours)) {
    return false;
  }
  rest = text.substr(cursor);
  return rest.empty() || rest.front() == ':';
}

bool IsZeroOffset(std::int64_t hours, std::string_view rest) {
  if (hours != 0) {
    return false;
  }
  for (const char c : rest) {
    if (c != ':' && c != '0') {
      return false;
    }
  }
  return true;
}

std::string_view StripDst(std::string_view wire) {
  const std::size_t dst = wire.find("DST");
  return dst == std::string_view::npos ? wire : wire.substr(0, dst);
}

} // namespace

std::string FrameRateToLabel(const std::int64_t centi_fps) {
  if (centi_fps >= 100) {
    return std::to_string(centi_fps / 100);
  }
  if (centi_fps <= 0) {
    return "0";
  }
  return "1/" + std::to_string(std::llround(100.0 / static_cast<double>(centi_fps)));
}

bool ParseFrameRateLabel(std::string_view label, std::int64_t& centi_fps) {
  const std::string trimmed = core::Trim(label);
  const std::size_t slash = trimmed.find('/');
  if (slash == std::string::npos) {
    std::int64_t whole = 0;
    if (!ParseUnsignedDigits(trimmed, whole)) {
      return false;
    }
    centi_fps = whole * 100;
    return true;
  }

  std::int64_t numerator = 0;
  std::int64_t denominator = 0;
  if (!ParseUnsignedDigits(std::string_view(trimmed).substr(0, slash), numerator) ||
      !ParseUnsignedDigits(std::string_view(trimmed).substr(slash + 1), denominator) ||
      denominator == 0) {
    return false;
  }
  centi_fps = std::llround(100.0 * static_cast<double>(numerator) /
                           static_cast<double>(denominator));
  return true;
}

std::int64_t GovLengthToSeconds(const std::int64_t frames, const std::int64_t centi_fps) {
  if (centi_fps <= 0) {
    return 0;
  }
  const double fps = static_cast<double>(centi_fps) / 100.0;
  return std::llround(static_cast<double>(frames) / fps);
}

std::int64_t SecondsToGovLength(const std::int64_t seconds, const std::int64_t centi_fps) {
  if (centi_fps <= 0) {
    return 0;
  }
  const double fps = static_cast<double>(centi_fps) / 100.0;
  return std::llround(static_cast<double>(seconds) * fps);
}

std::vector<std::string> GovLengthSecondChoices(const std::int64_t min_frames,
                                                const std::int64_t max_frames,
                                                const std::int64_t centi_fps) {
  std::vector<std::string> choices;
  if (centi_fps <= 0) {
    return choices;
  }
  const double fps = static_cast<double>(centi_fps) / 100.0;
  const auto first = static_cast<std::int64_t>(std::ceil(static_cast<double>(min_frames) / fps));
  const auto last = static_cast<std::int64_t>(std::floor(static_cast<double>(max_frames) / fps));
  for (std::int64_t seconds = first; seconds <= last; ++seconds) {
    choices.push_back(std::to_string(seconds));
  }
  return choices;
}

const std::vector<std::int64_t>& StandardBitrateLadder() {
  static const std::vector<std::int64_t> kLadder = {
      32,   48,   64,   80,   96,   128,  160,  192,  224,   256,   320,   384,
      448,  512,  640,  768,  896,  1024, 1280, 1536, 1792,  2048,  2560,  3072,
      3584, 4096, 5120, 6144, 7168, 8192, 10240, 12288, 14336, 16384,
  };
  return kLadder;
}

std::vector<std::string> GenerateBitrateChoices(const std::int64_t min_kbps,
                                                const std::int64_t max_kbps) {
  std::vector<std::string> choices;
  if (min_kbps > max_kbps) {
    return choices;
  }

  std::vector<std::int64_t> values;
  for (const std::int64_t rung : StandardBitrateLadder()) {
    if (rung >= min_kbps && rung <= max_kbps) {
      values.push_back(rung);
    }
  }
  values.push_back(min_kbps);
  values.push_back(max_kbps);
  std::sort(values.begin(), values.end());
  values.erase(std::unique(values.begin(), values.end()), values.end());

  choices.reserve(values.size());
  for (const std::int64_t value : values) {
    choices.push_back(std::to_string(value));
  }
  return choices;
}

bool HumanToWireTimezone(std::string_view human, const bool daylight_saving, std::string& wire) {
  std::string_view prefix;
  char sign = '+';
  std::int64_t hours = 0;
  std::string_view rest;
  const std::string trimmed = core::Trim(human);
  if (!SplitOffset(trimmed, prefix, sign, hours, rest) || prefix != "UTC") {
    return false;
  }

  const char wire_sign = IsZeroOffset(hours, rest) ? '-' : (sign == '+' ? '-' : '+');
  std::string base = "CST";
  base.push_back(wire_sign);
  base += std::to_string(hours);
  base += rest;
  wire = SetWireTimezoneDst(base, daylight_saving);
  return true;
}

bool WireToHumanTimezone(std::string_view wire, std::string& human) {
  std::string_view prefix;
  char sign = '+';
  std::int64_t hours = 0;
  std::string_view rest;
  const std::string trimmed = core::Trim(StripDst(wire));
  if (!SplitOffset(trimmed, prefix, sign, hours, rest)) {
    return false;
  }

  const char human_sign = IsZeroOffset(hours, rest) ? '+' : (sign == '-' ? '+' : '-');
  human = "UTC";
  human.push_back(human_sign);
  human += std::to_string(hours);
  human += rest;
  return true;
}

bool WireTimezoneHasDst(std::string_view wire) {
  return wire.find("DST") != std::string_view::npos;
}

std::string SetWireTimezoneDst(std::string_view wire, const bool enabled) {
  std::string base(StripDst(wire));
  if (enabled) {
    base += kDstRule;
  }
  return base;
}

std::vector<std::string> TimezoneChoices() {
  std::vector<std::string> choices;
  for (int offset = -12; offset <= 12; ++offset) {
    choices.push_back(std::string("UTC") + (offset < 0 ? "-" : "+") +
                      std::to_string(offset < 0 ? -offset : offset) + ":00:00");
  }
  return choices;
}

std::string FixedQualityToLabel(const std::int64_t quality) {
  for (const FixedQualityEntry& entry : kFixedQualityTable) {
    if (entry.value == quality) {
      return entry.label;
    }
  }
  return "Custom (" + std::to_string(quality) + ")";
}

bool ParseFixedQualityLabel(std::string_view label, std::int64_t& quality) {
  const std::size_t open = label.find('(');
  if (open == std::string_view::npos) {
    return ParseUnsignedDigits(core::Trim(label), quality);
  }
  const std::size_t close = label.find(')', open);
  if (close == std::string_view::npos) {
    return false;
  }
  return ParseUnsignedDigits(core::Trim(label.substr(open + 1, close - open - 1)), quality);
}

std::vector<std::string> FixedQualityChoices() {
  std::vector<std::string> choices;
  for (const FixedQualityEntry& entry : kFixedQualityTable) {
    choices.emplace_back(entry.label);
  }
  return choices;
}

std::vector<std::string> SensitivityChoices(const std::int64_t min, const std::int64_t max,
                                            const std::int64_t step) {
  std::vector<std::string> choices{std::to_string(min)};
  if (step <= 0) {
    return choices;
  }
  for (std::int64_t value = min + step; value <= max; value += step) {
    choices.push_back(std::to_string(value));
  }
  return choices;
}

std::vector<std::string> SpeakerVolumeChoices(const std::int64_t min, const std::int64_t max) {
  std::vector<std::string> choices;
  for (std::int64_t value = min; value <= max; value += 10) {
    choices.push_back(std::to_string(value));
  }
  const std::string max_label = std::to_string(max);
  if (max >= min && std::find(choices.begin(), choices.end(), max_label) == choices.end()) {
    choices.push_back(max_label);
  }
  return choices;
}

std::string NtpIntervalLabel(const std::int64_t minutes) {
  std::int64_t hours = std::llround(static_cast<double>(minutes) / 60.0);
  if (hours < 1) {
    hours = 1;
  }
  return std::to_string(hours) + (hours > 1 ? " hours" : " hour");
}

bool ParseNtpIntervalLabel(std::string_view label, std::int64_t& minutes) {
  const std::string trimmed = core::Trim(label);
  const std::size_t space = trimmed.find(' ');
  if (space == std::string::npos || trimmed.compare(space + 1, 4, "hour") != 0) {
    return false;
  }
  std::int64_t hours = 0;
  if (!ParseUnsignedDigits(std::string_view(trimmed).substr(0, space), hours) || hours < 1) {
    return false;
  }
  minutes = hours * 60;
  return true;
}

std::vector<std::string> NtpIntervalChoices() {
  std::vector<std::string> choices;
  for (std::int64_t hours = 1; hours <= kNtpMaxHours; ++hours) {
    choices.push_back(NtpIntervalLabel(hours * 60));
  }
  return choices;
}

std::string ResolutionLabel(const std::int64_t width, const std::int64_t height) {
  return std::to_string(width) + "x" + std::to_string(height);
}

bool ParseResolutionLabel(std::string_view label, std::int64_t& width, std::int64_t& height) {
  const std::string trimmed = core::Trim(label);
  const std::size_t separator = trimmed.find('x');
  if (separator == std::string::npos) {
    return false;
  }
  std::int64_t parsed_width = 0;
  std::int64_t parsed_height = 0;
  if (!ParseUnsignedDigits(std::string_view(trimmed).substr(0, separator), parsed_width) ||
      !ParseUnsignedDigits(std::string_view(trimmed).substr(separator + 1), parsed_height)) {
    return false;
  }
  width = parsed_width;
  height = parsed_height;
  return true;
}

} // namespace isapisync::transcode
