#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace isapisync::transcode {

// Conversions between device wire units and the strings shown in the settings
// list. Every label function has an inverse parser; the parsers return false
// on text they do not recognize and leave the output untouched.

// Frame rates travel in hundredths of a frame per second.
//
// - `n >= 100` renders as the whole-fps integer (`2500` -> `"25"`).
// - `0 < n < 100` renders as a fraction of one frame (`50` -> `"1/2"`).
// - `n <= 0` renders as `"0"`.
std::string FrameRateToLabel(std::int64_t centi_fps);
bool ParseFrameRateLabel(std::string_view label, std::int64_t& centi_fps);

// GOP length is stored in frames and shown as whole seconds at the stream's
// current frame rate. A non-positive frame rate maps everything to 0.
std::int64_t GovLengthToSeconds(std::int64_t frames, std::int64_t centi_fps);
std::int64_t SecondsToGovLength(std::int64_t seconds, std::int64_t centi_fps);
std::vector<std::string> GovLengthSecondChoices(std::int64_t min_frames, std::int64_t max_frames,
                                                std::int64_t centi_fps);

const std::vector<std::int64_t>& StandardBitrateLadder();

// Ladder values inside `[min_kbps, max_kbps]` plus both bounds, ascending and
// unique. Empty when the range is inverted.
std::vector<std::string> GenerateBitrateChoices(std::int64_t min_kbps, std::int64_t max_kbps);

inline constexpr std::string_view kDstRule = "DST01:00:00,M3.5.0/02:00:00,M10.5.0/03:00:00";

// `UTC+2:00:00` <-> `CST-2:00:00`. The wire form is POSIX TZ style, so the
// sign is the opposite of the human offset. A zero offset always renders as
// `UTC+0:00:00`.
bool HumanToWireTimezone(std::string_view human, bool daylight_saving, std::string& wire);
bool WireToHumanTimezone(std::string_view wire, std::string& human);
bool WireTimezoneHasDst(std::string_view wire);
// Idempotent: enabling twice appends the rule once.
std::string SetWireTimezoneDst(std::string_view wire, bool enabled);
std::vector<std::string> TimezoneChoices();

std::string FixedQualityToLabel(std::int64_t quality);
bool ParseFixedQualityLabel(std::string_view label, std::int64_t& quality);
std::vector<std::string> FixedQualityChoices();

// `min`, then every `min + k*step` that stays within `max`. A non-aligned
// `max` is not appended. A non-positive step yields only `min`.
std::vector<std::string> SensitivityChoices(std::int64_t min, std::int64_t max, std::int64_t step);

// Steps of 10 from `min`, with `max` appended when off-step.
std::vector<std::string> SpeakerVolumeChoices(std::int64_t min, std::int64_t max);

// NTP sync interval: minutes on the wire, whole hours in the settings list.
std::string NtpIntervalLabel(std::int64_t minutes);
bool ParseNtpIntervalLabel(std::string_view label, std::int64_t& minutes);
std::vector<std::string> NtpIntervalChoices();

std::string ResolutionLabel(std::int64_t width, std::int64_t height);
bool ParseResolutionLabel(std::string_view label, std::int64_t& width, std::int64_t& height);

} // namespace isapisync::transcode
