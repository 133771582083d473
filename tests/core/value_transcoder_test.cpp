#include "transcode/value_transcoder.hpp"

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <cstdint>
#include <string>
#include <vector>

namespace tc = isapisync::transcode;

TEST_CASE("Frame rate labels use whole fps and fractions below one", "[core][transcode]") {
  REQUIRE(tc::FrameRateToLabel(2500) == "25");
  REQUIRE(tc::FrameRateToLabel(1550) == "15");
  REQUIRE(tc::FrameRateToLabel(100) == "1");
  REQUIRE(tc::FrameRateToLabel(50) == "1/2");
  REQUIRE(tc::FrameRateToLabel(25) == "1/4");
  REQUIRE(tc::FrameRateToLabel(6) == "1/17");
  REQUIRE(tc::FrameRateToLabel(0) == "0");
  REQUIRE(tc::FrameRateToLabel(-5) == "0");
}

TEST_CASE("Frame rate labels parse back to wire values", "[core][transcode]") {
  for (const std::int64_t wire : {2500, 1500, 100, 50, 25, 6}) {
    std::int64_t parsed = 0;
    REQUIRE(tc::ParseFrameRateLabel(tc::FrameRateToLabel(wire), parsed));
    REQUIRE(parsed == wire);
  }

  std::int64_t untouched = 7;
  REQUIRE_FALSE(tc::ParseFrameRateLabel("fast", untouched));
  REQUIRE_FALSE(tc::ParseFrameRateLabel("1/0", untouched));
  REQUIRE(untouched == 7);
}

TEST_CASE("GOP length converts between frames and seconds", "[core][transcode]") {
  REQUIRE(tc::GovLengthToSeconds(50, 2500) == 2);
  REQUIRE(tc::SecondsToGovLength(2, 2500) == 50);
  REQUIRE(tc::SecondsToGovLength(4, 1500) == 60);
  REQUIRE(tc::GovLengthToSeconds(50, 0) == 0);
  REQUIRE(tc::SecondsToGovLength(3, 0) == 0);

  const std::vector<std::string> choices = tc::GovLengthSecondChoices(1, 400, 2500);
  REQUIRE(choices.front() == "1");
  REQUIRE(choices.back() == "16");
  REQUIRE(choices.size() == 16U);
  REQUIRE(tc::GovLengthSecondChoices(1, 400, 0).empty());
}

TEST_CASE("Bitrate choices stay inside the device range", "[core][transcode]") {
  const std::vector<std::string> choices = tc::GenerateBitrateChoices(100, 3000);
  REQUIRE(choices.front() == "100");
  REQUIRE(choices.back() == "3000");
  for (const std::string& choice : choices) {
    const std::int64_t value = std::stoll(choice);
    REQUIRE(value >= 100);
    REQUIRE(value <= 3000);
  }
  REQUIRE(choices[1] == "128");

  const std::vector<std::string> exact = tc::GenerateBitrateChoices(32, 8192);
  REQUIRE(exact.front() == "32");
  REQUIRE(exact.back() == "8192");
  REQUIRE(exact.size() == 30U);

  const std::vector<std::string> clipped = tc::GenerateBitrateChoices(512, 4096);
  REQUIRE(clipped.front() == "512");
  REQUIRE(clipped.back() == "4096");
  REQUIRE(std::find(clipped.begin(), clipped.end(), "32") == clipped.end());
  REQUIRE(std::find(clipped.begin(), clipped.end(), "8192") == clipped.end());

  REQUIRE(tc::GenerateBitrateChoices(5000, 100).empty());
  REQUIRE(tc::GenerateBitrateChoices(512, 512) == std::vector<std::string>{"512"});
}

TEST_CASE("Timezones flip sign between human and wire forms", "[core][transcode]") {
  std::string wire;
  REQUIRE(tc::HumanToWireTimezone("UTC+2:00:00", false, wire));
  REQUIRE(wire == "CST-2:00:00");
  REQUIRE(tc::HumanToWireTimezone("UTC-5:30:00", false, wire));
  REQUIRE(wire == "CST+5:30:00");
  REQUIRE(tc::HumanToWireTimezone("UTC+1:00:00", true, wire));
  REQUIRE(wire == "CST-1:00:00DST01:00:00,M3.5.0/02:00:00,M10.5.0/03:00:00");

  std::string human;
  REQUIRE(tc::WireToHumanTimezone("CST-8:00:00", human));
  REQUIRE(human == "UTC+8:00:00");
  REQUIRE(tc::WireToHumanTimezone("CST+3:00:00DST01:00:00,M3.5.0/02:00:00,M10.5.0/03:00:00",
                                  human));
  REQUIRE(human == "UTC-3:00:00");
}

TEST_CASE("Zero timezone offset renders as UTC+0", "[core][transcode]") {
  std::string human;
  REQUIRE(tc::WireToHumanTimezone("CST+0:00:00", human));
  REQUIRE(human == "UTC+0:00:00");
  REQUIRE(tc::WireToHumanTimezone("CST-0:00:00", human));
  REQUIRE(human == "UTC+0:00:00");

  std::string wire;
  REQUIRE(tc::HumanToWireTimezone("UTC-0:00:00", false, wire));
  REQUIRE(tc::WireToHumanTimezone(wire, human));
  REQUIRE(human == "UTC+0:00:00");
}

TEST_CASE("Every timezone choice survives a wire round trip", "[core][transcode]") {
  const std::vector<std::string> choices = tc::TimezoneChoices();
  REQUIRE(choices.size() == 25U);
  REQUIRE(choices.front() == "UTC-12:00:00");
  REQUIRE(choices.back() == "UTC+12:00:00");
  for (const std::string& choice : choices) {
    for (const bool dst : {false, true}) {
      std::string wire;
      std::string human;
      REQUIRE(tc::HumanToWireTimezone(choice, dst, wire));
      REQUIRE(tc::WireTimezoneHasDst(wire) == dst);
      REQUIRE(tc::WireToHumanTimezone(wire, human));
      REQUIRE(human == choice);
    }
  }
}

TEST_CASE("DST toggling is idempotent", "[core][transcode]") {
  const std::string once = tc::SetWireTimezoneDst("CST-1:00:00", true);
  REQUIRE(tc::SetWireTimezoneDst(once, true) == once);
  REQUIRE(tc::SetWireTimezoneDst(once, false) == "CST-1:00:00");
  REQUIRE(tc::SetWireTimezoneDst("CST-1:00:00", false) == "CST-1:00:00");

  std::string wire;
  REQUIRE_FALSE(tc::HumanToWireTimezone("GMT+1", false, wire));
}

TEST_CASE("Fixed quality labels cover the table and custom values", "[core][transcode]") {
  REQUIRE(tc::FixedQualityToLabel(60) == "Medium (60)");
  REQUIRE(tc::FixedQualityToLabel(55) == "Custom (55)");
  std::int64_t quality = 0;
  REQUIRE(tc::ParseFixedQualityLabel("High (80)", quality));
  REQUIRE(quality == 80);
  REQUIRE(tc::ParseFixedQualityLabel("Custom (55)", quality));
  REQUIRE(quality == 55);
  REQUIRE(tc::ParseFixedQualityLabel("40", quality));
  REQUIRE(quality == 40);
  REQUIRE_FALSE(tc::ParseFixedQualityLabel("High (", quality));
  REQUIRE(tc::FixedQualityChoices().size() == 6U);
}

TEST_CASE("Sensitivity choices step from min without forcing max", "[core][transcode]") {
  REQUIRE(tc::SensitivityChoices(0, 100, 20) ==
          std::vector<std::string>{"0", "20", "40", "60", "80", "100"});
  REQUIRE(tc::SensitivityChoices(0, 90, 20) ==
          std::vector<std::string>{"0", "20", "40", "60", "80"});
  REQUIRE(tc::SensitivityChoices(10, 100, 0) == std::vector<std::string>{"10"});
}

TEST_CASE("Speaker volume choices step by ten and end at max", "[core][transcode]") {
  REQUIRE(tc::SpeakerVolumeChoices(0, 100).size() == 11U);
  REQUIRE(tc::SpeakerVolumeChoices(0, 95).back() == "95");
  REQUIRE(tc::SpeakerVolumeChoices(0, 95).size() == 11U);
}

TEST_CASE("NTP interval is shown in hours", "[core][transcode]") {
  REQUIRE(tc::NtpIntervalLabel(60) == "1 hour");
  REQUIRE(tc::NtpIntervalLabel(120) == "2 hours");
  REQUIRE(tc::NtpIntervalLabel(10) == "1 hour");

  std::int64_t minutes = 0;
  REQUIRE(tc::ParseNtpIntervalLabel("3 hours", minutes));
  REQUIRE(minutes == 180);
  REQUIRE_FALSE(tc::ParseNtpIntervalLabel("3 days", minutes));
  REQUIRE_FALSE(tc::ParseNtpIntervalLabel("0 hours", minutes));

  const std::vector<std::string> choices = tc::NtpIntervalChoices();
  REQUIRE(choices.size() == 36U);
  REQUIRE(choices.front() == "1 hour");
  REQUIRE(choices.back() == "36 hours");
}

TEST_CASE("Resolution labels are WIDTHxHEIGHT", "[core][transcode]") {
  REQUIRE(tc::ResolutionLabel(1920, 1080) == "1920x1080");
  std::int64_t width = 0;
  std::int64_t height = 0;
  REQUIRE(tc::ParseResolutionLabel("1280x720", width, height));
  REQUIRE(width == 1280);
  REQUIRE(height == 720);
  REQUIRE_FALSE(tc::ParseResolutionLabel("1280*720", width, height));
  REQUIRE(width == 1280);
}
