#include "wire/text_patch.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

namespace wire = isapisync::wire;

namespace {

const std::string kStreamingChannel =
    "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
    "<StreamingChannel version=\"2.0\" xmlns=\"http://www.isapi.org/ver20/XMLSchema\">\n"
    "  <id>101</id>\n"
    "  <!-- vendor comment <GovLength>1</GovLength> -->\n"
    "  <Video>\n"
    "    <videoCodecType>H.264</videoCodecType>\n"
    "    <GovLength min=\"1\" max=\"400\">50</GovLength>\n"
    "    <SmartCodec><enabled>false</enabled></SmartCodec>\n"
    "    <hik:extension xmlns:hik=\"urn:x\" note='a > b'><hik:gain>12</hik:gain></hik:extension>\n"
    "  </Video>\n"
    "  <Audio>\n"
    "    <enabled>false</enabled>\n"
    "  </Audio>\n"
    "</StreamingChannel>\n";

wire::PatchTarget Target(std::vector<wire::PatchScope> scopes, std::string leaf,
                         std::string value) {
  return wire::PatchTarget{
      .path = wire::FieldPath{.scopes = std::move(scopes), .leaf = std::move(leaf)},
      .value = std::move(value),
  };
}

} // namespace

TEST_CASE("Patching one leaf changes only its text", "[core][wire][patch]") {
  wire::PatchResult result;
  std::string error;
  REQUIRE(wire::PatchText(kStreamingChannel, {Target({{.block_tag = "Video"}}, "GovLength", "75")},
                          result, error));
  REQUIRE(result.applied == std::vector<std::string>{"Video/GovLength"});
  REQUIRE(result.missed.empty());

  std::string expected = kStreamingChannel;
  const std::string before = "max=\"400\">50</GovLength>";
  expected.replace(expected.find(before), before.size(), "max=\"400\">75</GovLength>");
  REQUIRE(result.text == expected);
}

TEST_CASE("Scopes pick the right one of several same-named leaves", "[core][wire][patch]") {
  wire::PatchResult result;
  std::string error;
  REQUIRE(wire::PatchText(kStreamingChannel,
                          {Target({{.block_tag = "Audio"}}, "enabled", "true"),
                           Target({{.block_tag = "Video"}, {.block_tag = "SmartCodec"}},
                                  "enabled", "true")},
                          result, error));
  REQUIRE(result.applied.size() == 2U);
  REQUIRE(result.text.find("<Audio>\n    <enabled>true</enabled>") != std::string::npos);
  REQUIRE(result.text.find("<SmartCodec><enabled>true</enabled></SmartCodec>") !=
          std::string::npos);
  REQUIRE(result.text.find("<hik:extension xmlns:hik=\"urn:x\" note='a > b'>"
                           "<hik:gain>12</hik:gain></hik:extension>") != std::string::npos);
  REQUIRE(result.text.find("<!-- vendor comment <GovLength>1</GovLength> -->") !=
          std::string::npos);
}

TEST_CASE("Keyed scopes select blocks by child text", "[core][wire][patch]") {
  const std::string overlays = "<VideoOverlay><TextOverlayList>"
                               "<TextOverlay><id>1</id><displayText>A</displayText></TextOverlay>"
                               "<TextOverlay><id>2</id><displayText/></TextOverlay>"
                               "</TextOverlayList></VideoOverlay>";
  wire::PatchResult result;
  std::string error;
  REQUIRE(wire::PatchText(overlays,
                          {Target({{.block_tag = "TextOverlayList"},
                                   {.block_tag = "TextOverlay", .key_tag = "id", .key_value = "2"}},
                                  "displayText", "21.5 <C>")},
                          result, error));
  REQUIRE(result.applied.size() == 1U);
  REQUIRE(result.applied[0] == "TextOverlayList/TextOverlay[id=2]/displayText");
  REQUIRE(result.text ==
          "<VideoOverlay><TextOverlayList>"
          "<TextOverlay><id>1</id><displayText>A</displayText></TextOverlay>"
          "<TextOverlay><id>2</id><displayText>21.5 &lt;C&gt;</displayText></TextOverlay>"
          "</TextOverlayList></VideoOverlay>");
}

TEST_CASE("Unmatched targets are reported and leave the text alone", "[core][wire][patch]") {
  wire::PatchResult result;
  std::string error;
  REQUIRE(wire::PatchText(kStreamingChannel,
                          {Target({{.block_tag = "Video"}}, "fixedQuality", "60"),
                           Target({{.block_tag = "Audio", .key_tag = "id", .key_value = "9"}},
                                  "enabled", "true")},
                          result, error));
  REQUIRE_FALSE(result.AnyApplied());
  REQUIRE(result.missed.size() == 2U);
  REQUIRE(result.text == kStreamingChannel);
}

TEST_CASE("Malformed markup around a target is an error", "[core][wire][patch]") {
  wire::PatchResult result;
  std::string error;
  REQUIRE_FALSE(wire::PatchText("<Video><GovLength>50</Video", {Target({}, "GovLength", "1")},
                                result, error));
  REQUIRE(error.find("GovLength") != std::string::npos);

  REQUIRE_FALSE(wire::PatchText("<Video>", {Target({}, "", "1")}, result, error));
}

TEST_CASE("Element helpers insert remove and upsert", "[core][wire][patch]") {
  std::string time = "<Time><timeMode>manual</timeMode><localTime>old</localTime>"
                     "<timeZone>CST-1:00:00</timeZone></Time>";
  REQUIRE(wire::RemoveElement(time, "localTime"));
  REQUIRE(time == "<Time><timeMode>manual</timeMode><timeZone>CST-1:00:00</timeZone></Time>");
  REQUIRE(wire::InsertAfterElement(time, "timeMode", "<localTime>new</localTime>"));
  REQUIRE(time == "<Time><timeMode>manual</timeMode><localTime>new</localTime>"
                  "<timeZone>CST-1:00:00</timeZone></Time>");

  std::string input = "<VideoInputChannel><id>1</id></VideoInputChannel>";
  REQUIRE(wire::UpsertElement(input, "VideoInputChannel", "name", "Gate & Yard"));
  REQUIRE(input == "<VideoInputChannel><id>1</id><name>Gate &amp; Yard</name></VideoInputChannel>");
  REQUIRE(wire::UpsertElement(input, "VideoInputChannel", "name", "Yard"));
  REQUIRE(input == "<VideoInputChannel><id>1</id><name>Yard</name></VideoInputChannel>");
  REQUIRE_FALSE(wire::RemoveElement(input, "missing"));
}
