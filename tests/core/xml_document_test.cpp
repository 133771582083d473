#include "wire/xml_document.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>

namespace wire = isapisync::wire;

namespace {

constexpr const char* kCapsDocument =
    "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
    "<MotionDetection version=\"2.0\" xmlns=\"http://www.isapi.org/ver20/XMLSchema\">\n"
    "<enabled opt=\"true,false\">true</enabled>\n"
    "<MotionDetectionLayout>\n"
    "<sensitivityLevel min=\"0\" max=\"100\" step=\"20\"> 40 </sensitivityLevel>\n"
    "</MotionDetectionLayout>\n"
    "</MotionDetection>\n";

} // namespace

TEST_CASE("Leaves expose text and range attributes", "[core][wire][xml]") {
  pugi::xml_document doc;
  std::string error;
  REQUIRE(wire::ParseDocument(kCapsDocument, doc, error));

  const pugi::xml_node root = wire::RootElement(doc);
  REQUIRE(std::string(root.name()) == "MotionDetection");

  const wire::LeafValue level =
      wire::ReadLeaf(root.child("MotionDetectionLayout"), "sensitivityLevel");
  REQUIRE(level.present);
  REQUIRE(level.text == "40");
  REQUIRE(level.AsInt(0) == 40);
  REQUIRE(level.min == 0);
  REQUIRE(level.max == 100);
  REQUIRE(level.step == 20);

  const wire::LeafValue enabled = wire::ReadLeaf(root, "enabled");
  REQUIRE(enabled.AsBool());
  REQUIRE(enabled.opt.size() == 2U);
  REQUIRE(enabled.opt[0] == "true");
  REQUIRE(enabled.opt[1] == "false");
}

TEST_CASE("Missing leaves are absent rather than errors", "[core][wire][xml]") {
  pugi::xml_document doc;
  std::string error;
  REQUIRE(wire::ParseDocument(kCapsDocument, doc, error));
  const pugi::xml_node root = wire::RootElement(doc);

  const wire::LeafValue missing = wire::ReadLeaf(root, "samplingInterval");
  REQUIRE_FALSE(missing.present);
  REQUIRE(missing.AsInt(7) == 7);
  REQUIRE_FALSE(missing.AsBool());
  REQUIRE(wire::ChildText(root, "samplingInterval").empty());
  REQUIRE(wire::ChildInt(pugi::xml_node(), "anything", 3) == 3);
  REQUIRE_FALSE(wire::ReadLeaf(pugi::xml_node(), "enabled").present);
}

TEST_CASE("Parse failures are reported with a reason", "[core][wire][xml]") {
  pugi::xml_document doc;
  std::string error;
  REQUIRE_FALSE(wire::ParseDocument("", doc, error));
  REQUIRE(error.find("empty document") != std::string::npos);

  REQUIRE_FALSE(wire::ParseDocument("<Time><timeMode>NTP</Time>", doc, error));
  REQUIRE(error.find("xml parse failed") != std::string::npos);
}

TEST_CASE("Keyed children and created leaves", "[core][wire][xml]") {
  pugi::xml_document doc;
  std::string error;
  REQUIRE(wire::ParseDocument("<TextOverlayList>"
                              "<TextOverlay><id>1</id><displayText>A</displayText></TextOverlay>"
                              "<TextOverlay><id>2</id><displayText>B</displayText></TextOverlay>"
                              "</TextOverlayList>",
                              doc, error));
  pugi::xml_node list = wire::RootElement(doc);

  pugi::xml_node second = wire::FindChildByKey(list, "TextOverlay", "id", "2");
  REQUIRE(second);
  REQUIRE(wire::ChildText(second, "displayText") == "B");
  REQUIRE_FALSE(wire::FindChildByKey(list, "TextOverlay", "id", "9"));

  wire::SetChildText(second, "displayText", "Lobby & Hall");
  wire::SetChildText(second, "enabled", "true");
  REQUIRE(wire::ChildText(second, "displayText") == "Lobby & Hall");
  REQUIRE(wire::ChildBool(second, "enabled"));

  const std::string serialized = wire::SerializeDocument(doc);
  REQUIRE(serialized.find("Lobby &amp; Hall") != std::string::npos);
}

TEST_CASE("Option lists split on commas and trim", "[core][wire][xml]") {
  const auto items = wire::SplitOptList("G.711ulaw, G.711alaw ,G.726");
  REQUIRE(items.size() == 3U);
  REQUIRE(items[1] == "G.711alaw");
  REQUIRE(wire::SplitOptList("").empty());
}
