#pragma once

#include <pugixml.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace isapisync::wire {

// Uniform view of one leaf element. Capability documents annotate leaves with
// range and option attributes (`<x min="1" max="9" opt="a,b">5</x>`), value
// documents carry the bare scalar (`<x>5</x>`). Both shapes read the same way.
struct LeafValue {
  bool present = false;
  std::string text;
  std::optional<std::int64_t> min;
  std::optional<std::int64_t> max;
  std::optional<std::int64_t> step;
  std::vector<std::string> opt;

  std::int64_t AsInt(std::int64_t fallback) const;
  bool AsBool() const;
};

// Parses raw device XML. Declarations are kept so tree-level rewrites emit the
// same prolog the device sent.
bool ParseDocument(std::string_view raw, pugi::xml_document& doc, std::string& error);

// Compact serialization (no indentation added) of a possibly mutated tree.
std::string SerializeDocument(const pugi::xml_document& doc);

// First element child of the document, or a null node.
pugi::xml_node RootElement(const pugi::xml_document& doc);

// Absent elements yield `present == false`, never an error.
LeafValue ReadLeaf(const pugi::xml_node& parent, std::string_view tag);

std::string ChildText(const pugi::xml_node& parent, std::string_view tag);
std::int64_t ChildInt(const pugi::xml_node& parent, std::string_view tag, std::int64_t fallback);
bool ChildBool(const pugi::xml_node& parent, std::string_view tag);

std::vector<std::string> SplitOptList(std::string_view opt);

// Returns the first `block_tag` child of `parent` whose `key_tag` child text
// equals `key_value`, or a null node.
pugi::xml_node FindChildByKey(const pugi::xml_node& parent, std::string_view block_tag,
                              std::string_view key_tag, std::string_view key_value);

// Sets the text of `parent/tag`, creating the element when it is missing.
void SetChildText(pugi::xml_node& parent, std::string_view tag, std::string_view value);

} // namespace isapisync::wire
