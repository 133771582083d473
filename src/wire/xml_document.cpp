#include "wire/xml_document.hpp"

#include "core/string_utils.hpp"

#include <sstream>

namespace isapisync::wire {

namespace {

std::optional<std::int64_t> ReadIntAttribute(const pugi::xml_node& node, const char* name) {
  const pugi::xml_attribute attr = node.attribute(name);
  if (!attr) {
    return std::nullopt;
  }
  std::int64_t parsed = 0;
  if (!core::ParseInt64(attr.value(), parsed)) {
    return std::nullopt;
  }
  return parsed;
}

} // namespace

std::int64_t LeafValue::AsInt(const std::int64_t fallback) const {
  std::int64_t parsed = 0;
  if (!present || !core::ParseInt64(text, parsed)) {
    return fallback;
  }
  return parsed;
}

bool LeafValue::AsBool() const {
  return present && core::Trim(text) == "true";
}

bool ParseDocument(std::string_view raw, pugi::xml_document& doc, std::string& error) {
  if (core::Trim(raw).empty()) {
    error = "xml parse failed: empty document";
    return false;
  }

  const unsigned int options = pugi::parse_default | pugi::parse_declaration;
  const pugi::xml_parse_result result = doc.load_buffer(raw.data(), raw.size(), options);
  if (!result) {
    error = std::string("xml parse failed: ") + result.description() + " at offset " +
            std::to_string(result.offset);
    return false;
  }
  if (!RootElement(doc)) {
    error = "xml parse failed: document has no root element";
    return false;
  }
  return true;
}

std::string SerializeDocument(const pugi::xml_document& doc) {
  std::ostringstream out;
  doc.save(out, "", pugi::format_raw);
  return out.str();
}

pugi::xml_node RootElement(const pugi::xml_document& doc) {
  for (pugi::xml_node child = doc.first_child(); child; child = child.next_sibling()) {
    if (child.type() == pugi::node_element) {
      return child;
    }
  }
  return {};
}

LeafValue ReadLeaf(const pugi::xml_node& parent, std::string_view tag) {
  LeafValue leaf;
  if (!parent) {
    return leaf;
  }

  const std::string name(tag);
  const pugi::xml_node node = parent.child(name.c_str());
  if (!node) {
    return leaf;
  }

  leaf.present = true;
  leaf.text = core::Trim(node.child_value());
  leaf.min = ReadIntAttribute(node, "min");
  leaf.max = ReadIntAttribute(node, "max");
  leaf.step = ReadIntAttribute(node, "step");
  if (const pugi::xml_attribute opt = node.attribute("opt")) {
    leaf.opt = SplitOptList(opt.value());
  }
  return leaf;
}

std::string ChildText(const pugi::xml_node& parent, std::string_view tag) {
  return ReadLeaf(parent, tag).text;
}

std::int64_t ChildInt(const pugi::xml_node& parent, std::string_view tag,
                      const std::int64_t fallback) {
  return ReadLeaf(parent, tag).AsInt(fallback);
}

bool ChildBool(const pugi::xml_node& parent, std::string_view tag) {
  return ReadLeaf(parent, tag).AsBool();
}

std::vector<std::string> SplitOptList(std::string_view opt) {
  return core::SplitCsv(opt);
}

pugi::xml_node FindChildByKey(const pugi::xml_node& parent, std::string_view block_tag,
                              std::string_view key_tag, std::string_view key_value) {
  if (!parent) {
    return {};
  }

  const std::string block_name(block_tag);
  for (pugi::xml_node block = parent.child(block_name.c_str()); block;
       block = block.next_sibling(block_name.c_str())) {
    if (ChildText(block, key_tag) == key_value) {
      return block;
    }
  }
  return {};
}

void SetChildText(pugi::xml_node& parent, std::string_view tag, std::string_view value) {
  const std::string name(tag);
  pugi::xml_node node = parent.child(name.c_str());
  if (!node) {
    node = parent.append_child(name.c_str());
  }
  const std::string text(value);
  node.text().set(text.c_str());
}

} // namespace isapisync::wire
