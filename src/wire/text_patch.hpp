#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace isapisync::wire {

// One level of block selection. With an empty `key_tag` the first `block_tag`
// element in range is selected; otherwise the first block whose first
// `key_tag` element has text equal to `key_value`.
struct PatchScope {
  std::string block_tag;
  std::string key_tag;
  std::string key_value;
};

// Location of a leaf inside a raw document. Scopes nest from outermost to
// innermost; the leaf is the first element named `leaf` inside the last scope
// (or anywhere in the document when there are no scopes).
struct FieldPath {
  std::vector<PatchScope> scopes;
  std::string leaf;
};

struct PatchTarget {
  FieldPath path;
  std::string value;
};

struct PatchResult {
  std::string text;
  std::vector<std::string> applied;
  std::vector<std::string> missed;

  bool AnyApplied() const {
    return !applied.empty();
  }
};

// Human-readable form used in logs, e.g. `StreamingChannel[id=101]/Video/GovLength`.
std::string DescribePath(const FieldPath& path);

// Replaces the text content of each targeted leaf and nothing else. Opening
// tags keep their attributes, self-closing leaves become `<tag>value</tag>`,
// values are XML-escaped. Targets that match nothing land in `missed`.
// Fails only when the markup around a target cannot be tokenized.
bool PatchText(std::string_view raw, const std::vector<PatchTarget>& targets, PatchResult& result,
               std::string& error);

std::string EscapeXmlText(std::string_view value);

// Removes the first `tag` element together with the whitespace after it.
bool RemoveElement(std::string& text, std::string_view tag);

// Inserts `fragment` right after the first `anchor_tag` element.
bool InsertAfterElement(std::string& text, std::string_view anchor_tag, std::string_view fragment);

// Replaces the text of the first `tag` element, or appends `<tag>value</tag>`
// before the closing `root_tag` when the element is missing.
bool UpsertElement(std::string& text, std::string_view root_tag, std::string_view tag,
                   std::string_view value);

} // namespace isapisync::wire
