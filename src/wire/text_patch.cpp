#include "wire/text_patch.hpp"

#include "core/string_utils.hpp"

#include <cctype>

namespace isapisync::wire {

namespace {

constexpr std::size_t kNpos = std::string::npos;

enum class ScanStatus {
  kFound,
  kNotFound,
  kMalformed,
};

// Byte offsets of one element inside a raw document. For self-closing
// elements the inner range is empty and close_* equal open_end.
struct ElementSpan {
  std::size_t open_begin = 0;
  std::size_t open_end = 0;
  std::size_t close_begin = 0;
  std::size_t close_end = 0;
  bool self_closing = false;
};

bool IsNameTerminator(const char c) {
  return c == '>' || c == '/' || std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool NameMatchesAt(std::string_view text, const std::size_t pos, std::string_view tag) {
  if (pos + tag.size() >= text.size()) {
    return false;
  }
  return text.compare(pos, tag.size(), tag) == 0 && IsNameTerminator(text[pos + tag.size()]);
}

// Position of the '>' closing the tag that opens at `lt`, honoring quoted
// attribute values.
std::size_t FindTagEnd(std::string_view text, const std::size_t lt) {
  char quote = '\0';
  for (std::size_t i = lt + 1; i < text.size(); ++i) {
    const char c = text[i];
    if (quote != '\0') {
      if (c == quote) {
        quote = '\0';
      }
      continue;
    }
    if (c == '"' || c == '\'') {
      quote = c;
      continue;
    }
    if (c == '>') {
      return i;
    }
  }
  return kNpos;
}

// Skips comments, CDATA sections, processing instructions and doctype
// declarations starting at `lt`. Returns the offset just past them.
std::size_t SkipSpecial(std::string_view text, const std::size_t lt) {
  if (text.compare(lt, 4, "<!--") == 0) {
    const std::size_t end = text.find("-->", lt + 4);
    return end == kNpos ? kNpos : end + 3;
  }
  if (text.compare(lt, 9, "<![CDATA[") == 0) {
    const std::size_t end = text.find("]]>", lt + 9);
    return end == kNpos ? kNpos : end + 3;
  }
  if (text.compare(lt, 2, "<?") == 0) {
    const std::size_t end = text.find("?>", lt + 2);
    return end == kNpos ? kNpos : end + 2;
  }
  const std::size_t end = text.find('>', lt);
  return end == kNpos ? kNpos : end + 1;
}

bool IsSpecialAt(std::string_view text, const std::size_t lt) {
  return lt + 1 < text.size() && (text[lt + 1] == '!' || text[lt + 1] == '?');
}

ScanStatus FindMatchingClose(std::string_view text, std::string_view tag, ElementSpan& span) {
  int depth = 1;
  std::size_t pos = span.open_end;
  while (true) {
    const std::size_t lt = text.find('<', pos);
    if (lt == kNpos) {
      return ScanStatus::kMalformed;
    }
    if (IsSpecialAt(text, lt)) {
      pos = SkipSpecial(text, lt);
      if (pos == kNpos) {
        return ScanStatus::kMalformed;
      }
      continue;
    }
    if (lt + 1 < text.size() && text[lt + 1] == '/') {
      const std::size_t gt = text.find('>', lt);
      if (gt == kNpos) {
        return ScanStatus::kMalformed;
      }
      if (NameMatchesAt(text, lt + 2, tag) && --depth == 0) {
        span.close_begin = lt;
        span.close_end = gt + 1;
        return ScanStatus::kFound;
      }
      pos = gt + 1;
      continue;
    }
    if (NameMatchesAt(text, lt + 1, tag)) {
      const std::size_t gt = FindTagEnd(text, lt);
      if (gt == kNpos) {
        return ScanStatus::kMalformed;
      }
      if (text[gt - 1] != '/') {
        ++depth;
      }
      pos = gt + 1;
      continue;
    }
    pos = lt + 1;
  }
}

// Finds the first element named `tag` whose opening '<' lies in [begin, end).
ScanStatus FindElement(std::string_view text, const std::size_t begin, const std::size_t end,
                       std::string_view tag, ElementSpan& span) {
  std::size_t pos = begin;
  while (true) {
    const std::size_t lt = text.find('<', pos);
    if (lt == kNpos || lt >= end) {
      return ScanStatus::kNotFound;
    }
    if (IsSpecialAt(text, lt)) {
      pos = SkipSpecial(text, lt);
      if (pos == kNpos) {
        return ScanStatus::kMalformed;
      }
      continue;
    }
    if (!NameMatchesAt(text, lt + 1, tag)) {
      pos = lt + 1;
      continue;
    }

    const std::size_t gt = FindTagEnd(text, lt);
    if (gt == kNpos) {
      return ScanStatus::kMalformed;
    }
    span.open_begin = lt;
    span.open_end = gt + 1;
    if (text[gt - 1] == '/') {
      span.self_closing = true;
      span.close_begin = span.open_end;
      span.close_end = span.open_end;
      return ScanStatus::kFound;
    }
    span.self_closing = false;
    return FindMatchingClose(text, tag, span);
  }
}

std::string InnerText(std::string_view text, const ElementSpan& span) {
  return core::Trim(text.substr(span.open_end, span.close_begin - span.open_end));
}

ScanStatus SelectScope(std::string_view text, const PatchScope& scope, std::size_t& begin,
                       std::size_t& end) {
  std::size_t pos = begin;
  while (true) {
    ElementSpan block;
    const ScanStatus status = FindElement(text, pos, end, scope.block_tag, block);
    if (status != ScanStatus::kFound) {
      return status;
    }
    if (block.self_closing) {
      pos = block.open_end;
      continue;
    }

    bool selected = scope.key_tag.empty();
    if (!selected) {
      ElementSpan key;
      const ScanStatus key_status =
          FindElement(text, block.open_end, block.close_begin, scope.key_tag, key);
      if (key_status == ScanStatus::kMalformed) {
        return key_status;
      }
      selected = key_status == ScanStatus::kFound && !key.self_closing &&
                 InnerText(text, key) == scope.key_value;
    }

    if (selected) {
      begin = block.open_end;
      end = block.close_begin;
      return ScanStatus::kFound;
    }
    pos = block.close_end;
  }
}

// Rewrites `span` (an element named `tag`) so its content is `escaped_value`.
void ReplaceLeafContent(std::string& text, const ElementSpan& span, std::string_view tag,
                        std::string_view escaped_value) {
  if (!span.self_closing) {
    text.replace(span.open_end, span.close_begin - span.open_end, escaped_value);
    return;
  }

  std::string open_tag = text.substr(span.open_begin, span.open_end - span.open_begin);
  open_tag.resize(open_tag.size() - 2U);
  while (!open_tag.empty() && std::isspace(static_cast<unsigned char>(open_tag.back())) != 0) {
    open_tag.pop_back();
  }
  const std::string replacement =
      open_tag + ">" + std::string(escaped_value) + "</" + std::string(tag) + ">";
  text.replace(span.open_begin, span.open_end - span.open_begin, replacement);
}

ScanStatus LocateLeaf(std::string_view text, const FieldPath& path, ElementSpan& leaf) {
  std::size_t begin = 0;
  std::size_t end = text.size();
  for (const PatchScope& scope : path.scopes) {
    const ScanStatus status = SelectScope(text, scope, begin, end);
    if (status != ScanStatus::kFound) {
      return status;
    }
  }
  return FindElement(text, begin, end, path.leaf, leaf);
}

} // namespace

std::string DescribePath(const FieldPath& path) {
  std::string described;
  for (const PatchScope& scope : path.scopes) {
    described += scope.block_tag;
    if (!scope.key_tag.empty()) {
      described += "[" + scope.key_tag + "=" + scope.key_value + "]";
    }
    described += "/";
  }
  described += path.leaf;
  return described;
}

std::string EscapeXmlText(std::string_view value) {
  std::string escaped;
  escaped.reserve(value.size());
  for (const char c : value) {
    switch (c) {
    case '&':
      escaped += "&amp;";
      break;
    case '<':
      escaped += "&lt;";
      break;
    case '>':
      escaped += "&gt;";
      break;
    default:
      escaped.push_back(c);
      break;
    }
  }
  return escaped;
}

bool PatchText(std::string_view raw, const std::vector<PatchTarget>& targets, PatchResult& result,
               std::string& error) {
  result.text.assign(raw);
  result.applied.clear();
  result.missed.clear();

  for (const PatchTarget& target : targets) {
    const std::string described = DescribePath(target.path);
    if (target.path.leaf.empty()) {
      error = "patch target has an empty leaf tag";
      return false;
    }

    ElementSpan leaf;
    const ScanStatus status = LocateLeaf(result.text, target.path, leaf);
    if (status == ScanStatus::kMalformed) {
      error = "document markup is malformed around " + described;
      return false;
    }
    if (status == ScanStatus::kNotFound) {
      result.missed.push_back(described);
      continue;
    }

    ReplaceLeafContent(result.text, leaf, target.path.leaf, EscapeXmlText(target.value));
    result.applied.push_back(described);
  }
  return true;
}

bool RemoveElement(std::string& text, std::string_view tag) {
  ElementSpan span;
  if (FindElement(text, 0, text.size(), tag, span) != ScanStatus::kFound) {
    return false;
  }
  std::size_t erase_end = span.close_end;
  while (erase_end < text.size() && std::isspace(static_cast<unsigned char>(text[erase_end])) != 0) {
    ++erase_end;
  }
  text.erase(span.open_begin, erase_end - span.open_begin);
  return true;
}

bool InsertAfterElement(std::string& text, std::string_view anchor_tag,
                        std::string_view fragment) {
  ElementSpan span;
  if (FindElement(text, 0, text.size(), anchor_tag, span) != ScanStatus::kFound) {
    return false;
  }
  text.insert(span.close_end, fragment);
  return true;
}

bool UpsertElement(std::string& text, std::string_view root_tag, std::string_view tag,
                   std::string_view value) {
  const std::string escaped = EscapeXmlText(value);

  ElementSpan span;
  const ScanStatus status = FindElement(text, 0, text.size(), tag, span);
  if (status == ScanStatus::kFound) {
    ReplaceLeafContent(text, span, tag, escaped);
    return true;
  }
  if (status == ScanStatus::kMalformed) {
    return false;
  }

  const std::size_t root_close = text.rfind("</" + std::string(root_tag));
  if (root_close == kNpos) {
    return false;
  }
  text.insert(root_close, "<" + std::string(tag) + ">" + escaped + "</" + std::string(tag) + ">");
  return true;
}

} // namespace isapisync::wire
