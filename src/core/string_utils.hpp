#ifndef ISAPISYNC_CORE_STRING_UTILS_HPP_
#define ISAPISYNC_CORE_STRING_UTILS_HPP_

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <string_view>
#include <vector>

namespace isapisync::core {

inline std::string Trim(std::string_view input) {
  std::size_t begin = 0;
  while (begin < input.size() && std::isspace(static_cast<unsigned char>(input[begin])) != 0) {
    ++begin;
  }

  std::size_t end = input.size();
  while (end > begin && std::isspace(static_cast<unsigned char>(input[end - 1])) != 0) {
    --end;
  }

  return std::string(input.substr(begin, end - begin));
}

inline std::string ToLower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

inline bool ParseInt64(std::string_view raw, std::int64_t& parsed) {
  const std::string text = Trim(raw);
  if (text.empty()) {
    return false;
  }

  const char* begin = text.data();
  const char* end = begin + text.size();
  if (*begin == '+') {
    ++begin;
  }
  const auto [ptr, ec] = std::from_chars(begin, end, parsed);
  return ec == std::errc() && ptr == end;
}

inline bool ParseDouble(std::string_view raw, double& parsed) {
  const std::string text = Trim(raw);
  if (text.empty()) {
    return false;
  }

  char* parse_end = nullptr;
  parsed = std::strtod(text.c_str(), &parse_end);
  return parse_end != nullptr && *parse_end == '\0' && std::isfinite(parsed);
}

inline bool ParseBoolText(std::string_view raw, bool& parsed) {
  const std::string normalized = ToLower(Trim(raw));
  if (normalized == "true" || normalized == "1" || normalized == "on") {
    parsed = true;
    return true;
  }
  if (normalized == "false" || normalized == "0" || normalized == "off") {
    parsed = false;
    return true;
  }
  return false;
}

// Splits the comma separated `opt="a,b,c"` lists the device uses for
// enumerations. Empty items are dropped.
inline std::vector<std::string> SplitCsv(std::string_view raw) {
  std::vector<std::string> items;
  std::size_t cursor = 0;
  while (cursor <= raw.size()) {
    const std::size_t comma = raw.find(',', cursor);
    const std::size_t stop = comma == std::string_view::npos ? raw.size() : comma;
    std::string item = Trim(raw.substr(cursor, stop - cursor));
    if (!item.empty()) {
      items.push_back(std::move(item));
    }
    if (comma == std::string_view::npos) {
      break;
    }
    cursor = comma + 1;
  }
  return items;
}

inline std::string BoolText(bool value) {
  return value ? "true" : "false";
}

} // namespace isapisync::core

#endif // ISAPISYNC_CORE_STRING_UTILS_HPP_
