#ifndef ISAPISYNC_CORE_JSON_DOM_HPP_
#define ISAPISYNC_CORE_JSON_DOM_HPP_

#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <iomanip>
#include <map>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace isapisync::core::json {

// Small STL-only DOM for the config file and the persisted settings store.
struct Value {
  enum class Type {
    kNull,
    kObject,
    kArray,
    kString,
    kNumber,
    kBool,
  };

  using Object = std::map<std::string, Value>;
  using Array = std::vector<Value>;

  Type type = Type::kNull;
  Object object_value;
  Array array_value;
  std::string string_value;
  double number_value = 0.0;
  bool bool_value = false;

  static Value String(std::string text) {
    Value value;
    value.type = Type::kString;
    value.string_value = std::move(text);
    return value;
  }

  static Value MakeObject() {
    Value value;
    value.type = Type::kObject;
    return value;
  }

  bool IsObject() const {
    return type == Type::kObject;
  }

  // Returns nullptr when this is not an object or the key is missing.
  const Value* Find(std::string_view key) const {
    if (type != Type::kObject) {
      return nullptr;
    }
    const auto it = object_value.find(std::string(key));
    return it == object_value.end() ? nullptr : &it->second;
  }
};

class Parser {
public:
  explicit Parser(std::string_view input) : input_(input) {}

  bool Parse(Value& root, std::string& error) {
    SkipWhitespace();
    if (!ParseValue(root, 0, error)) {
      return false;
    }
    SkipWhitespace();
    if (pos_ < input_.size()) {
      return Fail("trailing content after JSON document", error);
    }
    return true;
  }

private:
  static constexpr int kMaxDepth = 64;

  bool ParseValue(Value& value, int depth, std::string& error) {
    if (depth > kMaxDepth) {
      return Fail("document nesting is too deep", error);
    }
    if (pos_ >= input_.size()) {
      return Fail("unexpected end of input", error);
    }

    const char c = input_[pos_];
    if (c == '{') {
      return ParseObject(value, depth, error);
    }
    if (c == '[') {
      return ParseArray(value, depth, error);
    }
    if (c == '"') {
      value.type = Value::Type::kString;
      return ParseString(value.string_value, error);
    }
    if (c == '-' || std::isdigit(static_cast<unsigned char>(c)) != 0) {
      value.type = Value::Type::kNumber;
      return ParseNumber(value.number_value, error);
    }
    if (ConsumeKeyword("true")) {
      value.type = Value::Type::kBool;
      value.bool_value = true;
      return true;
    }
    if (ConsumeKeyword("false")) {
      value.type = Value::Type::kBool;
      value.bool_value = false;
      return true;
    }
    if (ConsumeKeyword("null")) {
      value.type = Value::Type::kNull;
      return true;
    }
    return Fail("expected a JSON value", error);
  }

  bool ParseObject(Value& value, int depth, std::string& error) {
    value = Value::MakeObject();
    ++pos_;
    SkipWhitespace();
    if (Consume('}')) {
      return true;
    }

    while (true) {
      SkipWhitespace();
      std::string key;
      if (pos_ >= input_.size() || input_[pos_] != '"') {
        return Fail("expected a quoted object key", error);
      }
      if (!ParseString(key, error)) {
        return false;
      }
      SkipWhitespace();
      if (!Consume(':')) {
        return Fail("expected ':' after object key", error);
      }
      SkipWhitespace();
      Value item;
      if (!ParseValue(item, depth + 1, error)) {
        return false;
      }
      value.object_value[std::move(key)] = std::move(item);

      SkipWhitespace();
      if (Consume('}')) {
        return true;
      }
      if (!Consume(',')) {
        return Fail("expected ',' or '}' in object", error);
      }
    }
  }

  bool ParseArray(Value& value, int depth, std::string& error) {
    value = Value{};
    value.type = Value::Type::kArray;
    ++pos_;
    SkipWhitespace();
    if (Consume(']')) {
      return true;
    }

    while (true) {
      SkipWhitespace();
      Value item;
      if (!ParseValue(item, depth + 1, error)) {
        return false;
      }
      value.array_value.push_back(std::move(item));

      SkipWhitespace();
      if (Consume(']')) {
        return true;
      }
      if (!Consume(',')) {
        return Fail("expected ',' or ']' in array", error);
      }
    }
  }

  bool ParseString(std::string& output, std::string& error) {
    output.clear();
    ++pos_;
    while (pos_ < input_.size()) {
      const char c = input_[pos_++];
      if (c == '"') {
        return true;
      }
      if (static_cast<unsigned char>(c) < 0x20U) {
        return Fail("raw control character inside string", error);
      }
      if (c != '\\') {
        output.push_back(c);
        continue;
      }
      if (pos_ >= input_.size()) {
        return Fail("unterminated escape sequence", error);
      }
      const char esc = input_[pos_++];
      switch (esc) {
      case '"':
      case '\\':
      case '/':
        output.push_back(esc);
        break;
      case 'b':
        output.push_back('\b');
        break;
      case 'f':
        output.push_back('\f');
        break;
      case 'n':
        output.push_back('\n');
        break;
      case 'r':
        output.push_back('\r');
        break;
      case 't':
        output.push_back('\t');
        break;
      case 'u': {
        std::uint32_t code_point = 0;
        if (!ParseHex4(code_point)) {
          return Fail("invalid \\u escape", error);
        }
        AppendUtf8(code_point, output);
        break;
      }
      default:
        return Fail("invalid escape sequence", error);
      }
    }
    return Fail("unterminated string", error);
  }

  bool ParseHex4(std::uint32_t& code_point) {
    if (pos_ + 4 > input_.size()) {
      return false;
    }
    code_point = 0;
    for (int i = 0; i < 4; ++i) {
      const char h = input_[pos_++];
      code_point <<= 4U;
      if (h >= '0' && h <= '9') {
        code_point |= static_cast<std::uint32_t>(h - '0');
      } else if (h >= 'a' && h <= 'f') {
        code_point |= static_cast<std::uint32_t>(h - 'a' + 10);
      } else if (h >= 'A' && h <= 'F') {
        code_point |= static_cast<std::uint32_t>(h - 'A' + 10);
      } else {
        return false;
      }
    }
    return true;
  }

  // Surrogate pairs are not combined; config files in practice carry BMP text
  // such as the degree sign.
  static void AppendUtf8(std::uint32_t cp, std::string& out) {
    if (cp < 0x80U) {
      out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800U) {
      out.push_back(static_cast<char>(0xC0U | (cp >> 6U)));
      out.push_back(static_cast<char>(0x80U | (cp & 0x3FU)));
    } else {
      out.push_back(static_cast<char>(0xE0U | (cp >> 12U)));
      out.push_back(static_cast<char>(0x80U | ((cp >> 6U) & 0x3FU)));
      out.push_back(static_cast<char>(0x80U | (cp & 0x3FU)));
    }
  }

  bool ParseNumber(double& output, std::string& error) {
    const std::size_t start = pos_;
    if (input_[pos_] == '-') {
      ++pos_;
    }
    while (pos_ < input_.size()) {
      const char c = input_[pos_];
      if (std::isdigit(static_cast<unsigned char>(c)) != 0 || c == '.' || c == 'e' || c == 'E' ||
          c == '+' || c == '-') {
        ++pos_;
        continue;
      }
      break;
    }

    const std::string token(input_.substr(start, pos_ - start));
    char* end = nullptr;
    output = std::strtod(token.c_str(), &end);
    if (token.empty() || end == nullptr || *end != '\0') {
      return Fail("invalid number '" + token + "'", error);
    }
    return true;
  }

  void SkipWhitespace() {
    while (pos_ < input_.size() && std::isspace(static_cast<unsigned char>(input_[pos_])) != 0) {
      ++pos_;
    }
  }

  bool Consume(char expected) {
    if (pos_ < input_.size() && input_[pos_] == expected) {
      ++pos_;
      return true;
    }
    return false;
  }

  bool ConsumeKeyword(std::string_view keyword) {
    if (input_.substr(pos_, keyword.size()) != keyword) {
      return false;
    }
    pos_ += keyword.size();
    return true;
  }

  bool Fail(std::string_view message, std::string& error) const {
    std::size_t line = 1;
    std::size_t col = 1;
    for (std::size_t i = 0; i < pos_ && i < input_.size(); ++i) {
      if (input_[i] == '\n') {
        ++line;
        col = 1;
      } else {
        ++col;
      }
    }
    error = "json parse error at line " + std::to_string(line) + ", col " + std::to_string(col) +
            ": " + std::string(message);
    return false;
  }

  std::string_view input_;
  std::size_t pos_ = 0;
};

inline bool Parse(std::string_view input, Value& root, std::string& error) {
  Parser parser(input);
  return parser.Parse(root, error);
}

inline std::string Escape(std::string_view input) {
  std::ostringstream out;
  for (const char ch : input) {
    switch (ch) {
    case '"':
      out << "\\\"";
      break;
    case '\\':
      out << "\\\\";
      break;
    case '\n':
      out << "\\n";
      break;
    case '\r':
      out << "\\r";
      break;
    case '\t':
      out << "\\t";
      break;
    default:
      if (static_cast<unsigned char>(ch) < 0x20U) {
        out << "\\u" << std::hex << std::setw(4) << std::setfill('0')
            << static_cast<int>(static_cast<unsigned char>(ch)) << std::dec << std::setfill(' ');
      } else {
        out << ch;
      }
      break;
    }
  }
  return out.str();
}

// Writes a flat object of string members, one per line, keys sorted. This is
// the on-disk shape of a camera's persisted settings.
inline std::string WriteStringObject(const std::map<std::string, std::string>& members) {
  std::string out = "{\n";
  std::size_t index = 0;
  for (const auto& [key, value] : members) {
    out += "  \"" + Escape(key) + "\": \"" + Escape(value) + "\"";
    out += (++index < members.size()) ? ",\n" : "\n";
  }
  out += "}\n";
  return out;
}

} // namespace isapisync::core::json

#endif // ISAPISYNC_CORE_JSON_DOM_HPP_
