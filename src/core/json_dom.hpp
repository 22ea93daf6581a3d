#ifndef PROBEKIT_CORE_JSON_DOM_HPP_
#define PROBEKIT_CORE_JSON_DOM_HPP_

#include "core/json_utils.hpp"

#include <cctype>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <map>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace probekit::core::json {

// Small STL-only DOM used by plan loading. Object members are kept in a
// sorted map so iteration order (and therefore any derived diagnostics) is
// stable across platforms.
struct Value {
  enum class Type {
    kObject,
    kArray,
    kString,
    kNumber,
    kBool,
    kNull,
  };

  using Object = std::map<std::string, Value>;
  using Array = std::vector<Value>;

  Type type = Type::kNull;
  Object object_value;
  Array array_value;
  std::string string_value;
  double number_value = 0.0;
  bool bool_value = false;

  bool is_object() const {
    return type == Type::kObject;
  }
  bool is_array() const {
    return type == Type::kArray;
  }
  bool is_string() const {
    return type == Type::kString;
  }
  bool is_number() const {
    return type == Type::kNumber;
  }
  bool is_bool() const {
    return type == Type::kBool;
  }
  bool is_null() const {
    return type == Type::kNull;
  }

  // Returns the member for `key`, or nullptr when this is not an object or
  // the key is absent.
  const Value* Find(std::string_view key) const {
    if (type != Type::kObject) {
      return nullptr;
    }
    const auto it = object_value.find(std::string(key));
    return it == object_value.end() ? nullptr : &it->second;
  }
};

// Recursive-descent parser with line/column diagnostics.
class Parser {
public:
  explicit Parser(std::string_view input) : input_(input) {}

  bool Parse(Value& root, std::string& error) {
    root = Value{};
    SkipWhitespace();
    if (!ParseValue(root, 0, error)) {
      return false;
    }
    SkipWhitespace();
    if (!AtEnd()) {
      return Fail("unexpected trailing content after JSON value", error);
    }
    return true;
  }

private:
  static constexpr std::size_t kMaxDepth = 64;

  bool ParseValue(Value& value, std::size_t depth, std::string& error) {
    if (depth > kMaxDepth) {
      return Fail("maximum nesting depth exceeded", error);
    }
    if (AtEnd()) {
      return Fail("unexpected end of input while parsing value", error);
    }

    switch (Peek()) {
    case '{':
      return ParseObject(value, depth, error);
    case '[':
      return ParseArray(value, depth, error);
    case '"':
      value.type = Value::Type::kString;
      return ParseString(value.string_value, error);
    case 't':
      return ParseLiteral("true", value, Value::Type::kBool, true, error);
    case 'f':
      return ParseLiteral("false", value, Value::Type::kBool, false, error);
    case 'n':
      return ParseLiteral("null", value, Value::Type::kNull, false, error);
    default:
      break;
    }

    if (Peek() == '-' || std::isdigit(static_cast<unsigned char>(Peek())) != 0) {
      value.type = Value::Type::kNumber;
      return ParseNumber(value.number_value, error);
    }
    return Fail("expected JSON value", error);
  }

  bool ParseLiteral(std::string_view token, Value& value, Value::Type type, bool bool_value,
                    std::string& error) {
    if (input_.substr(pos_, token.size()) != token) {
      return Fail("invalid literal", error);
    }
    for (std::size_t i = 0; i < token.size(); ++i) {
      Advance();
    }
    value.type = type;
    value.bool_value = bool_value;
    return true;
  }

  bool ParseObject(Value& value, std::size_t depth, std::string& error) {
    value = Value{};
    value.type = Value::Type::kObject;
    Advance(); // '{'
    SkipWhitespace();
    if (Match('}')) {
      return true;
    }

    while (true) {
      SkipWhitespace();
      if (AtEnd() || Peek() != '"') {
        return Fail("expected string key in object", error);
      }
      std::string key;
      if (!ParseString(key, error)) {
        return false;
      }
      SkipWhitespace();
      if (!Match(':')) {
        return Fail("expected ':' after object key", error);
      }
      SkipWhitespace();
      Value member;
      if (!ParseValue(member, depth + 1U, error)) {
        return false;
      }
      value.object_value.insert_or_assign(std::move(key), std::move(member));

      SkipWhitespace();
      if (Match('}')) {
        return true;
      }
      if (!Match(',')) {
        return Fail("expected ',' between object entries", error);
      }
    }
  }

  bool ParseArray(Value& value, std::size_t depth, std::string& error) {
    value = Value{};
    value.type = Value::Type::kArray;
    Advance(); // '['
    SkipWhitespace();
    if (Match(']')) {
      return true;
    }

    while (true) {
      SkipWhitespace();
      Value item;
      if (!ParseValue(item, depth + 1U, error)) {
        return false;
      }
      value.array_value.push_back(std::move(item));

      SkipWhitespace();
      if (Match(']')) {
        return true;
      }
      if (!Match(',')) {
        return Fail("expected ',' between array items", error);
      }
    }
  }

  bool ParseString(std::string& output, std::string& error) {
    output.clear();
    Advance(); // opening quote

    while (!AtEnd()) {
      const char c = Advance();
      if (c == '"') {
        return true;
      }
      if (static_cast<unsigned char>(c) < 0x20U) {
        return Fail("control character in string is not allowed", error);
      }
      if (c != '\\') {
        output.push_back(c);
        continue;
      }

      if (AtEnd()) {
        break;
      }
      const char esc = Advance();
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
      case 'u':
        if (!ParseUnicodeEscape(output, error)) {
          return false;
        }
        break;
      default:
        return Fail("invalid escape sequence in string", error);
      }
    }

    return Fail("unterminated string literal", error);
  }

  // Basic multilingual plane only; surrogate pairs are rejected.
  bool ParseUnicodeEscape(std::string& output, std::string& error) {
    std::uint32_t code_point = 0;
    for (int i = 0; i < 4; ++i) {
      if (AtEnd()) {
        return Fail("truncated \\u escape", error);
      }
      const char h = Advance();
      code_point <<= 4U;
      if (h >= '0' && h <= '9') {
        code_point |= static_cast<std::uint32_t>(h - '0');
      } else if (h >= 'a' && h <= 'f') {
        code_point |= static_cast<std::uint32_t>(h - 'a' + 10);
      } else if (h >= 'A' && h <= 'F') {
        code_point |= static_cast<std::uint32_t>(h - 'A' + 10);
      } else {
        return Fail("invalid hex digit in \\u escape", error);
      }
    }
    if (code_point >= 0xD800U && code_point <= 0xDFFFU) {
      return Fail("surrogate \\u escapes are not supported", error);
    }

    if (code_point < 0x80U) {
      output.push_back(static_cast<char>(code_point));
    } else if (code_point < 0x800U) {
      output.push_back(static_cast<char>(0xC0U | (code_point >> 6U)));
      output.push_back(static_cast<char>(0x80U | (code_point & 0x3FU)));
    } else {
      output.push_back(static_cast<char>(0xE0U | (code_point >> 12U)));
      output.push_back(static_cast<char>(0x80U | ((code_point >> 6U) & 0x3FU)));
      output.push_back(static_cast<char>(0x80U | (code_point & 0x3FU)));
    }
    return true;
  }

  bool ParseNumber(double& output, std::string& error) {
    const std::size_t start = pos_;
    Match('-');
    if (!Match('0') && ConsumeDigits() == 0U) {
      return Fail("expected digits in number", error);
    }
    if (Match('.') && ConsumeDigits() == 0U) {
      return Fail("expected digits after decimal point", error);
    }
    if (Match('e') || Match('E')) {
      if (!Match('+')) {
        Match('-');
      }
      if (ConsumeDigits() == 0U) {
        return Fail("expected exponent digits", error);
      }
    }

    const std::string text(input_.substr(start, pos_ - start));
    char* end = nullptr;
    output = std::strtod(text.c_str(), &end);
    if (end == nullptr || *end != '\0') {
      return Fail("invalid number token", error);
    }
    return true;
  }

  std::size_t ConsumeDigits() {
    std::size_t count = 0;
    while (!AtEnd() && std::isdigit(static_cast<unsigned char>(Peek())) != 0) {
      Advance();
      ++count;
    }
    return count;
  }

  void SkipWhitespace() {
    while (!AtEnd() && std::isspace(static_cast<unsigned char>(Peek())) != 0) {
      Advance();
    }
  }

  bool Match(char expected) {
    if (AtEnd() || Peek() != expected) {
      return false;
    }
    Advance();
    return true;
  }

  char Peek() const {
    return input_[pos_];
  }

  char Advance() {
    const char c = input_[pos_++];
    if (c == '\n') {
      ++line_;
      col_ = 1;
    } else {
      ++col_;
    }
    return c;
  }

  bool AtEnd() const {
    return pos_ >= input_.size();
  }

  bool Fail(std::string_view message, std::string& error) const {
    error = "parse error at line " + std::to_string(line_) + ", col " + std::to_string(col_) +
            ": " + std::string(message);
    return false;
  }

  std::string_view input_;
  std::size_t pos_ = 0;
  std::size_t line_ = 1;
  std::size_t col_ = 1;
};

inline const char* ToString(Value::Type type) {
  switch (type) {
  case Value::Type::kObject:
    return "object";
  case Value::Type::kArray:
    return "array";
  case Value::Type::kString:
    return "string";
  case Value::Type::kNumber:
    return "number";
  case Value::Type::kBool:
    return "bool";
  case Value::Type::kNull:
    return "null";
  }
  return "null";
}

inline bool Parse(std::string_view input, Value& root, std::string& error) {
  Parser parser(input);
  return parser.Parse(root, error);
}

// Compact re-serialization, used when a plan embeds a JSON request body as an
// object instead of a string. Integral numbers print without a fraction.
inline void AppendJsonText(const Value& value, std::string& out) {
  switch (value.type) {
  case Value::Type::kObject: {
    out.push_back('{');
    bool first = true;
    for (const auto& [key, member] : value.object_value) {
      if (!first) {
        out.push_back(',');
      }
      first = false;
      out += core::Quoted(key);
      out.push_back(':');
      AppendJsonText(member, out);
    }
    out.push_back('}');
    return;
  }
  case Value::Type::kArray: {
    out.push_back('[');
    for (std::size_t i = 0; i < value.array_value.size(); ++i) {
      if (i != 0U) {
        out.push_back(',');
      }
      AppendJsonText(value.array_value[i], out);
    }
    out.push_back(']');
    return;
  }
  case Value::Type::kString:
    out += core::Quoted(value.string_value);
    return;
  case Value::Type::kNumber: {
    const double number = value.number_value;
    if (std::isfinite(number) && std::floor(number) == number &&
        std::fabs(number) < 9.0e15) {
      out += std::to_string(static_cast<long long>(number));
    } else {
      std::ostringstream text;
      text.precision(std::numeric_limits<double>::max_digits10);
      text << number;
      out += text.str();
    }
    return;
  }
  case Value::Type::kBool:
    out += value.bool_value ? "true" : "false";
    return;
  case Value::Type::kNull:
    out += "null";
    return;
  }
}

inline std::string ToJsonText(const Value& value) {
  std::string out;
  AppendJsonText(value, out);
  return out;
}

} // namespace probekit::core::json

#endif // PROBEKIT_CORE_JSON_DOM_HPP_
