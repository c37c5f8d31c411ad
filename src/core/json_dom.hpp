#ifndef AUTOPSY_CORE_JSON_DOM_HPP_
#define AUTOPSY_CORE_JSON_DOM_HPP_

#include "core/json_utils.hpp"

#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace autopsy::core::json {

// Minimal DOM shared by config loading, metadata records, cached pass-1
// results, and config-key canonicalization. Objects are ordered maps, so any
// serialized object has sorted keys regardless of insertion order.
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

  static Value MakeNull() {
    return Value{};
  }

  static Value MakeString(std::string text) {
    Value value;
    value.type = Type::kString;
    value.string_value = std::move(text);
    return value;
  }

  static Value MakeNumber(double number) {
    Value value;
    value.type = Type::kNumber;
    value.number_value = number;
    return value;
  }

  static Value MakeBool(bool flag) {
    Value value;
    value.type = Type::kBool;
    value.bool_value = flag;
    return value;
  }

  static Value MakeArray(Array items = {}) {
    Value value;
    value.type = Type::kArray;
    value.array_value = std::move(items);
    return value;
  }

  static Value MakeObject(Object members = {}) {
    Value value;
    value.type = Type::kObject;
    value.object_value = std::move(members);
    return value;
  }

  bool IsNull() const {
    return type == Type::kNull;
  }

  // Returns the named member of an object value, or nullptr.
  const Value* Find(std::string_view key) const {
    if (type != Type::kObject) {
      return nullptr;
    }
    const auto it = object_value.find(std::string(key));
    return it == object_value.end() ? nullptr : &it->second;
  }
};

// JSON parser with deterministic line/column diagnostics.
class Parser {
public:
  explicit Parser(std::string_view input) : input_(input) {}

  bool Parse(Value& root, std::string& error) {
    SkipWhitespace();
    if (!ParseValue(root, error)) {
      return false;
    }
    SkipWhitespace();
    if (!AtEnd()) {
      return Fail("unexpected trailing content after JSON value", error);
    }
    return true;
  }

private:
  bool ParseValue(Value& value, std::string& error) {
    if (AtEnd()) {
      return Fail("unexpected end of input while parsing value", error);
    }

    const char c = Peek();
    if (c == '{') {
      return ParseObject(value, error);
    }
    if (c == '[') {
      return ParseArray(value, error);
    }
    if (c == '"') {
      value = Value{};
      value.type = Value::Type::kString;
      return ParseString(value.string_value, error);
    }
    if (c == '-' || std::isdigit(static_cast<unsigned char>(c)) != 0) {
      value = Value{};
      value.type = Value::Type::kNumber;
      return ParseNumber(value.number_value, error);
    }
    if (StartsWith("true")) {
      value = Value::MakeBool(true);
      AdvanceN(4);
      return true;
    }
    if (StartsWith("false")) {
      value = Value::MakeBool(false);
      AdvanceN(5);
      return true;
    }
    if (StartsWith("null")) {
      value = Value::MakeNull();
      AdvanceN(4);
      return true;
    }

    return Fail("expected JSON value", error);
  }

  bool ParseObject(Value& value, std::string& error) {
    value = Value::MakeObject();

    if (!ConsumeChar('{', "expected '{' to start object", error)) {
      return false;
    }
    SkipWhitespace();

    if (Match('}')) {
      return true;
    }

    while (true) {
      SkipWhitespace();
      std::string key;
      if (!ParseString(key, error)) {
        return false;
      }

      SkipWhitespace();
      if (!ConsumeChar(':', "expected ':' after object key", error)) {
        return false;
      }

      SkipWhitespace();
      Value item;
      if (!ParseValue(item, error)) {
        return false;
      }
      value.object_value[key] = std::move(item);

      SkipWhitespace();
      if (Match('}')) {
        break;
      }
      if (!ConsumeChar(',', "expected ',' between object entries", error)) {
        return false;
      }
    }

    return true;
  }

  bool ParseArray(Value& value, std::string& error) {
    value = Value::MakeArray();

    if (!ConsumeChar('[', "expected '[' to start array", error)) {
      return false;
    }
    SkipWhitespace();

    if (Match(']')) {
      return true;
    }

    while (true) {
      SkipWhitespace();
      Value item;
      if (!ParseValue(item, error)) {
        return false;
      }
      value.array_value.push_back(std::move(item));

      SkipWhitespace();
      if (Match(']')) {
        break;
      }
      if (!ConsumeChar(',', "expected ',' between array items", error)) {
        return false;
      }
    }

    return true;
  }

  bool ParseHex4(std::uint32_t& code_point, std::string& error) {
    code_point = 0;
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
    return true;
  }

  static void AppendUtf8(std::uint32_t cp, std::string& output) {
    if (cp < 0x80U) {
      output.push_back(static_cast<char>(cp));
    } else if (cp < 0x800U) {
      output.push_back(static_cast<char>(0xC0U | (cp >> 6U)));
      output.push_back(static_cast<char>(0x80U | (cp & 0x3FU)));
    } else if (cp < 0x10000U) {
      output.push_back(static_cast<char>(0xE0U | (cp >> 12U)));
      output.push_back(static_cast<char>(0x80U | ((cp >> 6U) & 0x3FU)));
      output.push_back(static_cast<char>(0x80U | (cp & 0x3FU)));
    } else {
      output.push_back(static_cast<char>(0xF0U | (cp >> 18U)));
      output.push_back(static_cast<char>(0x80U | ((cp >> 12U) & 0x3FU)));
      output.push_back(static_cast<char>(0x80U | ((cp >> 6U) & 0x3FU)));
      output.push_back(static_cast<char>(0x80U | (cp & 0x3FU)));
    }
  }

  bool ParseUnicodeEscape(std::string& output, std::string& error) {
    std::uint32_t cp = 0;
    if (!ParseHex4(cp, error)) {
      return false;
    }
    if (cp >= 0xD800U && cp <= 0xDBFFU) {
      if (!StartsWith("\\u")) {
        return Fail("unpaired high surrogate in \\u escape", error);
      }
      AdvanceN(2);
      std::uint32_t low = 0;
      if (!ParseHex4(low, error)) {
        return false;
      }
      if (low < 0xDC00U || low > 0xDFFFU) {
        return Fail("invalid low surrogate in \\u escape", error);
      }
      cp = 0x10000U + ((cp - 0xD800U) << 10U) + (low - 0xDC00U);
    }
    AppendUtf8(cp, output);
    return true;
  }

  bool ParseString(std::string& output, std::string& error) {
    output.clear();
    if (!ConsumeChar('"', "expected '\"' to start string", error)) {
      return false;
    }

    while (!AtEnd()) {
      const char c = Advance();
      if (c == '"') {
        return true;
      }
      if (c == '\\') {
        if (AtEnd()) {
          return Fail("unterminated escape sequence in string", error);
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
        continue;
      }

      if (static_cast<unsigned char>(c) < 0x20U) {
        return Fail("control character in string is not allowed", error);
      }
      output.push_back(c);
    }

    return Fail("unterminated string literal", error);
  }

  bool ParseNumber(double& output, std::string& error) {
    const std::size_t start = pos_;

    Match('-');

    if (!Match('0')) {
      if (!ConsumeDigits()) {
        return Fail("expected digits in number", error);
      }
    }

    if (Match('.')) {
      if (!ConsumeDigits()) {
        return Fail("expected digits after decimal point", error);
      }
    }

    if (Match('e') || Match('E')) {
      if (!Match('+')) {
        Match('-');
      }
      if (!ConsumeDigits()) {
        return Fail("expected exponent digits", error);
      }
    }

    // strtod is correctly rounded, so shortest-form output reparses exactly.
    const std::string text(input_.substr(start, pos_ - start));
    char* parse_end = nullptr;
    output = std::strtod(text.c_str(), &parse_end);
    if (parse_end != text.c_str() + text.size()) {
      return Fail("invalid number token", error);
    }

    return true;
  }

  void SkipWhitespace() {
    while (!AtEnd() && std::isspace(static_cast<unsigned char>(Peek())) != 0) {
      Advance();
    }
  }

  bool ConsumeDigits() {
    std::size_t count = 0;
    while (!AtEnd() && std::isdigit(static_cast<unsigned char>(Peek())) != 0) {
      Advance();
      ++count;
    }
    return count > 0U;
  }

  bool ConsumeChar(char expected, std::string_view message, std::string& error) {
    if (AtEnd() || Peek() != expected) {
      return Fail(message, error);
    }
    Advance();
    return true;
  }

  bool Match(char expected) {
    if (AtEnd() || Peek() != expected) {
      return false;
    }
    Advance();
    return true;
  }

  bool StartsWith(std::string_view token) const {
    if (pos_ + token.size() > input_.size()) {
      return false;
    }
    return input_.substr(pos_, token.size()) == token;
  }

  void AdvanceN(std::size_t n) {
    for (std::size_t i = 0; i < n; ++i) {
      Advance();
    }
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

inline bool Parse(std::string_view input, Value& root, std::string& error) {
  Parser parser(input);
  return parser.Parse(root, error);
}

namespace detail {

inline void AppendIndent(std::string& out, int indent, int depth) {
  if (indent <= 0) {
    return;
  }
  out.push_back('\n');
  out.append(static_cast<std::size_t>(indent * depth), ' ');
}

inline void SerializeInto(const Value& value, int indent, int depth, std::string& out) {
  switch (value.type) {
  case Value::Type::kNull:
    out += "null";
    return;
  case Value::Type::kBool:
    out += value.bool_value ? "true" : "false";
    return;
  case Value::Type::kNumber:
    out += FormatJsonNumber(value.number_value);
    return;
  case Value::Type::kString:
    out.push_back('"');
    out += EscapeJson(value.string_value);
    out.push_back('"');
    return;
  case Value::Type::kArray: {
    if (value.array_value.empty()) {
      out += "[]";
      return;
    }
    out.push_back('[');
    bool first = true;
    for (const Value& item : value.array_value) {
      if (!first) {
        out.push_back(',');
      }
      first = false;
      AppendIndent(out, indent, depth + 1);
      SerializeInto(item, indent, depth + 1, out);
    }
    AppendIndent(out, indent, depth);
    out.push_back(']');
    return;
  }
  case Value::Type::kObject: {
    if (value.object_value.empty()) {
      out += "{}";
      return;
    }
    out.push_back('{');
    bool first = true;
    for (const auto& [key, member] : value.object_value) {
      if (!first) {
        out.push_back(',');
      }
      first = false;
      AppendIndent(out, indent, depth + 1);
      out.push_back('"');
      out += EscapeJson(key);
      out += indent > 0 ? "\": " : "\":";
      SerializeInto(member, indent, depth + 1, out);
    }
    AppendIndent(out, indent, depth);
    out.push_back('}');
    return;
  }
  }
}

} // namespace detail

// Serializes a DOM value. `indent == 0` yields the compact canonical form
// (sorted keys, no whitespace) used for hashing; a positive indent yields the
// human-readable artifact form.
inline std::string Serialize(const Value& value, int indent = 0) {
  std::string out;
  detail::SerializeInto(value, indent, 0, out);
  return out;
}

} // namespace autopsy::core::json

#endif // AUTOPSY_CORE_JSON_DOM_HPP_
