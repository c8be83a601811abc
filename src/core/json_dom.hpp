#ifndef PICAMD_CORE_JSON_DOM_HPP_
#define PICAMD_CORE_JSON_DOM_HPP_

#include <cctype>
#include <cstdlib>
#include <cmath>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace picamd::core::json {

// Scalar value of a flat request object.
struct Scalar {
  enum class Type {
    kString,
    kNumber,
    kBool,
    kNull,
  };

  Type type = Type::kNull;
  std::string string_value;
  double number_value = 0.0;
  bool bool_value = false;
};

using FlatObject = std::map<std::string, Scalar>;

// Parser for the small request bodies accepted by the control API: one JSON
// object whose members are strings, numbers, booleans or null. Nested
// objects and arrays are rejected with a positioned diagnostic.
class FlatObjectParser {
public:
  explicit FlatObjectParser(std::string_view input) : input_(input) {}

  bool Parse(FlatObject& object, std::string& error) {
    object.clear();
    SkipWhitespace();
    if (!ConsumeChar('{', "expected '{' to start object", error)) {
      return false;
    }
    SkipWhitespace();
    if (!Match('}')) {
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
        Scalar value;
        if (!ParseScalar(value, error)) {
          return false;
        }
        object[key] = std::move(value);

        SkipWhitespace();
        if (Match('}')) {
          break;
        }
        if (!ConsumeChar(',', "expected ',' between object entries", error)) {
          return false;
        }
      }
    }
    SkipWhitespace();
    if (!AtEnd()) {
      return Fail("unexpected trailing content after JSON object", error);
    }
    return true;
  }

private:
  bool ParseScalar(Scalar& value, std::string& error) {
    if (AtEnd()) {
      return Fail("unexpected end of input while parsing value", error);
    }
    const char c = input_[pos_];
    if (c == '{' || c == '[') {
      return Fail("nested values are not supported in request bodies", error);
    }
    if (c == '"') {
      value.type = Scalar::Type::kString;
      return ParseString(value.string_value, error);
    }
    if (c == '-' || std::isdigit(static_cast<unsigned char>(c)) != 0) {
      value.type = Scalar::Type::kNumber;
      return ParseNumber(value.number_value, error);
    }
    if (ConsumeToken("true")) {
      value.type = Scalar::Type::kBool;
      value.bool_value = true;
      return true;
    }
    if (ConsumeToken("false")) {
      value.type = Scalar::Type::kBool;
      value.bool_value = false;
      return true;
    }
    if (ConsumeToken("null")) {
      value.type = Scalar::Type::kNull;
      return true;
    }
    return Fail("expected JSON value", error);
  }

  bool ParseString(std::string& output, std::string& error) {
    output.clear();
    if (!ConsumeChar('"', "expected '\"' to start string", error)) {
      return false;
    }
    while (!AtEnd()) {
      const char c = input_[pos_++];
      if (c == '"') {
        return true;
      }
      if (c == '\\') {
        if (AtEnd()) {
          return Fail("unterminated escape sequence in string", error);
        }
        const char esc = input_[pos_++];
        switch (esc) {
        case '"':
        case '\\':
        case '/':
          output.push_back(esc);
          break;
        case 'n':
          output.push_back('\n');
          break;
        case 't':
          output.push_back('\t');
          break;
        default:
          return Fail("unsupported escape sequence in string", error);
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
    if (!AtEnd() && input_[pos_] == '-') {
      ++pos_;
    }
    while (!AtEnd() && (std::isdigit(static_cast<unsigned char>(input_[pos_])) != 0 ||
                        input_[pos_] == '.' || input_[pos_] == 'e' || input_[pos_] == 'E' ||
                        input_[pos_] == '+' || input_[pos_] == '-')) {
      ++pos_;
    }
    const std::string text(input_.substr(start, pos_ - start));
    char* end = nullptr;
    output = std::strtod(text.c_str(), &end);
    if (text.empty() || end != text.c_str() + text.size() || !std::isfinite(output)) {
      return Fail("invalid number token", error);
    }
    return true;
  }

  void SkipWhitespace() {
    while (!AtEnd() && std::isspace(static_cast<unsigned char>(input_[pos_])) != 0) {
      ++pos_;
    }
  }

  bool ConsumeChar(char expected, std::string_view message, std::string& error) {
    if (!Match(expected)) {
      return Fail(message, error);
    }
    return true;
  }

  bool Match(char expected) {
    if (AtEnd() || input_[pos_] != expected) {
      return false;
    }
    ++pos_;
    return true;
  }

  bool ConsumeToken(std::string_view token) {
    if (input_.substr(pos_, token.size()) != token) {
      return false;
    }
    pos_ += token.size();
    return true;
  }

  bool AtEnd() const {
    return pos_ >= input_.size();
  }

  bool Fail(std::string_view message, std::string& error) const {
    error = "parse error at offset " + std::to_string(pos_) + ": " + std::string(message);
    return false;
  }

  std::string_view input_;
  std::size_t pos_ = 0;
};

inline bool ParseFlatObject(std::string_view input, FlatObject& object, std::string& error) {
  FlatObjectParser parser(input);
  return parser.Parse(object, error);
}

// Reads an optional non-negative integer member. Absent or null members
// leave `value` empty; anything but an integral number is an error.
inline bool GetOptionalUInt32(const FlatObject& object, const std::string& key,
                              std::optional<std::uint32_t>& value, std::string& error) {
  value.reset();
  const auto it = object.find(key);
  if (it == object.end() || it->second.type == Scalar::Type::kNull) {
    return true;
  }
  const Scalar& scalar = it->second;
  if (scalar.type != Scalar::Type::kNumber || scalar.number_value < 0.0 ||
      scalar.number_value > 4294967295.0 ||
      std::floor(scalar.number_value) != scalar.number_value) {
    error = "'" + key + "' must be a non-negative integer";
    return false;
  }
  value = static_cast<std::uint32_t>(scalar.number_value);
  return true;
}

} // namespace picamd::core::json

#endif // PICAMD_CORE_JSON_DOM_HPP_
