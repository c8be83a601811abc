#ifndef PICAMD_CORE_JSON_UTILS_HPP_
#define PICAMD_CORE_JSON_UTILS_HPP_

#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>

namespace picamd::core {

inline std::string EscapeJson(std::string_view input) {
  std::ostringstream out;
  for (const char ch : input) {
    switch (ch) {
    case '"':
      out << "\\\"";
      break;
    case '\\':
      out << "\\\\";
      break;
    case '\b':
      out << "\\b";
      break;
    case '\f':
      out << "\\f";
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
    default: {
      const auto as_unsigned = static_cast<unsigned char>(ch);
      if (as_unsigned < 0x20U) {
        out << "\\u" << std::hex << std::setw(4) << std::setfill('0')
            << static_cast<int>(as_unsigned) << std::dec << std::setfill(' ');
      } else {
        out << ch;
      }
      break;
    }
    }
  }
  return out.str();
}

// Flat, insertion-ordered JSON object writer for response bodies.
//
//   JsonObjectWriter body;
//   body.Add("status", 0).Add("msg", "idle");
//   body.str() == R"({"status":0,"msg":"idle"})"
class JsonObjectWriter {
public:
  JsonObjectWriter& Add(std::string_view key, std::string_view value) {
    AppendKey(key);
    body_ << '"' << EscapeJson(value) << '"';
    return *this;
  }

  JsonObjectWriter& Add(std::string_view key, const char* value) {
    return Add(key, std::string_view(value));
  }

  JsonObjectWriter& Add(std::string_view key, std::int64_t value) {
    AppendKey(key);
    body_ << value;
    return *this;
  }

  JsonObjectWriter& Add(std::string_view key, int value) {
    return Add(key, static_cast<std::int64_t>(value));
  }

  JsonObjectWriter& Add(std::string_view key, std::uint32_t value) {
    return Add(key, static_cast<std::int64_t>(value));
  }

  JsonObjectWriter& Add(std::string_view key, double value, int precision) {
    AppendKey(key);
    body_ << std::fixed << std::setprecision(precision) << value;
    body_.unsetf(std::ios::floatfield);
    return *this;
  }

  JsonObjectWriter& Add(std::string_view key, bool value) {
    AppendKey(key);
    body_ << (value ? "true" : "false");
    return *this;
  }

  // Inserts an already serialized JSON value (object, array, null).
  JsonObjectWriter& AddRaw(std::string_view key, std::string_view raw_json) {
    AppendKey(key);
    body_ << raw_json;
    return *this;
  }

  std::string str() const {
    return "{" + body_.str() + "}";
  }

private:
  void AppendKey(std::string_view key) {
    if (!first_) {
      body_ << ',';
    }
    first_ = false;
    body_ << '"' << EscapeJson(key) << "\":";
  }

  std::ostringstream body_;
  bool first_ = true;
};

} // namespace picamd::core

#endif // PICAMD_CORE_JSON_UTILS_HPP_
