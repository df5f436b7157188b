#pragma once

#include <charconv>
#include <cmath>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace lanscan::core::common::json {

inline std::string Escape(const std::string& s) {
  std::string out;
  out.reserve(s.size() + 8);
  for (const char c : s) {
    switch (c) {
      case '\"': out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\b': out += "\\b"; break;
      case '\f': out += "\\f"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          const char hex[] = "0123456789abcdef";
          out += "\\u00";
          out += hex[(c >> 4) & 0x0f];
          out += hex[c & 0x0f];
        } else {
          out += c;
        }
    }
  }
  return out;
}

inline std::string Quote(const std::string& s) {
  std::string out;
  out.reserve(s.size() + 2);
  out.push_back('\"');
  out += Escape(s);
  out.push_back('\"');
  return out;
}

inline std::string Bool(bool v) { return v ? "true" : "false"; }

inline std::string Number(std::int64_t v) { return std::to_string(v); }
inline std::string Number(std::size_t v) { return std::to_string(v); }
inline std::string Number(int v) { return std::to_string(v); }

// Shortest text that reads back as the same double, independent of the C locale.
inline std::string Number(double v) {
  if (!std::isfinite(v)) return "null";
  char buf[32];
  const auto r = std::to_chars(buf, buf + sizeof(buf), v);
  if (r.ec != std::errc()) return "null";
  return std::string(buf, r.ptr);
}

inline std::string Object(std::initializer_list<std::pair<std::string, std::string>> fields) {
  std::string out;
  out.push_back('{');
  bool first = true;
  for (const auto& kv : fields) {
    if (!first) out.push_back(',');
    first = false;
    out += Quote(kv.first);
    out.push_back(':');
    out += kv.second;
  }
  out.push_back('}');
  return out;
}

inline std::string Object(const std::vector<std::pair<std::string, std::string>>& fields) {
  std::string out;
  out.push_back('{');
  bool first = true;
  for (const auto& kv : fields) {
    if (!first) out.push_back(',');
    first = false;
    out += Quote(kv.first);
    out.push_back(':');
    out += kv.second;
  }
  out.push_back('}');
  return out;
}

// Elements are already-encoded JSON values.
inline std::string Array(const std::vector<std::string>& items) {
  std::string out;
  out.push_back('[');
  bool first = true;
  for (const auto& item : items) {
    if (!first) out.push_back(',');
    first = false;
    out += item;
  }
  out.push_back(']');
  return out;
}

}  // namespace lanscan::core::common::json
