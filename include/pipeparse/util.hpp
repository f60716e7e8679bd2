#pragma once
#include <algorithm>
#include <cctype>
#include <string>

namespace pipeparse {
namespace util {

inline std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

inline std::string trim(const std::string &s) {
  size_t b = 0, e = s.size();
  while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
  while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
  return s.substr(b, e - b);
}

inline std::string json_escape(const std::string &s) {
  std::string o; o.reserve(s.size() + 8);
  for (char c : s) {
    switch (c) {
      case '\"': o += "\\\""; break;
      case '\\': o += "\\\\"; break;
      case '\b': o += "\\b"; break;
      case '\f': o += "\\f"; break;
      case '\n': o += "\\n"; break;
      case '\r': o += "\\r"; break;
      case '\t': o += "\\t"; break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          const char *hexd = "0123456789abcdef";
          o += "\\u00";
          o.push_back(hexd[(c >> 4) & 0xF]);
          o.push_back(hexd[c & 0xF]);
        } else {
          o.push_back(c);
        }
    }
  }
  return o;
}

} // namespace util
} // namespace pipeparse
