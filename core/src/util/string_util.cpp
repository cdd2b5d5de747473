#include "string_util.h"

#include <cstdio>
#include <sstream>

namespace hql::util {

namespace {

char fold(char c) {
  if (c >= 'A' && c <= 'Z') return static_cast<char>(c - 'A' + 'a');
  return c;
}

}  // namespace

bool is_hql_space(char c) {
  return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

std::string to_lower(std::string_view s) {
  std::string out;
  out.reserve(s.size());
  for (char c : s) {
    out.push_back(fold(c));
  }
  return out;
}

bool equals_ascii_ci(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i) {
    if (fold(a[i]) != fold(b[i])) return false;
  }
  return true;
}

std::string trim_ws(std::string_view s) {
  size_t start = 0;
  while (start < s.size() && is_hql_space(s[start])) {
    ++start;
  }
  size_t end = s.size();
  while (end > start && is_hql_space(s[end - 1])) {
    --end;
  }
  return std::string(s.substr(start, end - start));
}

std::vector<std::string_view> split_ws(std::string_view s) {
  std::vector<std::string_view> out;
  size_t i = 0;
  while (i < s.size()) {
    while (i < s.size() && is_hql_space(s[i])) {
      ++i;
    }
    size_t start = i;
    while (i < s.size() && !is_hql_space(s[i])) {
      ++i;
    }
    if (start < i) out.push_back(s.substr(start, i - start));
  }
  return out;
}

std::string strip_prefix_once(std::string_view s, std::string_view prefix) {
  if (s.substr(0, prefix.size()) == prefix) {
    return std::string(s.substr(prefix.size()));
  }
  return std::string(s);
}

std::string strip_suffix_once(std::string_view s, std::string_view suffix) {
  if (s.size() >= suffix.size() && s.substr(s.size() - suffix.size()) == suffix) {
    return std::string(s.substr(0, s.size() - suffix.size()));
  }
  return std::string(s);
}

std::string json_escape(std::string_view s) {
  std::ostringstream out;
  for (char c : s) {
    switch (c) {
      case '\\':
        out << "\\\\";
        break;
      case '"':
        out << "\\\"";
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
        if (static_cast<unsigned char>(c) < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
          out << buf;
        } else {
          out << c;
        }
        break;
    }
  }
  return out.str();
}

}  // namespace hql::util
