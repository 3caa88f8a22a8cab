#include "ini_line.hpp"
#include <cctype>

static inline bool is_space(unsigned char c) {
  return std::isspace(c) != 0;
}

std::string_view trim_line(std::string_view raw) {
  size_t i = 0;
  size_t j = raw.size();
  while (i < j && is_space(static_cast<unsigned char>(raw[i]))) i++;
  while (j > i && is_space(static_cast<unsigned char>(raw[j - 1]))) j--;
  return raw.substr(i, j - i);
}

/* key: one or more chars that are neither space nor '=', then spaces, '=', spaces, value */
static bool match_option(std::string_view s, IniLine& out) {
  size_t k = 0;
  while (k < s.size() && s[k] != '=' && !is_space(static_cast<unsigned char>(s[k]))) k++;
  if (k == 0) return false;
  size_t p = k;
  while (p < s.size() && is_space(static_cast<unsigned char>(s[p]))) p++;
  if (p >= s.size() || s[p] != '=') return false;
  p++;
  while (p < s.size() && is_space(static_cast<unsigned char>(s[p]))) p++;
  out.kind = LineKind::Option;
  out.name.assign(s.substr(0, k));
  out.value.assign(s.substr(p));
  return true;
}

static bool match_section(std::string_view s, IniLine& out) {
  if (s.size() < 3 || s[0] != '[') return false;
  size_t close = s.find(']', 1);
  if (close == std::string_view::npos || close == 1) return false;
  out.kind = LineKind::Section;
  out.name.assign(s.substr(1, close - 1));
  return true;
}

IniLine classify_line(std::string_view raw) {
  IniLine out;
  std::string_view s = trim_line(raw);
  if (s.empty()) { out.kind = LineKind::Blank; return out; }
  if (s[0] == '#' || s[0] == ';') { out.kind = LineKind::Comment; return out; }
  if (match_option(s, out)) return out;
  if (match_section(s, out)) return out;
  out.kind = LineKind::Other;
  return out;
}

std::string format_option(std::string_view option, std::string_view value) {
  std::string s;
  s.reserve(option.size() + value.size() + 4);
  s.append(option);
  s += " = ";
  s.append(value);
  s.push_back('\n');
  return s;
}

std::string format_section(std::string_view section) {
  std::string s;
  s.reserve(section.size() + 3);
  s.push_back('[');
  s.append(section);
  s += "]\n";
  return s;
}

static bool one_line(std::string_view s) {
  return s.find_first_of("\r\n") == std::string_view::npos;
}

bool writable_option(std::string_view option) {
  if (option.empty() || !one_line(option)) return false;
  IniLine l = classify_line(format_option(option, "x"));
  return l.kind == LineKind::Option && l.name == option;
}

bool writable_section(std::string_view section) {
  if (section.empty() || !one_line(section)) return false;
  IniLine l = classify_line(format_section(section));
  return l.kind == LineKind::Section && l.name == section;
}

bool writable_value(std::string_view value) {
  return one_line(value);
}
