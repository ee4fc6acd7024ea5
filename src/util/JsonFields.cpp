// Repository: RetroVue-clipshard
// Component: JSON Field Helpers
// Purpose: Flat-document JSON escaping and field extraction.
// Copyright (c) 2026 RetroVue

#include "clipshard/util/JsonFields.hpp"

#include <cstdio>
#include <regex>

namespace clipshard::util {

std::string JsonEscape(const std::string& s) {
  std::string out;
  out.reserve(s.size() + 8);
  for (char c : s) {
    const auto uc = static_cast<unsigned char>(c);
    if (c == '"') out += "\\\"";
    else if (c == '\\') out += "\\\\";
    else if (c == '\n') out += "\\n";
    else if (c == '\r') out += "\\r";
    else if (c == '\t') out += "\\t";
    else if (uc < 0x20 || c == '<' || c == '>' || c == '&') {
      char buf[8];
      std::snprintf(buf, sizeof(buf), "\\u%04x", uc);
      out += buf;
    } else {
      out += c;
    }
  }
  return out;
}

std::string JsonUnescape(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  for (size_t i = 0; i < s.size(); ++i) {
    if (s[i] != '\\' || i + 1 >= s.size()) {
      out += s[i];
      continue;
    }
    const char next = s[++i];
    if (next == 'n') out += '\n';
    else if (next == 'r') out += '\r';
    else if (next == 't') out += '\t';
    else if (next == 'u' && i + 4 < s.size() &&
             s.find_first_not_of("0123456789abcdefABCDEF", i + 1) >= i + 5) {
      // ASCII range only; that is all JsonEscape produces.
      out += static_cast<char>(std::stoi(s.substr(i + 1, 4), nullptr, 16) & 0x7F);
      i += 4;
    } else {
      out += next;
    }
  }
  return out;
}

bool ExtractInt(const std::string& json, const std::string& field_name, int64_t& out_value) {
  std::regex pattern("\"" + field_name + "\"\\s*:\\s*(-?\\d{1,18})");
  std::smatch match;
  if (std::regex_search(json, match, pattern)) {
    out_value = std::stoll(match[1].str());
    return true;
  }
  return false;
}

bool ExtractBool(const std::string& json, const std::string& field_name, bool& out_value) {
  std::regex pattern("\"" + field_name + "\"\\s*:\\s*(true|false)");
  std::smatch match;
  if (std::regex_search(json, match, pattern)) {
    out_value = (match[1].str() == "true");
    return true;
  }
  return false;
}

bool ExtractString(const std::string& json, const std::string& field_name,
                   std::string& out_value) {
  std::regex pattern("\"" + field_name + "\"\\s*:\\s*\"((?:[^\"\\\\]|\\\\.)*)\"");
  std::smatch match;
  if (std::regex_search(json, match, pattern)) {
    out_value = JsonUnescape(match[1].str());
    return true;
  }
  return false;
}

}  // namespace clipshard::util
