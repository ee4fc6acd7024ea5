// Repository: RetroVue-clipshard
// Component: JSON Field Helpers
// Purpose: Flat-document JSON escaping and field extraction.
// Copyright (c) 2026 RetroVue

#ifndef CLIPSHARD_UTIL_JSON_FIELDS_HPP_
#define CLIPSHARD_UTIL_JSON_FIELDS_HPP_

#include <cstdint>
#include <string>

namespace clipshard::util {

// Escapes quotes, backslashes, control characters and the HTML-sensitive
// <, >, & as \u00XX escapes.
std::string JsonEscape(const std::string& s);
std::string JsonUnescape(const std::string& s);

// Regex lookups of "field_name": <value> anywhere in json. Intended for the
// small flat documents this project writes and reads; nesting is ignored.
// Each returns false (out_value untouched) when the field is absent or has
// the wrong type.
bool ExtractInt(const std::string& json, const std::string& field_name, int64_t& out_value);
bool ExtractBool(const std::string& json, const std::string& field_name, bool& out_value);
bool ExtractString(const std::string& json, const std::string& field_name,
                   std::string& out_value);

}  // namespace clipshard::util

#endif  // CLIPSHARD_UTIL_JSON_FIELDS_HPP_
