#pragma once

#include <string>
#include <vector>

namespace boolstab {

std::string trim(const std::string& s);

std::string to_lower(std::string s);

std::vector<std::string> split(const std::string& s, char delim);

// Split on runs of whitespace. Empty tokens are never produced.
std::vector<std::string> split_whitespace(const std::string& s);


// v + 1, or v unchanged once it has reached INT_MAX.
int saturating_increment(int v);

// Strict parsing helpers.
//
// These functions trim leading/trailing whitespace and then require that the
// entire remaining string is a valid value (no trailing "abc" fragments).
//
// Notes:
// - to_double() parses numbers using the classic "C" locale so that '.' is
//   treated as the decimal separator regardless of the user's global locale.
// - to_bool() accepts 1/0, true/false, on/off, yes/no (case-insensitive).
//
// All of them throw std::runtime_error naming the offending text.
int to_int(const std::string& s);
double to_double(const std::string& s);
bool to_bool(const std::string& s);

// Escape a string for safe inclusion in JSON string values.
// The returned string does NOT include surrounding quotes.
std::string json_escape(const std::string& s);

} // namespace boolstab
