#pragma once

#include <string>
#include <vector>

namespace partdb2kicad {

// Parse an integer, returning default if missing/invalid.
// The whole (trimmed) string must be a number: "2.0" or "3x" are invalid.
int parse_int(const std::string& str, int default_val = 0);

// Same rules as parse_int, for part ids
long parse_long(const std::string& str, long default_val = 0);

// Format a double for KiCad output (6 decimal places, trailing zeros trimmed)
std::string fmt(double val);

// Format a coordinate with fixed 2 decimals ("-0.00" becomes "0.00")
std::string fmt2(double val);

// Trim whitespace
std::string trim(const std::string& s);

// Case-insensitive string compare
bool iequals(const std::string& a, const std::string& b);

std::string to_lower(const std::string& s);
std::string to_upper(const std::string& s);

// Case-insensitive suffix test, both sides trimmed first
bool iends_with(const std::string& s, const std::string& suffix);

// Collapse every whitespace run to a single space and trim the ends
std::string collapse_whitespace(const std::string& s);

// Split on a delimiter, trimming each field and dropping empty ones
std::vector<std::string> split_trimmed(const std::string& s, char delim);

// Escape quotes and backslashes for use inside an s-expression string
std::string sexp_escape(const std::string& s);

// Undo sexp_escape: a backslash makes the next character literal
std::string sexp_unescape(const std::string& s);

// Always double-quote a string for symbol library output
std::string sq(const std::string& s);

// Replace every occurrence of `from` in s with `to`
std::string replace_all(std::string s, const std::string& from, const std::string& to);

} // namespace partdb2kicad
