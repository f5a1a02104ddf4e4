#include "utils.h"
#include <cctype>
#include <sstream>
#include <iomanip>
#include <algorithm>
#include <stdexcept>

namespace partdb2kicad {

int parse_int(const std::string& str, int default_val) {
    std::string s = trim(str);
    if (s.empty()) return default_val;
    try {
        size_t used = 0;
        int val = std::stoi(s, &used);
        if (used != s.size()) return default_val;
        return val;
    } catch (const std::exception&) {
        return default_val;
    }
}

long parse_long(const std::string& str, long default_val) {
    std::string s = trim(str);
    if (s.empty()) return default_val;
    try {
        size_t used = 0;
        long val = std::stol(s, &used);
        if (used != s.size()) return default_val;
        return val;
    } catch (const std::exception&) {
        return default_val;
    }
}

std::string fmt(double val) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(6) << val;
    std::string s = oss.str();
    // Trim trailing zeros after decimal point
    if (s.find('.') != std::string::npos) {
        size_t last_nonzero = s.find_last_not_of('0');
        if (last_nonzero != std::string::npos && s[last_nonzero] == '.') {
            s.erase(last_nonzero); // remove the dot too
        } else {
            s.erase(last_nonzero + 1);
        }
    }
    // Avoid "-0"
    if (s == "-0") s = "0";
    return s;
}

std::string fmt2(double val) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << val;
    std::string s = oss.str();
    if (s == "-0.00") s = "0.00";
    return s;
}

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

bool iequals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower((unsigned char)a[i]) != std::tolower((unsigned char)b[i]))
            return false;
    }
    return true;
}

std::string to_lower(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string to_upper(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

bool iends_with(const std::string& s, const std::string& suffix) {
    std::string hay = to_lower(trim(s));
    std::string needle = to_lower(trim(suffix));
    if (needle.size() > hay.size()) return false;
    return hay.compare(hay.size() - needle.size(), needle.size(), needle) == 0;
}

std::string collapse_whitespace(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    bool in_space = false;
    for (char c : s) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            in_space = true;
            continue;
        }
        if (in_space && !out.empty()) out += ' ';
        in_space = false;
        out += c;
    }
    return out;
}

std::vector<std::string> split_trimmed(const std::string& s, char delim) {
    std::vector<std::string> fields;
    std::istringstream iss(s);
    std::string field;
    while (std::getline(iss, field, delim)) {
        field = trim(field);
        if (!field.empty()) fields.push_back(field);
    }
    return fields;
}

std::string sexp_escape(const std::string& s) {
    std::string result;
    result.reserve(s.size());
    for (char c : s) {
        if (c == '"' || c == '\\') result += '\\';
        result += c;
    }
    return result;
}

std::string sexp_unescape(const std::string& s) {
    std::string result;
    result.reserve(s.size());
    for (size_t i = 0; i < s.size(); i++) {
        if (s[i] == '\\' && i + 1 < s.size()) i++;
        result += s[i];
    }
    return result;
}

std::string sq(const std::string& s) {
    return "\"" + sexp_escape(s) + "\"";
}

std::string replace_all(std::string s, const std::string& from, const std::string& to) {
    if (from.empty()) return s;
    size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
    return s;
}

} // namespace partdb2kicad
