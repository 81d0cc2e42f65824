#pragma once
// Purpose: Text forms for AspectRatio ("W:H") and Dimension ("WxH") as they
// arrive from configuration files and object metadata strings.
//
// Both parsers follow the same shape: split on a single separator, then read
// each side as a non-negative integer. Failures are reported as a typed ParseError through an optional out param;
// the value out param is left untouched on failure.

#include <cctype>
#include <cstddef>
#include <limits>
#include <string>

#include "size.hpp"

namespace grid {

enum class ParseErrorKind {
    Separator, // separator missing or repeated
    ParseInt   // a side is not a non-negative integer
};

struct ParseError {
    ParseErrorKind kind = ParseErrorKind::Separator;
    std::string message;
};

inline const char* to_string(ParseErrorKind k) {
    return k == ParseErrorKind::ParseInt ? "parse-int" : "separator";
}

namespace detail_parse {

// Parses a whole string of decimal digits. Returns false when it is empty,
// holds anything but digits, or does not fit in size_t.
inline bool read_number(const std::string& s, std::size_t& out) {
    if (s.empty()) return false;
    std::size_t value = 0;
    const std::size_t max = std::numeric_limits<std::size_t>::max();
    for (char ch : s) {
        if (!std::isdigit(static_cast<unsigned char>(ch))) return false;
        std::size_t digit = static_cast<std::size_t>(ch - '0');
        if (value > (max - digit) / 10) return false;
        value = value * 10 + digit;
    }
    out = value;
    return true;
}

inline bool fail(ParseError* err, ParseErrorKind kind, const std::string& message) {
    if (err) {
        err->kind = kind;
        err->message = message;
    }
    return false;
}

// Splits on exactly one separator before either side is read.
inline bool parse_pair(const std::string& s, char sep, std::size_t& a, std::size_t& b, ParseError* err) {
    const std::size_t at = s.find(sep);
    if (at == std::string::npos || s.find(sep, at + 1) != std::string::npos) {
        return fail(err, ParseErrorKind::Separator,
                    std::string("expected exactly one '") + sep + "' in '" + s + "'");
    }
    std::size_t first = 0, second = 0;
    if (!read_number(s.substr(0, at), first)) {
        return fail(err, ParseErrorKind::ParseInt, "invalid first component in '" + s + "'");
    }
    if (!read_number(s.substr(at + 1), second)) {
        return fail(err, ParseErrorKind::ParseInt, "invalid second component in '" + s + "'");
    }
    a = first;
    b = second;
    return true;
}

} // namespace detail_parse

inline bool parse_aspect_ratio(const std::string& s, AspectRatio& out, ParseError* err = nullptr) {
    std::size_t w = 0, h = 0;
    if (!detail_parse::parse_pair(s, ':', w, h, err)) return false;
    out = AspectRatio{ w, h };
    return true;
}

inline bool parse_dimension(const std::string& s, Dimension& out, ParseError* err = nullptr) {
    std::size_t w = 0, h = 0;
    if (!detail_parse::parse_pair(s, 'x', w, h, err)) return false;
    out = Dimension{ w, h };
    return true;
}

} // namespace grid
