#pragma once
// Purpose: Filter layout records by capture time and rating.
// Both values come from optional string metadata. A missing or malformed
// value never aborts: the timestamp falls back to the unix epoch (0) and the
// rating to 0.

#include <cstdint>
#include <optional>
#include <regex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "../logger.hpp"
#include "../photogrid/layout_data.hpp"

namespace photo_search {

struct SearchFilter {
    std::optional<std::int64_t> before; // unix seconds, inclusive
    std::optional<std::int64_t> after;  // unix seconds, inclusive
    std::optional<std::uint8_t> rating; // minimum rating

    bool empty() const { return !before && !after && !rating; }

    bool operator==(const SearchFilter& o) const {
        return before == o.before && after == o.after && rating == o.rating;
    }
};

namespace detail {

// Days since 1970-01-01 for a proleptic Gregorian date.
inline std::int64_t days_from_civil(std::int64_t y, unsigned m, unsigned d) {
    y -= m <= 2;
    const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

inline bool valid_date(int y, int m, int d) {
    static const int days[] = { 31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31 };
    if (m < 1 || m > 12 || d < 1) return false;
    int max = days[m - 1];
    if (m == 2 && ((y % 4 == 0 && y % 100 != 0) || y % 400 == 0)) max = 29;
    return d <= max;
}

} // namespace detail

// RFC 3339 date-time with a Z or +hh:mm offset, e.g. "2024-08-23T14:05:00+02:00".
inline std::optional<std::int64_t> parse_rfc3339(const std::string& s) {
    static const std::regex re(
        R"(^(\d{4})-(\d{2})-(\d{2})[Tt ](\d{2}):(\d{2}):(\d{2})(\.\d+)?([Zz]|([+-])(\d{2}):(\d{2}))$)");
    std::smatch m;
    if (!std::regex_match(s, m, re)) return std::nullopt;

    const int year = std::stoi(m[1].str());
    const int month = std::stoi(m[2].str());
    const int day = std::stoi(m[3].str());
    const int hour = std::stoi(m[4].str());
    const int minute = std::stoi(m[5].str());
    const int second = std::stoi(m[6].str());
    if (!detail::valid_date(year, month, day)) return std::nullopt;
    if (hour > 23 || minute > 59 || second > 60) return std::nullopt;

    std::int64_t offset = 0;
    if (m[9].matched) {
        const int oh = std::stoi(m[10].str());
        const int om = std::stoi(m[11].str());
        if (oh > 23 || om > 59) return std::nullopt;
        offset = (oh * 3600 + om * 60) * (m[9].str() == "-" ? -1 : 1);
    }

    const std::int64_t days = detail::days_from_civil(year, static_cast<unsigned>(month),
                                                      static_cast<unsigned>(day));
    return days * 86400 + hour * 3600 + minute * 60 + second - offset;
}

// Capture time in unix seconds; 0 when absent or malformed.
inline std::int64_t get_timestamp(const photogrid::PhotoLayoutData& p) {
    auto it = p.metadata.find("timestamp");
    if (it == p.metadata.end()) return 0;
    if (auto ts = parse_rfc3339(it->second)) return *ts;
    logger::warn("malformed timestamp '" + it->second + "', using epoch");
    return 0;
}

// Rating 0..255; 0 when absent or malformed.
inline std::uint8_t get_rating(const photogrid::PhotoLayoutData& p) {
    auto it = p.metadata.find("rating");
    if (it == p.metadata.end()) return 0;
    const std::string& v = it->second;
    if (v.empty() || v.size() > 3 || v.find_first_not_of("0123456789") != std::string::npos) {
        logger::warn("malformed rating '" + v + "', using 0");
        return 0;
    }
    const int r = std::stoi(v);
    if (r > 255) {
        logger::warn("rating '" + v + "' out of range, using 0");
        return 0;
    }
    return static_cast<std::uint8_t>(r);
}

inline bool matches(const SearchFilter& f, const photogrid::PhotoLayoutData& p) {
    if (f.before || f.after) {
        const std::int64_t ts = get_timestamp(p);
        if (f.before && ts > *f.before) return false;
        if (f.after && ts < *f.after) return false;
    }
    if (f.rating && get_rating(p) < *f.rating) return false;
    return true;
}

// Matching records, in input order.
inline std::vector<photogrid::PhotoLayoutData> filter(const std::vector<photogrid::PhotoLayoutData>& items,
                                                      const SearchFilter& f) {
    std::vector<photogrid::PhotoLayoutData> out;
    if (f.empty()) return items;
    for (const auto& p : items) {
        if (matches(f, p)) out.push_back(p);
    }
    return out;
}

// --------- JSON adapters ----------
inline void to_json(nlohmann::json& j, const SearchFilter& f) {
    j = nlohmann::json::object();
    if (f.before) j["before"] = *f.before;
    if (f.after) j["after"] = *f.after;
    if (f.rating) j["rating"] = *f.rating;
}

inline void from_json(const nlohmann::json& j, SearchFilter& f) {
    SearchFilter tmp;
    if (j.contains("before") && !j.at("before").is_null()) tmp.before = j.at("before").get<std::int64_t>();
    if (j.contains("after") && !j.at("after").is_null()) tmp.after = j.at("after").get<std::int64_t>();
    if (j.contains("rating") && !j.at("rating").is_null()) tmp.rating = j.at("rating").get<std::uint8_t>();
    f = tmp;
}

} // namespace photo_search
