#pragma once
// Purpose: Driver configuration (JSON via nlohmann::json) and command-line
// overrides.
//
// Notes:
// - Store::load always fills 'out' (defaults when the file is missing or
//   does not parse) and reports whether the file was read.
// - apply_defaults normalizes values so later stages never see an empty
//   breakpoint list or an unknown rounding/format name.
// - Command-line flags override whatever the file says.

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "../grid/rounded.hpp"
#include "../logger.hpp"
#include "../photo_search/mod.hpp"
#include "../photogrid/layout_data.hpp"
#include "../photogrid/serialize.hpp"

namespace app {
namespace config {

struct AppConfig {
    // IO
    std::string input;            // layout data JSON; empty -> built-in sample
    std::string output;           // result document; empty -> stdout
    std::string format = "json";  // "json" | "cbor"

    // Layout
    std::vector<std::size_t> breakpoints = photogrid::default_breakpoints();
    std::string rounding = "ceil"; // "ceil" | "half_up"
    bool grow_to_width = true;

    // Records kept before layout
    photo_search::SearchFilter filter;

    // Logging
    bool log_to_file = false;
    std::string log_file = "photogrid.log";
    std::string log_level = "info"; // "info" | "warn" | "error"
};

// Values given on the command line; unset fields keep the config value.
struct Overrides {
    std::optional<std::string> config_path;
    std::optional<std::string> input;
    std::optional<std::string> output;
    std::optional<std::string> format;
    std::optional<std::vector<std::size_t>> breakpoints;
    std::optional<std::string> rounding;
    std::optional<bool> grow_to_width;
    std::optional<std::string> log_level;
};

inline grid::RoundingPolicy rounding_policy(const AppConfig& cfg) {
    return cfg.rounding == "half_up" ? grid::RoundingPolicy::HalfUp : grid::RoundingPolicy::Ceil;
}

inline photogrid::Format output_format(const AppConfig& cfg) {
    return cfg.format == "cbor" ? photogrid::Format::Cbor : photogrid::Format::Json;
}

// "3,4,5" -> {3,4,5}. Returns false on an empty list, an empty or
// non-numeric entry, or a zero column count.
inline bool parse_breakpoints(const std::string& s, std::vector<std::size_t>& out) {
    std::vector<std::size_t> tmp;
    std::size_t start = 0;
    while (start <= s.size()) {
        std::size_t comma = s.find(',', start);
        std::string token = s.substr(start, comma == std::string::npos ? std::string::npos : comma - start);
        if (token.empty() || token.find_first_not_of("0123456789") != std::string::npos || token.size() > 9) {
            return false;
        }
        std::size_t v = static_cast<std::size_t>(std::stoul(token));
        if (v == 0) return false;
        tmp.push_back(v);
        if (comma == std::string::npos) break;
        start = comma + 1;
    }
    if (tmp.empty()) return false;
    out = std::move(tmp);
    return true;
}

// Apply defaults and sanity checks.
inline void apply_defaults(AppConfig& cfg) {
    std::vector<std::size_t> kept;
    for (std::size_t b : cfg.breakpoints) {
        if (b > 0) kept.push_back(b);
    }
    if (kept.size() != cfg.breakpoints.size()) {
        logger::warn("dropping zero-column breakpoints");
    }
    cfg.breakpoints = kept.empty() ? photogrid::default_breakpoints() : kept;

    if (cfg.rounding != "ceil" && cfg.rounding != "half_up") {
        logger::warn("unknown rounding '" + cfg.rounding + "', using ceil");
        cfg.rounding = "ceil";
    }
    if (cfg.format != "json" && cfg.format != "cbor") {
        logger::warn("unknown format '" + cfg.format + "', using json");
        cfg.format = "json";
    }
    if (cfg.log_level.empty()) cfg.log_level = "info";
    if (cfg.log_to_file && cfg.log_file.empty()) cfg.log_file = "photogrid.log";
}

inline void apply_overrides(AppConfig& cfg, const Overrides& o) {
    if (o.input)         cfg.input = *o.input;
    if (o.output)        cfg.output = *o.output;
    if (o.format)        cfg.format = *o.format;
    if (o.breakpoints)   cfg.breakpoints = *o.breakpoints;
    if (o.rounding)      cfg.rounding = *o.rounding;
    if (o.grow_to_width) cfg.grow_to_width = *o.grow_to_width;
    if (o.log_level)     cfg.log_level = *o.log_level;
    apply_defaults(cfg);
}

// --------- JSON adapters ----------
inline void to_json(nlohmann::json& j, const AppConfig& c) {
    j = nlohmann::json{
        {"input", c.input},
        {"output", c.output},
        {"format", c.format},
        {"breakpoints", c.breakpoints},
        {"rounding", c.rounding},
        {"grow_to_width", c.grow_to_width},
        {"filter", c.filter},
        {"log_to_file", c.log_to_file},
        {"log_file", c.log_file},
        {"log_level", c.log_level}
    };
}

inline void from_json(const nlohmann::json& j, AppConfig& c) {
    // keep defaults first
    AppConfig tmp = c;

    if (j.contains("input")) j.at("input").get_to(tmp.input);
    if (j.contains("output")) j.at("output").get_to(tmp.output);
    if (j.contains("format")) j.at("format").get_to(tmp.format);

    if (j.contains("breakpoints")) j.at("breakpoints").get_to(tmp.breakpoints);
    if (j.contains("rounding")) j.at("rounding").get_to(tmp.rounding);
    if (j.contains("grow_to_width")) j.at("grow_to_width").get_to(tmp.grow_to_width);

    if (j.contains("filter")) j.at("filter").get_to(tmp.filter);

    if (j.contains("log_to_file")) j.at("log_to_file").get_to(tmp.log_to_file);
    if (j.contains("log_file")) j.at("log_file").get_to(tmp.log_file);
    if (j.contains("log_level")) j.at("log_level").get_to(tmp.log_level);

    c = std::move(tmp);
}

class Store {
public:
    // Load config (JSON). Always sets 'out' (merged with defaults).
    // Returns true if file existed and was parsed successfully, false if file missing or parse error.
    static bool load(const std::string& path, AppConfig& out);

    // Save config (JSON).
    static bool save(const std::string& path, const AppConfig& cfg);
};

// --------- Store implementation ----------
inline bool Store::load(const std::string& path, AppConfig& out) {
    AppConfig cfg;
    apply_defaults(cfg);

    std::ifstream in(path, std::ios::in);
    if (!in.is_open()) {
        out = std::move(cfg);
        return false;
    }

    try {
        nlohmann::json j;
        in >> j;
        from_json(j, cfg);
        apply_defaults(cfg);
        out = std::move(cfg);
        return true;
    } catch (const nlohmann::json::exception& e) {
        logger::warn("config " + path + " ignored: " + e.what());
        AppConfig defaults;
        apply_defaults(defaults);
        out = std::move(defaults);
        return false;
    }
}

inline bool Store::save(const std::string& path, const AppConfig& cfg) {
    try {
        nlohmann::json j = cfg;
        std::ofstream out(path, std::ios::out | std::ios::trunc);
        if (!out.is_open()) return false;
        out << j.dump(2);
        return static_cast<bool>(out);
    } catch (const nlohmann::json::exception& e) {
        logger::error("failed to save config " + path + ": " + e.what());
        return false;
    }
}

} // namespace config
} // namespace app
