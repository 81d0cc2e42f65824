#include "app.hpp"
#include <fstream>
#include <iostream>
#include <string>
#include <utility>

#include "../logger.hpp"
#include "../photo_search/mod.hpp"
#include "../photogrid/layout_data.hpp"
#include "../photogrid/serialize.hpp"

namespace app {

namespace {

const char* kDefaultConfigPath = "photogrid.json";

bool take_value(const std::vector<std::string>& args, std::size_t& i, std::string& value, std::string& error) {
    if (i + 1 >= args.size()) {
        error = "missing value for " + args[i];
        return false;
    }
    value = args[++i];
    return true;
}

} // namespace

std::string usage() {
    return "usage: photogrid [--config FILE] [--input FILE] [--output FILE]\n"
           "                 [--format json|cbor] [--breakpoints 3,4,6,8,12]\n"
           "                 [--rounding ceil|half_up] [--no-grow] [--log-level info|warn|error]\n";
}

bool parse_args(const std::vector<std::string>& args, config::Overrides& out, bool& help, std::string& error) {
    help = false;
    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& a = args[i];
        std::string value;
        if (a == "-h" || a == "--help") {
            help = true;
        } else if (a == "--no-grow") {
            out.grow_to_width = false;
        } else if (a == "--grow") {
            out.grow_to_width = true;
        } else if (a == "--config") {
            if (!take_value(args, i, value, error)) return false;
            out.config_path = value;
        } else if (a == "--input") {
            if (!take_value(args, i, value, error)) return false;
            out.input = value;
        } else if (a == "--output") {
            if (!take_value(args, i, value, error)) return false;
            out.output = value;
        } else if (a == "--format") {
            if (!take_value(args, i, value, error)) return false;
            if (value != "json" && value != "cbor") {
                error = "unknown format: " + value;
                return false;
            }
            out.format = value;
        } else if (a == "--rounding") {
            if (!take_value(args, i, value, error)) return false;
            if (value != "ceil" && value != "half_up") {
                error = "unknown rounding: " + value;
                return false;
            }
            out.rounding = value;
        } else if (a == "--breakpoints") {
            if (!take_value(args, i, value, error)) return false;
            std::vector<std::size_t> b;
            if (!config::parse_breakpoints(value, b)) {
                error = "invalid breakpoints: " + value;
                return false;
            }
            out.breakpoints = std::move(b);
        } else if (a == "--log-level") {
            if (!take_value(args, i, value, error)) return false;
            out.log_level = value;
        } else {
            error = "unknown argument: " + a;
            return false;
        }
    }
    return true;
}

App::App(std::vector<std::string> args, std::ostream& out)
    : args_(std::move(args)), out_(out) {}

int App::run() {
    // 1) Command line
    config::Overrides overrides;
    bool help = false;
    std::string error;
    if (!parse_args(args_, overrides, help, error)) {
        logger::error(error);
        std::cerr << usage();
        return 1;
    }
    if (help) {
        out_ << usage();
        return 0;
    }

    // 2) Config file. An explicitly named file must exist.
    config::AppConfig cfg;
    const std::string cfgPath = overrides.config_path ? *overrides.config_path : kDefaultConfigPath;
    const bool cfgLoaded = config::Store::load(cfgPath, cfg);
    if (!cfgLoaded && overrides.config_path) {
        logger::error("cannot read config: " + cfgPath);
        return 1;
    }
    config::apply_overrides(cfg, overrides);

    // 3) Logger
    logger::set_level(logger::level_from_string(cfg.log_level));
    if (cfg.log_to_file) {
        logger::set_log_file(cfg.log_file);
        logger::info("Logging to file: " + cfg.log_file);
    }
    if (cfgLoaded) logger::info("Config loaded: " + cfgPath);

    // 4) Layout records
    std::vector<photogrid::PhotoLayoutData> items;
    if (cfg.input.empty()) {
        logger::info("no input given, using the built-in sample");
        items = photogrid::sample_layout_data();
    } else if (!photogrid::load_layout_data(cfg.input, items)) {
        return 1;
    }

    const std::size_t before = items.size();
    items = photo_search::filter(items, cfg.filter);
    if (items.size() != before) {
        logger::info("filter kept " + std::to_string(items.size()) + " of " + std::to_string(before) + " records");
    }

    // 5) Layout
    photogrid::LayoutGrid layout = photogrid::from_layout_data(std::move(items), cfg.breakpoints,
                                                               config::rounding_policy(cfg));
    if (cfg.grow_to_width) {
        layout = layout.grow_to_width();
    }

    // 6) Output
    const photogrid::Format format = config::output_format(cfg);
    if (!cfg.output.empty()) {
        if (!photogrid::save(cfg.output, layout, format)) {
            return 1;
        }
        logger::info(std::string("wrote ") + photogrid::to_string(format) + " layout to " + cfg.output);
        return 0;
    }

    out_ << photogrid::encode(layout, format);
    if (format == photogrid::Format::Json) out_ << '\n';
    out_.flush();
    return out_ ? 0 : 1;
}

} // namespace app
