#pragma once
// Purpose: Photo records fed to the layout engine and the default sizing rule
// that turns them into a responsive grid.
//
// A record carries one or more resized sources (pixel dimensions + url) and
// free-form string metadata. Sizing uses the widest source.

#include <cstddef>
#include <fstream>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "../grid/contract.hpp"
#include "../grid/rounded.hpp"
#include "../logger.hpp"
#include "responsive.hpp"
#include "serialize.hpp"

namespace photogrid {

struct SrcSet {
    grid::Dimension dimensions;
    std::string url;

    bool operator==(const SrcSet& o) const { return dimensions == o.dimensions && url == o.url; }
};

struct PhotoLayoutData {
    std::vector<SrcSet> srcs;
    std::map<std::string, std::string> metadata;
    // Older records only carry the ratio; used when srcs is empty.
    std::optional<grid::AspectRatio> aspect_ratio;

    bool operator==(const PhotoLayoutData& o) const {
        return srcs == o.srcs && metadata == o.metadata && aspect_ratio == o.aspect_ratio;
    }
};

using LayoutGrid = ResponsivePhotoGrid<PhotoLayoutData>;

inline const std::vector<std::size_t>& default_breakpoints() {
    static const std::vector<std::size_t> b{ 3, 4, 6, 8, 12 };
    return b;
}

// --------- JSON adapters ----------
inline void to_json(nlohmann::json& j, const SrcSet& s) {
    j = nlohmann::json{ {"dimensions", s.dimensions}, {"url", s.url} };
}

inline void from_json(const nlohmann::json& j, SrcSet& s) {
    j.at("dimensions").get_to(s.dimensions);
    j.at("url").get_to(s.url);
}

inline void to_json(nlohmann::json& j, const PhotoLayoutData& p) {
    j = nlohmann::json{ {"srcs", p.srcs}, {"metadata", p.metadata} };
    if (p.aspect_ratio) j["aspect_ratio"] = *p.aspect_ratio;
}

// Non-string metadata values are stored in their JSON text form.
inline void from_json(const nlohmann::json& j, PhotoLayoutData& p) {
    PhotoLayoutData tmp;
    if (j.contains("srcs")) j.at("srcs").get_to(tmp.srcs);
    if (j.contains("aspect_ratio") && !j.at("aspect_ratio").is_null()) {
        tmp.aspect_ratio = j.at("aspect_ratio").get<grid::AspectRatio>();
    }
    if (j.contains("metadata") && j.at("metadata").is_object()) {
        for (auto it = j.at("metadata").begin(); it != j.at("metadata").end(); ++it) {
            if (it.value().is_string()) {
                tmp.metadata[it.key()] = it.value().get<std::string>();
            } else {
                tmp.metadata[it.key()] = it.value().dump();
            }
        }
    }
    p = std::move(tmp);
}

// Pixel extent used for sizing: the widest source, else the stored ratio.
// Empty when neither is present or the chosen one has a zero side.
inline std::optional<grid::Dimension> layout_extent(const PhotoLayoutData& p) {
    const SrcSet* widest = nullptr;
    for (const auto& s : p.srcs) {
        if (!widest || s.dimensions.width > widest->dimensions.width) widest = &s;
    }
    grid::Dimension d;
    if (widest) {
        d = widest->dimensions;
    } else if (p.aspect_ratio) {
        d = grid::Dimension{ p.aspect_ratio->width, p.aspect_ratio->height };
    } else {
        return std::nullopt;
    }
    if (d.width == 0 || d.height == 0) return std::nullopt;
    return d;
}

// Default sizing: two-cell short edge, clamped per breakpoint. The first
// breakpoint sets every item to exactly the full width; later ones cap the
// width at the column count.
template <grid::RoundingPolicy POLICY = grid::RoundingPolicy::Ceil>
inline grid::Dimension layout_size(const PhotoLayoutData& p, const BreakpointContext& ctx) {
    std::optional<grid::Dimension> extent = layout_extent(p);
    if (!extent) {
        grid::contract::violation("layout record has no usable size");
    }
    auto rounded = grid::RoundedAspectRatio<2, POLICY>::from_size(*extent);
    grid::ClampConfig clamp;
    clamp.max_width = ctx.columns;
    if (ctx.index == 0) {
        clamp.min_width = ctx.columns;
    }
    return grid::clamp_width_to(rounded, clamp);
}

inline LayoutGrid from_layout_data(std::vector<PhotoLayoutData> items,
                                   const std::vector<std::size_t>& breakpoints = default_breakpoints(),
                                   grid::RoundingPolicy policy = grid::RoundingPolicy::Ceil) {
    if (policy == grid::RoundingPolicy::HalfUp) {
        return LayoutGrid(std::move(items), breakpoints, layout_size<grid::RoundingPolicy::HalfUp>);
    }
    return LayoutGrid(std::move(items), breakpoints, layout_size<grid::RoundingPolicy::Ceil>);
}

// Parse an array of records. Records that fail to convert, or that have
// nothing to size from or a zero-sized extent, are skipped with a warning.
inline std::vector<PhotoLayoutData> parse_layout_data(const nlohmann::json& root) {
    std::vector<PhotoLayoutData> out;
    if (!root.is_array()) {
        logger::warn("layout data is not an array");
        return out;
    }
    std::size_t idx = 0;
    for (const auto& item : root) {
        try {
            PhotoLayoutData p = item.get<PhotoLayoutData>();
            if (!layout_extent(p)) {
                logger::warn("layout record " + std::to_string(idx) + " has no usable size, skipped");
            } else {
                out.push_back(std::move(p));
            }
        } catch (const grid::TextFormatError& e) {
            logger::warn("layout record " + std::to_string(idx) + " skipped: " + e.what());
        } catch (const nlohmann::json::exception& e) {
            logger::warn("layout record " + std::to_string(idx) + " skipped: " + e.what());
        }
        ++idx;
    }
    return out;
}

// Load records from a JSON file. Returns false when the file is missing or is
// not valid JSON; 'out' is cleared in that case.
inline bool load_layout_data(const std::string& path, std::vector<PhotoLayoutData>& out) {
    out.clear();
    std::ifstream in(path, std::ios::in);
    if (!in.is_open()) {
        logger::error("layout data not found: " + path);
        return false;
    }
    try {
        nlohmann::json root;
        in >> root;
        out = parse_layout_data(root);
        logger::info("loaded " + std::to_string(out.size()) + " layout records from " + path);
        return true;
    } catch (const nlohmann::json::exception& e) {
        logger::error("failed to parse layout data " + path + ": " + e.what());
        return false;
    }
}

namespace detail_sample {

inline const char* sample_json() {
    return R"json([
  {"aspect_ratio":"3600:2401","srcs":[{"dimensions":"3600x2401","url":"https://images.unsplash.com/photo-1719937206300-fc0dac6f8cac"}],"metadata":{}},
  {"aspect_ratio":"2095:2521","srcs":[{"dimensions":"2095x2521","url":"https://images.unsplash.com/photo-1724198169550-ba2fde71cfc7"}],"metadata":{}},
  {"aspect_ratio":"4000:6000","srcs":[{"dimensions":"4000x6000","url":"https://images.unsplash.com/photo-1724384108758-dcc4f20518d7"}],"metadata":{}},
  {"aspect_ratio":"8467:11289","srcs":[{"dimensions":"8467x11289","url":"https://images.unsplash.com/photo-1724368202147-121dae0bd49d"}],"metadata":{}},
  {"aspect_ratio":"11648:8736","srcs":[{"dimensions":"11648x8736","url":"https://images.unsplash.com/photo-1724368202141-ef6f3522f50f"}],"metadata":{}},
  {"aspect_ratio":"4000:6000","srcs":[{"dimensions":"4000x6000","url":"https://images.unsplash.com/photo-1720048171527-208cb3e93192"}],"metadata":{}},
  {"aspect_ratio":"2958:3697","srcs":[{"dimensions":"2958x3697","url":"https://images.unsplash.com/photo-1724254351233-914fd32f2515"}],"metadata":{}},
  {"aspect_ratio":"8736:11648","srcs":[{"dimensions":"8736x11648","url":"https://images.unsplash.com/photo-1724368202143-3781f7b30d23"}],"metadata":{}},
  {"aspect_ratio":"4160:6240","srcs":[{"dimensions":"4160x6240","url":"https://images.unsplash.com/photo-1724348264169-6addad93be28"}],"metadata":{}},
  {"aspect_ratio":"2832:4240","srcs":[{"dimensions":"2832x4240","url":"https://images.unsplash.com/photo-1724340557729-e4bbb15c63c0"}],"metadata":{}}
])json";
}

} // namespace detail_sample

inline std::vector<PhotoLayoutData> sample_layout_data() {
    return parse_layout_data(nlohmann::json::parse(detail_sample::sample_json()));
}

// Built-in sample laid out on 3/4/5/8/12 columns from the stored ratios,
// grown to width.
inline LayoutGrid default_grid() {
    static const std::vector<std::size_t> breakpoints{ 3, 4, 5, 8, 12 };
    LayoutGrid g(sample_layout_data(), breakpoints, [](const PhotoLayoutData& p, const BreakpointContext&) {
        return grid::RoundedAspectRatio<2>::from_aspect_ratio(*p.aspect_ratio);
    });
    return g.grow_to_width();
}

} // namespace photogrid
