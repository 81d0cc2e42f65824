#pragma once
// Purpose: Serialized form of a responsive grid (JSON via nlohmann::json, CBOR
// for compact transport) plus file load/save.
//
// Document shape:
//   { "breakpoints": [ { "placements": [ { "data": <ordinal>,
//                                          "size": {"width", "height"},
//                                          "origin": {"x", "y"} } ],
//                        "width": <columns> } ],
//     "data": [ <item>, ... ] }
//
// Reading a document checks every breakpoint against the layout invariants
// (each ordinal exactly once, inside the right edge, no overlap) and throws
// SerializeError when one does not hold.

#include <cstdint>
#include <fstream>
#include <iterator>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "../grid/content.hpp"
#include "../grid/parse.hpp"
#include "../grid/size.hpp"
#include "../logger.hpp"
#include "photo_grid.hpp"
#include "responsive.hpp"

namespace grid {

// A text form ("W:H", "WxH") inside a document that does not parse.
class TextFormatError : public std::runtime_error {
public:
    explicit TextFormatError(const ParseError& e)
        : std::runtime_error(std::string(to_string(e.kind)) + ": " + e.message), error_(e) {}

    const ParseError& error() const { return error_; }

private:
    ParseError error_;
};

// --------- JSON adapters ----------
inline void to_json(nlohmann::json& j, const Dimension& d) {
    j = nlohmann::json{ {"width", d.width}, {"height", d.height} };
}

// Accepts {"width", "height"} or the "WxH" text form.
inline void from_json(const nlohmann::json& j, Dimension& d) {
    if (j.is_string()) {
        ParseError err;
        if (!parse_dimension(j.get<std::string>(), d, &err)) throw TextFormatError(err);
        return;
    }
    j.at("width").get_to(d.width);
    j.at("height").get_to(d.height);
}

inline void to_json(nlohmann::json& j, const AspectRatio& r) {
    j = nlohmann::json{ {"width", r.width}, {"height", r.height} };
}

// Accepts {"width", "height"} or the "W:H" text form.
inline void from_json(const nlohmann::json& j, AspectRatio& r) {
    if (j.is_string()) {
        ParseError err;
        if (!parse_aspect_ratio(j.get<std::string>(), r, &err)) throw TextFormatError(err);
        return;
    }
    j.at("width").get_to(r.width);
    j.at("height").get_to(r.height);
}

inline void to_json(nlohmann::json& j, const Coord& c) {
    j = nlohmann::json{ {"x", c.x}, {"y", c.y} };
}

inline void from_json(const nlohmann::json& j, Coord& c) {
    j.at("x").get_to(c.x);
    j.at("y").get_to(c.y);
}

template <typename T>
inline void to_json(nlohmann::json& j, const GridContent<T>& c) {
    j = nlohmann::json{ {"data", c.data}, {"size", c.size}, {"origin", c.origin} };
}

template <typename T>
inline void from_json(const nlohmann::json& j, GridContent<T>& c) {
    j.at("data").get_to(c.data);
    j.at("size").get_to(c.size);
    j.at("origin").get_to(c.origin);
}

} // namespace grid

namespace photogrid {

class SerializeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

enum class Format {
    Json,
    Cbor
};

inline const char* to_string(Format f) {
    return f == Format::Cbor ? "cbor" : "json";
}

template <typename T>
inline void to_json(nlohmann::json& j, const PhotoGrid<T>& g) {
    j = nlohmann::json{ {"placements", g.grid}, {"width", g.width} };
}

template <typename T>
inline void from_json(const nlohmann::json& j, PhotoGrid<T>& g) {
    j.at("placements").get_to(g.grid);
    j.at("width").get_to(g.width);
}

namespace detail_serialize {

// Checks one breakpoint of ordinals against a store of `count` items.
inline void validate(const PhotoGrid<std::size_t>& g, std::size_t count, std::size_t bp) {
    const std::string where = "breakpoint " + std::to_string(bp) + ": ";
    if (g.grid.size() != count) {
        throw SerializeError(where + std::to_string(g.grid.size()) + " placements for " +
                             std::to_string(count) + " items");
    }
    std::vector<bool> seen_ids(count, false);
    for (const auto& c : g.grid) {
        if (c.data >= count) {
            throw SerializeError(where + "ordinal " + std::to_string(c.data) + " out of range");
        }
        if (seen_ids[c.data]) {
            throw SerializeError(where + "ordinal " + std::to_string(c.data) + " placed twice");
        }
        seen_ids[c.data] = true;
        if (c.size.width == 0 || c.size.height == 0) {
            throw SerializeError(where + "empty span for ordinal " + std::to_string(c.data));
        }
        if (c.size.width > g.width || c.origin.x > g.width - c.size.width) {
            throw SerializeError(where + "ordinal " + std::to_string(c.data) + " crosses the right edge");
        }
        if (c.origin.y > std::numeric_limits<std::size_t>::max() - c.size.height) {
            throw SerializeError(where + "ordinal " + std::to_string(c.data) + " runs past the last row");
        }
    }

    for (std::size_t i = 0; i < g.grid.size(); ++i) {
        const auto& a = g.grid[i];
        for (std::size_t k = i + 1; k < g.grid.size(); ++k) {
            const auto& b = g.grid[k];
            if (a.width_range().intersects(b.width_range()) && a.height_range().intersects(b.height_range())) {
                throw SerializeError(where + "placements overlap: ordinals " + std::to_string(a.data) +
                                     " and " + std::to_string(b.data));
            }
        }
    }
}

} // namespace detail_serialize

template <typename T>
inline void to_json(nlohmann::json& j, const ResponsivePhotoGrid<T>& g) {
    j = nlohmann::json{ {"breakpoints", g.breakpoints()}, {"data", g.data()} };
}

template <typename T>
inline void from_json(const nlohmann::json& j, ResponsivePhotoGrid<T>& g) {
    std::vector<PhotoGrid<std::size_t>> grids;
    std::vector<T> data;
    try {
        j.at("breakpoints").get_to(grids);
        j.at("data").get_to(data);
    } catch (const nlohmann::json::exception& e) {
        throw SerializeError(std::string("malformed grid document: ") + e.what());
    } catch (const grid::TextFormatError& e) {
        throw SerializeError(std::string("malformed grid document: ") + e.what());
    }
    for (std::size_t b = 0; b < grids.size(); ++b) {
        detail_serialize::validate(grids[b], data.size(), b);
    }
    g = ResponsivePhotoGrid<T>::from_parts(std::move(grids), std::move(data));
}

template <typename T>
inline std::vector<std::uint8_t> to_cbor(const ResponsivePhotoGrid<T>& g) {
    return nlohmann::json::to_cbor(nlohmann::json(g));
}

template <typename T>
inline ResponsivePhotoGrid<T> from_cbor(const std::vector<std::uint8_t>& bytes) {
    nlohmann::json j;
    try {
        j = nlohmann::json::from_cbor(bytes);
    } catch (const nlohmann::json::exception& e) {
        throw SerializeError(std::string("malformed cbor: ") + e.what());
    }
    return j.get<ResponsivePhotoGrid<T>>();
}

// Encode to the bytes written to disk or stdout.
template <typename T>
inline std::string encode(const ResponsivePhotoGrid<T>& g, Format format) {
    if (format == Format::Cbor) {
        std::vector<std::uint8_t> bytes = to_cbor(g);
        return std::string(bytes.begin(), bytes.end());
    }
    return nlohmann::json(g).dump(2);
}

// Save a grid document. Returns true on success.
template <typename T>
inline bool save(const std::string& path, const ResponsivePhotoGrid<T>& g, Format format = Format::Json) {
    try {
        const std::string body = encode(g, format);
        std::ofstream out(path, std::ios::out | std::ios::trunc | std::ios::binary);
        if (!out.is_open()) {
            logger::error("cannot open " + path + " for writing");
            return false;
        }
        out.write(body.data(), static_cast<std::streamsize>(body.size()));
        return static_cast<bool>(out);
    } catch (const std::exception& e) {
        logger::error("failed to encode grid: " + std::string(e.what()));
        return false;
    }
}

// Load a grid document. Returns false on missing file or invalid content;
// 'out' is left untouched in that case.
template <typename T>
inline bool load(const std::string& path, ResponsivePhotoGrid<T>& out, Format format = Format::Json) {
    std::ifstream in(path, std::ios::in | std::ios::binary);
    if (!in.is_open()) {
        logger::warn("grid document not found: " + path);
        return false;
    }
    try {
        if (format == Format::Cbor) {
            std::vector<std::uint8_t> bytes((std::istreambuf_iterator<char>(in)),
                                            std::istreambuf_iterator<char>());
            out = from_cbor<T>(bytes);
        } else {
            nlohmann::json j;
            in >> j;
            out = j.get<ResponsivePhotoGrid<T>>();
        }
        return true;
    } catch (const std::exception& e) {
        logger::error("failed to load grid document " + path + ": " + e.what());
        return false;
    }
}

} // namespace photogrid
