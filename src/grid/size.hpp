#pragma once
// Purpose: Value types for grid cell geometry (Dimension, AspectRatio, Coord)
// and the Size capability shared by every sizing rule.
//
// A "Size" is any type exposing width() and height() in grid cells. The
// helpers below are templates over that capability instead of a base class,
// so plain structs and sizing rules stay trivially copyable.

#include <cstddef>
#include <string>
#include <vector>
#include <numeric>

namespace grid {

enum class Orientation {
    Portrait,
    Landscape
};

inline const char* to_string(Orientation o) {
    return o == Orientation::Landscape ? "landscape" : "portrait";
}

struct AspectRatio {
    std::size_t width = 0;
    std::size_t height = 0;

    // Divide both sides by their gcd. A 0:0 ratio is returned unchanged.
    AspectRatio reduced() const {
        std::size_t g = std::gcd(width, height);
        if (g == 0) return *this;
        return AspectRatio{ width / g, height / g };
    }

    // "W:H"
    std::string to_string() const {
        return std::to_string(width) + ":" + std::to_string(height);
    }

    bool operator==(const AspectRatio& o) const { return width == o.width && height == o.height; }
    bool operator!=(const AspectRatio& o) const { return !(*this == o); }
};

struct Dimension {
    std::size_t width = 0;
    std::size_t height = 0;

    AspectRatio aspect_ratio() const {
        return AspectRatio{ width, height }.reduced();
    }

    // "WxH"
    std::string to_string() const {
        return std::to_string(width) + "x" + std::to_string(height);
    }

    bool operator==(const Dimension& o) const { return width == o.width && height == o.height; }
    bool operator!=(const Dimension& o) const { return !(*this == o); }
};

struct Coord {
    std::size_t x = 0;
    std::size_t y = 0;

    // All coords inside the inclusive rectangle [this, bottom_right], row-major.
    std::vector<Coord> iter_area(const Coord& bottom_right) const {
        std::vector<Coord> out;
        if (bottom_right.x < x || bottom_right.y < y) return out;
        out.reserve((bottom_right.x - x + 1) * (bottom_right.y - y + 1));
        for (std::size_t cy = y; cy <= bottom_right.y; ++cy) {
            for (std::size_t cx = x; cx <= bottom_right.x; ++cx) {
                out.push_back(Coord{ cx, cy });
            }
        }
        return out;
    }

    bool operator==(const Coord& o) const { return x == o.x && y == o.y; }
    bool operator!=(const Coord& o) const { return !(*this == o); }
};

// Size capability. S either provides width()/height() or is one of the
// plain value types overloaded below.

template <typename S>
inline std::size_t width_of(const S& s) { return s.width(); }
template <typename S>
inline std::size_t height_of(const S& s) { return s.height(); }

inline std::size_t width_of(const Dimension& d) { return d.width; }
inline std::size_t height_of(const Dimension& d) { return d.height; }
inline std::size_t width_of(const AspectRatio& r) { return r.width; }
inline std::size_t height_of(const AspectRatio& r) { return r.height; }

// Landscape if width >= height.
template <typename S>
inline Orientation orientation(const S& s) {
    return width_of(s) >= height_of(s) ? Orientation::Landscape : Orientation::Portrait;
}

template <typename S>
inline AspectRatio aspect_ratio(const S& s) {
    return AspectRatio{ width_of(s), height_of(s) }.reduced();
}

template <typename S>
inline Dimension dimension_of(const S& s) {
    return Dimension{ width_of(s), height_of(s) };
}

} // namespace grid
