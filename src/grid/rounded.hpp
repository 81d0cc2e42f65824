#pragma once
// Purpose: Convert an image aspect ratio into a small integer cell footprint.
//
// RoundedAspectRatio<SIZE> anchors the short edge to SIZE cells and rounds the
// long edge according to an explicit RoundingPolicy. NormalizedAspectRatio is
// the SIZE=1 shape used for hand-built layouts. clamp_width_to() bounds a
// footprint to a breakpoint's column count.

#include <algorithm>
#include <cstddef>
#include <optional>

#include "size.hpp"
#include "contract.hpp"

namespace grid {

enum class RoundingPolicy {
    Ceil,   // round the long edge up on any nonzero remainder
    HalfUp  // round up only once the remainder reaches half the divisor
};

inline const char* to_string(RoundingPolicy p) {
    return p == RoundingPolicy::HalfUp ? "half_up" : "ceil";
}

namespace detail_round {

inline std::size_t divide(std::size_t num, std::size_t den, RoundingPolicy policy) {
    std::size_t q = num / den;
    std::size_t r = num % den;
    if (r == 0) return q;
    if (policy == RoundingPolicy::Ceil) return q + 1;
    return (2 * r >= den) ? q + 1 : q;
}

// Long edge for a (short, long) pair anchored at `size` short-edge cells.
// The divisor is truncated the same way for every input; when the short edge
// is smaller than `size` the division is done on the scaled value instead.
inline std::size_t long_edge(std::size_t min, std::size_t max, std::size_t size, RoundingPolicy policy) {
    if (min == 0 || max == 0) {
        contract::violation("aspect ratio with a zero extent cannot be rounded");
    }
    std::size_t divisor = min / size;
    if (divisor == 0) {
        return divide(max * size, min, policy);
    }
    return divide(max, divisor, policy);
}

} // namespace detail_round

template <std::size_t SIZE, RoundingPolicy POLICY = RoundingPolicy::Ceil>
class RoundedAspectRatio {
    static_assert(SIZE > 0, "short edge must span at least one cell");

public:
    RoundedAspectRatio(Orientation o, std::size_t long_edge)
        : orientation_(o), long_edge_(long_edge) {}

    static RoundedAspectRatio from_aspect_ratio(const AspectRatio& ratio) {
        return from_extents(ratio.width, ratio.height);
    }

    // Uses the raw extents of `s`; they are not gcd-reduced first, so large
    // pixel sizes keep their precision.
    template <typename S>
    static RoundedAspectRatio from_size(const S& s) {
        return from_extents(width_of(s), height_of(s));
    }

    std::size_t width() const {
        return orientation_ == Orientation::Portrait ? SIZE : long_edge_;
    }

    std::size_t height() const {
        return orientation_ == Orientation::Portrait ? long_edge_ : SIZE;
    }

    Orientation orientation() const { return orientation_; }
    std::size_t long_edge() const { return long_edge_; }

    static constexpr std::size_t short_edge() { return SIZE; }
    static constexpr RoundingPolicy policy() { return POLICY; }

private:
    static RoundedAspectRatio from_extents(std::size_t w, std::size_t h) {
        Orientation o = w >= h ? Orientation::Landscape : Orientation::Portrait;
        std::size_t min = o == Orientation::Portrait ? w : h;
        std::size_t max = o == Orientation::Portrait ? h : w;
        return RoundedAspectRatio(o, detail_round::long_edge(min, max, SIZE, POLICY));
    }

    Orientation orientation_;
    std::size_t long_edge_;
};

// Short edge is one cell, long edge an integer multiple of it.
struct NormalizedAspectRatio {
    Orientation orientation = Orientation::Landscape;
    std::size_t long_edge = 1;

    static NormalizedAspectRatio from_aspect_ratio(const AspectRatio& ratio) {
        Orientation o = ratio.width >= ratio.height ? Orientation::Landscape : Orientation::Portrait;
        std::size_t min = o == Orientation::Portrait ? ratio.width : ratio.height;
        std::size_t max = o == Orientation::Portrait ? ratio.height : ratio.width;
        return NormalizedAspectRatio{ o, detail_round::long_edge(min, max, 1, RoundingPolicy::Ceil) };
    }

    std::size_t width() const { return orientation == Orientation::Portrait ? 1 : long_edge; }
    std::size_t height() const { return orientation == Orientation::Portrait ? long_edge : 1; }
};

struct ClampConfig {
    std::optional<std::size_t> min_width;
    std::optional<std::size_t> max_width;
};

// Scale a footprint so that its width becomes max_width when it is wider.
// Height keeps the proportion, floored at one cell.
template <typename S>
inline Dimension clamp_width_to(const S& s, std::size_t max_width) {
    const std::size_t w = width_of(s);
    const std::size_t h = height_of(s);
    if (w <= max_width || w == 0) return Dimension{ w, h };
    std::size_t scaled = h * max_width / w;
    return Dimension{ max_width, std::max<std::size_t>(scaled, 1) };
}

// The max clamp applies first; a min_width then widens narrower footprints.
template <typename S>
inline Dimension clamp_width_to(const S& s, const ClampConfig& cfg) {
    Dimension d = dimension_of(s);
    if (cfg.max_width) {
        d = clamp_width_to(d, *cfg.max_width);
    }
    if (cfg.min_width && d.width > 0 && d.width < *cfg.min_width) {
        std::size_t scaled = d.height * *cfg.min_width / d.width;
        d = Dimension{ *cfg.min_width, std::max<std::size_t>(scaled, 1) };
    }
    return d;
}

} // namespace grid
