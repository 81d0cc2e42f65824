#pragma once
// Purpose: A placed rectangle (payload, span in cells, top-left origin) and the
// half-open range helpers used to compare placements row-wise.

#include <cstddef>
#include <type_traits>
#include <utility>

#include "size.hpp"

namespace grid {

// Half-open [start, end).
struct Range {
    std::size_t start = 0;
    std::size_t end = 0;

    bool intersects(const Range& o) const {
        return start < o.end && o.start < end;
    }

    bool operator==(const Range& o) const { return start == o.start && end == o.end; }
};

template <typename T>
struct GridContent {
    T data{};
    Dimension size;
    Coord origin;

    const T& content() const { return data; }

    Range height_range() const { return Range{ origin.y, origin.y + size.height }; }
    Range width_range() const { return Range{ origin.x, origin.x + size.width }; }

    // Same area with a different payload.
    template <typename F, typename U = std::decay_t<std::invoke_result_t<F&, const T&>>>
    GridContent<U> map(F fn) const {
        return GridContent<U>{ fn(data), size, origin };
    }

    bool operator==(const GridContent& o) const {
        return data == o.data && size == o.size && origin == o.origin;
    }
    bool operator!=(const GridContent& o) const { return !(*this == o); }
};

} // namespace grid
