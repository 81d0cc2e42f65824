#pragma once
// Purpose: Greedy first-fit packing of sized items into an occupancy grid.
// Each cell ends up holding the ordinal of the item that claimed it.
// No backtracking: the result depends only on input order.

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "grid.hpp"
#include "size.hpp"
#include "contract.hpp"

namespace grid {

using OccupancyGrid = Grid<std::optional<std::size_t>>;

// True when a w x h rectangle with its top-left at idx stays inside the right
// edge and only covers empty cells. Rows past the allocated height are empty.
inline bool does_fit_at(const OccupancyGrid& g, std::size_t idx, std::size_t w, std::size_t h) {
    if (g.to_dimension(idx).x + w > g.width()) return false;
    for (std::size_t cell : g.area_indices(idx, w, h)) {
        const auto* v = g.get(cell);
        if (v && v->has_value()) return false;
    }
    return true;
}

inline void insert_at(OccupancyGrid& g, std::size_t idx, std::size_t id, std::size_t w, std::size_t h) {
    std::vector<std::size_t> cells = g.area_indices(idx, w, h);
    g.extend_to(cells.back());
    for (std::size_t cell : cells) {
        *g.get_mut(cell) = id;
    }
}

// Place one item. Scans allocated cells row-major for the first fit and
// appends below the allocated rows when none exists.
template <typename S>
inline void add(OccupancyGrid& g, std::size_t id, const S& item) {
    const std::size_t w = width_of(item);
    const std::size_t h = height_of(item);
    if (w == 0 || h == 0) {
        contract::violation("item " + std::to_string(id) + " has zero extent " +
                            std::to_string(w) + "x" + std::to_string(h));
    }
    if (w > g.width()) {
        contract::violation("item " + std::to_string(id) + " is " + std::to_string(w) +
                            " cells wide, grid has " + std::to_string(g.width()) + " columns");
    }

    const std::size_t len = g.size();
    for (std::size_t idx = 0; idx < len; ++idx) {
        if (g.get(idx)->has_value()) continue;
        if (does_fit_at(g, idx, w, h)) {
            insert_at(g, idx, id, w, h);
            return;
        }
    }

    g.extend_to(len);
    insert_at(g, len, id, w, h);
}

// Place every item in order; item i is recorded as ordinal i.
template <typename Items>
inline void add_all(OccupancyGrid& g, const Items& items) {
    std::size_t id = 0;
    for (const auto& item : items) {
        add(g, id, item);
        ++id;
    }
}

} // namespace grid
