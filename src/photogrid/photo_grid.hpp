#pragma once
// Purpose: One complete layout at a single column count.
//
// new_with_mapper() packs ordinals sized by a caller rule, reconstructs the
// rectangles and substitutes each ordinal with its item. Every ordinal must be
// consumed exactly once; debug and test builds check this with a bitset.

#include <algorithm>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "../grid/content.hpp"
#include "../grid/contract.hpp"
#include "../grid/packer.hpp"
#include "../grid/visitor.hpp"
#include "../logger.hpp"

namespace photogrid {

using grid::Coord;
using grid::Dimension;
using grid::GridContent;

template <typename T>
struct PhotoGrid {
    std::vector<GridContent<T>> grid;
    std::size_t width = 0;

    // size_fn: const T& -> Size
    template <typename F>
    static PhotoGrid new_with_mapper(const std::vector<T>& photos, std::size_t width, F size_fn) {
        grid::OccupancyGrid occupancy(width);
        std::size_t id = 0;
        for (const T& photo : photos) {
            grid::add(occupancy, id, size_fn(photo));
            ++id;
        }
        const std::size_t rows = occupancy.height();

        PhotoGrid out = from_ordinals(photos, width, grid::reconstruct(std::move(occupancy)));
        logger::info("packed " + std::to_string(out.grid.size()) + " items into " +
                     std::to_string(width) + " columns, " + std::to_string(rows) + " rows");
        return out;
    }

    // Substitute each ordinal placement with its item.
    static PhotoGrid from_ordinals(const std::vector<T>& photos, std::size_t width,
                                   const std::vector<GridContent<std::size_t>>& ordinals) {
#if PHOTOGRID_CHECK_CONSUMPTION
        std::vector<bool> taken(photos.size(), false);
#endif
        PhotoGrid out;
        out.width = width;
        out.grid.reserve(ordinals.size());
        for (const auto& c : ordinals) {
            if (c.data >= photos.size()) {
                grid::contract::violation("placement refers to ordinal " + std::to_string(c.data) +
                                          " of " + std::to_string(photos.size()));
            }
#if PHOTOGRID_CHECK_CONSUMPTION
            if (taken[c.data]) {
                grid::contract::violation("ordinal " + std::to_string(c.data) + " consumed twice");
            }
            taken[c.data] = true;
#endif
            out.grid.push_back(GridContent<T>{ photos[c.data], c.size, c.origin });
        }
        return out;
    }

    // Widen every placement that has nothing to its right over any of its
    // rows so that it reaches the right edge. Heights never change.
    PhotoGrid grow_non_intersecting() const {
        PhotoGrid out = *this;
        std::vector<std::size_t> to_grow;
        for (std::size_t i = 0; i < grid.size(); ++i) {
            const auto rows = grid[i].height_range();
            bool blocked = false;
            for (std::size_t j = 0; j < grid.size() && !blocked; ++j) {
                if (j == i || grid[j].origin.x <= grid[i].origin.x) continue;
                blocked = grid[j].height_range().intersects(rows);
            }
            if (!blocked) to_grow.push_back(i);
        }
        for (std::size_t idx : to_grow) {
            auto& item = out.grid[idx];
            item.size.width = width - item.origin.x;
        }
        return out;
    }

    // Number of rows spanned by the placements.
    std::size_t rows() const {
        std::size_t h = 0;
        for (const auto& c : grid) {
            h = std::max(h, c.origin.y + c.size.height);
        }
        return h;
    }

    bool operator==(const PhotoGrid& o) const { return width == o.width && grid == o.grid; }
    bool operator!=(const PhotoGrid& o) const { return !(*this == o); }
};

} // namespace photogrid
