#pragma once
// Test-only checks for the layout invariants the engine relies on but does
// not verify at runtime.

#include <algorithm>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "grid/packer.hpp"
#include "photogrid/photo_grid.hpp"

namespace test_support {

// Every value in the occupancy grid forms exactly one filled rectangle.
inline ::testing::AssertionResult VerifyRectangles(const grid::OccupancyGrid& g) {
    struct Box {
        std::size_t min_x, min_y, max_x, max_y, cells;
    };
    std::map<std::size_t, Box> boxes;
    for (std::size_t idx = 0; idx < g.size(); ++idx) {
        const auto& v = *g.get(idx);
        if (!v) continue;
        const grid::Coord c = g.to_dimension(idx);
        auto it = boxes.find(*v);
        if (it == boxes.end()) {
            boxes.emplace(*v, Box{ c.x, c.y, c.x, c.y, 1 });
            continue;
        }
        Box& b = it->second;
        b.min_x = std::min(b.min_x, c.x);
        b.min_y = std::min(b.min_y, c.y);
        b.max_x = std::max(b.max_x, c.x);
        b.max_y = std::max(b.max_y, c.y);
        ++b.cells;
    }
    for (const auto& kv : boxes) {
        const Box& b = kv.second;
        const std::size_t area = (b.max_x - b.min_x + 1) * (b.max_y - b.min_y + 1);
        if (area != b.cells) {
            return ::testing::AssertionFailure()
                   << "value " << kv.first << " covers " << b.cells << " cells of a " << area
                   << "-cell bounding box";
        }
    }
    return ::testing::AssertionSuccess();
}

// Placements cover ordinals 0..count-1 exactly once, stay inside the right
// edge and never share a cell.
inline ::testing::AssertionResult VerifyPlacements(const photogrid::PhotoGrid<std::size_t>& g,
                                                   std::size_t count) {
    if (g.grid.size() != count) {
        return ::testing::AssertionFailure() << g.grid.size() << " placements for " << count << " items";
    }
    std::vector<bool> seen(count, false);
    std::vector<std::optional<std::size_t>> cells(g.width * g.rows());
    for (const auto& c : g.grid) {
        if (c.data >= count) {
            return ::testing::AssertionFailure() << "ordinal " << c.data << " out of range";
        }
        if (seen[c.data]) {
            return ::testing::AssertionFailure() << "ordinal " << c.data << " placed twice";
        }
        seen[c.data] = true;
        if (c.size.width == 0 || c.size.height == 0) {
            return ::testing::AssertionFailure() << "ordinal " << c.data << " has an empty span";
        }
        if (c.origin.x + c.size.width > g.width) {
            return ::testing::AssertionFailure()
                   << "ordinal " << c.data << " crosses the right edge of " << g.width;
        }
        for (std::size_t y = c.origin.y; y < c.origin.y + c.size.height; ++y) {
            for (std::size_t x = c.origin.x; x < c.origin.x + c.size.width; ++x) {
                auto& cell = cells[y * g.width + x];
                if (cell) {
                    return ::testing::AssertionFailure() << "ordinals " << *cell << " and " << c.data
                                                         << " overlap at (" << x << "," << y << ")";
                }
                cell = c.data;
            }
        }
    }
    return ::testing::AssertionSuccess();
}

} // namespace test_support
