#pragma once
// Purpose: Rebuild the rectangles of a filled occupancy grid.
//
// The visitor walks the cells row-major with a cursor and a seen mask. At an
// unseen occupied cell it finds the bottom-right corner by running right along
// the row and down along the column while the value stays the same, marks the
// rectangle seen and emits it. This relies on every same-valued region being
// one axis-aligned rectangle, which the packer guarantees; it is not checked.

#include <cstddef>
#include <optional>
#include <utility>
#include <vector>

#include "content.hpp"
#include "grid.hpp"

namespace grid {

template <typename T>
class GridVisitor {
public:
    explicit GridVisitor(Grid<std::optional<T>> grid)
        : grid_(std::move(grid)), seen_(grid_.size(), false) {}

    std::optional<GridContent<T>> next() {
        const std::size_t len = grid_.size();
        while (cur_ < len) {
            if (seen_[cur_]) {
                ++cur_;
                continue;
            }
            const std::optional<T>& cell = *grid_.get(cur_);
            if (!cell) {
                seen_[cur_] = true;
                ++cur_;
                continue;
            }

            const Coord origin = grid_.to_dimension(cur_);
            const Coord corner = touching(origin, *cell);
            for (const Coord& c : origin.iter_area(corner)) {
                seen_[grid_.to_index(c)] = true;
            }

            GridContent<T> out{ *cell,
                                Dimension{ corner.x - origin.x + 1, corner.y - origin.y + 1 },
                                origin };
            cur_ += out.size.width;
            return out;
        }
        return std::nullopt;
    }

private:
    // Bottom-right corner of the rectangle holding `val` whose top-left is `top_left`.
    Coord touching(const Coord& top_left, const T& val) const {
        std::size_t right = top_left.x;
        while (right + 1 < grid_.width()) {
            const auto* v = grid_.at(Coord{ right + 1, top_left.y });
            if (!v || !*v || !(**v == val)) break;
            ++right;
        }
        std::size_t bottom = top_left.y;
        for (;;) {
            const auto* v = grid_.at(Coord{ top_left.x, bottom + 1 });
            if (!v || !*v || !(**v == val)) break;
            ++bottom;
        }
        return Coord{ right, bottom };
    }

    Grid<std::optional<T>> grid_;
    std::vector<bool> seen_;
    std::size_t cur_ = 0;
};

// Drain a consumed grid into its placements, in row-major order of origins.
template <typename T>
inline std::vector<GridContent<T>> reconstruct(Grid<std::optional<T>> grid) {
    GridVisitor<T> visitor(std::move(grid));
    std::vector<GridContent<T>> out;
    while (auto c = visitor.next()) {
        out.push_back(std::move(*c));
    }
    return out;
}

} // namespace grid
