#pragma once
// Purpose: Occupancy grid. One flat row-major buffer plus an explicit column
// count; rows are appended on demand and never removed.
//
// Invariant: contents().size() == width() * height().

#include <cstddef>
#include <utility>
#include <vector>

#include "size.hpp"

namespace grid {

enum class Neighbours {
    Plus,  // orthogonal: up, left, right, down
    Cross, // diagonal corners
    All    // all eight surrounding cells
};

template <typename T>
class Grid {
public:
    explicit Grid(std::size_t width) : width_(width) {}

    static Grid with_height(std::size_t width, std::size_t height) {
        Grid g(width);
        g.contents_.resize(width * height);
        g.height_ = height;
        return g;
    }

    std::size_t width() const { return width_; }
    std::size_t height() const { return height_; }
    std::size_t size() const { return contents_.size(); }

    const std::vector<T>& contents() const { return contents_; }

    std::size_t to_index(const Coord& c) const {
        return c.y * width_ + c.x;
    }

    Coord to_dimension(std::size_t idx) const {
        return Coord{ idx % width_, idx / width_ };
    }

    // Null when idx lies past the allocated cells.
    const T* get(std::size_t idx) const {
        return idx < contents_.size() ? &contents_[idx] : nullptr;
    }

    T* get_mut(std::size_t idx) {
        return idx < contents_.size() ? &contents_[idx] : nullptr;
    }

    const T* at(const Coord& c) const {
        if (c.x >= width_) return nullptr;
        return get(to_index(c));
    }

    // Grow with default cells so that the row holding idx is allocated.
    void extend_to(std::size_t idx) {
        if (width_ == 0) return;
        std::size_t rows = idx / width_ + 1;
        if (rows <= height_) return;
        contents_.resize(rows * width_);
        height_ = rows;
    }

    // Row-major list of every allocated coord.
    std::vector<Coord> coords() const {
        std::vector<Coord> out;
        out.reserve(contents_.size());
        for (std::size_t y = 0; y < height_; ++y) {
            for (std::size_t x = 0; x < width_; ++x) {
                out.push_back(Coord{ x, y });
            }
        }
        return out;
    }

    // In-bounds neighbours of c. Edges do not wrap.
    std::vector<Coord> neighbours(const Coord& c, Neighbours mode) const {
        static const int plus[][2] = { {0, -1}, {-1, 0}, {1, 0}, {0, 1} };
        static const int cross[][2] = { {-1, -1}, {1, -1}, {-1, 1}, {1, 1} };
        static const int all[][2] = { {-1, -1}, {0, -1}, {1, -1}, {-1, 0},
                                      {1, 0}, {-1, 1}, {0, 1}, {1, 1} };

        const int (*offsets)[2] = plus;
        std::size_t n = 4;
        if (mode == Neighbours::Cross) {
            offsets = cross;
        } else if (mode == Neighbours::All) {
            offsets = all;
            n = 8;
        }

        std::vector<Coord> out;
        out.reserve(n);
        for (std::size_t i = 0; i < n; ++i) {
            long long nx = static_cast<long long>(c.x) + offsets[i][0];
            long long ny = static_cast<long long>(c.y) + offsets[i][1];
            if (nx < 0 || ny < 0) continue;
            if (static_cast<std::size_t>(nx) >= width_ || static_cast<std::size_t>(ny) >= height_) continue;
            out.push_back(Coord{ static_cast<std::size_t>(nx), static_cast<std::size_t>(ny) });
        }
        return out;
    }

    // Flat indices covered by a w x h rectangle whose top-left is `offset`.
    // Indices may point past the allocated cells.
    std::vector<std::size_t> area_indices(std::size_t offset, std::size_t w, std::size_t h) const {
        std::vector<std::size_t> out;
        out.reserve(w * h);
        for (std::size_t y = 0; y < h; ++y) {
            for (std::size_t x = 0; x < w; ++x) {
                out.push_back(offset + y * width_ + x);
            }
        }
        return out;
    }

    bool operator==(const Grid& o) const {
        return width_ == o.width_ && height_ == o.height_ && contents_ == o.contents_;
    }

private:
    std::size_t width_ = 0;
    std::size_t height_ = 0;
    std::vector<T> contents_;
};

} // namespace grid
