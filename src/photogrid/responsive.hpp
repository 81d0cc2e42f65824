#pragma once
// Purpose: One PhotoGrid per breakpoint over the same item set.
//
// Items live once in data(); every breakpoint stores placements of ordinals
// into that store. Breakpoints are computed independently of each other and
// the whole object is read-only once built.

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "photo_grid.hpp"
#include "../logger.hpp"

namespace photogrid {

// What a sizing rule knows about the breakpoint it is sizing for.
struct BreakpointContext {
    std::size_t index = 0;   // position in the breakpoint list
    std::size_t columns = 0; // column count of that breakpoint
};

// One item's placement in one breakpoint.
template <typename T>
struct Slot {
    const T* item = nullptr;
    const GridContent<std::size_t>* placement = nullptr;
    std::size_t columns = 0;
};

template <typename T>
class ResponsivePhotoGrid {
public:
    ResponsivePhotoGrid() = default;

    // size_fn: (const T&, BreakpointContext) -> Size
    template <typename F>
    ResponsivePhotoGrid(std::vector<T> photos, const std::vector<std::size_t>& breakpoints, F size_fn)
        : data_(std::move(photos)) {
        std::vector<std::size_t> ids(data_.size());
        for (std::size_t i = 0; i < ids.size(); ++i) ids[i] = i;

        grids_.reserve(breakpoints.size());
        for (std::size_t idx = 0; idx < breakpoints.size(); ++idx) {
            const BreakpointContext ctx{ idx, breakpoints[idx] };
            grids_.push_back(PhotoGrid<std::size_t>::new_with_mapper(
                ids, ctx.columns, [&](const std::size_t& id) { return size_fn(data_[id], ctx); }));
        }
        index_slots();
        logger::info("built responsive grid: " + std::to_string(data_.size()) + " items, " +
                     std::to_string(grids_.size()) + " breakpoints");
    }

    // Reassemble from already computed parts, e.g. after deserialization.
    // Callers are responsible for the parts being consistent.
    static ResponsivePhotoGrid from_parts(std::vector<PhotoGrid<std::size_t>> grids, std::vector<T> data) {
        ResponsivePhotoGrid out;
        out.grids_ = std::move(grids);
        out.data_ = std::move(data);
        out.index_slots();
        return out;
    }

    const std::vector<PhotoGrid<std::size_t>>& breakpoints() const { return grids_; }
    const std::vector<T>& data() const { return data_; }

    // Breakpoint i, or null when i is out of range.
    const PhotoGrid<std::size_t>* at(std::size_t i) const {
        return i < grids_.size() ? &grids_[i] : nullptr;
    }

    // Placements with ordinals resolved to the stored items.
    std::vector<PhotoGrid<const T*>> grids() const {
        std::vector<PhotoGrid<const T*>> out;
        out.reserve(grids_.size());
        for (const auto& g : grids_) {
            PhotoGrid<const T*> resolved;
            resolved.width = g.width;
            resolved.grid.reserve(g.grid.size());
            for (const auto& c : g.grid) {
                resolved.grid.push_back(c.map([this](std::size_t id) { return &data_[id]; }));
            }
            out.push_back(std::move(resolved));
        }
        return out;
    }

    // Where item n sits in every breakpoint. Empty when n is out of range.
    std::vector<Slot<T>> contents_at(std::size_t n) const {
        std::vector<Slot<T>> out;
        if (n >= data_.size()) return out;
        out.reserve(grids_.size());
        for (std::size_t b = 0; b < grids_.size(); ++b) {
            const std::size_t pos = slots_[b][n];
            if (pos == npos) continue;
            out.push_back(Slot<T>{ &data_[n], &grids_[b].grid[pos], grids_[b].width });
        }
        return out;
    }

    // Number of placements in the first breakpoint. Every breakpoint holds
    // the same number.
    std::size_t contents_len() const {
        return grids_.empty() ? 0 : grids_.front().grid.size();
    }

    // Close trailing row gaps in every breakpoint.
    ResponsivePhotoGrid grow_to_width() const {
        ResponsivePhotoGrid out;
        out.data_ = data_;
        out.grids_.reserve(grids_.size());
        for (const auto& g : grids_) {
            out.grids_.push_back(g.grow_non_intersecting());
        }
        out.slots_ = slots_;
        return out;
    }

    bool operator==(const ResponsivePhotoGrid& o) const {
        return grids_ == o.grids_ && data_ == o.data_;
    }
    bool operator!=(const ResponsivePhotoGrid& o) const { return !(*this == o); }

private:
    static constexpr std::size_t npos = static_cast<std::size_t>(-1);

    // identity -> placement position, per breakpoint
    void index_slots() {
        slots_.assign(grids_.size(), std::vector<std::size_t>(data_.size(), npos));
        for (std::size_t b = 0; b < grids_.size(); ++b) {
            const auto& placements = grids_[b].grid;
            for (std::size_t pos = 0; pos < placements.size(); ++pos) {
                const std::size_t id = placements[pos].data;
                if (id < data_.size()) slots_[b][id] = pos;
            }
        }
    }

    std::vector<PhotoGrid<std::size_t>> grids_;
    std::vector<T> data_;
    std::vector<std::vector<std::size_t>> slots_;
};

} // namespace photogrid
