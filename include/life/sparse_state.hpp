#pragma once
/*
SparseState: alive cells only, as a list of rows.

Layout:
  rows_ = [ {y0, [x, x, ...]}, {y1, [x, ...]}, ... ]

Invariants:
  - rows strictly ascending by y
  - columns inside a row strictly ascending by x
  - no empty row is stored
  - count_ == total number of columns across rows

Insertion and removal keep the invariants with std::lower_bound + insert/erase
on contiguous vectors. append_cell() is the O(1) path used when a whole
generation is rebuilt in row-major order.
*/

#include <algorithm>
#include <cstddef>
#include <span>
#include <utility>
#include <vector>

#include "core/config.hpp"
#include "life/cell.hpp"

namespace life {

struct Row {
    coord_t y{0};
    std::vector<coord_t> xs; // alive columns, ascending
};

class SparseState {
public:
    SparseState() = default;

    // Build from an arbitrary (unsorted, possibly repeating) seed list.
    explicit SparseState(std::span<const Cell> cells) {
        for (const Cell& c : cells) add_cell(c.x, c.y);
    }

    // Insert (x, y) at its sorted position, creating the row if needed.
    // Returns false (and leaves the state untouched) when already present.
    bool add_cell(coord_t x, coord_t y) {
        auto rit = find_row_slot(y);
        if (rit == rows_.end() || rit->y != y) {
            Row r; r.y = y; r.xs.push_back(x);
            rows_.insert(rit, std::move(r));
            ++count_;
            return true;
        }
        auto& xs = rit->xs;
        auto cit = std::lower_bound(xs.begin(), xs.end(), x);
        if (cit != xs.end() && *cit == x) return false;
        xs.insert(cit, x);
        ++count_;
        return true;
    }

    // Remove (x, y); drops the row when it becomes empty.
    // Returns false when the cell was not present.
    bool remove_cell(coord_t x, coord_t y) {
        auto rit = find_row_slot(y);
        if (rit == rows_.end() || rit->y != y) return false;
        auto& xs = rit->xs;
        auto cit = std::lower_bound(xs.begin(), xs.end(), x);
        if (cit == xs.end() || *cit != x) return false;
        xs.erase(cit);
        if (xs.empty()) rows_.erase(rit);
        --count_;
        return true;
    }

    bool is_alive(coord_t x, coord_t y) const {
        auto rit = find_row_slot(y);
        if (rit == rows_.end() || rit->y != y) return false;
        return std::binary_search(rit->xs.begin(), rit->xs.end(), x);
    }

    // Append a cell that sorts after every stored cell (row-major).
    void append_cell(coord_t x, coord_t y) {
        if (rows_.empty() || rows_.back().y < y) {
            Row r; r.y = y; r.xs.push_back(x);
            rows_.push_back(std::move(r));
        } else {
            CORE_ASSERT_H(rows_.back().y == y && rows_.back().xs.back() < x,
                          "SparseState::append_cell: cell out of row-major order");
            rows_.back().xs.push_back(x);
        }
        ++count_;
    }

    void clear() noexcept { rows_.clear(); count_ = 0; }

    [[nodiscard]] bool empty() const noexcept { return rows_.empty(); }
    [[nodiscard]] core::count_t size() const noexcept { return count_; }
    [[nodiscard]] std::size_t row_count() const noexcept { return rows_.size(); }
    [[nodiscard]] const std::vector<Row>& rows() const noexcept { return rows_; }

    template <class F>
    void for_each_cell(F&& f) const {
        for (const Row& r : rows_)
            for (coord_t x : r.xs) f(x, r.y);
    }

    // Row-major snapshot of every alive cell.
    std::vector<Cell> cells() const {
        std::vector<Cell> out;
        out.reserve(count_);
        for_each_cell([&](coord_t x, coord_t y){ out.push_back(Cell{x, y}); });
        return out;
    }

    // Full structural check (sort order, no empty rows, count).
    [[nodiscard]] bool check_invariants() const {
        core::count_t n = 0;
        for (std::size_t i = 0; i < rows_.size(); ++i) {
            const Row& r = rows_[i];
            if (r.xs.empty()) return false;
            if (i > 0 && !(rows_[i - 1].y < r.y)) return false;
            if (std::adjacent_find(r.xs.begin(), r.xs.end(),
                                   [](coord_t a, coord_t b){ return !(a < b); }) != r.xs.end())
                return false;
            n += r.xs.size();
        }
        return n == count_;
    }

    friend bool operator==(const SparseState& a, const SparseState& b) {
        if (a.count_ != b.count_ || a.rows_.size() != b.rows_.size()) return false;
        for (std::size_t i = 0; i < a.rows_.size(); ++i)
            if (a.rows_[i].y != b.rows_[i].y || a.rows_[i].xs != b.rows_[i].xs) return false;
        return true;
    }

private:
    std::vector<Row> rows_;
    core::count_t count_{0};

    // First row with row.y >= y.
    std::vector<Row>::iterator find_row_slot(coord_t y) {
        return std::lower_bound(rows_.begin(), rows_.end(), y,
                                [](const Row& r, coord_t v){ return r.y < v; });
    }
    std::vector<Row>::const_iterator find_row_slot(coord_t y) const {
        return std::lower_bound(rows_.begin(), rows_.end(), y,
                                [](const Row& r, coord_t v){ return r.y < v; });
    }
};

} // namespace life
