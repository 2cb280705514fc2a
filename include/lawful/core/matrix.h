// core/matrix.h — Dense row-major matrix used as a relation over a carrier
// Part of the lawful algebra library (C++20)
//
// DESIGN RATIONALE:
// The closure engine works on an n×n relation whose cells are values of a
// semiring carrier (double distances, bool reachability, path counts).
// matrix<T> owns its cells in a single std::vector<T>, row-major, and
// exposes (row, col) indexing.  Its shape is fixed at construction: an
// algorithm that needs a different shape builds a new matrix.
//
// The shape is NOT required to be square here.  A 3×4 matrix is a valid
// value; it is the closure engine that rejects it with dimension_mismatch.
// Ragged nested row lists are rejected at construction.
//
// matrix<bool> is backed by std::vector<bool>, so element references are
// proxies.  Code that writes cells from several threads must not share a
// matrix; the engines give each worker its own buffer.

#ifndef LAWFUL_CORE_MATRIX_H
#define LAWFUL_CORE_MATRIX_H

#include "error.h"

#include <cstddef>
#include <initializer_list>
#include <stdexcept>
#include <vector>

namespace lawful {

/// Dense row-major matrix with a shape fixed at construction.
template<typename T>
class matrix {
    using storage_type = std::vector<T>;

public:
    using value_type = T;
    using size_type = std::size_t;
    using reference = typename storage_type::reference;
    using const_reference = typename storage_type::const_reference;
    using iterator = typename storage_type::iterator;
    using const_iterator = typename storage_type::const_iterator;

    // -----------------------------------------------------------------
    // Construction
    // -----------------------------------------------------------------

    matrix() = default;

    /// rows × cols value-initialised cells.
    matrix(std::size_t rows, std::size_t cols)
        : rows_(rows), cols_(cols), data_(rows * cols) {}

    /// rows × cols copies of `fill`.
    matrix(std::size_t rows, std::size_t cols, T const& fill)
        : rows_(rows), cols_(cols), data_(rows * cols, fill) {}

    /// Nested row list.  Every row must have the same length.
    matrix(std::initializer_list<std::initializer_list<T>> rows)
        : rows_(rows.size()),
          cols_(rows.size() == 0 ? 0 : rows.begin()->size())
    {
        data_.reserve(rows_ * cols_);
        for (auto const& r : rows) {
            require_extent(r.size(), cols_, "matrix: ragged row list");
            data_.insert(data_.end(), r.begin(), r.end());
        }
    }

    /// Nested row vectors.  Every row must have the same length.
    explicit matrix(std::vector<std::vector<T>> const& rows)
        : rows_(rows.size()),
          cols_(rows.empty() ? 0 : rows.front().size())
    {
        data_.reserve(rows_ * cols_);
        for (auto const& r : rows) {
            require_extent(r.size(), cols_, "matrix: ragged row list");
            data_.insert(data_.end(), r.begin(), r.end());
        }
    }

    /// n × n copies of `fill`.
    [[nodiscard]] static matrix square(std::size_t n, T const& fill) {
        return matrix(n, n, fill);
    }

    // -----------------------------------------------------------------
    // Shape queries
    // -----------------------------------------------------------------

    [[nodiscard]] std::size_t rows() const noexcept { return rows_; }
    [[nodiscard]] std::size_t cols() const noexcept { return cols_; }
    [[nodiscard]] std::size_t size() const noexcept { return data_.size(); }
    [[nodiscard]] bool empty() const noexcept { return data_.empty(); }
    [[nodiscard]] bool is_square() const noexcept { return rows_ == cols_; }

    // -----------------------------------------------------------------
    // Element access
    // -----------------------------------------------------------------

    reference operator()(std::size_t r, std::size_t c) {
        return data_[r * cols_ + c];
    }
    const_reference operator()(std::size_t r, std::size_t c) const {
        return data_[r * cols_ + c];
    }

    reference at(std::size_t r, std::size_t c) {
        if (r >= rows_ || c >= cols_)
            throw std::out_of_range("matrix::at: index out of bounds");
        return data_[r * cols_ + c];
    }
    const_reference at(std::size_t r, std::size_t c) const {
        if (r >= rows_ || c >= cols_)
            throw std::out_of_range("matrix::at: index out of bounds");
        return data_[r * cols_ + c];
    }

    // -----------------------------------------------------------------
    // Iterators (row-major order)
    // -----------------------------------------------------------------

    iterator begin() noexcept { return data_.begin(); }
    iterator end() noexcept { return data_.end(); }
    const_iterator begin() const noexcept { return data_.begin(); }
    const_iterator end() const noexcept { return data_.end(); }

    /// Iterator range of row r.
    iterator row_begin(std::size_t r) noexcept {
        return data_.begin() + static_cast<std::ptrdiff_t>(r * cols_);
    }
    const_iterator row_begin(std::size_t r) const noexcept {
        return data_.begin() + static_cast<std::ptrdiff_t>(r * cols_);
    }
    iterator row_end(std::size_t r) noexcept { return row_begin(r + 1); }
    const_iterator row_end(std::size_t r) const noexcept { return row_begin(r + 1); }

    // -----------------------------------------------------------------
    // Comparison
    // -----------------------------------------------------------------

    [[nodiscard]] bool operator==(matrix const& other) const {
        return rows_ == other.rows_ && cols_ == other.cols_ &&
               data_ == other.data_;
    }

private:
    std::size_t rows_ = 0;
    std::size_t cols_ = 0;
    storage_type data_{};
};

} // namespace lawful

#endif // LAWFUL_CORE_MATRIX_H
