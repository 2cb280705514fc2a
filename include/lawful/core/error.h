// core/error.h — Contract-violation errors and guard helpers
// Part of the lawful algebra library (C++20)
//
// DESIGN RATIONALE:
// The engines trust the algebraic laws (they cannot be checked in
// general), but two contract violations are mechanically detectable:
//
//   empty_reduction     a semigroup-only reduction over no elements;
//                         there is no identity to fall back on.
//   dimension_mismatch  a relation that is not square, or two
//                         relations whose shapes cannot be combined.
//
// Both are programming errors, so they derive from the <stdexcept>
// logic hierarchy and are thrown at the offending call.  Nothing is
// retried or corrected.
//
// Each check has a single enforcement point:
//
//   require_nonempty(n, "reduce_nonempty: empty range");
//   require_square(rows, cols, "close: relation is not square");
//
// At constexpr time the throw makes the call non-constant, so the
// compiler diagnostic carries the message.
//
// Copyright (c) 2025 Andrew Drakeford. All rights reserved.

#ifndef LAWFUL_CORE_ERROR_H
#define LAWFUL_CORE_ERROR_H

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>

namespace lawful {

// =========================================================================
// Error kinds
// =========================================================================

/// Detectable contract violations.  A structure that breaks its own laws
/// is a precondition failure and has no kind here.
enum class error_kind : unsigned char {
    empty_reduction,
    dimension_mismatch,
};

[[nodiscard]] constexpr std::string_view to_string(error_kind k) noexcept {
    switch (k) {
    case error_kind::empty_reduction:    return "empty_reduction";
    case error_kind::dimension_mismatch: return "dimension_mismatch";
    }
    return "unknown";
}

// =========================================================================
// Exception types
// =========================================================================

/// Semigroup-only reduction (or zeroth semigroup power) with no elements.
class empty_reduction : public std::logic_error {
public:
    explicit empty_reduction(char const* what) : std::logic_error(what) {}
    explicit empty_reduction(std::string const& what) : std::logic_error(what) {}

    [[nodiscard]] static constexpr error_kind kind() noexcept {
        return error_kind::empty_reduction;
    }
};

/// Relation shape does not fit the operation (non-square, or mismatched).
class dimension_mismatch : public std::length_error {
public:
    explicit dimension_mismatch(char const* what) : std::length_error(what) {}
    explicit dimension_mismatch(std::string const& what) : std::length_error(what) {}

    [[nodiscard]] static constexpr error_kind kind() noexcept {
        return error_kind::dimension_mismatch;
    }
};

// =========================================================================
// Guards
// =========================================================================

/// Throw empty_reduction(msg) when `count` is zero.
constexpr void require_nonempty(std::size_t count, char const* msg) {
    if (count == 0) {
        throw empty_reduction(msg);
    }
}

/// Throw dimension_mismatch(msg) unless rows == cols.
constexpr void require_square(std::size_t rows, std::size_t cols,
                              char const* msg)
{
    if (rows != cols) {
        throw dimension_mismatch(msg);
    }
}

/// Throw dimension_mismatch(msg) unless the two extents agree.
/// Used for inner dimensions of a product and for shape equality.
constexpr void require_extent(std::size_t lhs, std::size_t rhs,
                              char const* msg)
{
    if (lhs != rhs) {
        throw dimension_mismatch(msg);
    }
}

} // namespace lawful

#endif // LAWFUL_CORE_ERROR_H
