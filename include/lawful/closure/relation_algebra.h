// closure/relation_algebra.h — Matrices over a semiring
// Part of the lawful algebra library (C++20)
//
// A relation is a matrix<T> over the carrier of a semiring R.  Relations
// of matching shape form a semiring of their own:
//
//   relation_sum(r, A, B)      C[i][j] = A[i][j] ⊕ B[i][j]
//   relation_product(r, A, B)  C[i][j] = ⊕_k A[i][k] ⊗ B[k][j]
//   zero_relation(r, n)        all 0
//   identity_relation(r, n)    1 on the diagonal, 0 elsewhere
//
// Each product cell is a dot product evaluated by the reduction engine:
// fold_map over k under the additive monoid.  Rows are independent, so a
// product may split its rows across worker threads (max_workers > 1).
// Each worker fills a private block of rows; blocks are copied into the
// result after the join, so matrix<bool> is safe.
//
// relation_product_monoid packages the product as a monoid on n×n
// relations, which lets reduce::power raise a relation to the k-th power
// by squaring (k-step composition).
//
// SHAPE ERRORS (dimension_mismatch):
//   relation_sum      shapes differ
//   relation_product  A.cols() != B.rows()
//   relation_power    A not square

#ifndef LAWFUL_CLOSURE_RELATION_ALGEBRA_H
#define LAWFUL_CLOSURE_RELATION_ALGEBRA_H

#include "lawful/algebra/concepts.h"
#include "lawful/core/error.h"
#include "lawful/core/matrix.h"
#include "lawful/core/workers.h"
#include "lawful/reduce/power.h"
#include "lawful/reduce/reduce.h"

#include <cstddef>
#include <cstdint>
#include <ranges>
#include <vector>

namespace lawful::closure {

using algebra::carrier_t;
using algebra::semiring;

/// Relation type over semiring R.
template<semiring R>
using relation = matrix<carrier_t<R>>;

// =========================================================================
// Constants
// =========================================================================

/// n×n relation with every cell 0.
template<semiring R>
[[nodiscard]] relation<R> zero_relation(R const& r, std::size_t n) {
    return relation<R>(n, n, algebra::zero(r));
}

/// n×n relation with 1 on the diagonal and 0 elsewhere.
template<semiring R>
[[nodiscard]] relation<R> identity_relation(R const& r, std::size_t n) {
    auto out = zero_relation(r, n);
    for (std::size_t i = 0; i < n; ++i) {
        out(i, i) = algebra::one(r);
    }
    return out;
}

// =========================================================================
// Sum
// =========================================================================

/// Cellwise a ⊕ b.
template<semiring R>
[[nodiscard]] relation<R>
relation_sum(R const& r, relation<R> const& a, relation<R> const& b) {
    require_extent(a.rows(), b.rows(), "relation_sum: row counts differ");
    require_extent(a.cols(), b.cols(), "relation_sum: column counts differ");

    relation<R> out(a.rows(), a.cols());
    for (std::size_t i = 0; i < a.rows(); ++i) {
        for (std::size_t j = 0; j < a.cols(); ++j) {
            out(i, j) = algebra::add(r, a(i, j), b(i, j));
        }
    }
    return out;
}

// =========================================================================
// Product
// =========================================================================

namespace detail {

// ⊕_k a[i][k] ⊗ b[k][j], through the reduction engine.
template<semiring R>
carrier_t<R> dot(R const& r, relation<R> const& a, relation<R> const& b,
                 std::size_t i, std::size_t j)
{
    auto const inner = std::views::iota(std::size_t{0}, a.cols());
    return reduce::fold_map(r.additive(), inner, [&](std::size_t k) {
        return algebra::mul(r, a(i, k), b(k, j));
    });
}

} // namespace detail

/// c[i][j] = ⊕_k a[i][k] ⊗ b[k][j].
///
/// max_workers: 1 computes every row on the calling thread; 0 uses one
/// worker per hardware thread; otherwise at most that many row blocks.
template<semiring R>
[[nodiscard]] relation<R>
relation_product(R const& r, relation<R> const& a, relation<R> const& b,
                 std::size_t max_workers = 1)
{
    require_extent(a.cols(), b.rows(),
        "relation_product: inner dimensions differ");

    std::size_t const rows = a.rows();
    std::size_t const cols = b.cols();
    relation<R> out(rows, cols);

    std::size_t const tasks = resolve_workers(max_workers, rows);
    if (tasks <= 1) {
        for (std::size_t i = 0; i < rows; ++i) {
            for (std::size_t j = 0; j < cols; ++j) {
                out(i, j) = detail::dot(r, a, b, i, j);
            }
        }
        return out;
    }

    using T = carrier_t<R>;
    std::vector<std::vector<T>> blocks(tasks);
    fork_join(tasks, [&](std::size_t t) {
        auto const span = partition_range(rows, tasks, t);
        auto& block = blocks[t];
        block.reserve(span.size() * cols);
        for (std::size_t i = span.first; i < span.last; ++i) {
            for (std::size_t j = 0; j < cols; ++j) {
                block.push_back(detail::dot(r, a, b, i, j));
            }
        }
    });

    for (std::size_t t = 0; t < tasks; ++t) {
        auto const span = partition_range(rows, tasks, t);
        std::size_t idx = 0;
        for (std::size_t i = span.first; i < span.last; ++i) {
            for (std::size_t j = 0; j < cols; ++j) {
                out(i, j) = blocks[t][idx++];
            }
        }
    }
    return out;
}

// =========================================================================
// Product monoid and power
// =========================================================================

/// n×n relations over R under relation_product.
/// Unlike the catalog structures this descriptor carries the side length,
/// which identity() needs.
template<semiring R>
struct relation_product_monoid {
    using value_type = relation<R>;

    static constexpr bool declared_associative = true;
    static constexpr bool declared_commutative = false;
    static constexpr bool declared_idempotent  = false;

    R ring{};
    std::size_t size = 0;
    std::size_t max_workers = 1;

    [[nodiscard]] value_type combine(value_type const& a, value_type const& b) const {
        return relation_product(ring, a, b, max_workers);
    }

    [[nodiscard]] value_type identity() const {
        return identity_relation(ring, size);
    }
};

/// k-step composition a^k; a^0 is the identity relation.
template<semiring R>
[[nodiscard]] relation<R>
relation_power(R const& r, relation<R> const& a, std::uint64_t k,
               std::size_t max_workers = 1)
{
    require_square(a.rows(), a.cols(), "relation_power: relation is not square");
    return reduce::power(relation_product_monoid<R>{r, a.rows(), max_workers}, a, k);
}

} // namespace lawful::closure

#endif // LAWFUL_CLOSURE_RELATION_ALGEBRA_H
