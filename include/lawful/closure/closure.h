// closure/closure.h — Semiring closure of a square relation
// Part of the lawful algebra library (C++20)
//
// ALGORITHM:
// For an n×n relation R over semiring (⊕, 0, ⊗, 1) compute the
// ⊕-combination of all k-step compositions of R:
//
//   R⁺ = R ⊕ R² ⊕ R³ ⊕ …           (transitive, paths of length >= 1)
//   R* = I ⊕ R⁺                     (reflexive_transitive)
//
// One algorithm, several meanings, chosen by the semiring:
//
//   tropical_semiring<double>   all-pairs shortest distances (+inf: no path)
//   boolean_semiring            reachability (false: no path)
//   counting_semiring<long>     number of distinct paths
//   bottleneck_semiring<int>    widest-path capacity
//
// Two schemes:
//
//   floyd_warshall  n pivot passes; pass k relaxes every cell through k:
//                     R[i][j] = R[i][j] ⊕ (R[i][k] ⊗ R[k][j])
//                   Row k and column k are snapshot at the start of the
//                   pass, so the rows of one pass are independent and may
//                   run on workers.  O(n³).
//
//   doubling        exact geometric sum R ⊕ R² ⊕ … ⊕ R^L by binary
//                   decomposition of L (L = max_path_length, 0 means n):
//                     S(2m)   = S(m) ⊕ P(m) ⊗ S(m),   P(2m)   = P(m) ⊗ P(m)
//                     S(m+1)  = R ⊕ R ⊗ S(m),         P(m+1)  = P(m) ⊗ R
//                   O(log L) relation products.  Counts each path once,
//                   so it is exact for the counting semiring on any graph
//                   up to length L.
//
// Both schemes run a fixed number of iterations.  They never loop until a
// fixpoint, so a non-idempotent ⊕ over a cyclic relation returns the
// value after that fixed count (not an unbounded closure).
//
// EARLY EXIT (closure_options::early_exit, idempotent ⊕ only):
//   doubling        stop once a round leaves S unchanged; with idempotent
//                   ⊕ no longer path can improve a cell after that.
//   floyd_warshall  skip a pass whose pivot row or column is entirely 0;
//                   0 absorbs under ⊗, so the pass cannot change anything.
// For a non-idempotent ⊕ the flag is ignored.
//
// ERRORS:
//   non-square relation -> dimension_mismatch

#ifndef LAWFUL_CLOSURE_CLOSURE_H
#define LAWFUL_CLOSURE_CLOSURE_H

#include "lawful/algebra/concepts.h"
#include "lawful/closure/relation_algebra.h"
#include "lawful/core/error.h"
#include "lawful/core/matrix.h"
#include "lawful/core/stats.h"
#include "lawful/core/workers.h"

#include <bit>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

namespace lawful::closure {

/// R⁺ or R*.
enum class closure_kind : unsigned char {
    transitive,             ///< paths of length >= 1
    reflexive_transitive,   ///< additionally the empty path: I ⊕ R⁺
};

/// Per-call configuration of the closure engine.
struct closure_options {
    closure_scheme scheme = closure_scheme::floyd_warshall;
    closure_kind kind = closure_kind::transitive;

    /// doubling: longest path length combined, 0 = n.
    /// floyd_warshall ignores it.
    std::uint64_t max_path_length = 0;

    /// Stop or skip work that provably cannot change the result.
    /// Honoured only when the additive monoid declares idempotence.
    bool early_exit = false;

    /// Row-parallel workers per pass / product, 1 = calling thread only,
    /// 0 = one per hardware thread.
    std::size_t max_workers = 1;
};

/// New relation plus the statistics of the closure that produced it.
template<typename T>
struct closure_result {
    matrix<T> relation;
    closure_stats stats;
};

/// Semiring whose cells can be compared (needed to count updates and to
/// detect a round without change).
template<typename R>
concept comparable_semiring =
    semiring<R> && std::equality_comparable<carrier_t<R>>;

namespace detail {

template<typename T>
std::size_t count_changed(matrix<T> const& before, matrix<T> const& after) {
    std::size_t changed = 0;
    auto a = before.begin();
    for (auto b = after.begin(); b != after.end(); ++a, ++b) {
        if (!(*a == *b)) ++changed;
    }
    return changed;
}

// One Floyd-Warshall pass over rows [span.first, span.last) through pivot
// k, writing row-major results of those rows to `out`.
template<semiring R>
std::size_t relax_rows(R const& r, relation<R> const& rel,
                       std::vector<carrier_t<R>> const& pivot_row,
                       std::vector<carrier_t<R>> const& pivot_col,
                       index_range span, std::vector<carrier_t<R>>& out)
{
    std::size_t const n = rel.cols();
    std::size_t changed = 0;
    out.clear();
    out.reserve(span.size() * n);
    for (std::size_t i = span.first; i < span.last; ++i) {
        carrier_t<R> const via = pivot_col[i];
        for (std::size_t j = 0; j < n; ++j) {
            carrier_t<R> const old = rel(i, j);
            carrier_t<R> next = algebra::add(r, old, algebra::mul(r, via, pivot_row[j]));
            if (!(next == old)) ++changed;
            out.push_back(std::move(next));
        }
    }
    return changed;
}

template<semiring R>
bool all_zero(R const& r, std::vector<carrier_t<R>> const& xs) {
    auto const z = algebra::zero(r);
    for (auto const& x : xs) {
        if (!(x == z)) return false;
    }
    return true;
}

template<comparable_semiring R>
void floyd_warshall(R const& r, relation<R>& rel, closure_options const& opt,
                    closure_stats& stats)
{
    using T = carrier_t<R>;
    constexpr bool may_skip = algebra::idempotent_semiring<R>;

    std::size_t const n = rel.rows();
    std::size_t const tasks = resolve_workers(opt.max_workers, n);

    std::vector<T> pivot_row(n);
    std::vector<T> pivot_col(n);
    std::vector<std::vector<T>> blocks(tasks);
    std::vector<std::size_t> changed(tasks, 0);

    for (std::size_t k = 0; k < n; ++k) {
        for (std::size_t x = 0; x < n; ++x) {
            pivot_row[x] = rel(k, x);
            pivot_col[x] = rel(x, k);
        }

        if constexpr (may_skip) {
            if (opt.early_exit &&
                (all_zero(r, pivot_row) || all_zero(r, pivot_col))) {
                ++stats.passes_skipped;
                continue;
            }
        }

        fork_join(tasks, [&](std::size_t t) {
            changed[t] = relax_rows(r, rel, pivot_row, pivot_col,
                                    partition_range(n, tasks, t), blocks[t]);
        });

        for (std::size_t t = 0; t < tasks; ++t) {
            auto const span = partition_range(n, tasks, t);
            std::size_t idx = 0;
            for (std::size_t i = span.first; i < span.last; ++i) {
                for (std::size_t j = 0; j < n; ++j) {
                    rel(i, j) = blocks[t][idx++];
                }
            }
            stats.cell_updates += changed[t];
        }
        ++stats.passes;
    }
}

template<comparable_semiring R>
void doubling(R const& r, relation<R>& rel, closure_options const& opt,
              closure_stats& stats)
{
    constexpr bool may_stop = algebra::idempotent_semiring<R>;

    std::uint64_t const length =
        opt.max_path_length == 0 ? rel.rows() : opt.max_path_length;
    if (length == 0) {
        return;
    }

    auto product = [&](relation<R> const& a, relation<R> const& b) {
        ++stats.products;
        return relation_product(r, a, b, opt.max_workers);
    };

    relation<R> const base = rel;
    relation<R> sum = base;   // S(1)
    relation<R> pow = base;   // P(1) = R^1

    // Walk the bits of `length` below its leading one, most significant
    // first.  Invariant: sum = R ⊕ … ⊕ R^m, pow = R^m.
    int const top = static_cast<int>(std::bit_width(length)) - 1;
    for (int bit = top - 1; bit >= 0; --bit) {
        relation<R> const before = sum;

        sum = relation_sum(r, sum, product(pow, sum));
        pow = product(pow, pow);

        if ((length >> bit) & 1u) {
            sum = relation_sum(r, base, product(base, sum));
            pow = product(pow, base);
        }

        ++stats.passes;
        std::size_t const changed = count_changed(before, sum);
        stats.cell_updates += changed;

        if constexpr (may_stop) {
            if (opt.early_exit && changed == 0) {
                stats.stopped_early = bit > 0;
                break;
            }
        }
    }

    rel = std::move(sum);
}

} // namespace detail

// =========================================================================
// Entry points
// =========================================================================

/// Close `rel` in place (the caller's buffer receives the result).
/// Throws dimension_mismatch when rel is not square.
template<comparable_semiring R>
closure_stats close_in_place_detailed(R const& r, relation<R>& rel,
                                      closure_options const& opt = {})
{
    require_square(rel.rows(), rel.cols(), "close: relation is not square");

    closure_stats stats{};
    stats.scheme = opt.scheme;
    stats.nodes = rel.rows();

    if (opt.scheme == closure_scheme::doubling) {
        detail::doubling(r, rel, opt, stats);
    } else {
        detail::floyd_warshall(r, rel, opt, stats);
    }

    if (opt.kind == closure_kind::reflexive_transitive) {
        for (std::size_t i = 0; i < rel.rows(); ++i) {
            rel(i, i) = algebra::add(r, algebra::one(r), rel(i, i));
        }
    }
    return stats;
}

/// Close `rel` in place.
template<comparable_semiring R>
void close_in_place(R const& r, relation<R>& rel, closure_options const& opt = {}) {
    close_in_place_detailed(r, rel, opt);
}

/// Closure of `rel` as a new relation, with statistics.
template<comparable_semiring R>
[[nodiscard]] closure_result<carrier_t<R>>
close_detailed(R const& r, relation<R> const& rel, closure_options const& opt = {})
{
    closure_result<carrier_t<R>> out{rel, {}};
    out.stats = close_in_place_detailed(r, out.relation, opt);
    return out;
}

/// Closure of `rel` as a new relation.
template<comparable_semiring R>
[[nodiscard]] relation<R>
close(R const& r, relation<R> const& rel, closure_options const& opt = {})
{
    return close_detailed(r, rel, opt).relation;
}

} // namespace lawful::closure

#endif // LAWFUL_CLOSURE_CLOSURE_H
