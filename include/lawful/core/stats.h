// core/stats.h - Statistics reported by the reduction and closure engines
// Part of the lawful algebra library (C++20)
//
// DESIGN RATIONALE:
// The library does no logging and no I/O.  What a caller would otherwise
// read from a log (how many combines a reduction took, how many workers
// ran, how many closure passes were skipped) is returned as a plain
// aggregate from the *_detailed entry points.
//
// Both structs are:
// - Trivially copyable aggregates, zero-initialised
// - Combinable with operator+ for aggregation across calls
// - Populated only by the engine that owns them
//
// The harness that owns I/O decides whether and how to print them.

#ifndef LAWFUL_CORE_STATS_H
#define LAWFUL_CORE_STATS_H

#include <algorithm>
#include <cstddef>

namespace lawful {

/// Evaluation strategy of the reduction engine.
enum class reduce_strategy : unsigned char {
    sequential,       ///< canonical left fold
    balanced_tree,    ///< pairwise divide and conquer over index ranges
    parallel_chunks,  ///< contiguous chunks on worker threads, joined in order
};

/// Iteration scheme of the closure engine.
enum class closure_scheme : unsigned char {
    floyd_warshall,   ///< triple loop over a pivot index
    doubling,         ///< geometric sum R ⊕ R² ⊕ … ⊕ R^L by squaring
};

/// Statistics collected during one reduction.
///
/// Example usage:
/// ```cpp
/// auto r = reduce_detailed(sum_monoid<int>{}, xs,
///                          {.strategy = reduce_strategy::parallel_chunks});
/// // r.stats.combines == xs.size() - 1 for a non-empty input
/// ```
struct reduce_stats {
    /// Strategy that actually ran.  Inputs too small to split fall back
    /// to sequential.
    reduce_strategy strategy = reduce_strategy::sequential;

    /// Number of input elements.
    std::size_t elements = 0;

    /// Number of calls to combine().
    /// For a non-empty input every strategy performs elements - 1.
    std::size_t combines = 0;

    /// Number of contiguous chunks the input was split into.
    /// 1 for sequential and balanced_tree.
    std::size_t chunks = 0;

    /// Number of worker threads forked (0 when everything ran on the
    /// calling thread).
    std::size_t workers = 0;

    /// Aggregate two reductions.  Counters sum; workers keep the maximum.
    constexpr reduce_stats operator+(reduce_stats const& other) const {
        return reduce_stats{
            .strategy = strategy,
            .elements = elements + other.elements,
            .combines = combines + other.combines,
            .chunks = chunks + other.chunks,
            .workers = std::max(workers, other.workers),
        };
    }
};

/// Statistics collected during one closure.
struct closure_stats {
    closure_scheme scheme = closure_scheme::floyd_warshall;

    /// Side length of the relation.
    std::size_t nodes = 0;

    /// Pivot passes (floyd_warshall) or doubling rounds (doubling) run.
    std::size_t passes = 0;

    /// Floyd-Warshall passes skipped because the pivot row or column was
    /// entirely the additive identity.  Only with early_exit.
    std::size_t passes_skipped = 0;

    /// Relation products computed (doubling scheme).
    std::size_t products = 0;

    /// Cells whose value changed, summed over all passes.
    std::size_t cell_updates = 0;

    /// True when the doubling scheme stopped before its fixed round count
    /// because a round changed nothing.
    bool stopped_early = false;

    constexpr closure_stats operator+(closure_stats const& other) const {
        return closure_stats{
            .scheme = scheme,
            .nodes = std::max(nodes, other.nodes),
            .passes = passes + other.passes,
            .passes_skipped = passes_skipped + other.passes_skipped,
            .products = products + other.products,
            .cell_updates = cell_updates + other.cell_updates,
            .stopped_early = stopped_early || other.stopped_early,
        };
    }
};

} // namespace lawful

#endif // LAWFUL_CORE_STATS_H
