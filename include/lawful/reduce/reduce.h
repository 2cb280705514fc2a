// reduce/reduce.h — Structure-aware reduction engine
// Part of the lawful algebra library (C++20)
//
// ALGORITHM:
// Combine every element of a sequence under a semigroup or monoid.
// Associativity is the only law the engine leans on: it lets the same
// combination be evaluated in any grouping, so the caller chooses one.
//
//   sequential       ((((x0 . x1) . x2) . x3) . x4)          canonical
//   balanced_tree    ((x0 . x1) . (x2 . (x3 . x4)))          depth log n
//   parallel_chunks  (P0 . P1 . P2), Pi = fold of chunk i on its own thread
//
// All three return the same value under the algebra's equality, and all
// perform exactly n - 1 combines for n elements.  Commutativity is never
// assumed: the left half (or earlier chunk) is always the left operand.
//
// EMPTY INPUT:
// - monoid:    returns identity()
// - semigroup: throws empty_reduction (reduce_nonempty)
//
// Balanced and chunked evaluation need random access; other iterators are
// folded sequentially.
//
// Example:
// ```cpp
// std::vector<int> xs{1, 2, 3, 4, 5};
// reduce(sum_monoid<int>{}, xs);                                        // 15
// reduce(sum_monoid<int>{}, xs, {.strategy = reduce_strategy::balanced_tree});
// fold_map(sum_monoid<int>{}, xs, power_t<2>{});                        // 55
// ```

#ifndef LAWFUL_REDUCE_REDUCE_H
#define LAWFUL_REDUCE_REDUCE_H

#include "lawful/algebra/concepts.h"
#include "lawful/algebra/operations.h"
#include "lawful/core/error.h"
#include "lawful/core/stats.h"
#include "lawful/core/workers.h"

#include <cstddef>
#include <iterator>
#include <optional>
#include <ranges>
#include <stdexcept>
#include <utility>
#include <vector>

namespace lawful::reduce {

using algebra::carrier_t;
using algebra::monoid;
using algebra::semigroup;

/// Range whose begin and end have the same type when viewed as const.
template<typename R>
concept common_input_range =
    std::ranges::input_range<R const> && std::ranges::common_range<R const>;

// =========================================================================
// Options and results
// =========================================================================

/// Per-call configuration of the reduction engine.
struct reduce_options {
    reduce_strategy strategy = reduce_strategy::sequential;

    /// parallel_chunks: minimum elements per chunk.  The input is split
    /// into ceil(n / chunk_size) chunks, capped by max_workers.
    std::size_t chunk_size = 1024;

    /// parallel_chunks: worker cap, 0 = std::thread::hardware_concurrency().
    std::size_t max_workers = 0;
};

/// Value plus the statistics of the reduction that produced it.
template<typename T>
struct reduction {
    T value;
    reduce_stats stats;
};

// =========================================================================
// Evaluation strategies (non-empty input)
// =========================================================================

namespace detail {

// Left fold of [first, last), first != last.
template<typename S, typename It, typename Proj>
carrier_t<S> fold_sequential(S const& s, It first, It last, Proj const& proj,
                             std::size_t& combines)
{
    carrier_t<S> acc = static_cast<carrier_t<S>>(proj(*first));
    for (++first; first != last; ++first) {
        acc = s.combine(acc, static_cast<carrier_t<S>>(proj(*first)));
        ++combines;
    }
    return acc;
}

// Pairwise tree over [first, first + n), n >= 1.  Left half is combined
// on the left.
template<typename S, typename It, typename Proj>
carrier_t<S> fold_tree(S const& s, It first, std::size_t n, Proj const& proj,
                       std::size_t& combines)
{
    if (n == 1) {
        return static_cast<carrier_t<S>>(proj(*first));
    }
    std::size_t const half = n / 2;
    auto left = fold_tree(s, first, half, proj, combines);
    auto right = fold_tree(s, first + static_cast<std::ptrdiff_t>(half),
                           n - half, proj, combines);
    ++combines;
    return s.combine(left, right);
}

// Contiguous chunks on worker threads; partials joined in chunk order.
// Each worker writes only its own slot.
template<typename S, typename It, typename Proj>
carrier_t<S> fold_chunks(S const& s, It first, std::size_t n, std::size_t tasks,
                         Proj const& proj, reduce_stats& stats)
{
    std::vector<std::optional<carrier_t<S>>> partials(tasks);
    std::vector<std::size_t> partial_combines(tasks, 0);

    stats.workers = fork_join(tasks, [&](std::size_t i) {
        auto const r = partition_range(n, tasks, i);
        auto const b = first + static_cast<std::ptrdiff_t>(r.first);
        auto const e = first + static_cast<std::ptrdiff_t>(r.last);
        partials[i].emplace(fold_sequential(s, b, e, proj, partial_combines[i]));
    });

    carrier_t<S> acc = std::move(*partials[0]);
    stats.combines += partial_combines[0];
    for (std::size_t i = 1; i < tasks; ++i) {
        acc = s.combine(acc, *partials[i]);
        stats.combines += partial_combines[i] + 1;
    }
    stats.chunks = tasks;
    return acc;
}

// Dispatch a non-empty range to the requested strategy.
template<typename S, typename It, typename Proj>
reduction<carrier_t<S>> run(S const& s, It first, It last, Proj const& proj,
                            reduce_options const& opt)
{
    reduce_stats stats{};
    stats.strategy = reduce_strategy::sequential;
    stats.chunks = 1;

    if constexpr (std::random_access_iterator<It>) {
        auto const n = static_cast<std::size_t>(last - first);
        stats.elements = n;

        if (opt.strategy == reduce_strategy::balanced_tree) {
            stats.strategy = reduce_strategy::balanced_tree;
            auto v = fold_tree(s, first, n, proj, stats.combines);
            return {std::move(v), stats};
        }

        if (opt.strategy == reduce_strategy::parallel_chunks) {
            if (opt.chunk_size == 0) {
                throw std::invalid_argument("reduce: chunk_size must be positive");
            }
            std::size_t const wanted = (n + opt.chunk_size - 1) / opt.chunk_size;
            std::size_t const tasks = resolve_workers(opt.max_workers, wanted);
            if (tasks > 1) {
                stats.strategy = reduce_strategy::parallel_chunks;
                auto v = fold_chunks(s, first, n, tasks, proj, stats);
                return {std::move(v), stats};
            }
        }

        auto v = fold_sequential(s, first, last, proj, stats.combines);
        return {std::move(v), stats};
    } else {
        auto v = fold_sequential(s, first, last, proj, stats.combines);
        stats.elements = stats.combines + 1;
        return {std::move(v), stats};
    }
}

} // namespace detail

// =========================================================================
// Monoid reduction: empty input yields identity()
// =========================================================================

/// Reduce [first, last) under monoid m, with statistics.
template<monoid M, std::input_iterator It>
[[nodiscard]] reduction<carrier_t<M>>
reduce_detailed(M const& m, It first, It last, reduce_options const& opt = {})
{
    if (first == last) {
        return {m.identity(), reduce_stats{.strategy = opt.strategy}};
    }
    return detail::run(m, first, last, algebra::identity_t{}, opt);
}

/// Reduce a range under monoid m, with statistics.
template<monoid M, common_input_range R>
[[nodiscard]] reduction<carrier_t<M>>
reduce_detailed(M const& m, R const& xs, reduce_options const& opt = {})
{
    return reduce_detailed(m, std::ranges::begin(xs), std::ranges::end(xs), opt);
}

/// Reduce [first, last) under monoid m.
template<monoid M, std::input_iterator It>
[[nodiscard]] carrier_t<M>
reduce(M const& m, It first, It last, reduce_options const& opt = {})
{
    return reduce_detailed(m, first, last, opt).value;
}

/// Reduce a range under monoid m.
template<monoid M, common_input_range R>
[[nodiscard]] carrier_t<M>
reduce(M const& m, R const& xs, reduce_options const& opt = {})
{
    return reduce_detailed(m, xs, opt).value;
}

// =========================================================================
// Semigroup reduction: empty input is a contract violation
// =========================================================================

/// Reduce a non-empty [first, last) under semigroup s.
/// Throws empty_reduction when first == last.
template<semigroup S, std::input_iterator It>
[[nodiscard]] carrier_t<S>
reduce_nonempty(S const& s, It first, It last, reduce_options const& opt = {})
{
    if (first == last) {
        throw empty_reduction("reduce_nonempty: empty range has no identity to return");
    }
    return detail::run(s, first, last, algebra::identity_t{}, opt).value;
}

/// Reduce a non-empty range under semigroup s.
template<semigroup S, common_input_range R>
[[nodiscard]] carrier_t<S>
reduce_nonempty(S const& s, R const& xs, reduce_options const& opt = {})
{
    return reduce_nonempty(s, std::ranges::begin(xs), std::ranges::end(xs), opt);
}

// =========================================================================
// fold_map: map into the monoid, then reduce
// =========================================================================

/// Map every element through f into m's carrier and reduce.
/// f runs inside the chunk that owns the element, so under
/// parallel_chunks it runs on worker threads and must not mutate shared
/// state.
template<monoid M, common_input_range R, typename F>
[[nodiscard]] carrier_t<M>
fold_map(M const& m, R const& xs, F const& f, reduce_options const& opt = {})
{
    auto first = std::ranges::begin(xs);
    auto last = std::ranges::end(xs);
    if (first == last) {
        return m.identity();
    }
    return detail::run(m, first, last, f, opt).value;
}

} // namespace lawful::reduce

#endif // LAWFUL_REDUCE_REDUCE_H
