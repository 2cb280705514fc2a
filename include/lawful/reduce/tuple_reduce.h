// reduce/tuple_reduce.h
//
// Compile-time reduction of a fixed-size tuple of carrier values.
//
// tuple_reduce(m, tup) folds the elements of a std::tuple (or std::array,
// or anything with tuple_size / get) under monoid m, left-to-right. An
// empty tuple yields m.identity().
//
// tuple_reduce_nonempty(s, tup) needs only a semigroup and rejects an
// empty tuple at compile time, the static counterpart of empty_reduction.
//
// Example:
//   tuple_reduce(sum_monoid<int>{}, std::make_tuple(1, 2, 3, 4)) == 10
//   tuple_reduce(min_monoid<int>{}, std::array{5, 2, 8, 1})     == 1
//   tuple_reduce(sum_monoid<int>{}, std::tuple<>{})             == 0
//
// Copyright (c) 2025 Andrew Drakeford. All rights reserved.

#ifndef LAWFUL_REDUCE_TUPLE_REDUCE_H
#define LAWFUL_REDUCE_TUPLE_REDUCE_H

#include <cstddef>
#include <tuple>
#include <type_traits>
#include <utility>

#include "lawful/algebra/concepts.h"

namespace lawful::reduce {

namespace detail {

// Fold with initial value: acc . t[0] . t[1] . ... . t[N-1]
template<typename S, typename Acc, typename Tuple, std::size_t... Is>
constexpr Acc tuple_fold_impl(S const& s, Acc acc, Tuple const& tup,
                              std::index_sequence<Is...>) {
    ((acc = s.combine(acc, static_cast<Acc>(std::get<Is>(tup)))), ...);
    return acc;
}

// Fold without initial value: t[0] . t[1] . ... . t[N-1]
template<typename S, typename Acc, typename Tuple, std::size_t... Is>
constexpr Acc tuple_fold_no_init_impl(S const& s, Tuple const& tup,
                                      std::index_sequence<Is...>) {
    Acc acc = static_cast<Acc>(std::get<0>(tup));
    ((acc = s.combine(acc, static_cast<Acc>(std::get<Is + 1>(tup)))), ...);
    return acc;
}

}  // namespace detail

/// Fold a non-empty tuple under semigroup s.
template<algebra::semigroup S, typename Tuple>
[[nodiscard]] constexpr algebra::carrier_t<S>
tuple_reduce_nonempty(S const& s, Tuple const& tup) {
    using T = algebra::carrier_t<S>;
    constexpr auto N = std::tuple_size_v<std::remove_cvref_t<Tuple>>;
    static_assert(N > 0, "Cannot reduce an empty tuple under a semigroup: no identity");

    return detail::tuple_fold_no_init_impl<S, T>(
        s, tup, std::make_index_sequence<N - 1>{});
}

/// Fold a tuple under monoid m; an empty tuple yields m.identity().
template<algebra::monoid M, typename Tuple>
[[nodiscard]] constexpr algebra::carrier_t<M>
tuple_reduce(M const& m, Tuple const& tup) {
    constexpr auto N = std::tuple_size_v<std::remove_cvref_t<Tuple>>;
    if constexpr (N == 0) {
        return m.identity();
    } else {
        return tuple_reduce_nonempty(m, tup);
    }
}

}  // namespace lawful::reduce

#endif  // LAWFUL_REDUCE_TUPLE_REDUCE_H
