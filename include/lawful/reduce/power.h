// reduce/power.h — Repeated combination by squaring
// Part of the lawful algebra library (C++20)
//
// power(s, x, n) = x . x . ... . x   (n copies)
//
// Associativity lets the n - 1 combines be regrouped into O(log n):
// square the base once per bit of n and fold the set bits into the
// result.  All operands are powers of the same x, so no commutativity is
// needed.
//
// n == 0 is the empty combination:
// - monoid:    identity()
// - semigroup: throws empty_reduction
//
// The same routine raises relations to a power when given the relation
// product monoid (closure/relation_algebra.h).

#ifndef LAWFUL_REDUCE_POWER_H
#define LAWFUL_REDUCE_POWER_H

#include "lawful/algebra/concepts.h"
#include "lawful/core/error.h"

#include <cstdint>
#include <optional>
#include <utility>

namespace lawful::reduce {

/// x combined with itself n times under semigroup s.
template<algebra::semigroup S>
[[nodiscard]] constexpr algebra::carrier_t<S>
power(S const& s, algebra::carrier_t<S> const& x, std::uint64_t n)
{
    using T = algebra::carrier_t<S>;

    if (n == 0) {
        if constexpr (algebra::monoid<S>) {
            return s.identity();
        } else {
            throw empty_reduction("power: zeroth power of a semigroup element");
        }
    }

    std::optional<T> result;
    T base = x;
    while (true) {
        if (n & 1u) {
            result = result ? s.combine(*result, base) : base;
        }
        n >>= 1;
        if (n == 0) break;
        base = s.combine(base, base);
    }
    return std::move(*result);
}

} // namespace lawful::reduce

#endif // LAWFUL_REDUCE_POWER_H
