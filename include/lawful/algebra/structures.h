// lawful/algebra/structures.h
//
// The structure catalog: ready-made semigroups, monoids and semirings.
//
// Every entry is an empty, default-constructible descriptor. Copies are
// free and there is nothing to share or synchronise; a "canonical" sum
// monoid is simply sum_monoid<int>{} wherever it is needed.
//
//   op_semigroup<Op, T>      combine = Op
//   op_monoid<Op, T>         combine = Op, identity = Op::identity<T>()
//   semiring_of<Add, Mul>    two monoid witnesses over one carrier
//
// Named entries:
//
//   sum_monoid<T>            (+, 0)
//   product_monoid<T>        (*, 1)
//   min_monoid<T>            (min, +inf)
//   max_monoid<T>            (max, -inf)
//   any_monoid               (or, false)
//   all_monoid               (and, true)
//   bit_or_monoid<T>         (|, 0)
//   bit_and_monoid<T>        (&, ~0)
//   concat_monoid<Seq>       (++, empty)        not commutative
//   min_semigroup<T>         min, no identity
//   max_semigroup<T>         max, no identity
//   first_semigroup<T>       keep left, no identity
//   last_semigroup<T>        keep right, no identity
//
//   tropical_semiring<T>     (min, +)    0 = +inf, 1 = 0    shortest paths
//   max_plus_semiring<T>     (max, +)    0 = -inf, 1 = 0    longest paths (DAG)
//   bottleneck_semiring<T>   (max, min)  0 = -inf, 1 = +inf widest paths
//   boolean_semiring         (or, and)   0 = false, 1 = true reachability
//   counting_semiring<T>     (+, *)      0 = 0, 1 = 1       path counts
//
// Copyright (c) 2025 Andrew Drakeford. All rights reserved.

#ifndef LAWFUL_ALGEBRA_STRUCTURES_H
#define LAWFUL_ALGEBRA_STRUCTURES_H

#include <concepts>

#include "lawful/algebra/concepts.h"
#include "lawful/algebra/operations.h"

namespace lawful::algebra {

// ---------------------------------------------------------------------------
// Structures from a single operation
// ---------------------------------------------------------------------------

/// Semigroup over T whose combine is Op. Op must be associative over T.
template<typename Op, typename T>
struct op_semigroup {
    using value_type     = T;
    using operation_type = Op;

    static constexpr bool declared_associative = true;
    static constexpr bool declared_commutative = detail::has_declared_commut<Op>;
    static constexpr bool declared_idempotent  = detail::has_declared_idemp<Op>;

    static constexpr T combine(T const& a, T const& b) {
        return static_cast<T>(Op{}(a, b));
    }
};

/// Monoid over T whose combine is Op and identity is Op::identity<T>().
template<typename Op, typename T>
    requires has_identity<Op, T>
struct op_monoid {
    using value_type     = T;
    using operation_type = Op;

    static constexpr bool declared_associative = true;
    static constexpr bool declared_commutative = detail::has_declared_commut<Op>;
    static constexpr bool declared_idempotent  = detail::has_declared_idemp<Op>;

    static constexpr T combine(T const& a, T const& b) {
        return static_cast<T>(Op{}(a, b));
    }

    static constexpr T identity() {
        return Op::template identity<T>();
    }
};

// ---------------------------------------------------------------------------
// Monoid catalog
// ---------------------------------------------------------------------------

template<typename T> using sum_monoid     = op_monoid<plus_fn, T>;
template<typename T> using product_monoid = op_monoid<multiplies_fn, T>;
template<typename T> using min_monoid     = op_monoid<min_fn, T>;
template<typename T> using max_monoid     = op_monoid<max_fn, T>;
template<typename T> using bit_or_monoid  = op_monoid<bit_or_fn, T>;
template<typename T> using bit_and_monoid = op_monoid<bit_and_fn, T>;
template<typename Seq> using concat_monoid = op_monoid<concat_fn, Seq>;

using any_monoid = op_monoid<logical_or_fn, bool>;
using all_monoid = op_monoid<logical_and_fn, bool>;

// ---------------------------------------------------------------------------
// Semigroup-only catalog
// ---------------------------------------------------------------------------

template<typename T> using min_semigroup   = op_semigroup<min_fn, T>;
template<typename T> using max_semigroup   = op_semigroup<max_fn, T>;
template<typename T> using first_semigroup = op_semigroup<first_fn, T>;
template<typename T> using last_semigroup  = op_semigroup<last_fn, T>;

// ---------------------------------------------------------------------------
// Semirings
// ---------------------------------------------------------------------------

/// Semiring assembled from an additive and a multiplicative monoid over
/// the same carrier. The caller guarantees distributivity and that the
/// additive identity is absorbing under Mul.
template<monoid Add, monoid Mul>
    requires std::same_as<carrier_t<Add>, carrier_t<Mul>>
struct semiring_of {
    using value_type          = carrier_t<Add>;
    using additive_type       = Add;
    using multiplicative_type = Mul;

    static constexpr additive_type additive() noexcept { return {}; }
    static constexpr multiplicative_type multiplicative() noexcept { return {}; }
};

/// (min, +) over T. Additive identity +inf, absorbing under +.
template<typename T>
using tropical_semiring = semiring_of<min_monoid<T>, op_monoid<tropical_plus_fn, T>>;

/// (max, +) over T. Additive identity -inf, absorbing under +.
template<typename T>
using max_plus_semiring = semiring_of<max_monoid<T>, op_monoid<arctic_plus_fn, T>>;

/// (max, min) over T. Widest-path / bottleneck capacity.
template<typename T>
using bottleneck_semiring = semiring_of<max_monoid<T>, min_monoid<T>>;

/// (or, and) over bool.
using boolean_semiring = semiring_of<any_monoid, all_monoid>;

/// (+, *) over T. Counts ways instead of deciding reachability.
template<typename T>
using counting_semiring = semiring_of<sum_monoid<T>, product_monoid<T>>;

}  // namespace lawful::algebra

#endif  // LAWFUL_ALGEBRA_STRUCTURES_H
