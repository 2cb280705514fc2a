// lawful/algebra/concepts.h
//
// Capability sets: semigroup, monoid, commutative monoid, semiring.
//
// A structure is a stateless descriptor type, not a value type. The
// carrier is named by the nested value_type; the operations are member
// functions (usually static) of the descriptor:
//
//   struct my_max {
//       using value_type = int;
//       static constexpr int combine(int a, int b) { return a < b ? b : a; }
//       static constexpr int identity() { return INT_MIN; }
//   };
//   static_assert(monoid<my_max>);
//
// A semiring descriptor names two monoid witnesses over one carrier:
//
//   struct my_semiring {
//       using value_type          = T;
//       using additive_type       = ...;   // (⊕, 0)
//       using multiplicative_type = ...;   // (⊗, 1)
//       static constexpr additive_type       additive()       { return {}; }
//       static constexpr multiplicative_type multiplicative() { return {}; }
//   };
//
// The concepts check signatures only. Associativity, identity,
// distributivity and absorption are preconditions the implementer
// guarantees; nothing here or in the engines verifies them.
//
// Copyright (c) 2025 Andrew Drakeford. All rights reserved.

#ifndef LAWFUL_ALGEBRA_CONCEPTS_H
#define LAWFUL_ALGEBRA_CONCEPTS_H

#include <concepts>
#include <type_traits>

#include "lawful/algebra/operations.h"

namespace lawful::algebra {

// ---------------------------------------------------------------------------
// Carrier access
// ---------------------------------------------------------------------------

/// Carrier type of a structure descriptor.
template<typename S>
using carrier_t = typename std::remove_cvref_t<S>::value_type;

// ---------------------------------------------------------------------------
// Semigroup / Monoid
// ---------------------------------------------------------------------------

/// Closed binary combine over S::value_type.
/// Law (unchecked): combine(combine(a, b), c) == combine(a, combine(b, c)).
template<typename S>
concept semigroup =
    requires { typename S::value_type; } &&
    std::copy_constructible<typename S::value_type> &&
    requires(S const& s,
             typename S::value_type const& a,
             typename S::value_type const& b) {
        { s.combine(a, b) } -> std::convertible_to<typename S::value_type>;
    };

/// Semigroup with an identity element.
/// Law (unchecked): combine(identity(), x) == x == combine(x, identity()).
template<typename M>
concept monoid =
    semigroup<M> &&
    requires(M const& m) {
        { m.identity() } -> std::convertible_to<typename M::value_type>;
    };

/// Monoid whose descriptor declares combine(a, b) == combine(b, a).
/// The engines never require this; it documents intent.
template<typename M>
concept commutative_monoid = monoid<M> && declares_commutative<M>;

// ---------------------------------------------------------------------------
// Semiring
// ---------------------------------------------------------------------------

/// Two monoid witnesses over the same carrier.
/// Laws (unchecked):
///   ⊗ distributes over ⊕ on both sides
///   0 ⊗ x == 0 == x ⊗ 0
template<typename R>
concept semiring =
    requires {
        typename R::value_type;
        typename R::additive_type;
        typename R::multiplicative_type;
    } &&
    monoid<typename R::additive_type> &&
    monoid<typename R::multiplicative_type> &&
    std::same_as<carrier_t<typename R::additive_type>, typename R::value_type> &&
    std::same_as<carrier_t<typename R::multiplicative_type>, typename R::value_type> &&
    requires(R const& r) {
        { r.additive() } -> std::convertible_to<typename R::additive_type>;
        { r.multiplicative() } -> std::convertible_to<typename R::multiplicative_type>;
    };

/// Semiring whose additive monoid declares a ⊕ a == a.
/// Idempotence bounds how far a closure can change, which is what makes
/// early stopping sound.
template<typename R>
concept idempotent_semiring =
    semiring<R> && declares_idempotent<typename R::additive_type>;

// ---------------------------------------------------------------------------
// Semiring shorthands
// ---------------------------------------------------------------------------

/// Additive identity 0.
template<semiring R>
[[nodiscard]] constexpr carrier_t<R> zero(R const& r) {
    return r.additive().identity();
}

/// Multiplicative identity 1.
template<semiring R>
[[nodiscard]] constexpr carrier_t<R> one(R const& r) {
    return r.multiplicative().identity();
}

/// a ⊕ b.
template<semiring R>
[[nodiscard]] constexpr carrier_t<R>
add(R const& r, carrier_t<R> const& a, carrier_t<R> const& b) {
    return r.additive().combine(a, b);
}

/// a ⊗ b.
template<semiring R>
[[nodiscard]] constexpr carrier_t<R>
mul(R const& r, carrier_t<R> const& a, carrier_t<R> const& b) {
    return r.multiplicative().combine(a, b);
}

}  // namespace lawful::algebra

#endif  // LAWFUL_ALGEBRA_CONCEPTS_H
