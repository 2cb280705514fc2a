// lawful/algebra/operations.h
//
// Typed binary operations from which the structure catalog is built.
//
// These are stateless function objects. Each binary operation carries:
//   - operator()(a, b): the combination itself
//   - declared_associative / declared_commutative / declared_idempotent:
//     mathematical intent annotations
//   - identity<T>(): the identity element for carrier T, where one exists
//     (first_fn and last_fn have none: they only make semigroups)
//
// The annotations are descriptive. The engines never check them against
// values; a structure that declares a law it does not satisfy produces
// silently wrong results. The only annotation an engine acts on is
// declared_idempotent, which lets the closure engine stop early when the
// caller asks for it.
//
// A few unary transforms (identity_t, constant_t, power_t) are kept for
// use with fold_map.
//
// Copyright (c) 2025 Andrew Drakeford. All rights reserved.

#ifndef LAWFUL_ALGEBRA_OPERATIONS_H
#define LAWFUL_ALGEBRA_OPERATIONS_H

#include <concepts>
#include <limits>
#include <type_traits>
#include <utility>

namespace lawful::algebra {

// ---------------------------------------------------------------------------
// Infinity sentinels
//
// +inf / -inf where the carrier has them, otherwise the extreme
// representable values. Integer carriers therefore reserve max() and
// lowest() as "unreachable" markers.
// ---------------------------------------------------------------------------

template<typename T>
[[nodiscard]] constexpr T positive_infinity() noexcept {
    if constexpr (std::numeric_limits<T>::has_infinity) {
        return std::numeric_limits<T>::infinity();
    } else {
        return std::numeric_limits<T>::max();
    }
}

template<typename T>
[[nodiscard]] constexpr T negative_infinity() noexcept {
    if constexpr (std::numeric_limits<T>::has_infinity) {
        return -std::numeric_limits<T>::infinity();
    } else {
        return std::numeric_limits<T>::lowest();
    }
}

// ---------------------------------------------------------------------------
// Transform operations (unary: T -> U), for fold_map
// ---------------------------------------------------------------------------

/// Identity transform: returns its argument unchanged.
struct identity_t {
    template<typename T>
    constexpr T operator()(T x) const noexcept { return x; }
};

/// Constant transform: ignores input, returns a fixed value.
/// Used for counting: fold_map(sum_monoid<int>{}, xs, constant_t<1>{}).
template<auto V>
struct constant_t {
    template<typename T>
    constexpr auto operator()(T const&) const noexcept { return V; }
};

/// Power transform: computes x^P using binary exponentiation.
/// power_t<0>: always 1.  power_t<1>: identity.  power_t<2>: x*x.
template<int P>
struct power_t {
    static_assert(P >= 0, "Negative exponents not supported");

    template<typename T>
    constexpr T operator()(T x) const noexcept {
        if constexpr (P == 0) {
            return T{1};
        } else if constexpr (P == 1) {
            return x;
        } else if constexpr (P % 2 == 0) {
            auto half = power_t<P / 2>{}(x);
            return half * half;
        } else {
            return x * power_t<P - 1>{}(x);
        }
    }
};

// ---------------------------------------------------------------------------
// Binary operations (T, T) -> T
// ---------------------------------------------------------------------------

/// Plus: addition. Identity element: 0.
struct plus_fn {
    template<typename T>
    constexpr T operator()(T const& a, T const& b) const { return a + b; }

    static constexpr bool declared_associative = true;
    static constexpr bool declared_commutative = true;
    static constexpr bool declared_idempotent  = false;

    template<typename T>
    static constexpr T identity() noexcept { return T{}; }
};

/// Multiplies: multiplication. Identity element: 1.
struct multiplies_fn {
    template<typename T>
    constexpr T operator()(T const& a, T const& b) const { return a * b; }

    static constexpr bool declared_associative = true;
    static constexpr bool declared_commutative = true;
    static constexpr bool declared_idempotent  = false;

    template<typename T>
    static constexpr T identity() noexcept { return T{1}; }
};

/// Minimum: returns the smaller of two values (the left one on ties).
/// Identity element: +infinity (largest representable value).
struct min_fn {
    template<typename T>
    constexpr T operator()(T const& a, T const& b) const { return b < a ? b : a; }

    static constexpr bool declared_associative = true;
    static constexpr bool declared_commutative = true;
    static constexpr bool declared_idempotent  = true;

    template<typename T>
    static constexpr T identity() noexcept { return positive_infinity<T>(); }
};

/// Maximum: returns the larger of two values (the left one on ties).
/// Identity element: -infinity (lowest representable value).
struct max_fn {
    template<typename T>
    constexpr T operator()(T const& a, T const& b) const { return a < b ? b : a; }

    static constexpr bool declared_associative = true;
    static constexpr bool declared_commutative = true;
    static constexpr bool declared_idempotent  = true;

    template<typename T>
    static constexpr T identity() noexcept { return negative_infinity<T>(); }
};

/// Logical OR over bool. Identity element: false.
struct logical_or_fn {
    constexpr bool operator()(bool a, bool b) const noexcept { return a || b; }

    static constexpr bool declared_associative = true;
    static constexpr bool declared_commutative = true;
    static constexpr bool declared_idempotent  = true;

    template<typename T>
    static constexpr T identity() noexcept { return T{false}; }
};

/// Logical AND over bool. Identity element: true.
struct logical_and_fn {
    constexpr bool operator()(bool a, bool b) const noexcept { return a && b; }

    static constexpr bool declared_associative = true;
    static constexpr bool declared_commutative = true;
    static constexpr bool declared_idempotent  = true;

    template<typename T>
    static constexpr T identity() noexcept { return T{true}; }
};

/// Bitwise AND. Identity element: all-ones.
struct bit_and_fn {
    template<typename T>
    constexpr T operator()(T a, T b) const noexcept { return a & b; }

    static constexpr bool declared_associative = true;
    static constexpr bool declared_commutative = true;
    static constexpr bool declared_idempotent  = true;

    template<typename T>
    static constexpr T identity() noexcept { return static_cast<T>(~T{}); }
};

/// Bitwise OR. Identity element: 0.
struct bit_or_fn {
    template<typename T>
    constexpr T operator()(T a, T b) const noexcept { return a | b; }

    static constexpr bool declared_associative = true;
    static constexpr bool declared_commutative = true;
    static constexpr bool declared_idempotent  = true;

    template<typename T>
    static constexpr T identity() noexcept { return T{}; }
};

/// Addition where +infinity is absorbing: the multiplicative operation of
/// the tropical (min, +) semiring. Identity element: 0.
///
/// For integer carriers positive_infinity<T>() is max(), and plain
/// addition would overflow; the explicit check keeps max() absorbing.
/// Finite sums that overflow are the caller's concern.
struct tropical_plus_fn {
    template<typename T>
    constexpr T operator()(T const& a, T const& b) const {
        constexpr T inf = positive_infinity<T>();
        if (a == inf || b == inf) return inf;
        return a + b;
    }

    static constexpr bool declared_associative = true;
    static constexpr bool declared_commutative = true;
    static constexpr bool declared_idempotent  = false;

    template<typename T>
    static constexpr T identity() noexcept { return T{}; }
};

/// Addition where -infinity is absorbing: the multiplicative operation of
/// the arctic (max, +) semiring. Identity element: 0.
struct arctic_plus_fn {
    template<typename T>
    constexpr T operator()(T const& a, T const& b) const {
        constexpr T ninf = negative_infinity<T>();
        if (a == ninf || b == ninf) return ninf;
        return a + b;
    }

    static constexpr bool declared_associative = true;
    static constexpr bool declared_commutative = true;
    static constexpr bool declared_idempotent  = false;

    template<typename T>
    static constexpr T identity() noexcept { return T{}; }
};

/// Concatenation of sequences (std::string, std::vector<T>, ...).
/// Identity element: the empty sequence. Not commutative.
struct concat_fn {
    template<typename Seq>
    Seq operator()(Seq const& a, Seq const& b) const {
        Seq out;
        out.reserve(a.size() + b.size());
        out.insert(out.end(), a.begin(), a.end());
        out.insert(out.end(), b.begin(), b.end());
        return out;
    }

    static constexpr bool declared_associative = true;
    static constexpr bool declared_commutative = false;
    static constexpr bool declared_idempotent  = false;

    template<typename Seq>
    static Seq identity() { return Seq{}; }
};

/// Keep the left operand. Semigroup only: no identity exists.
struct first_fn {
    template<typename T>
    constexpr T operator()(T const& a, T const&) const { return a; }

    static constexpr bool declared_associative = true;
    static constexpr bool declared_commutative = false;
    static constexpr bool declared_idempotent  = true;
};

/// Keep the right operand. Semigroup only: no identity exists.
struct last_fn {
    template<typename T>
    constexpr T operator()(T const&, T const& b) const { return b; }

    static constexpr bool declared_associative = true;
    static constexpr bool declared_commutative = false;
    static constexpr bool declared_idempotent  = true;
};

// ---------------------------------------------------------------------------
// Declared-property queries
//
// A type that says nothing about a property is treated as not declaring
// it. These work for operations and for structure descriptors alike, since
// both spell the flags the same way.
// ---------------------------------------------------------------------------

namespace detail {
    template<typename Op, typename = void>
    inline constexpr bool has_declared_assoc = false;
    template<typename Op>
    inline constexpr bool has_declared_assoc<Op, std::void_t<decltype(Op::declared_associative)>> =
        Op::declared_associative;

    template<typename Op, typename = void>
    inline constexpr bool has_declared_commut = false;
    template<typename Op>
    inline constexpr bool has_declared_commut<Op, std::void_t<decltype(Op::declared_commutative)>> =
        Op::declared_commutative;

    template<typename Op, typename = void>
    inline constexpr bool has_declared_idemp = false;
    template<typename Op>
    inline constexpr bool has_declared_idemp<Op, std::void_t<decltype(Op::declared_idempotent)>> =
        Op::declared_idempotent;
}  // namespace detail

/// Does Op declare associativity?
template<typename Op>
concept declares_associative = detail::has_declared_assoc<Op>;

/// Does Op declare commutativity?
template<typename Op>
concept declares_commutative = detail::has_declared_commut<Op>;

/// Does Op declare idempotency (a op a == a)?
template<typename Op>
concept declares_idempotent = detail::has_declared_idemp<Op>;

/// Can this operation produce an identity element for type T?
template<typename Op, typename T>
concept has_identity = requires { { Op::template identity<T>() } -> std::same_as<T>; };

}  // namespace lawful::algebra

#endif  // LAWFUL_ALGEBRA_OPERATIONS_H
