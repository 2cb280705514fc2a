// lawful/algebra/instances.h
//
// Structures built from other structures.
//
//   product_of<S...>      carrier tuple<value_type...>, combine lane by lane.
//                         A product of semigroups is a semigroup; when every
//                         factor is a monoid, so is the product.
//
//   optional_monoid<S>    carrier optional<value_type>. Adjoins a new
//                         identity (nullopt) to any semigroup.
//
//   map_monoid<K, S>      carrier unordered_map<K, value_type>. Key-wise
//                         union; values that share a key are combined with
//                         S (left map's value on the left). Identity: the
//                         empty map. Only S's semigroup part is used.
//
// These compose: map_monoid<char, product_of<max_monoid<double>, any_monoid>>
// is a monoid, and so are maps of maps.
//
// Copyright (c) 2025 Andrew Drakeford. All rights reserved.

#ifndef LAWFUL_ALGEBRA_INSTANCES_H
#define LAWFUL_ALGEBRA_INSTANCES_H

#include <cstddef>
#include <functional>
#include <optional>
#include <tuple>
#include <unordered_map>
#include <utility>

#include "lawful/algebra/concepts.h"

namespace lawful::algebra {

// ---------------------------------------------------------------------------
// product_of: direct product
// ---------------------------------------------------------------------------

/// Direct product of semigroups, combined lane by lane.
///
/// Given factors (S0, ..., SN-1) and tuples a, b:
///   combine(a, b) = (S0.combine(a[0], b[0]), ..., SN-1.combine(a[N-1], b[N-1]))
///   identity()    = (S0.identity(), ..., SN-1.identity())   [monoid factors only]
template<semigroup... S>
struct product_of {
    using value_type = std::tuple<carrier_t<S>...>;

    static constexpr std::size_t lane_count = sizeof...(S);

    static constexpr bool declared_associative = true;
    static constexpr bool declared_commutative = (declares_commutative<S> && ...);
    static constexpr bool declared_idempotent  = (declares_idempotent<S> && ...);

    static constexpr value_type combine(value_type const& a, value_type const& b) {
        return combine_impl(a, b, std::index_sequence_for<S...>{});
    }

    static constexpr value_type identity()
        requires (monoid<S> && ...)
    {
        return value_type{S{}.identity()...};
    }

private:
    template<std::size_t... Is>
    static constexpr value_type combine_impl(value_type const& a,
                                             value_type const& b,
                                             std::index_sequence<Is...>) {
        return value_type{S{}.combine(std::get<Is>(a), std::get<Is>(b))...};
    }
};

// ---------------------------------------------------------------------------
// optional_monoid: adjoin an identity
// ---------------------------------------------------------------------------

/// Turns semigroup S into a monoid by adjoining nullopt as identity.
template<semigroup S>
struct optional_monoid {
    using value_type = std::optional<carrier_t<S>>;

    static constexpr bool declared_associative = true;
    static constexpr bool declared_commutative = declares_commutative<S>;
    static constexpr bool declared_idempotent  = declares_idempotent<S>;

    static constexpr value_type combine(value_type const& a, value_type const& b) {
        if (a && b) return value_type{S{}.combine(*a, *b)};
        return a ? a : b;
    }

    static constexpr value_type identity() noexcept { return std::nullopt; }
};

// ---------------------------------------------------------------------------
// map_monoid: key-wise merge
// ---------------------------------------------------------------------------

/// {key -> value} is a monoid whenever the values form a semigroup.
template<typename K, semigroup S, typename Hash = std::hash<K>>
struct map_monoid {
    using key_type   = K;
    using value_type = std::unordered_map<K, carrier_t<S>, Hash>;

    static constexpr bool declared_associative = true;
    static constexpr bool declared_commutative = declares_commutative<S>;
    static constexpr bool declared_idempotent  = declares_idempotent<S>;

    static value_type combine(value_type const& a, value_type const& b) {
        value_type out = a;
        for (auto const& [k, v] : b) {
            auto [it, inserted] = out.try_emplace(k, v);
            if (!inserted) {
                it->second = S{}.combine(it->second, v);
            }
        }
        return out;
    }

    static value_type identity() { return value_type{}; }
};

}  // namespace lawful::algebra

#endif  // LAWFUL_ALGEBRA_INSTANCES_H
