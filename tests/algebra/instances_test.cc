// tests/algebra/instances_test.cc
//
// Google Tests for derived structures: product_of, optional_monoid,
// map_monoid (including maps of maps) and the Gaussian statistics monoid.
//
// Tests validate:
//   1. Lane-wise combination and identity of direct products
//   2. nullopt as the adjoined identity of optional_monoid
//   3. Key-wise merge of map_monoid, order of operands on shared keys
//   4. Gaussian merge agrees with one-pass accumulation
//   5. Sampled associativity and identity laws for every instance
//
// Copyright (c) 2025 Andrew Drakeford. All rights reserved.

#include <lawful/algebra/algebra.h>

#include <gtest/gtest.h>

#include "laws.h"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <numbers>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>
#include <tuple>
#include <unordered_map>
#include <vector>

using namespace lawful::algebra;

namespace {

auto const small_ints = [](std::mt19937& g) {
    return std::uniform_int_distribution<int>(-20, 20)(g);
};

using word_counts = map_monoid<std::string, sum_monoid<int>>;

auto const random_word_counts = [](std::mt19937& g) {
    static char const* const words[] = {"a", "b", "c", "d"};
    word_counts::value_type m;
    int const n = std::uniform_int_distribution<int>(0, 3)(g);
    for (int i = 0; i < n; ++i) {
        auto const w = words[std::uniform_int_distribution<int>(0, 3)(g)];
        m[w] += std::uniform_int_distribution<int>(1, 9)(g);
    }
    return m;
};

auto const random_gaussian = [](std::mt19937& g) {
    std::uniform_int_distribution<int> len(0, 6);
    std::uniform_real_distribution<double> x(-10.0, 10.0);
    gaussian out;
    for (int i = len(g); i > 0; --i) out += x(g);
    return out;
};

}  // namespace

// ============================================================================
// product_of
// ============================================================================

TEST(ProductOf, CombinesLaneByLane) {
    using P = product_of<sum_monoid<int>, max_monoid<double>, any_monoid>;
    static_assert(monoid<P>);
    static_assert(P::lane_count == 3);

    constexpr auto c = P::combine({1, 2.5, false}, {4, -1.0, true});
    static_assert(std::get<0>(c) == 5);
    static_assert(std::get<1>(c) == 2.5);
    static_assert(std::get<2>(c) == true);

    EXPECT_EQ(std::get<0>(c), 5);
}

TEST(ProductOf, IdentityIsTupleOfIdentities) {
    using P = product_of<sum_monoid<int>, product_monoid<int>, all_monoid>;
    constexpr auto id = P::identity();
    static_assert(id == std::tuple<int, int, bool>{0, 1, true});

    EXPECT_EQ(P::combine(id, {3, 4, false}), (std::tuple<int, int, bool>{3, 4, false}));
}

TEST(ProductOf, SemigroupFactorMakesSemigroupOnly) {
    using P = product_of<first_semigroup<int>, sum_monoid<int>>;
    static_assert(semigroup<P>);
    static_assert(!monoid<P>);

    EXPECT_EQ(P::combine({1, 10}, {2, 20}), (std::tuple<int, int>{1, 30}));
}

TEST(ProductOf, DeclaredFlagsAreConjunctions) {
    static_assert(product_of<sum_monoid<int>, min_monoid<int>>::declared_commutative);
    static_assert(!product_of<sum_monoid<int>, min_monoid<int>>::declared_idempotent);
    static_assert(product_of<min_monoid<int>, max_monoid<int>>::declared_idempotent);
    static_assert(!product_of<sum_monoid<int>, concat_monoid<std::string>>::declared_commutative);
}

TEST(ProductOf, Laws) {
    using P = product_of<sum_monoid<int>, min_monoid<int>>;
    auto gen = [](std::mt19937& g) {
        return P::value_type{small_ints(g), small_ints(g)};
    };
    EXPECT_TRUE(laws::associative(P{}, gen));
    EXPECT_TRUE(laws::monoid_identity(P{}, gen));
}

// ============================================================================
// optional_monoid
// ============================================================================

TEST(OptionalMonoid, AdjoinsIdentityToSemigroup) {
    using O = optional_monoid<min_semigroup<int>>;
    static_assert(!monoid<min_semigroup<int>>);
    static_assert(monoid<O>);
    static_assert(!O::identity().has_value());

    static_assert(O::combine(3, 5) == 3);
    static_assert(O::combine(std::nullopt, 5) == 5);
    static_assert(O::combine(4, std::nullopt) == 4);
    static_assert(!O::combine(std::nullopt, std::nullopt).has_value());

    EXPECT_EQ(O::combine(7, 2), std::optional<int>(2));
}

TEST(OptionalMonoid, KeepsOperandOrder) {
    using O = optional_monoid<first_semigroup<std::string>>;
    EXPECT_EQ(O::combine(std::string("left"), std::string("right")),
              std::optional<std::string>("left"));
    EXPECT_EQ(O::combine(std::nullopt, std::string("right")),
              std::optional<std::string>("right"));
}

TEST(OptionalMonoid, Laws) {
    using O = optional_monoid<last_semigroup<int>>;
    auto gen = [](std::mt19937& g) -> std::optional<int> {
        if (std::bernoulli_distribution(0.3)(g)) return std::nullopt;
        return small_ints(g);
    };
    EXPECT_TRUE(laws::associative(O{}, gen));
    EXPECT_TRUE(laws::monoid_identity(O{}, gen));
}

// ============================================================================
// map_monoid
// ============================================================================

TEST(MapMonoid, MergesKeys) {
    word_counts::value_type a{{"the", 2}, {"cat", 1}};
    word_counts::value_type b{{"the", 3}, {"dog", 4}};

    auto const c = word_counts::combine(a, b);
    EXPECT_EQ(c.size(), 3u);
    EXPECT_EQ(c.at("the"), 5);
    EXPECT_EQ(c.at("cat"), 1);
    EXPECT_EQ(c.at("dog"), 4);

    // Inputs are untouched.
    EXPECT_EQ(a.at("the"), 2);
    EXPECT_EQ(b.size(), 2u);
}

TEST(MapMonoid, IdentityIsEmptyMap) {
    static_assert(monoid<word_counts>);
    EXPECT_TRUE(word_counts::identity().empty());

    word_counts::value_type a{{"x", 1}};
    EXPECT_EQ(word_counts::combine(word_counts::identity(), a), a);
    EXPECT_EQ(word_counts::combine(a, word_counts::identity()), a);
}

TEST(MapMonoid, SharedKeyLeftValueOnLeft) {
    using M = map_monoid<int, concat_monoid<std::string>>;
    M::value_type a{{1, "ab"}};
    M::value_type b{{1, "cd"}};
    EXPECT_EQ(M::combine(a, b).at(1), "abcd");
    EXPECT_EQ(M::combine(b, a).at(1), "cdab");
}

TEST(MapMonoid, SemigroupValuesSuffice) {
    using M = map_monoid<char, max_semigroup<int>>;
    static_assert(monoid<M>);
    static_assert(M::declared_idempotent);

    M::value_type a{{'x', 3}, {'y', 8}};
    M::value_type b{{'x', 5}};
    auto const c = M::combine(a, b);
    EXPECT_EQ(c.at('x'), 5);
    EXPECT_EQ(c.at('y'), 8);
}

TEST(MapMonoid, ValuesMayBeProducts) {
    using M = map_monoid<char, product_of<max_monoid<double>, any_monoid>>;
    static_assert(monoid<M>);

    M::value_type a{{'p', {1.5, false}}};
    M::value_type b{{'p', {0.5, true}}, {'q', {2.0, false}}};
    auto const c = M::combine(a, b);
    EXPECT_EQ(c.at('p'), (std::tuple<double, bool>{1.5, true}));
    EXPECT_EQ(c.at('q'), (std::tuple<double, bool>{2.0, false}));
}

TEST(MapMonoid, MapsOfMaps) {
    using Inner = map_monoid<std::string, sum_monoid<int>>;
    using Outer = map_monoid<int, Inner>;
    static_assert(monoid<Outer>);

    Outer::value_type a{{2024, {{"jan", 3}, {"feb", 1}}}};
    Outer::value_type b{{2024, {{"jan", 2}}}, {2025, {{"jan", 7}}}};

    auto const c = Outer::combine(a, b);
    EXPECT_EQ(c.size(), 2u);
    EXPECT_EQ(c.at(2024).at("jan"), 5);
    EXPECT_EQ(c.at(2024).at("feb"), 1);
    EXPECT_EQ(c.at(2025).at("jan"), 7);
}

TEST(MapMonoid, Laws) {
    EXPECT_TRUE(laws::associative(word_counts{}, random_word_counts));
    EXPECT_TRUE(laws::monoid_identity(word_counts{}, random_word_counts));
    EXPECT_TRUE(laws::commutative(word_counts{}, random_word_counts));
}

// ============================================================================
// Gaussian
// ============================================================================

TEST(Gaussian, EmptyAndSinglePoint) {
    constexpr gaussian empty{};
    static_assert(empty.count() == 0);

    constexpr gaussian one_point(3.0);
    static_assert(one_point.count() == 1);
    static_assert(one_point.mean() == 3.0);
    static_assert(one_point.sum_squared_deviations() == 0.0);

    EXPECT_THROW((void)empty.variance(), std::domain_error);
    EXPECT_THROW((void)one_point.variance(), std::domain_error);
}

TEST(Gaussian, OnePassMoments) {
    std::vector<double> xs{2, 4, 4, 4, 5, 5, 7, 9};
    auto const g = gaussian::from_samples(xs);
    EXPECT_EQ(g.count(), 8u);
    EXPECT_DOUBLE_EQ(g.mean(), 5.0);
    EXPECT_NEAR(g.sum_squared_deviations(), 32.0, 1e-12);
    EXPECT_NEAR(g.variance(), 32.0 / 7.0, 1e-12);
}

TEST(Gaussian, MergedChunksEqualOnePass) {
    std::mt19937 rng(7);
    std::normal_distribution<double> dist(10.0, 3.0);
    std::vector<double> xs(1000);
    for (auto& x : xs) x = dist(rng);

    auto const whole = gaussian::from_samples(xs);

    gaussian merged;
    for (std::size_t begin = 0; begin < xs.size(); begin += 137) {
        std::size_t const end = std::min(begin + 137, xs.size());
        gaussian chunk;
        for (std::size_t i = begin; i < end; ++i) chunk += xs[i];
        merged = gaussian_monoid::combine(merged, chunk);
    }

    EXPECT_EQ(merged, whole);
    EXPECT_NEAR(merged.variance(), whole.variance(), 1e-9);
}

TEST(Gaussian, MergeWithEmptyIsNoOp) {
    constexpr auto g = gaussian(1.0) + 3.0;
    static_assert(gaussian_monoid::combine(gaussian_monoid::identity(), g).count() == 2);
    static_assert(gaussian_monoid::combine(g, gaussian{}).mean() == 2.0);

    EXPECT_EQ(gaussian::merge(gaussian{}, gaussian{}).count(), 0u);
}

TEST(Gaussian, DensityAndDistribution) {
    auto const g = gaussian::from_samples(std::vector<double>{-1.0, 1.0});
    ASSERT_DOUBLE_EQ(g.mean(), 0.0);
    ASSERT_DOUBLE_EQ(g.variance(), 2.0);

    double const v = 2.0;
    EXPECT_NEAR(g.pdf(0.0), 1.0 / std::sqrt(2.0 * std::numbers::pi * v), 1e-12);
    EXPECT_NEAR(g.cdf(0.0), 0.5, 1e-12);
    EXPECT_GT(g.cdf(1.0), 0.5);
    EXPECT_LT(g.cdf(-1.0), 0.5);
    EXPECT_NEAR(g.cdf(1.0) + g.cdf(-1.0), 1.0, 1e-12);
}

TEST(Gaussian, Laws) {
    static_assert(monoid<gaussian_monoid>);
    EXPECT_TRUE(laws::associative(gaussian_monoid{}, random_gaussian));
    EXPECT_TRUE(laws::monoid_identity(gaussian_monoid{}, random_gaussian));
    EXPECT_TRUE(laws::commutative(gaussian_monoid{}, random_gaussian));
}
