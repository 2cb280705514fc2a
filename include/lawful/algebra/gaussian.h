// lawful/algebra/gaussian.h
//
// One-dimensional Gaussian sufficient statistics as a monoid.
//
// A gaussian holds (count, mean, M2) where M2 is the sum of squared
// deviations from the mean. Two summaries of disjoint samples merge into
// the summary of their union (Chan et al. parallel variance):
//
//   n  = na + nb
//   m  = ma * na/n + mb * nb/n
//   M2 = M2a + M2b + (ma - mb)^2 * na * nb / n
//
// The merge is associative with the empty summary as identity, so a
// sample set can be summarised chunk by chunk (on any number of threads)
// and the chunk summaries reduced: the result equals the one-pass
// accumulation up to floating-point rounding. Equality therefore compares
// moments with a tolerance (numpy.isclose defaults: atol 1e-8, rtol 1e-5)
// and counts exactly.
//
// Copyright (c) 2025 Andrew Drakeford. All rights reserved.

#ifndef LAWFUL_ALGEBRA_GAUSSIAN_H
#define LAWFUL_ALGEBRA_GAUSSIAN_H

#include <cmath>
#include <cstddef>
#include <numbers>
#include <stdexcept>

namespace lawful::algebra {

class gaussian {
public:
    /// The empty distribution (identity of the merge).
    constexpr gaussian() noexcept = default;

    /// A single data point.
    constexpr explicit gaussian(double x) noexcept
        : n_(1), m1_(x), m2_(0.0) {}

    /// Accumulate every value of a range one at a time.
    template<typename Range>
    [[nodiscard]] static gaussian from_samples(Range const& xs) {
        gaussian g;
        for (auto const& x : xs) {
            g += static_cast<double>(x);
        }
        return g;
    }

    // -----------------------------------------------------------------
    // Accumulation
    // -----------------------------------------------------------------

    /// Add one data point (Welford update).
    constexpr gaussian& operator+=(double x) noexcept {
        ++n_;
        double const old_mean = m1_;
        m1_ += (x - old_mean) / static_cast<double>(n_);
        m2_ += (x - old_mean) * (x - m1_);
        return *this;
    }

    [[nodiscard]] friend constexpr gaussian operator+(gaussian g, double x) noexcept {
        g += x;
        return g;
    }

    /// Summary of the union of two disjoint sample sets.
    [[nodiscard]] static constexpr gaussian merge(gaussian const& a,
                                                  gaussian const& b) noexcept {
        std::size_t const n = a.n_ + b.n_;
        if (n == 0) {
            return gaussian{};
        }
        double const na = static_cast<double>(a.n_);
        double const nb = static_cast<double>(b.n_);
        double const nn = static_cast<double>(n);
        double const d = a.m1_ - b.m1_;

        gaussian out;
        out.n_ = n;
        out.m1_ = a.m1_ * (na / nn) + b.m1_ * (nb / nn);
        out.m2_ = a.m2_ + b.m2_ + d * d * (na * nb) / nn;
        return out;
    }

    // -----------------------------------------------------------------
    // Queries
    // -----------------------------------------------------------------

    [[nodiscard]] constexpr std::size_t count() const noexcept { return n_; }
    [[nodiscard]] constexpr double mean() const noexcept { return m1_; }
    [[nodiscard]] constexpr double sum_squared_deviations() const noexcept { return m2_; }

    /// Sample variance M2 / (n - 1).
    /// Throws std::domain_error with fewer than two samples.
    [[nodiscard]] double variance() const {
        if (n_ < 2) {
            throw std::domain_error("gaussian::variance: needs at least two samples");
        }
        return m2_ / static_cast<double>(n_ - 1);
    }

    /// Probability density at x.
    [[nodiscard]] double pdf(double x) const {
        double const v = variance();
        double const d = x - m1_;
        return std::exp(-0.5 * d * d / v) / std::sqrt(2.0 * std::numbers::pi * v);
    }

    /// Cumulative distribution at x.
    [[nodiscard]] double cdf(double x) const {
        double const v = variance();
        return 0.5 * (1.0 + std::erf((x - m1_) / std::sqrt(2.0 * v)));
    }

    // -----------------------------------------------------------------
    // Comparison
    // -----------------------------------------------------------------

    [[nodiscard]] friend bool operator==(gaussian const& a, gaussian const& b) {
        return a.n_ == b.n_ && close(a.m1_, b.m1_) && close(a.m2_, b.m2_);
    }

private:
    static bool close(double x, double y) {
        return std::abs(x - y) <= 1e-8 + 1e-5 * std::abs(y);
    }

    std::size_t n_ = 0;
    double m1_ = 0.0;
    double m2_ = 0.0;
};

/// Monoid descriptor over gaussian: combine = merge, identity = empty.
struct gaussian_monoid {
    using value_type = gaussian;

    static constexpr bool declared_associative = true;
    static constexpr bool declared_commutative = true;
    static constexpr bool declared_idempotent  = false;

    static constexpr gaussian combine(gaussian const& a, gaussian const& b) noexcept {
        return gaussian::merge(a, b);
    }

    static constexpr gaussian identity() noexcept { return gaussian{}; }
};

}  // namespace lawful::algebra

#endif  // LAWFUL_ALGEBRA_GAUSSIAN_H
