// tests/core/core_test.cc
//
// Google Tests for the lawful core layer.
//
// Tests matrix, the contract-violation errors and their guards, range
// partitioning, fork_join and the statistics aggregates.  Compile-time
// correctness is checked with static_assert where the code is constexpr.
//
// Copyright (c) 2025 Andrew Drakeford. All rights reserved.

#include <lawful/core/error.h>
#include <lawful/core/matrix.h>
#include <lawful/core/stats.h>
#include <lawful/core/workers.h>

#include <gtest/gtest.h>

#include <atomic>
#include <cstddef>
#include <numeric>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

using namespace lawful;

// ============================================================================
// matrix: construction and shape
// ============================================================================

TEST(Matrix, DefaultIsEmpty) {
    matrix<int> m;
    EXPECT_TRUE(m.empty());
    EXPECT_EQ(m.rows(), 0u);
    EXPECT_EQ(m.cols(), 0u);
    EXPECT_TRUE(m.is_square());
}

TEST(Matrix, FillConstruction) {
    matrix<double> m(3, 4, 1.5);
    EXPECT_EQ(m.rows(), 3u);
    EXPECT_EQ(m.cols(), 4u);
    EXPECT_EQ(m.size(), 12u);
    EXPECT_FALSE(m.is_square());
    for (double x : m) EXPECT_DOUBLE_EQ(x, 1.5);
}

TEST(Matrix, SquareFactory) {
    auto m = matrix<int>::square(5, 7);
    EXPECT_TRUE(m.is_square());
    EXPECT_EQ(m.rows(), 5u);
    EXPECT_EQ(m(4, 4), 7);
}

TEST(Matrix, NestedRowsAreRowMajor) {
    matrix<int> m{{1, 2, 3},
                  {4, 5, 6}};
    EXPECT_EQ(m.rows(), 2u);
    EXPECT_EQ(m.cols(), 3u);
    EXPECT_EQ(m(0, 2), 3);
    EXPECT_EQ(m(1, 0), 4);

    std::vector<int> flat(m.begin(), m.end());
    EXPECT_EQ(flat, (std::vector<int>{1, 2, 3, 4, 5, 6}));

    std::vector<int> row1(m.row_begin(1), m.row_end(1));
    EXPECT_EQ(row1, (std::vector<int>{4, 5, 6}));
}

TEST(Matrix, FromVectorOfRows) {
    std::vector<std::vector<long>> rows{{1, 0}, {0, 1}};
    matrix<long> m(rows);
    EXPECT_EQ(m.rows(), 2u);
    EXPECT_EQ(m(1, 1), 1);
}

TEST(Matrix, RaggedRowsRejected) {
    EXPECT_THROW((matrix<int>{{1, 2, 3}, {4, 5}}), dimension_mismatch);

    std::vector<std::vector<int>> rows{{1}, {2, 3}};
    EXPECT_THROW((void)matrix<int>(rows), dimension_mismatch);
}

TEST(Matrix, CheckedAccess) {
    matrix<int> m(2, 3, 0);
    m.at(1, 2) = 9;
    EXPECT_EQ(m(1, 2), 9);
    EXPECT_THROW((void)m.at(2, 0), std::out_of_range);
    EXPECT_THROW((void)m.at(0, 3), std::out_of_range);

    matrix<int> const& cm = m;
    EXPECT_EQ(cm.at(1, 2), 9);
    EXPECT_THROW((void)cm.at(5, 5), std::out_of_range);
}

TEST(Matrix, BoolCellsAreWritable) {
    matrix<bool> m(2, 2, false);
    m(0, 1) = true;
    EXPECT_TRUE(m(0, 1));
    EXPECT_FALSE(m(1, 0));
}

TEST(Matrix, EqualityComparesShapeAndCells) {
    matrix<int> a(2, 3, 0);
    matrix<int> b(3, 2, 0);
    matrix<int> c(2, 3, 0);
    EXPECT_FALSE(a == b);  // same cell count, different shape
    EXPECT_TRUE(a == c);
    c(0, 0) = 1;
    EXPECT_FALSE(a == c);
}

// ============================================================================
// Errors and guards
// ============================================================================

TEST(Errors, KindsAndNames) {
    static_assert(empty_reduction::kind() == error_kind::empty_reduction);
    static_assert(dimension_mismatch::kind() == error_kind::dimension_mismatch);
    static_assert(to_string(error_kind::empty_reduction) == "empty_reduction");
    static_assert(to_string(error_kind::dimension_mismatch) == "dimension_mismatch");

    EXPECT_EQ(to_string(error_kind::dimension_mismatch), "dimension_mismatch");
}

TEST(Errors, StandardHierarchy) {
    static_assert(std::is_base_of_v<std::logic_error, empty_reduction>);
    static_assert(std::is_base_of_v<std::length_error, dimension_mismatch>);

    try {
        throw dimension_mismatch("close: relation is not square");
    } catch (std::logic_error const& e) {
        EXPECT_EQ(std::string(e.what()), "close: relation is not square");
    }
}

TEST(Errors, RequireNonempty) {
    EXPECT_NO_THROW(require_nonempty(1, "x"));
    EXPECT_THROW(require_nonempty(0, "x"), empty_reduction);
}

TEST(Errors, RequireSquareAndExtent) {
    EXPECT_NO_THROW(require_square(4, 4, "x"));
    EXPECT_THROW(require_square(3, 4, "x"), dimension_mismatch);
    EXPECT_NO_THROW(require_extent(2, 2, "x"));
    EXPECT_THROW(require_extent(2, 5, "x"), dimension_mismatch);
}

// Guards are constexpr: a passing check is usable in a constant expression.
constexpr int guarded_square(int n) {
    require_square(static_cast<std::size_t>(n), static_cast<std::size_t>(n), "x");
    return n * n;
}
static_assert(guarded_square(3) == 9);

// ============================================================================
// partition_range / resolve_workers
// ============================================================================

TEST(Partition, CoversRangeContiguously) {
    static_assert(partition_range(10, 3, 0).first == 0);
    static_assert(partition_range(10, 3, 0).size() == 4);
    static_assert(partition_range(10, 3, 1).size() == 3);
    static_assert(partition_range(10, 3, 2).last == 10);

    for (std::size_t n : {0u, 1u, 7u, 64u, 1001u}) {
        for (std::size_t parts : {1u, 2u, 3u, 8u}) {
            std::size_t expected_first = 0;
            for (std::size_t i = 0; i < parts; ++i) {
                auto const r = partition_range(n, parts, i);
                EXPECT_EQ(r.first, expected_first);
                EXPECT_LE(r.size(), n / parts + 1);
                expected_first = r.last;
            }
            EXPECT_EQ(expected_first, n);
        }
    }
}

TEST(Partition, MorePartsThanElements) {
    EXPECT_EQ(partition_range(2, 4, 0).size(), 1u);
    EXPECT_EQ(partition_range(2, 4, 1).size(), 1u);
    EXPECT_TRUE(partition_range(2, 4, 2).empty());
    EXPECT_TRUE(partition_range(2, 4, 3).empty());
}

TEST(ResolveWorkers, CapsAndDefaults) {
    EXPECT_EQ(resolve_workers(4, 100), 4u);
    EXPECT_EQ(resolve_workers(8, 3), 3u);
    EXPECT_EQ(resolve_workers(4, 0), 1u);
    EXPECT_EQ(resolve_workers(1, 100), 1u);

    std::size_t const hw = resolve_workers(0, 1000000);
    EXPECT_GE(hw, 1u);
}

// ============================================================================
// fork_join
// ============================================================================

TEST(ForkJoin, RunsEveryTaskOnce) {
    constexpr std::size_t tasks = 6;
    std::vector<int> hits(tasks, 0);
    std::size_t const forked = fork_join(tasks, [&](std::size_t i) { ++hits[i]; });

    EXPECT_EQ(forked, tasks - 1);
    EXPECT_EQ(hits, std::vector<int>(tasks, 1));
}

TEST(ForkJoin, SingleTaskStaysOnCaller) {
    std::atomic<int> calls{0};
    EXPECT_EQ(fork_join(1, [&](std::size_t) { ++calls; }), 0u);
    EXPECT_EQ(calls.load(), 1);

    EXPECT_EQ(fork_join(0, [&](std::size_t) { ++calls; }), 0u);
    EXPECT_EQ(calls.load(), 1);
}

TEST(ForkJoin, PrivateSlotsSumToWhole) {
    std::vector<int> xs(1000);
    std::iota(xs.begin(), xs.end(), 1);

    constexpr std::size_t tasks = 4;
    std::vector<long> partial(tasks, 0);
    fork_join(tasks, [&](std::size_t t) {
        auto const r = partition_range(xs.size(), tasks, t);
        for (std::size_t i = r.first; i < r.last; ++i) partial[t] += xs[i];
    });

    EXPECT_EQ(std::accumulate(partial.begin(), partial.end(), 0L), 500500L);
}

TEST(ForkJoin, WorkerExceptionRethrownAfterJoin) {
    std::atomic<int> finished{0};
    EXPECT_THROW(
        fork_join(4, [&](std::size_t i) {
            if (i == 2) throw std::runtime_error("task 2 failed");
            ++finished;
        }),
        std::runtime_error);
    // The other three tasks still ran to completion before the rethrow.
    EXPECT_EQ(finished.load(), 3);
}

TEST(ForkJoin, LowestFailingSlotWins) {
    try {
        fork_join(3, [](std::size_t i) {
            throw std::runtime_error("task " + std::to_string(i));
        });
        FAIL() << "expected an exception";
    } catch (std::runtime_error const& e) {
        EXPECT_EQ(std::string(e.what()), "task 0");
    }
}

// ============================================================================
// Statistics
// ============================================================================

TEST(Stats, ZeroInitialised) {
    constexpr reduce_stats rs{};
    static_assert(rs.combines == 0 && rs.workers == 0);
    constexpr closure_stats cs{};
    static_assert(cs.passes == 0 && !cs.stopped_early);
}

TEST(Stats, ReduceStatsAggregate) {
    constexpr reduce_stats a{.strategy = reduce_strategy::parallel_chunks,
                             .elements = 10, .combines = 9, .chunks = 2, .workers = 1};
    constexpr reduce_stats b{.strategy = reduce_strategy::sequential,
                             .elements = 5, .combines = 4, .chunks = 1, .workers = 0};
    constexpr auto sum = a + b;
    static_assert(sum.elements == 15);
    static_assert(sum.combines == 13);
    static_assert(sum.chunks == 3);
    static_assert(sum.workers == 1);
    static_assert(sum.strategy == reduce_strategy::parallel_chunks);

    EXPECT_EQ(sum.combines, 13u);
}

TEST(Stats, ClosureStatsAggregate) {
    closure_stats a{};
    a.nodes = 4;
    a.passes = 4;
    a.cell_updates = 7;
    closure_stats b{};
    b.nodes = 6;
    b.passes = 2;
    b.passes_skipped = 1;
    b.stopped_early = true;

    auto const sum = a + b;
    EXPECT_EQ(sum.nodes, 6u);
    EXPECT_EQ(sum.passes, 6u);
    EXPECT_EQ(sum.passes_skipped, 1u);
    EXPECT_EQ(sum.cell_updates, 7u);
    EXPECT_TRUE(sum.stopped_early);
}
