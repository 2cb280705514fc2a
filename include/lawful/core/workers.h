// core/workers.h — Fork/join over contiguous index ranges
// Part of the lawful algebra library (C++20)
//
// DESIGN RATIONALE:
// Associativity lets a reduction be split into contiguous chunks whose
// partial results are combined afterwards in chunk order.  The chunks have
// no interdependency until that final combine, so the simplest correct
// machinery is: fork one std::thread per chunk, join them all, then read
// the per-chunk results.  No pool, no queue, no locks.
//
// Rules every caller follows:
// - task i reads only its own input slice plus immutable shared state
// - task i writes only slot i of a pre-sized result vector
// - results are consumed on the calling thread after fork_join returns
//
// Task 0 runs on the calling thread.  An exception escaping a task is
// captured as a std::exception_ptr in that task's slot and rethrown on the
// calling thread after every worker has joined (the lowest slot wins).

#ifndef LAWFUL_CORE_WORKERS_H
#define LAWFUL_CORE_WORKERS_H

#include <algorithm>
#include <cstddef>
#include <exception>
#include <thread>
#include <utility>
#include <vector>

namespace lawful {

// =========================================================================
// Range partitioning
// =========================================================================

/// Half-open index range [first, last).
struct index_range {
    std::size_t first = 0;
    std::size_t last = 0;

    [[nodiscard]] constexpr std::size_t size() const noexcept {
        return last - first;
    }
    [[nodiscard]] constexpr bool empty() const noexcept {
        return first == last;
    }
};

/// The i-th of `parts` contiguous, near-equal slices of [0, n).
/// The first n % parts slices are one element longer.
[[nodiscard]] constexpr index_range
partition_range(std::size_t n, std::size_t parts, std::size_t i) noexcept {
    std::size_t const base = n / parts;
    std::size_t const extra = n % parts;
    std::size_t const first = i * base + std::min(i, extra);
    return {first, first + base + (i < extra ? 1 : 0)};
}

/// Resolve a requested worker count: 0 means one per hardware thread.
/// Never more workers than tasks, never fewer than one.
[[nodiscard]] inline std::size_t
resolve_workers(std::size_t requested, std::size_t tasks) noexcept {
    std::size_t w = requested;
    if (w == 0) {
        w = std::thread::hardware_concurrency();
    }
    w = std::min(w, tasks);
    return w == 0 ? 1 : w;
}

// =========================================================================
// fork_join
// =========================================================================

namespace detail {

// Joins every started thread on scope exit, including during unwinding
// from a failed std::thread construction.
class thread_group {
public:
    explicit thread_group(std::size_t capacity) { threads_.reserve(capacity); }

    thread_group(thread_group const&) = delete;
    thread_group& operator=(thread_group const&) = delete;

    ~thread_group() { join_all(); }

    template<typename F>
    void spawn(F&& f) {
        threads_.emplace_back(std::forward<F>(f));
    }

    void join_all() noexcept {
        for (auto& t : threads_) {
            if (t.joinable()) t.join();
        }
    }

    [[nodiscard]] std::size_t size() const noexcept { return threads_.size(); }

private:
    std::vector<std::thread> threads_;
};

} // namespace detail

/// Run task(i) for every i in [0, tasks), tasks 1..n-1 on their own
/// threads and task 0 on the caller, then join.
///
/// Returns the number of threads forked (tasks - 1, or 0 when tasks <= 1).
/// Rethrows the first captured task exception after the join.
template<typename Task>
std::size_t fork_join(std::size_t tasks, Task const& task) {
    if (tasks == 0) {
        return 0;
    }
    if (tasks == 1) {
        task(std::size_t{0});
        return 0;
    }

    std::vector<std::exception_ptr> errors(tasks);
    std::size_t forked = 0;
    {
        detail::thread_group group(tasks - 1);
        for (std::size_t i = 1; i < tasks; ++i) {
            group.spawn([&task, &errors, i] {
                try {
                    task(i);
                } catch (...) {
                    errors[i] = std::current_exception();
                }
            });
        }
        forked = group.size();

        try {
            task(std::size_t{0});
        } catch (...) {
            errors[0] = std::current_exception();
        }
    }  // join barrier

    for (auto const& e : errors) {
        if (e) std::rethrow_exception(e);
    }
    return forked;
}

} // namespace lawful

#endif // LAWFUL_CORE_WORKERS_H
