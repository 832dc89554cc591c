#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <exception>
#include <mutex>
#include <thread>
#include <vector>

namespace speckle_track::core {

// Clamp a configured worker count to the hardware and to the number of tasks.
inline int compute_worker_count(int requested, size_t task_count) {
    int workers = std::max(1, requested);
    int cpu_cores = static_cast<int>(std::thread::hardware_concurrency());
    if (cpu_cores > 0) {
        workers = std::min(workers, cpu_cores);
    }
    if (task_count > 0) {
        workers = std::min(workers, static_cast<int>(std::max<size_t>(1, task_count)));
    }
    return std::max(1, workers);
}

namespace detail {

template <typename Worker>
void run_workers(int n_workers, Worker&& worker) {
    std::mutex error_mutex;
    std::exception_ptr first_error;

    auto guarded = [&](int w) {
        try {
            worker(w);
        } catch (...) {
            std::lock_guard<std::mutex> lock(error_mutex);
            if (!first_error) {
                first_error = std::current_exception();
            }
        }
    };

    if (n_workers > 1) {
        std::vector<std::thread> threads;
        threads.reserve(static_cast<size_t>(n_workers));
        for (int w = 0; w < n_workers; ++w) {
            threads.emplace_back(guarded, w);
        }
        for (auto& t : threads) {
            if (t.joinable()) {
                t.join();
            }
        }
    } else {
        guarded(0);
    }

    if (first_error) {
        std::rethrow_exception(first_error);
    }
}

} // namespace detail

// Dynamic scheduling: workers pull indices [0, n) from a shared counter.
// fn(index) must only write state owned by that index.
template <typename Fn>
void parallel_for(size_t n, int workers, Fn&& fn) {
    if (n == 0) return;
    const int n_workers = compute_worker_count(workers, n);
    std::atomic<size_t> next{0};
    std::atomic<bool> failed{false};

    detail::run_workers(n_workers, [&](int) {
        try {
            while (!failed.load(std::memory_order_relaxed)) {
                const size_t i = next.fetch_add(1);
                if (i >= n) {
                    break;
                }
                fn(i);
            }
        } catch (...) {
            failed.store(true, std::memory_order_relaxed);
            throw;
        }
    });
}

// Static partitioning: worker w receives the contiguous range [begin, end).
// Partition boundaries depend only on n and the worker count, so per-worker
// accumulators merged in worker order give reproducible sums.
template <typename Fn>
void parallel_for_static(size_t n, int workers, Fn&& fn) {
    if (n == 0) return;
    const int n_workers = compute_worker_count(workers, n);

    detail::run_workers(n_workers, [&](int w) {
        const size_t begin = n * static_cast<size_t>(w) / static_cast<size_t>(n_workers);
        const size_t end = n * static_cast<size_t>(w + 1) / static_cast<size_t>(n_workers);
        if (begin < end) {
            fn(w, begin, end);
        }
    });
}

inline int static_partition_count(size_t n, int workers) {
    return n == 0 ? 0 : compute_worker_count(workers, n);
}

} // namespace speckle_track::core
