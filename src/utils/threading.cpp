/**
 * Arbor Threading Utilities
 */

#include "arbor/threading.hpp"
#include <algorithm>
#include <atomic>
#include <exception>
#include <mutex>
#include <thread>
#include <vector>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace arbor {
namespace threading {

namespace {

size_t hardware_threads() {
    const unsigned n = std::thread::hardware_concurrency();
    return n > 0 ? n : 1;
}

#ifndef _OPENMP
std::atomic<size_t> worker_count{0};
#endif

// Keeps the first exception raised by any iteration
class FirstError {
public:
    void capture() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!error_) error_ = std::current_exception();
    }

    void rethrow() const {
        if (error_) std::rethrow_exception(error_);
    }

private:
    std::mutex mutex_;
    std::exception_ptr error_;
};

} // namespace

// ============================================================================
// Parallel For
// ============================================================================

void run_on_threads(size_t begin, size_t end, size_t n_threads,
                    const std::function<void(size_t)>& body) {
    if (begin >= end) return;
    if (n_threads == 0) n_threads = hardware_threads();
    n_threads = std::min(n_threads, end - begin);

    std::atomic<size_t> next{begin};
    FirstError error;
    auto work = [&] {
        for (size_t i = next++; i < end; i = next++) {
            try {
                body(i);
            } catch (...) {
                error.capture();
            }
        }
    };

    std::vector<std::thread> workers;
    workers.reserve(n_threads - 1);
    for (size_t t = 1; t < n_threads; ++t) {
        workers.emplace_back(work);
    }
    work();
    for (auto& worker : workers) {
        worker.join();
    }
    error.rethrow();
}

void parallel_for(size_t begin, size_t end, std::function<void(size_t)> body) {
    #ifdef _OPENMP
    FirstError error;
    const long long first = static_cast<long long>(begin);
    const long long last = static_cast<long long>(end);
    #pragma omp parallel for schedule(dynamic)
    for (long long i = first; i < last; ++i) {
        try {
            body(static_cast<size_t>(i));
        } catch (...) {
            error.capture();
        }
    }
    error.rethrow();
    #else
    run_on_threads(begin, end, worker_count.load(), body);
    #endif
}

void set_num_threads(int n) {
    #ifdef _OPENMP
    omp_set_num_threads(n > 0 ? n : static_cast<int>(hardware_threads()));
    #else
    worker_count = n > 0 ? static_cast<size_t>(n) : 0;
    #endif
}

} // namespace threading
} // namespace arbor
