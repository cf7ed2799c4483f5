#pragma once

/**
 * Arbor Threading Utilities
 *
 * Fork-join helpers: OpenMP when available, otherwise plain std::thread
 * workers started per call.
 */

#include <cstddef>
#include <functional>

namespace arbor {
namespace threading {

// Run body(i) for every i in [begin, end); returns when all calls finished.
// The first exception thrown by body is rethrown after the others complete.
void parallel_for(size_t begin, size_t end, std::function<void(size_t)> body);

// parallel_for on n_threads std::thread workers (0 = hardware concurrency)
void run_on_threads(size_t begin, size_t end, size_t n_threads,
                    const std::function<void(size_t)>& body);

// n <= 0 restores the hardware default
void set_num_threads(int n);

} // namespace threading
} // namespace arbor
