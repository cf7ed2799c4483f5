#pragma once

/**
 * Arbor: Decision Trees and Tree Ensembles
 *
 * Information-gain decision trees for k-class classification:
 * - ID3Tree: categorical columns, one branch per value
 * - C45Tree: adds binary threshold splits on continuous columns
 * - Post-pruning of least-gain nodes
 * - BaggingTrees and RandomForest majority-vote ensembles of C4.5 trees
 *
 * Usage:
 * ```cpp
 * #include <arbor/arbor.hpp>
 *
 * arbor::Config config = arbor::Config::c45(2, {1, 2});
 * config.tree.height = 3;
 * arbor::C45Tree tree(config);
 * tree.train(X, y);
 * tree.prune();
 * arbor::Label c = tree.predict(z);
 * ```
 *
 * Ensembles:
 * ```cpp
 * arbor::Config config = arbor::Config::random_forest(7, 11);
 * config.continuous = {0, 1, 2};
 * arbor::RandomForest forest(config);
 * forest.train(X, y);
 * arbor::Labels yp = forest.predict_batch(X);
 * ```
 */

#define ARBOR_VERSION_MAJOR 0
#define ARBOR_VERSION_MINOR 1
#define ARBOR_VERSION_PATCH 0
#define ARBOR_VERSION_STRING "0.1.0"

#include "arbor/types.hpp"
#include "arbor/config.hpp"
#include "arbor/dataset.hpp"
#include "arbor/split.hpp"
#include "arbor/tree.hpp"
#include "arbor/id3.hpp"
#include "arbor/c45.hpp"
#include "arbor/pruner.hpp"
#include "arbor/ensemble.hpp"
#include <cstdio>

namespace arbor {

/**
 * Library version information
 */
struct Version {
    static constexpr int major = ARBOR_VERSION_MAJOR;
    static constexpr int minor = ARBOR_VERSION_MINOR;
    static constexpr int patch = ARBOR_VERSION_PATCH;
    static constexpr const char* string = ARBOR_VERSION_STRING;
};

/**
 * Get compile-time feature flags
 */
struct CompileFeatures {
    static constexpr bool has_openmp =
        #ifdef _OPENMP
            true;
        #else
            false;
        #endif
};

/**
 * Print library info
 */
inline void print_info() {
    std::printf("Arbor v%s\n", Version::string);
    std::printf("  OpenMP: %s\n", CompileFeatures::has_openmp ? "Yes" : "No");
}

} // namespace arbor
