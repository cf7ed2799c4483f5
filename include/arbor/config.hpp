#pragma once

/**
 * Arbor Configuration
 *
 * Hyperparameters for decision trees, pruning and tree ensembles.
 * A Config is an immutable value: every model takes its own copy at
 * construction and validates it there.
 */

#include "types.hpp"
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace arbor {

// ============================================================================
// Tree Configuration
// ============================================================================

struct TreeConfig {
    int32_t height = 4;                        // Max edges on a root-to-leaf path
    Float cutoff = 0.01;                       // Stop splitting at or below this entropy
};

// ============================================================================
// Pruning Configuration
// ============================================================================

struct PruneConfig {
    int32_t n_prune = 1;                       // Pruning iterations
    Float threshold = 0.98;                    // Collapse a candidate if its gain is below this
};

// ============================================================================
// Ensemble Configuration
// ============================================================================

struct EnsembleConfig {
    int32_t n_trees = 11;                      // Number of trees (odd avoids two-class ties)
    Float b_ratio = 0.7;                       // Row bagging fraction, in (0, 1)
    Float fb_ratio = 0.7;                      // Column bagging fraction (random forest), in (0, 1)
};

// ============================================================================
// Main Configuration
// ============================================================================

struct Config {
    uint32_t n_classes = 2;
    std::vector<std::string> class_names = {"No", "Yes"};
    std::vector<std::string> feature_names;    // Empty => x0, x1, ...
    std::set<FeatureIndex> continuous;         // Columns split by threshold (C4.5)

    TreeConfig tree;
    PruneConfig prune;
    EnsembleConfig ensemble;

    // Verbosity and logging
    int32_t verbosity = 0;                     // 0=silent, 1=progress, 2=debug

    // Tree l of an ensemble draws from stream seed + l
    uint64_t seed = 0;

    int32_t n_threads = -1;                    // Ensemble build threads (-1 = auto)

    // ========================================================================
    // Factory Methods
    // ========================================================================

    static Config id3(uint32_t num_classes = 2) {
        Config cfg;
        cfg.set_classes(num_classes);
        return cfg;
    }

    static Config c45(uint32_t num_classes = 2, std::set<FeatureIndex> conts = {}) {
        Config cfg;
        cfg.set_classes(num_classes);
        cfg.continuous = std::move(conts);
        return cfg;
    }

    static Config bagging(uint32_t num_classes = 2, int32_t n_trees = 11) {
        Config cfg;
        cfg.set_classes(num_classes);
        cfg.ensemble.n_trees = n_trees;
        return cfg;
    }

    static Config random_forest(uint32_t num_classes = 2, int32_t n_trees = 11) {
        return bagging(num_classes, n_trees);
    }

    // Keep the default class names only when they still match k
    void set_classes(uint32_t num_classes) {
        n_classes = num_classes;
        if (class_names.size() != num_classes) {
            class_names.clear();
        }
    }

    std::string class_name(Label c) const {
        if (c >= 0 && static_cast<size_t>(c) < class_names.size()) {
            return class_names[c];
        }
        return "c" + std::to_string(c);
    }

    // ========================================================================
    // Validation
    // ========================================================================

    void validate() const {
        if (n_classes < 2) {
            throw std::invalid_argument("n_classes must be at least 2");
        }
        if (!class_names.empty() && class_names.size() != n_classes) {
            throw std::invalid_argument("number of class names (" + std::to_string(class_names.size()) +
                                        ") != number of classes (" + std::to_string(n_classes) + ")");
        }
        if (tree.height < 0) {
            throw std::invalid_argument("height cannot be negative");
        }
        if (tree.cutoff < 0 || tree.cutoff > 1) {
            throw std::invalid_argument("cutoff must be in [0, 1]");
        }
        if (prune.n_prune < 0) {
            throw std::invalid_argument("n_prune cannot be negative");
        }
        for (FeatureIndex j : continuous) {
            if (j < 0) {
                throw std::invalid_argument("continuous feature index cannot be negative");
            }
        }
    }

    // Ensembles additionally check the bagging parameters
    void validate_ensemble(bool feature_bagging) const {
        validate();
        if (ensemble.n_trees <= 0) {
            throw std::invalid_argument("number of trees must be at least one");
        }
        if (ensemble.b_ratio <= 0 || ensemble.b_ratio >= 1) {
            throw std::invalid_argument("bagging ratio b_ratio restricted to (0, 1)");
        }
        if (feature_bagging && (ensemble.fb_ratio <= 0 || ensemble.fb_ratio >= 1)) {
            throw std::invalid_argument("feature bagging ratio fb_ratio restricted to (0, 1)");
        }
    }
};

} // namespace arbor
