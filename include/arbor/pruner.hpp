#pragma once

/**
 * Arbor Post-Pruning
 *
 * Bottom-up pruning: repeatedly collapse the least-gain node whose
 * children are all leaves, while its gain stays below a threshold.
 */

#include "types.hpp"

namespace arbor {

class DecisionTree;

class Pruner {
public:
    Pruner(Float threshold, int32_t verbosity = 0);

    /**
     * Collapse the best candidate if its gain is below the threshold
     * @return true if a node was turned into a leaf
     */
    bool prune_once(DecisionTree& tree) const;

    // Up to n_prune rounds; stops at the first round that collapses nothing
    Index prune(DecisionTree& tree, int32_t n_prune) const;

    Float threshold() const { return threshold_; }

private:
    Float threshold_;
    int32_t verbosity_;
};

} // namespace arbor
