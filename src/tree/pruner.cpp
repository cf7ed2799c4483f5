/**
 * Arbor Post-Pruning Implementation
 */

#include "arbor/pruner.hpp"
#include "arbor/tree.hpp"
#include <cstdio>

namespace arbor {

Pruner::Pruner(Float threshold, int32_t verbosity)
    : threshold_(threshold), verbosity_(verbosity) {}

bool Pruner::prune_once(DecisionTree& tree) const {
    const auto can = tree.candidates();
    const auto best = tree.best_candidate(can);

    if (!best) {
        if (verbosity_ > 0) {
            std::printf("prune: no candidates left\n");
        }
        return false;
    }

    const auto [node, gain] = *best;
    if (verbosity_ > 0) {
        std::printf("prune: %zu candidates, best node %u with gain %.4f (threshold %.4f)\n",
                    can.size(), node, gain, threshold_);
    }

    if (gain >= threshold_) {
        return false;
    }

    if (verbosity_ > 1) {
        std::printf("[DEBUG] prune: entropy before %.4f\n", tree.calc_entropy());
    }
    const bool collapsed = tree.make_leaf(node);
    if (collapsed && verbosity_ > 1) {
        std::printf("[DEBUG] prune: collapsed node %u, entropy after %.4f\n",
                    node, tree.calc_entropy());
    }
    return collapsed;
}

Index Pruner::prune(DecisionTree& tree, int32_t n_prune) const {
    Index collapsed = 0;
    for (int32_t i = 0; i < n_prune; ++i) {
        if (!prune_once(tree)) break;
        ++collapsed;
    }
    return collapsed;
}

} // namespace arbor
