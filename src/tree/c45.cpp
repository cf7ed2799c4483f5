/**
 * Arbor C4.5 Decision Tree Implementation
 */

#include "arbor/c45.hpp"

namespace arbor {

C45Tree::C45Tree(Config config) : DecisionTree(std::move(config)) {}

std::string C45Tree::model_name() const {
    return "DecisionTree_C45_" + std::to_string(config_.tree.height);
}

SplitInfo C45Tree::find_split(
    const SplitFinder& finder,
    const std::vector<Index>& rows,
    const std::vector<FeatureIndex>& columns
) const {
    return finder.find_best_split(rows, columns, true);
}

std::vector<std::pair<int, std::vector<Index>>> C45Tree::partition(
    const Dataset& data,
    const TreeNode& node,
    const std::vector<Index>& rows
) const {
    if (!node.threshold) {
        return partition_by_value(data, node.feature, rows);
    }

    const Float thr = *node.threshold;
    std::vector<Index> below, above;
    for (Index i : rows) {
        if (data.value(i, node.feature) <= thr) {
            below.push_back(i);
        } else {
            above.push_back(i);
        }
    }

    std::vector<std::pair<int, std::vector<Index>>> groups;
    groups.emplace_back(0, std::move(below));
    groups.emplace_back(1, std::move(above));
    return groups;
}

bool C45Tree::splits_by_threshold(const Dataset& data, FeatureIndex f) const {
    return data.is_continuous(f);
}

} // namespace arbor
