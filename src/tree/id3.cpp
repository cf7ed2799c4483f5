/**
 * Arbor ID3 Decision Tree Implementation
 */

#include "arbor/id3.hpp"

namespace arbor {

ID3Tree::ID3Tree(Config config) : DecisionTree(std::move(config)) {}

std::string ID3Tree::model_name() const {
    return "DecisionTree_ID3_" + std::to_string(config_.tree.height);
}

SplitInfo ID3Tree::find_split(
    const SplitFinder& finder,
    const std::vector<Index>& rows,
    const std::vector<FeatureIndex>& columns
) const {
    return finder.find_best_split(rows, columns, false);
}

std::vector<std::pair<int, std::vector<Index>>> ID3Tree::partition(
    const Dataset& data,
    const TreeNode& node,
    const std::vector<Index>& rows
) const {
    return partition_by_value(data, node.feature, rows);
}

bool ID3Tree::splits_by_threshold(const Dataset&, FeatureIndex) const {
    return false;
}

} // namespace arbor
