#pragma once

/**
 * Arbor ID3 Decision Tree
 *
 * Every column is categorical: a node splits into one branch per distinct
 * training value of the feature with maximal information gain.
 */

#include "tree.hpp"

namespace arbor {

class ID3Tree : public DecisionTree {
public:
    explicit ID3Tree(Config config = Config::id3());

    std::string model_name() const override;

protected:
    SplitInfo find_split(
        const SplitFinder& finder,
        const std::vector<Index>& rows,
        const std::vector<FeatureIndex>& columns
    ) const override;

    std::vector<std::pair<int, std::vector<Index>>> partition(
        const Dataset& data,
        const TreeNode& node,
        const std::vector<Index>& rows
    ) const override;

    bool splits_by_threshold(const Dataset& data, FeatureIndex f) const override;
};

} // namespace arbor
