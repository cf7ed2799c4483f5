#pragma once

/**
 * Arbor C4.5 Decision Tree
 *
 * ID3 extended with continuous columns (Config::continuous): such a column
 * splits into branch 0 (value <= threshold) and branch 1 (value > threshold),
 * with the threshold searched anew at every node.
 */

#include "tree.hpp"

namespace arbor {

class C45Tree : public DecisionTree {
public:
    explicit C45Tree(Config config = Config::c45());

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
