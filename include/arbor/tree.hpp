#pragma once

/**
 * Arbor Decision Tree Structure
 *
 * Arena of TreeNode addressed by NodeIndex. The tree owns its nodes; a node
 * refers to its children through its branch map and to its parent through
 * an optional index. Induction (ID3, C4.5) is supplied by subclasses through
 * find_split() and partition(); everything else lives here:
 * - Attaching nodes and tracking the leaf set
 * - Recursive growth with height and entropy cutoffs
 * - Prediction with majority fallback on unseen branch values
 * - Weighted leaf entropy, pruning candidates, printing, persistence
 */

#include "types.hpp"
#include "config.hpp"
#include "classifier.hpp"
#include "dataset.hpp"
#include "split.hpp"
#include <iosfwd>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace arbor {

class DecisionTree : public Classifier {
public:
    explicit DecisionTree(Config config);

    // ========================================================================
    // Training
    // ========================================================================

    // Rebuilds the tree from scratch
    void train(const Matrix& x, const Labels& y) override;
    void train(const Dataset& data);

    // ========================================================================
    // Prediction
    // ========================================================================

    Frequency class_counts(const Vector& z) const override;
    Label predict(const Vector& z) const override;

    /**
     * Node a query ends on: a leaf, or the internal node whose branch for
     * the query's value does not exist.
     */
    NodeIndex descend(const Vector& z) const;

    // ========================================================================
    // Structure
    // ========================================================================

    NodeIndex add_root(TreeNode node);
    NodeIndex add(NodeIndex parent, int branch_value, TreeNode child);

    /**
     * Turn an internal node into a leaf, dropping its descendants from the
     * leaf set. Returns false if the node already is a leaf.
     */
    bool make_leaf(NodeIndex n);

    bool leaf_children(NodeIndex n) const;

    // Parents of leaves whose children are all leaves, in index order
    std::vector<NodeIndex> candidates() const;

    // Candidate with the least gain (first on ties)
    std::optional<std::pair<NodeIndex, Float>> best_candidate(
        const std::vector<NodeIndex>& can) const;

    // ========================================================================
    // Pruning
    // ========================================================================

    /**
     * Collapse up to n_prune least-gain candidates whose gain is below
     * threshold. Returns the number of nodes turned into leaves.
     */
    Index prune(int32_t n_prune, Float threshold);
    Index prune() { return prune(config_.prune.n_prune, config_.prune.threshold); }

    // ========================================================================
    // Entropy
    // ========================================================================

    // Size-weighted mean entropy of the leaves
    Float calc_entropy() const;
    Float calc_entropy(const std::vector<NodeIndex>& nodes) const;

    // ========================================================================
    // Access Tree Structure
    // ========================================================================

    const std::vector<TreeNode>& nodes() const { return nodes_; }
    const TreeNode& node(NodeIndex n) const { return nodes_[n]; }
    std::optional<NodeIndex> root() const { return root_; }
    const std::set<NodeIndex>& leaves() const { return leaves_; }

    Index n_leaves() const { return static_cast<Index>(leaves_.size()); }
    Index n_nodes() const;               // Reachable from the root
    int32_t height() const;              // Edges on the longest root-to-leaf path
    int32_t depth(NodeIndex n) const;

    FeatureIndex n_features() const { return static_cast<FeatureIndex>(feature_names_.size()); }
    const std::vector<std::string>& feature_names() const { return feature_names_; }

    // Split features in the order the nodes were created
    const std::vector<FeatureIndex>& feature_order() const { return feature_order_; }

    // Distinct values per training column (0 for continuous columns)
    const std::vector<Index>& value_counts() const { return value_counts_; }

    bool is_trained() const override { return root_.has_value(); }

    // ========================================================================
    // Output
    // ========================================================================

    void print_tree(std::ostream& out) const;
    std::string to_string() const;
    std::string describe(NodeIndex n) const;

    // ========================================================================
    // Serialization
    // ========================================================================

    void save(std::ostream& out) const;
    void load(std::istream& in);

protected:
    /**
     * Best split of rows over the available columns
     */
    virtual SplitInfo find_split(
        const SplitFinder& finder,
        const std::vector<Index>& rows,
        const std::vector<FeatureIndex>& columns
    ) const = 0;

    /**
     * Rows of an internal node grouped by branch value, ascending
     */
    virtual std::vector<std::pair<int, std::vector<Index>>> partition(
        const Dataset& data,
        const TreeNode& node,
        const std::vector<Index>& rows
    ) const = 0;

    // Whether a column splits in two at a threshold rather than by value
    virtual bool splits_by_threshold(const Dataset& data, FeatureIndex f) const = 0;

    // Group rows by the (integer) value of a categorical feature
    std::vector<std::pair<int, std::vector<Index>>> partition_by_value(
        const Dataset& data,
        FeatureIndex feature,
        const std::vector<Index>& rows
    ) const;

private:
    std::vector<TreeNode> nodes_;
    std::optional<NodeIndex> root_;
    std::set<NodeIndex> leaves_;

    std::vector<std::string> feature_names_;
    std::vector<FeatureIndex> feature_order_;
    std::vector<Index> value_counts_;

    void clear();

    std::optional<NodeIndex> build_recursive(
        const Dataset& data,
        const SplitFinder& finder,
        const std::vector<Index>& rows,
        const std::vector<FeatureIndex>& columns,
        std::optional<NodeIndex> parent,
        int branch_value,
        int32_t current_depth
    );

    void print_recursive(std::ostream& out, NodeIndex n, int level) const;
};

} // namespace arbor
