#pragma once

/**
 * Arbor Tree Ensembles
 *
 * BaggingTrees: n_trees C4.5 trees, each trained on floor(b_ratio * m) rows
 * drawn with replacement; prediction is a majority vote.
 *
 * RandomForest: bagging plus feature bagging. Each tree also sees only
 * floor(fb_ratio * n) columns drawn without replacement; queries are
 * projected onto a tree's columns before it votes.
 *
 * Tree l draws from its own stream seeded with config.seed + l, so the
 * ensemble does not depend on the order or thread trees are built in.
 */

#include "types.hpp"
#include "config.hpp"
#include "classifier.hpp"
#include "dataset.hpp"
#include "c45.hpp"
#include <memory>
#include <string>
#include <vector>

namespace arbor {

// ============================================================================
// Bagging
// ============================================================================

class BaggingTrees : public Classifier {
public:
    explicit BaggingTrees(Config config = Config::bagging());

    // ========================================================================
    // Training
    // ========================================================================

    void train(const Matrix& x, const Labels& y) override;
    void train(const Dataset& data);

    // ========================================================================
    // Prediction
    // ========================================================================

    // Votes per class from every built tree
    Frequency class_counts(const Vector& z) const override;

    // ========================================================================
    // Model Information
    // ========================================================================

    std::string model_name() const override;
    bool is_trained() const override;

    size_t n_trees() const { return trees_.size(); }
    size_t n_built() const;

    // Null when building tree l failed
    const C45Tree* tree(size_t l) const { return trees_.at(l).get(); }

    // Training rows (indices into the full dataset) of tree l
    const std::vector<Index>& sample_rows(size_t l) const { return sample_rows_.at(l); }

    Index sample_size() const { return sample_size_; }

protected:
    BaggingTrees(Config config, bool feature_bagging);

    // Called before the trees are built, with the slots already sized
    virtual void prepare(const Dataset& data);

    // Build tree l into its slot
    virtual void build_member(const Dataset& data, size_t l);

    // Query as seen by tree l
    virtual Vector project(const Vector& z, size_t l) const;

    // Config of a member tree trained on data
    Config member_config(const Dataset& data) const;

    void check_query(const Vector& z) const;

    std::vector<std::unique_ptr<C45Tree>> trees_;
    std::vector<std::vector<Index>> sample_rows_;
    Index sample_size_ = 0;
    FeatureIndex n_features_ = 0;
};

// ============================================================================
// Random Forest
// ============================================================================

class RandomForest : public BaggingTrees {
public:
    explicit RandomForest(Config config = Config::random_forest());

    std::string model_name() const override;

    // Columns (ascending, indices into the full dataset) of tree l
    const std::vector<FeatureIndex>& columns(size_t l) const { return columns_.at(l); }

    FeatureIndex n_selected_features() const { return n_selected_; }

protected:
    void prepare(const Dataset& data) override;
    void build_member(const Dataset& data, size_t l) override;
    Vector project(const Vector& z, size_t l) const override;

private:
    std::vector<std::vector<FeatureIndex>> columns_;
    FeatureIndex n_selected_ = 0;
};

} // namespace arbor
