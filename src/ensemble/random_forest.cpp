/**
 * Arbor Random Forest Implementation
 */

#include "arbor/ensemble.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>

namespace arbor {

RandomForest::RandomForest(Config config) : BaggingTrees(std::move(config), true) {}

std::string RandomForest::model_name() const {
    return "RandomForest_" + std::to_string(config_.tree.height) + "_" +
           std::to_string(config_.ensemble.n_trees);
}

void RandomForest::prepare(const Dataset& data) {
    columns_.assign(trees_.size(), {});
    n_selected_ = std::max<FeatureIndex>(
        1, static_cast<FeatureIndex>(std::floor(config_.ensemble.fb_ratio * data.n_features())));

    if (config_.verbosity > 0) {
        std::printf("%s: %d of %d columns per tree\n",
                    model_name().c_str(), n_selected_, data.n_features());
    }
}

void RandomForest::build_member(const Dataset& data, size_t l) {
    Rng rng(config_.seed + l);
    sample_rows_[l] = data.bootstrap_sample(sample_size_, rng);
    columns_[l] = data.random_feature_subsample(n_selected_, rng);

    Dataset sub = data.take_rows(sample_rows_[l]).take_columns(columns_[l]);
    auto tree = std::make_unique<C45Tree>(member_config(sub));
    tree->train(sub);

    if (config_.verbosity > 1) {
        std::printf("[DEBUG] tree %zu: %zu columns, %u leaves\n", l, columns_[l].size(), tree->n_leaves());
    }
    trees_[l] = std::move(tree);
}

Vector RandomForest::project(const Vector& z, size_t l) const {
    const auto& cols = columns_[l];
    Vector sub(static_cast<Eigen::Index>(cols.size()));
    for (size_t j = 0; j < cols.size(); ++j) {
        sub(static_cast<Eigen::Index>(j)) = z(cols[j]);
    }
    return sub;
}

} // namespace arbor
