/**
 * Arbor Bagging Implementation
 */

#include "arbor/ensemble.hpp"
#include "arbor/threading.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <stdexcept>

namespace arbor {

BaggingTrees::BaggingTrees(Config config) : BaggingTrees(std::move(config), false) {}

BaggingTrees::BaggingTrees(Config config, bool feature_bagging)
    : Classifier(std::move(config)) {
    config_.validate_ensemble(feature_bagging);
}

std::string BaggingTrees::model_name() const {
    return "BaggingTrees_" + std::to_string(config_.tree.height) + "_" +
           std::to_string(config_.ensemble.n_trees);
}

void BaggingTrees::train(const Matrix& x, const Labels& y) {
    train(Dataset(x, y, config_.n_classes, config_.continuous, config_.feature_names));
}

void BaggingTrees::train(const Dataset& data) {
    if (data.n_classes() != config_.n_classes) {
        throw std::invalid_argument("dataset has " + std::to_string(data.n_classes()) +
                                    " classes, model expects " + std::to_string(config_.n_classes));
    }

    const auto size = static_cast<Index>(std::floor(config_.ensemble.b_ratio * data.n_samples()));
    if (size == 0) {
        throw std::invalid_argument("b_ratio * n_samples leaves no rows to train on");
    }

    const size_t n = static_cast<size_t>(config_.ensemble.n_trees);
    trees_.clear();
    trees_.resize(n);
    sample_rows_.assign(n, {});
    sample_size_ = size;
    n_features_ = data.n_features();
    prepare(data);

    if (config_.verbosity > 0) {
        std::printf("%s: building %zu trees on %u of %u rows\n",
                    model_name().c_str(), n, sample_size_, data.n_samples());
    }

    if (config_.n_threads > 0) {
        threading::set_num_threads(config_.n_threads);
    }

    // Each tree writes only its own slot
    threading::parallel_for(0, n, [&](size_t l) {
        try {
            build_member(data, l);
        } catch (const std::exception& e) {
            trees_[l].reset();
            if (config_.verbosity > 0) {
                std::printf("%s: tree %zu failed: %s\n", model_name().c_str(), l, e.what());
            }
        }
    });

    const size_t built = n_built();
    if (built == 0) {
        throw std::runtime_error(model_name() + ": no tree could be built");
    }

    if (config_.verbosity > 0) {
        std::printf("%s: %zu of %zu trees built\n", model_name().c_str(), built, n);
    }
}

void BaggingTrees::prepare(const Dataset& /*data*/) {}

Config BaggingTrees::member_config(const Dataset& data) const {
    Config cfg = config_;
    cfg.continuous = data.continuous_features();
    cfg.feature_names = data.feature_names();
    cfg.verbosity = std::max(0, config_.verbosity - 1);
    return cfg;
}

void BaggingTrees::build_member(const Dataset& data, size_t l) {
    Rng rng(config_.seed + l);
    sample_rows_[l] = data.bootstrap_sample(sample_size_, rng);

    Dataset sub = data.take_rows(sample_rows_[l]);
    auto tree = std::make_unique<C45Tree>(member_config(sub));
    tree->train(sub);

    if (config_.verbosity > 1) {
        std::printf("[DEBUG] tree %zu: %u leaves, height %d\n", l, tree->n_leaves(), tree->height());
    }
    trees_[l] = std::move(tree);
}

Vector BaggingTrees::project(const Vector& z, size_t /*l*/) const {
    return z;
}

void BaggingTrees::check_query(const Vector& z) const {
    if (!is_trained()) {
        throw std::runtime_error(model_name() + " has not been trained");
    }
    if (z.size() < n_features_) {
        throw std::invalid_argument("query vector has " + std::to_string(z.size()) +
                                    " values, ensemble expects " + std::to_string(n_features_));
    }
}

Frequency BaggingTrees::class_counts(const Vector& z) const {
    check_query(z);

    Frequency votes(config_.n_classes, 0);
    for (size_t l = 0; l < trees_.size(); ++l) {
        if (!trees_[l]) continue;
        votes[trees_[l]->predict(project(z, l))] += 1;
    }
    return votes;
}

size_t BaggingTrees::n_built() const {
    return static_cast<size_t>(std::count_if(trees_.begin(), trees_.end(),
        [](const std::unique_ptr<C45Tree>& t) { return t != nullptr; }));
}

bool BaggingTrees::is_trained() const {
    return n_built() > 0;
}

} // namespace arbor
