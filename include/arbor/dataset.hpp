#pragma once

/**
 * Arbor Dataset
 *
 * Training view over an instance matrix and its labels with:
 * - Per-feature metadata (name, categorical/continuous, distinct values)
 * - Class frequency over a working row index
 * - Row/column projection for bagging and feature bagging
 * - Seeded sampling with and without replacement
 */

#include "types.hpp"
#include <random>
#include <set>
#include <string>
#include <vector>

namespace arbor {

using Rng = std::mt19937_64;

class Dataset {
public:
    Dataset() = default;

    /**
     * Create a dataset from a dense matrix
     * @param x Instance matrix [n_samples x n_features]
     * @param y Class labels, each in [0, n_classes)
     * @param n_classes Number of classes k
     * @param continuous Columns treated as continuous
     * @param feature_names Optional names (empty => x0, x1, ...)
     */
    Dataset(
        Matrix x,
        Labels y,
        uint32_t n_classes,
        const std::set<FeatureIndex>& continuous = {},
        std::vector<std::string> feature_names = {}
    );

    // ========================================================================
    // Accessors
    // ========================================================================

    Index n_samples() const { return static_cast<Index>(x_.rows()); }
    FeatureIndex n_features() const { return static_cast<FeatureIndex>(x_.cols()); }
    uint32_t n_classes() const { return n_classes_; }

    const Matrix& x() const { return x_; }
    const Labels& y() const { return y_; }

    Float value(Index row, FeatureIndex feature) const { return x_(row, feature); }
    // Out-of-range values (continuous columns only) saturate
    int category(Index row, FeatureIndex feature) const {
        const Float v = x_(row, feature);
        return to_category(v).value_or(v < 0 ? std::numeric_limits<int>::min()
                                              : std::numeric_limits<int>::max());
    }
    Label label(Index row) const { return y_(row); }

    const std::vector<FeatureInfo>& feature_info() const { return feature_info_; }
    const FeatureInfo& feature_info(FeatureIndex f) const { return feature_info_[f]; }

    bool is_continuous(FeatureIndex f) const {
        return feature_info_[f].kind == FeatureKind::Continuous;
    }

    std::set<FeatureIndex> continuous_features() const;
    std::vector<std::string> feature_names() const;

    // Number of distinct values per column (0 for continuous columns)
    std::vector<Index> value_counts() const;

    // Sorted distinct categories of any column, continuous ones included
    std::vector<int> categories(FeatureIndex f) const;

    std::vector<Index> all_rows() const;
    std::vector<FeatureIndex> all_features() const;

    // ========================================================================
    // Class Frequency
    // ========================================================================

    Frequency class_frequency() const;
    Frequency class_frequency(const std::vector<Index>& rows) const;

    // ========================================================================
    // Projection
    // ========================================================================

    // Rows may repeat (bootstrap samples)
    Dataset take_rows(const std::vector<Index>& rows) const;

    // Continuous flags and names follow their columns
    Dataset take_columns(const std::vector<FeatureIndex>& columns) const;

    // ========================================================================
    // Sampling
    // ========================================================================

    /**
     * Draw row indices with replacement
     */
    std::vector<Index> bootstrap_sample(Index size, Rng& rng) const;

    /**
     * Draw distinct column indices, returned in increasing order
     */
    std::vector<FeatureIndex> random_feature_subsample(FeatureIndex size, Rng& rng) const;

    /**
     * Shift labels so the smallest becomes 0; returns the amount subtracted
     */
    static Label shift_to_zero(Labels& y);

private:
    Matrix x_;
    Labels y_;
    uint32_t n_classes_ = 0;
    std::vector<FeatureInfo> feature_info_;

    void validate() const;
    void detect_feature_values();
};

} // namespace arbor
