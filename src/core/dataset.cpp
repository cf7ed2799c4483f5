/**
 * Arbor Dataset Implementation
 */

#include "arbor/dataset.hpp"
#include <algorithm>
#include <numeric>
#include <stdexcept>

namespace arbor {

// ============================================================================
// Dataset Construction
// ============================================================================

Dataset::Dataset(
    Matrix x,
    Labels y,
    uint32_t n_classes,
    const std::set<FeatureIndex>& continuous,
    std::vector<std::string> feature_names
) : x_(std::move(x)), y_(std::move(y)), n_classes_(n_classes) {
    validate();

    const FeatureIndex n_features = this->n_features();

    if (!feature_names.empty() && feature_names.size() != static_cast<size_t>(n_features)) {
        throw std::invalid_argument("number of feature names (" + std::to_string(feature_names.size()) +
                                    ") != number of columns (" + std::to_string(n_features) + ")");
    }

    feature_info_.resize(n_features);
    for (FeatureIndex f = 0; f < n_features; ++f) {
        feature_info_[f].name = feature_names.empty() ? "x" + std::to_string(f) : feature_names[f];
    }

    for (FeatureIndex f : continuous) {
        if (f < 0 || f >= n_features) {
            throw std::invalid_argument("continuous feature index " + std::to_string(f) + " out of range");
        }
        feature_info_[f].kind = FeatureKind::Continuous;
    }

    for (FeatureIndex f = 0; f < n_features; ++f) {
        if (is_continuous(f)) continue;
        for (Index i = 0; i < n_samples(); ++i) {
            if (!to_category(x_(i, f))) {
                throw std::invalid_argument("categorical value " + std::to_string(x_(i, f)) +
                                            " at row " + std::to_string(i) + ", column " +
                                            std::to_string(f) + " is not an int");
            }
        }
    }

    detect_feature_values();
}

void Dataset::validate() const {
    if (x_.rows() == 0 || x_.cols() == 0) {
        throw std::invalid_argument("instance matrix is empty");
    }
    if (x_.rows() != y_.size()) {
        throw std::invalid_argument("row dimensions of x (" + std::to_string(x_.rows()) +
                                    ") and y (" + std::to_string(y_.size()) + ") are incompatible");
    }
    if (n_classes_ < 2) {
        throw std::invalid_argument("n_classes must be at least 2");
    }
    if (!x_.allFinite()) {
        throw std::invalid_argument("instance matrix contains NaN or infinite values");
    }
    for (Eigen::Index i = 0; i < y_.size(); ++i) {
        if (y_(i) < 0 || static_cast<uint32_t>(y_(i)) >= n_classes_) {
            throw std::invalid_argument("label " + std::to_string(y_(i)) + " at row " + std::to_string(i) +
                                        " outside [0, " + std::to_string(n_classes_) + ")");
        }
    }
}

// ============================================================================
// Feature Metadata
// ============================================================================

void Dataset::detect_feature_values() {
    for (FeatureIndex f = 0; f < n_features(); ++f) {
        FeatureInfo& info = feature_info_[f];
        info.values.clear();
        if (info.kind == FeatureKind::Continuous) {
            continue;
        }

        info.values = categories(f);
    }
}

std::vector<int> Dataset::categories(FeatureIndex f) const {
    std::vector<int> values;
    values.reserve(n_samples());
    for (Index i = 0; i < n_samples(); ++i) {
        values.push_back(category(i, f));
    }
    std::sort(values.begin(), values.end());
    values.erase(std::unique(values.begin(), values.end()), values.end());
    return values;
}

std::set<FeatureIndex> Dataset::continuous_features() const {
    std::set<FeatureIndex> result;
    for (FeatureIndex f = 0; f < n_features(); ++f) {
        if (is_continuous(f)) result.insert(f);
    }
    return result;
}

std::vector<std::string> Dataset::feature_names() const {
    std::vector<std::string> names;
    names.reserve(feature_info_.size());
    for (const auto& info : feature_info_) {
        names.push_back(info.name);
    }
    return names;
}

std::vector<Index> Dataset::value_counts() const {
    std::vector<Index> vc;
    vc.reserve(feature_info_.size());
    for (const auto& info : feature_info_) {
        vc.push_back(static_cast<Index>(info.values.size()));
    }
    return vc;
}

std::vector<Index> Dataset::all_rows() const {
    std::vector<Index> rows(n_samples());
    std::iota(rows.begin(), rows.end(), 0);
    return rows;
}

std::vector<FeatureIndex> Dataset::all_features() const {
    std::vector<FeatureIndex> features(n_features());
    std::iota(features.begin(), features.end(), static_cast<FeatureIndex>(0));
    return features;
}

// ============================================================================
// Class Frequency
// ============================================================================

Frequency Dataset::class_frequency() const {
    Frequency freq(n_classes_, 0);
    for (Eigen::Index i = 0; i < y_.size(); ++i) {
        freq[y_(i)] += 1;
    }
    return freq;
}

Frequency Dataset::class_frequency(const std::vector<Index>& rows) const {
    Frequency freq(n_classes_, 0);
    for (Index i : rows) {
        freq[y_(i)] += 1;
    }
    return freq;
}

// ============================================================================
// Projection
// ============================================================================

Dataset Dataset::take_rows(const std::vector<Index>& rows) const {
    Matrix sub_x(rows.size(), x_.cols());
    Labels sub_y(rows.size());

    for (size_t r = 0; r < rows.size(); ++r) {
        sub_x.row(r) = x_.row(rows[r]);
        sub_y(r) = y_(rows[r]);
    }

    return Dataset(std::move(sub_x), std::move(sub_y), n_classes_, continuous_features(), feature_names());
}

Dataset Dataset::take_columns(const std::vector<FeatureIndex>& columns) const {
    Matrix sub_x(x_.rows(), columns.size());
    std::set<FeatureIndex> sub_continuous;
    std::vector<std::string> sub_names;
    sub_names.reserve(columns.size());

    for (size_t c = 0; c < columns.size(); ++c) {
        const FeatureIndex f = columns[c];
        if (f < 0 || f >= n_features()) {
            throw std::invalid_argument("column index " + std::to_string(f) + " out of range");
        }
        sub_x.col(c) = x_.col(f);
        sub_names.push_back(feature_info_[f].name);
        if (is_continuous(f)) {
            sub_continuous.insert(static_cast<FeatureIndex>(c));
        }
    }

    return Dataset(std::move(sub_x), y_, n_classes_, sub_continuous, std::move(sub_names));
}

// ============================================================================
// Sampling
// ============================================================================

std::vector<Index> Dataset::bootstrap_sample(Index size, Rng& rng) const {
    std::uniform_int_distribution<Index> pick(0, n_samples() - 1);

    std::vector<Index> rows(size);
    for (auto& r : rows) {
        r = pick(rng);
    }
    return rows;
}

std::vector<FeatureIndex> Dataset::random_feature_subsample(FeatureIndex size, Rng& rng) const {
    FeatureIndex n = std::min(size, n_features());
    std::vector<FeatureIndex> indices(n_features());
    std::iota(indices.begin(), indices.end(), static_cast<FeatureIndex>(0));

    std::shuffle(indices.begin(), indices.end(), rng);

    indices.resize(n);
    std::sort(indices.begin(), indices.end());
    return indices;
}

Label Dataset::shift_to_zero(Labels& y) {
    if (y.size() == 0) return 0;
    Label shift = y.minCoeff();
    if (shift != 0) {
        y.array() -= shift;
    }
    return shift;
}

} // namespace arbor
