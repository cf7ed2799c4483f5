#pragma once

/**
 * Arbor Split Criterion
 *
 * Information-gain split search over a working row index:
 * - Categorical features: one branch per distinct value
 * - Continuous features: binary split at the midpoint threshold that
 *   minimises the weighted entropy of (<= threshold, > threshold)
 */

#include "types.hpp"
#include "dataset.hpp"
#include <optional>
#include <utility>
#include <vector>

namespace arbor {

// ============================================================================
// Entropy
// ============================================================================

/**
 * Shannon entropy (base 2) of a class-frequency vector.
 * Zero counts contribute nothing; an all-zero vector has entropy 0.
 */
Float entropy(const Frequency& freq);

// Gains at or below this are treated as no gain
constexpr Float kMinGain = 1e-12;

// ============================================================================
// Split Information
// ============================================================================

struct SplitInfo {
    FeatureIndex feature = kNoFeature;
    Float gain = 0.0;
    Frequency freq;                         // Class counts over all branches
    std::optional<Float> threshold;         // Set for continuous features

    bool is_valid() const { return feature >= 0; }
};

// ============================================================================
// Split Finder
// ============================================================================

class SplitFinder {
public:
    explicit SplitFinder(const Dataset& data);

    /**
     * Gain of splitting rows on each distinct value of feature
     * @return (gain, aggregate class frequency)
     */
    std::pair<Float, Frequency> categorical_gain(
        FeatureIndex feature,
        const std::vector<Index>& rows
    ) const;

    /**
     * Midpoint between consecutive sorted distinct values (within rows)
     * minimising the weighted entropy of the binary split.
     * The first minimum wins. Empty if the feature is constant over rows.
     */
    std::optional<Float> find_threshold(
        FeatureIndex feature,
        const std::vector<Index>& rows
    ) const;

    /**
     * Gain of the binary split (<= threshold, > threshold) over rows
     */
    std::pair<Float, Frequency> continuous_gain(
        FeatureIndex feature,
        const std::vector<Index>& rows,
        Float threshold
    ) const;

    /**
     * Best feature among columns; ties go to the first column.
     * @param use_continuous Honour continuous flags (C4.5); otherwise every
     *        column is split by value (ID3)
     * @return feature == kNoFeature when no column has positive gain
     */
    SplitInfo find_best_split(
        const std::vector<Index>& rows,
        const std::vector<FeatureIndex>& columns,
        bool use_continuous
    ) const;

private:
    const Dataset& data_;
};

} // namespace arbor
