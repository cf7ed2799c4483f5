/**
 * Arbor Split Criterion Implementation
 */

#include "arbor/split.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <map>

namespace arbor {

// ============================================================================
// Entropy
// ============================================================================

Float entropy(const Frequency& freq) {
    const Index sum = total(freq);
    if (sum == 0) return 0.0;

    Float h = 0.0;
    for (Index c : freq) {
        if (c == 0) continue;
        const Float p = static_cast<Float>(c) / sum;
        h -= p * std::log2(p);
    }
    return h;
}

namespace {

// Weighted entropy of a two-way partition
Float split_entropy(const Frequency& below, const Frequency& above) {
    const Float n_below = static_cast<Float>(total(below));
    const Float n_above = static_cast<Float>(total(above));
    const Float n = n_below + n_above;
    if (n == 0) return 0.0;
    return (n_below / n) * entropy(below) + (n_above / n) * entropy(above);
}

} // namespace

// ============================================================================
// Split Finder
// ============================================================================

SplitFinder::SplitFinder(const Dataset& data) : data_(data) {}

std::pair<Float, Frequency> SplitFinder::categorical_gain(
    FeatureIndex feature,
    const std::vector<Index>& rows
) const {
    const uint32_t k = data_.n_classes();
    Frequency freq(k, 0);
    if (rows.empty()) {
        return {0.0, freq};
    }

    std::map<int, Frequency> groups;
    for (Index i : rows) {
        auto& group = groups[data_.category(i, feature)];
        if (group.empty()) group.assign(k, 0);
        group[data_.label(i)] += 1;
        freq[data_.label(i)] += 1;
    }

    const Float n = static_cast<Float>(rows.size());
    Float weighted = 0.0;
    for (const auto& [value, group] : groups) {
        weighted += (total(group) / n) * entropy(group);
    }

    return {entropy(freq) - weighted, freq};
}

std::optional<Float> SplitFinder::find_threshold(
    FeatureIndex feature,
    const std::vector<Index>& rows
) const {
    const uint32_t k = data_.n_classes();

    std::vector<std::pair<Float, Label>> points;
    points.reserve(rows.size());
    for (Index i : rows) {
        points.emplace_back(data_.value(i, feature), data_.label(i));
    }
    std::sort(points.begin(), points.end());

    Frequency below(k, 0);
    Frequency above(k, 0);
    for (const auto& p : points) {
        above[p.second] += 1;
    }

    std::optional<Float> best;
    Float min_entropy = std::numeric_limits<Float>::max();

    // Sweep upward; a candidate sits between each pair of distinct values
    for (size_t i = 0; i + 1 < points.size(); ++i) {
        below[points[i].second] += 1;
        above[points[i].second] -= 1;

        if (points[i].first == points[i + 1].first) {
            continue;
        }

        const Float mid = (points[i].first + points[i + 1].first) / 2.0;
        const Float ent = split_entropy(below, above);
        if (ent < min_entropy) {
            min_entropy = ent;
            best = mid;
        }
    }

    return best;
}

std::pair<Float, Frequency> SplitFinder::continuous_gain(
    FeatureIndex feature,
    const std::vector<Index>& rows,
    Float threshold
) const {
    const uint32_t k = data_.n_classes();
    Frequency below(k, 0);
    Frequency above(k, 0);

    for (Index i : rows) {
        if (data_.value(i, feature) <= threshold) {
            below[data_.label(i)] += 1;
        } else {
            above[data_.label(i)] += 1;
        }
    }

    Frequency freq(k, 0);
    for (uint32_t c = 0; c < k; ++c) {
        freq[c] = below[c] + above[c];
    }

    return {entropy(freq) - split_entropy(below, above), freq};
}

SplitInfo SplitFinder::find_best_split(
    const std::vector<Index>& rows,
    const std::vector<FeatureIndex>& columns,
    bool use_continuous
) const {
    SplitInfo best;
    best.freq = data_.class_frequency(rows);
    best.gain = kMinGain;

    for (FeatureIndex j : columns) {
        Float gain = 0.0;
        std::optional<Float> threshold;

        if (use_continuous && data_.is_continuous(j)) {
            threshold = find_threshold(j, rows);
            if (!threshold) continue;
            gain = continuous_gain(j, rows, *threshold).first;
        } else {
            gain = categorical_gain(j, rows).first;
        }

        if (gain > best.gain) {
            best.feature = j;
            best.gain = gain;
            best.threshold = threshold;
        }
    }

    if (!best.is_valid()) {
        best.gain = 0.0;
    }
    return best;
}

} // namespace arbor
