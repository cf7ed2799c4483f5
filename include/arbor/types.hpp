#pragma once

/**
 * Arbor: Decision Trees and Tree Ensembles
 *
 * Core type definitions:
 * - Eigen-backed instance matrix, query vector and label vector
 * - Class-frequency vectors
 * - Arena tree node
 */

#include <Eigen/Dense>
#include <cmath>
#include <cstdint>
#include <cstddef>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace arbor {

// ============================================================================
// Basic Types
// ============================================================================

using Float = double;                   // Feature values, gains, entropies
using Index = uint32_t;                 // Row indices and counts
using FeatureIndex = int32_t;           // Column index (negative => no feature)
using NodeIndex = uint32_t;             // Position of a node in the tree arena
using Label = int32_t;                  // Class labels in [0, k)

// Instances are stored in rows, so row-major keeps an instance contiguous
using Matrix = Eigen::Matrix<Float, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using Vector = Eigen::Matrix<Float, Eigen::Dynamic, 1>;
using Labels = Eigen::VectorXi;

// Per-class counts, length k
using Frequency = std::vector<Index>;

constexpr FeatureIndex kNoFeature = -1;

// ============================================================================
// Frequency Helpers
// ============================================================================

inline Index total(const Frequency& freq) {
    Index sum = 0;
    for (Index c : freq) sum += c;
    return sum;
}

// Index of the largest count; ties go to the lowest class
inline Label argmax(const Frequency& freq) {
    Label best = 0;
    for (size_t c = 1; c < freq.size(); ++c) {
        if (freq[c] > freq[best]) best = static_cast<Label>(c);
    }
    return best;
}

// Branch key of a categorical value; empty for NaN, infinities and values
// outside the range of int
inline std::optional<int> to_category(Float value) {
    if (!std::isfinite(value) ||
        value < static_cast<Float>(std::numeric_limits<int>::min()) ||
        value > static_cast<Float>(std::numeric_limits<int>::max())) {
        return std::nullopt;
    }
    return static_cast<int>(value);
}

// ============================================================================
// Feature Metadata
// ============================================================================

enum class FeatureKind : uint8_t {
    Categorical = 0,
    Continuous = 1
};

struct FeatureInfo {
    std::string name;
    FeatureKind kind = FeatureKind::Categorical;
    std::vector<int> values;             // Sorted distinct values (categorical only)
};

// ============================================================================
// Tree Node (arena element)
// ============================================================================

struct TreeNode {
    FeatureIndex feature = kNoFeature;   // Split column, kNoFeature for leaves
    Float gain = 0.0;                    // Information gain when the node was created
    Frequency freq;                      // Class counts of the rows reaching this node
    Label majority = 0;                  // argmax(freq)
    std::optional<NodeIndex> parent;     // Non-owning back link, empty for the root
    int branch_value = -1;               // Key of this node in the parent's branch map
    std::map<int, NodeIndex> branches;   // Branch value -> child
    bool is_leaf = true;
    std::optional<Float> threshold;      // Continuous split: 0 <=> value <= threshold

    Index count() const { return total(freq); }
    bool is_continuous() const { return threshold.has_value(); }
};

// ============================================================================
// Classification Result
// ============================================================================

struct Classification {
    Label label = 0;
    std::string name;
    Float probability = 0.0;             // Share of the supporting counts/votes
};

} // namespace arbor
