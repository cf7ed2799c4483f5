#pragma once

/**
 * Arbor Classifier Interface
 *
 * Common contract of single trees and tree ensembles:
 * train on (x, y), then predict a class index for a query vector.
 */

#include "types.hpp"
#include "config.hpp"
#include <string>

namespace arbor {

class Classifier {
public:
    explicit Classifier(Config config);
    virtual ~Classifier() = default;

    // ========================================================================
    // Training
    // ========================================================================

    virtual void train(const Matrix& x, const Labels& y) = 0;

    // ========================================================================
    // Prediction
    // ========================================================================

    /**
     * Counts supporting each class for query z: class frequencies at the
     * node a tree ends on, or tree votes for an ensemble.
     */
    virtual Frequency class_counts(const Vector& z) const = 0;

    // Class with the most support; ties go to the lowest class
    virtual Label predict(const Vector& z) const;

    // One prediction per row of x
    Labels predict_batch(const Matrix& x) const;

    // Predicted class with its name and share of support
    Classification classify(const Vector& z) const;

    // ========================================================================
    // Model Information
    // ========================================================================

    virtual std::string model_name() const = 0;
    virtual bool is_trained() const = 0;

    const Config& config() const { return config_; }
    uint32_t n_classes() const { return config_.n_classes; }

protected:
    Config config_;
};

} // namespace arbor
