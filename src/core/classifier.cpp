/**
 * Arbor Classifier Implementation
 */

#include "arbor/classifier.hpp"

namespace arbor {

Classifier::Classifier(Config config) : config_(std::move(config)) {
    config_.validate();
}

Label Classifier::predict(const Vector& z) const {
    return argmax(class_counts(z));
}

Labels Classifier::predict_batch(const Matrix& x) const {
    Labels yp(x.rows());
    for (Eigen::Index i = 0; i < x.rows(); ++i) {
        Vector z = x.row(i).transpose();
        yp(i) = predict(z);
    }
    return yp;
}

Classification Classifier::classify(const Vector& z) const {
    Frequency counts = class_counts(z);

    Classification result;
    result.label = argmax(counts);
    result.name = config_.class_name(result.label);

    Index sum = total(counts);
    if (sum > 0) {
        result.probability = static_cast<Float>(counts[result.label]) / sum;
    }
    return result;
}

} // namespace arbor
