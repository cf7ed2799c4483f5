/**
 * Arbor Python Bindings
 *
 * Provides sklearn-compatible API for easy integration.
 */

#include <pybind11/pybind11.h>
#include <pybind11/eigen.h>
#include <pybind11/stl.h>
#include <algorithm>
#include <memory>
#include <set>
#include <sstream>

#include "arbor/arbor.hpp"

namespace py = pybind11;
using namespace arbor;

namespace {

// Labels are 0..k-1; k is at least 2
uint32_t detect_classes(const Labels& y) {
    if (y.size() == 0) {
        throw std::runtime_error("y is empty");
    }
    if (y.minCoeff() < 0) {
        throw std::runtime_error("labels must be non-negative, shift them first");
    }
    return std::max<uint32_t>(2, static_cast<uint32_t>(y.maxCoeff()) + 1);
}

std::set<FeatureIndex> to_feature_set(const std::vector<int>& features) {
    return std::set<FeatureIndex>(features.begin(), features.end());
}

} // namespace

// ============================================================================
// Python Tree Classifier
// ============================================================================

class ArborTreeClassifier {
public:
    ArborTreeClassifier(
        const std::string& algorithm = "c45",
        int height = 4,
        double cutoff = 0.01,
        std::vector<int> continuous = {},
        std::vector<std::string> feature_names = {},
        std::vector<std::string> class_names = {},
        int verbosity = 0
    ) : algorithm_(algorithm) {
        if (algorithm_ != "id3" && algorithm_ != "c45") {
            throw std::invalid_argument("algorithm must be 'id3' or 'c45', got '" + algorithm_ + "'");
        }
        config_.tree.height = height;
        config_.tree.cutoff = cutoff;
        config_.continuous = to_feature_set(continuous);
        config_.feature_names = std::move(feature_names);
        config_.class_names = std::move(class_names);
        config_.verbosity = verbosity;
    }

    void fit(const Matrix& X, const Labels& y) {
        Config config = config_;
        const auto k = detect_classes(y);
        if (config.class_names.empty()) {
            config.set_classes(k);
            if (k == 2) config.class_names = {"No", "Yes"};
        } else {
            config.n_classes = k;
        }

        if (algorithm_ == "id3") {
            tree_ = std::make_unique<ID3Tree>(config);
        } else {
            tree_ = std::make_unique<C45Tree>(config);
        }
        tree_->train(X, y);
    }

    Labels predict(const Matrix& X) const {
        return fitted().predict_batch(X);
    }

    py::tuple classify(const Vector& z) const {
        Classification result = fitted().classify(z);
        return py::make_tuple(result.label, result.name, result.probability);
    }

    unsigned prune(int n_prune, double threshold) {
        return fitted().prune(n_prune, threshold);
    }

    std::string print_tree() const {
        return fitted().to_string();
    }

    double calc_entropy() const {
        return fitted().calc_entropy();
    }

    py::bytes save() const {
        std::ostringstream out;
        fitted().save(out);
        return py::bytes(out.str());
    }

    void load(const std::string& data, unsigned n_classes) {
        Config config = config_;
        config.set_classes(n_classes);
        if (algorithm_ == "id3") {
            tree_ = std::make_unique<ID3Tree>(config);
        } else {
            tree_ = std::make_unique<C45Tree>(config);
        }
        std::istringstream in(data);
        tree_->load(in);
    }

    unsigned n_leaves() const { return fitted().n_leaves(); }
    int height() const { return fitted().height(); }
    std::string model_name() const { return fitted().model_name(); }

private:
    std::string algorithm_;
    Config config_;
    std::unique_ptr<DecisionTree> tree_;

    DecisionTree& fitted() const {
        if (!tree_ || !tree_->is_trained()) {
            throw std::runtime_error("Model not fitted. Call fit() first.");
        }
        return *tree_;
    }
};

// ============================================================================
// Python Ensemble Classifier
// ============================================================================

class ArborEnsembleClassifier {
public:
    ArborEnsembleClassifier(
        const std::string& method = "random_forest",
        int n_trees = 11,
        double b_ratio = 0.7,
        double fb_ratio = 0.7,
        int height = 4,
        double cutoff = 0.01,
        std::vector<int> continuous = {},
        int n_threads = -1,
        unsigned long long seed = 0,
        int verbosity = 0
    ) : method_(method) {
        if (method_ != "bagging" && method_ != "random_forest") {
            throw std::invalid_argument("method must be 'bagging' or 'random_forest', got '" + method_ + "'");
        }
        config_.ensemble.n_trees = n_trees;
        config_.ensemble.b_ratio = b_ratio;
        config_.ensemble.fb_ratio = fb_ratio;
        config_.tree.height = height;
        config_.tree.cutoff = cutoff;
        config_.continuous = to_feature_set(continuous);
        config_.n_threads = n_threads;
        config_.seed = seed;
        config_.verbosity = verbosity;
    }

    void fit(const Matrix& X, const Labels& y) {
        Config config = config_;
        config.set_classes(detect_classes(y));

        if (method_ == "bagging") {
            model_ = std::make_unique<BaggingTrees>(config);
        } else {
            model_ = std::make_unique<RandomForest>(config);
        }
        model_->train(X, y);
    }

    Labels predict(const Matrix& X) const {
        return fitted().predict_batch(X);
    }

    std::vector<unsigned> votes(const Vector& z) const {
        Frequency counts = fitted().class_counts(z);
        return std::vector<unsigned>(counts.begin(), counts.end());
    }

    size_t n_built() const { return fitted().n_built(); }
    std::string model_name() const { return fitted().model_name(); }

private:
    std::string method_;
    Config config_;
    std::unique_ptr<BaggingTrees> model_;

    const BaggingTrees& fitted() const {
        if (!model_ || !model_->is_trained()) {
            throw std::runtime_error("Model not fitted. Call fit() first.");
        }
        return *model_;
    }
};

// ============================================================================
// Module Definition
// ============================================================================

PYBIND11_MODULE(_arbor, m) {
    m.doc() = "Arbor: ID3/C4.5 decision trees, bagging and random forests";

    m.attr("__version__") = ARBOR_VERSION_STRING;

    py::class_<ArborTreeClassifier>(m, "ArborTreeClassifier")
        .def(py::init<const std::string&, int, double, std::vector<int>,
                      std::vector<std::string>, std::vector<std::string>, int>(),
             py::arg("algorithm") = "c45",
             py::arg("height") = 4,
             py::arg("cutoff") = 0.01,
             py::arg("continuous") = std::vector<int>(),
             py::arg("feature_names") = std::vector<std::string>(),
             py::arg("class_names") = std::vector<std::string>(),
             py::arg("verbosity") = 0)
        .def("fit", &ArborTreeClassifier::fit, py::arg("X"), py::arg("y"))
        .def("predict", &ArborTreeClassifier::predict, py::arg("X"))
        .def("classify", &ArborTreeClassifier::classify, py::arg("z"))
        .def("prune", &ArborTreeClassifier::prune,
             py::arg("n_prune") = 1,
             py::arg("threshold") = 0.98)
        .def("print_tree", &ArborTreeClassifier::print_tree)
        .def("calc_entropy", &ArborTreeClassifier::calc_entropy)
        .def("save", &ArborTreeClassifier::save)
        .def("load", &ArborTreeClassifier::load, py::arg("data"), py::arg("n_classes"))
        .def_property_readonly("n_leaves", &ArborTreeClassifier::n_leaves)
        .def_property_readonly("height", &ArborTreeClassifier::height)
        .def_property_readonly("model_name", &ArborTreeClassifier::model_name);

    py::class_<ArborEnsembleClassifier>(m, "ArborEnsembleClassifier")
        .def(py::init<const std::string&, int, double, double, int, double,
                      std::vector<int>, int, unsigned long long, int>(),
             py::arg("method") = "random_forest",
             py::arg("n_trees") = 11,
             py::arg("b_ratio") = 0.7,
             py::arg("fb_ratio") = 0.7,
             py::arg("height") = 4,
             py::arg("cutoff") = 0.01,
             py::arg("continuous") = std::vector<int>(),
             py::arg("n_threads") = -1,
             py::arg("seed") = 0,
             py::arg("verbosity") = 0)
        .def("fit", &ArborEnsembleClassifier::fit, py::arg("X"), py::arg("y"))
        .def("predict", &ArborEnsembleClassifier::predict, py::arg("X"))
        .def("votes", &ArborEnsembleClassifier::votes, py::arg("z"))
        .def_property_readonly("n_built", &ArborEnsembleClassifier::n_built)
        .def_property_readonly("model_name", &ArborEnsembleClassifier::model_name);

    m.def("print_info", &print_info, "Print Arbor library information");
}
