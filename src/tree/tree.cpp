/**
 * Arbor Decision Tree Implementation
 */

#include "arbor/tree.hpp"
#include "arbor/pruner.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <istream>
#include <map>
#include <ostream>
#include <sstream>
#include <stdexcept>

namespace arbor {

// ============================================================================
// Decision Tree
// ============================================================================

DecisionTree::DecisionTree(Config config) : Classifier(std::move(config)) {}

void DecisionTree::clear() {
    nodes_.clear();
    root_.reset();
    leaves_.clear();
    feature_order_.clear();
    value_counts_.clear();
    feature_names_.clear();
}

void DecisionTree::train(const Matrix& x, const Labels& y) {
    train(Dataset(x, y, config_.n_classes, config_.continuous, config_.feature_names));
}

void DecisionTree::train(const Dataset& data) {
    if (data.n_classes() != config_.n_classes) {
        throw std::invalid_argument("dataset has " + std::to_string(data.n_classes()) +
                                    " classes, model expects " + std::to_string(config_.n_classes));
    }

    clear();
    feature_names_ = data.feature_names();
    value_counts_.assign(data.n_features(), 0);
    for (FeatureIndex f = 0; f < data.n_features(); ++f) {
        if (!splits_by_threshold(data, f)) {
            value_counts_[f] = static_cast<Index>(data.categories(f).size());
        }
    }

    if (config_.verbosity > 1) {
        std::printf("[DEBUG] %s: train() started, n_samples=%u, n_features=%d, entropy_0=%.4f\n",
                    model_name().c_str(), data.n_samples(), data.n_features(),
                    entropy(data.class_frequency()));
    }

    SplitFinder finder(data);
    build_recursive(data, finder, data.all_rows(), data.all_features(), std::nullopt, -1, 0);

    if (config_.verbosity > 0) {
        std::printf("%s: trained with %u leaves, height %d, leaf entropy %.4f\n",
                    model_name().c_str(), n_leaves(), height(), calc_entropy());
    }
}

std::optional<NodeIndex> DecisionTree::build_recursive(
    const Dataset& data,
    const SplitFinder& finder,
    const std::vector<Index>& rows,
    const std::vector<FeatureIndex>& columns,
    std::optional<NodeIndex> parent,
    int branch_value,
    int32_t current_depth
) {
    if (rows.empty()) {
        return std::nullopt;
    }

    SplitInfo split = find_split(finder, rows, columns);
    const bool pure = entropy(split.freq) <= config_.tree.cutoff;

    // An impure subset nothing separates is dropped below the root;
    // queries reaching the missing branch stop at the parent
    if (!split.is_valid() && !pure && parent) {
        if (config_.verbosity > 1) {
            std::printf("[DEBUG] depth=%d: no positive gain over %zu rows, branch %d dropped\n",
                        current_depth, rows.size(), branch_value);
        }
        return std::nullopt;
    }

    TreeNode node;
    node.gain = split.gain;
    node.freq = std::move(split.freq);
    node.majority = argmax(node.freq);
    node.is_leaf = !split.is_valid() || pure || current_depth >= config_.tree.height;

    if (!node.is_leaf) {
        node.feature = split.feature;
        node.threshold = split.threshold;
    }

    const NodeIndex idx = parent ? add(*parent, branch_value, std::move(node))
                                 : add_root(std::move(node));
    if (nodes_[idx].is_leaf) {
        return idx;
    }

    const FeatureIndex j = nodes_[idx].feature;
    feature_order_.push_back(j);

    std::vector<FeatureIndex> remaining;
    remaining.reserve(columns.size());
    for (FeatureIndex c : columns) {
        if (c != j) remaining.push_back(c);
    }

    // nodes_ may reallocate while children are added
    auto branches = partition(data, nodes_[idx], rows);
    for (const auto& [value, branch_rows] : branches) {
        build_recursive(data, finder, branch_rows, remaining, idx, value, current_depth + 1);
    }

    return idx;
}

std::vector<std::pair<int, std::vector<Index>>> DecisionTree::partition_by_value(
    const Dataset& data,
    FeatureIndex feature,
    const std::vector<Index>& rows
) const {
    std::map<int, std::vector<Index>> by_value;
    for (Index i : rows) {
        by_value[data.category(i, feature)].push_back(i);
    }
    return {by_value.begin(), by_value.end()};
}

// ============================================================================
// Structure
// ============================================================================

NodeIndex DecisionTree::add_root(TreeNode node) {
    node.parent.reset();
    node.branch_value = -1;
    const NodeIndex idx = static_cast<NodeIndex>(nodes_.size());
    nodes_.push_back(std::move(node));
    root_ = idx;
    if (nodes_[idx].is_leaf) leaves_.insert(idx);
    return idx;
}

NodeIndex DecisionTree::add(NodeIndex parent, int branch_value, TreeNode child) {
    child.parent = parent;
    child.branch_value = branch_value;
    const NodeIndex idx = static_cast<NodeIndex>(nodes_.size());
    nodes_.push_back(std::move(child));
    nodes_[parent].branches[branch_value] = idx;
    if (nodes_[idx].is_leaf) leaves_.insert(idx);
    return idx;
}

bool DecisionTree::make_leaf(NodeIndex n) {
    TreeNode& node = nodes_[n];
    if (node.is_leaf) {
        if (config_.verbosity > 0) {
            std::printf("make_leaf: node %u already is a leaf\n", n);
        }
        return false;
    }

    // Detached descendants stay in the arena but leave the leaf set
    std::vector<NodeIndex> stack;
    for (const auto& [value, child] : node.branches) {
        stack.push_back(child);
    }
    while (!stack.empty()) {
        NodeIndex d = stack.back();
        stack.pop_back();
        leaves_.erase(d);
        for (const auto& [value, child] : nodes_[d].branches) {
            stack.push_back(child);
        }
    }
    node.branches.clear();
    node.is_leaf = true;
    node.feature = kNoFeature;
    node.threshold.reset();
    leaves_.insert(n);
    return true;
}

bool DecisionTree::leaf_children(NodeIndex n) const {
    for (const auto& [value, child] : nodes_[n].branches) {
        if (!nodes_[child].is_leaf) return false;
    }
    return true;
}

std::vector<NodeIndex> DecisionTree::candidates() const {
    std::set<NodeIndex> can;
    for (NodeIndex leaf : leaves_) {
        const auto& parent = nodes_[leaf].parent;
        if (parent && leaf_children(*parent)) {
            can.insert(*parent);
        }
    }
    return std::vector<NodeIndex>(can.begin(), can.end());
}

std::optional<std::pair<NodeIndex, Float>> DecisionTree::best_candidate(
    const std::vector<NodeIndex>& can
) const {
    std::optional<std::pair<NodeIndex, Float>> best;
    for (NodeIndex n : can) {
        if (!best || nodes_[n].gain < best->second) {
            best = std::make_pair(n, nodes_[n].gain);
        }
    }
    return best;
}

Index DecisionTree::prune(int32_t n_prune, Float threshold) {
    Pruner pruner(threshold, config_.verbosity);
    return pruner.prune(*this, n_prune);
}

// ============================================================================
// Prediction
// ============================================================================

NodeIndex DecisionTree::descend(const Vector& z) const {
    if (!root_) {
        throw std::runtime_error("decision tree has not been trained");
    }
    if (z.size() < n_features()) {
        throw std::invalid_argument("query vector has " + std::to_string(z.size()) +
                                    " values, tree expects " + std::to_string(n_features()));
    }

    NodeIndex n = *root_;
    while (!nodes_[n].is_leaf) {
        const TreeNode& node = nodes_[n];
        const Float value = z(node.feature);
        const std::optional<int> branch =
            node.threshold ? std::optional<int>(value <= *node.threshold ? 0 : 1)
                           : to_category(value);

        // Unseen or non-finite value: consensus of this node
        if (!std::isfinite(value) || !branch) {
            break;
        }
        auto it = node.branches.find(*branch);
        if (it == node.branches.end()) {
            break;
        }
        n = it->second;
    }
    return n;
}

Frequency DecisionTree::class_counts(const Vector& z) const {
    return nodes_[descend(z)].freq;
}

Label DecisionTree::predict(const Vector& z) const {
    return nodes_[descend(z)].majority;
}

// ============================================================================
// Entropy
// ============================================================================

Float DecisionTree::calc_entropy() const {
    return calc_entropy(std::vector<NodeIndex>(leaves_.begin(), leaves_.end()));
}

Float DecisionTree::calc_entropy(const std::vector<NodeIndex>& nodes) const {
    Float sum = 0.0;
    Float ent = 0.0;
    for (NodeIndex n : nodes) {
        const Float count = nodes_[n].count();
        sum += count;
        ent += count * entropy(nodes_[n].freq);
    }
    if (config_.verbosity > 1) {
        std::printf("[DEBUG] calc_entropy: nodes=%zu, sum=%.0f, ent=%.4f\n", nodes.size(), sum, ent);
    }
    return sum > 0 ? ent / sum : 0.0;
}

// ============================================================================
// Shape
// ============================================================================

Index DecisionTree::n_nodes() const {
    if (!root_) return 0;

    Index count = 0;
    std::vector<NodeIndex> stack = {*root_};
    while (!stack.empty()) {
        NodeIndex n = stack.back();
        stack.pop_back();
        ++count;
        for (const auto& [value, child] : nodes_[n].branches) {
            stack.push_back(child);
        }
    }
    return count;
}

int32_t DecisionTree::depth(NodeIndex n) const {
    int32_t d = 0;
    for (auto p = nodes_[n].parent; p; p = nodes_[*p].parent) {
        ++d;
    }
    return d;
}

int32_t DecisionTree::height() const {
    int32_t h = 0;
    for (NodeIndex leaf : leaves_) {
        h = std::max(h, depth(leaf));
    }
    return h;
}

// ============================================================================
// Output
// ============================================================================

std::string DecisionTree::describe(NodeIndex n) const {
    const TreeNode& node = nodes_[n];
    std::ostringstream out;
    out << node.branch_value << " -> \tNode (j = " << node.feature;
    if (node.feature >= 0 && node.feature < n_features()) {
        out << " (" << feature_names_[node.feature] << ")";
    }
    out << ", gain = " << node.gain << ", nu = [";
    for (size_t c = 0; c < node.freq.size(); ++c) {
        out << (c ? ", " : "") << node.freq[c];
    }
    out << "], y = " << node.majority << ", leaf = " << (node.is_leaf ? "true" : "false");
    if (node.threshold) {
        out << ", thres = " << *node.threshold;
    }
    out << ")";
    return out.str();
}

void DecisionTree::print_recursive(std::ostream& out, NodeIndex n, int level) const {
    const std::string indent(level, '\t');
    if (nodes_[n].is_leaf) {
        out << indent << "[ " << describe(n) << " ]\n";
        return;
    }
    out << indent << "[ " << describe(n) << "\n";
    for (const auto& [value, child] : nodes_[n].branches) {
        print_recursive(out, child, level + 1);
    }
    out << indent << "]\n";
}

void DecisionTree::print_tree(std::ostream& out) const {
    out << "Decision Tree:\n";
    if (root_) {
        print_recursive(out, *root_, 0);
    }
    out << "\n";
}

std::string DecisionTree::to_string() const {
    std::ostringstream out;
    print_tree(out);
    return out.str();
}

// ============================================================================
// Serialization
// ============================================================================

namespace {

constexpr uint32_t kModelMagic = 0x54425241;  // "ARBT"
constexpr uint32_t kModelVersion = 1;

template <typename T>
void write_pod(std::ostream& out, const T& value) {
    out.write(reinterpret_cast<const char*>(&value), sizeof(value));
}

template <typename T>
T read_pod(std::istream& in) {
    T value{};
    in.read(reinterpret_cast<char*>(&value), sizeof(value));
    if (!in) {
        throw std::runtime_error("Truncated Arbor model stream");
    }
    return value;
}

void write_string(std::ostream& out, const std::string& s) {
    write_pod(out, static_cast<uint32_t>(s.size()));
    out.write(s.data(), static_cast<std::streamsize>(s.size()));
}

std::string read_string(std::istream& in) {
    auto len = read_pod<uint32_t>(in);
    std::string s(len, '\0');
    in.read(&s[0], len);
    if (!in) {
        throw std::runtime_error("Truncated Arbor model stream");
    }
    return s;
}

} // namespace

void DecisionTree::save(std::ostream& out) const {
    write_pod(out, kModelMagic);
    write_pod(out, kModelVersion);
    write_pod(out, config_.n_classes);

    write_pod(out, static_cast<uint32_t>(feature_names_.size()));
    for (const auto& name : feature_names_) write_string(out, name);

    write_pod(out, static_cast<uint32_t>(value_counts_.size()));
    for (Index vc : value_counts_) write_pod(out, vc);

    write_pod(out, static_cast<uint32_t>(feature_order_.size()));
    for (FeatureIndex j : feature_order_) write_pod(out, j);

    write_pod(out, static_cast<uint8_t>(root_.has_value()));
    write_pod(out, root_.value_or(0));

    write_pod(out, static_cast<uint32_t>(nodes_.size()));
    for (const auto& node : nodes_) {
        write_pod(out, node.feature);
        write_pod(out, node.gain);
        for (Index c : node.freq) write_pod(out, c);
        write_pod(out, node.majority);
        write_pod(out, static_cast<uint8_t>(node.parent.has_value()));
        write_pod(out, node.parent.value_or(0));
        write_pod(out, static_cast<int32_t>(node.branch_value));
        write_pod(out, static_cast<uint8_t>(node.is_leaf));
        write_pod(out, static_cast<uint8_t>(node.threshold.has_value()));
        write_pod(out, node.threshold.value_or(0.0));
        write_pod(out, static_cast<uint32_t>(node.branches.size()));
        for (const auto& [value, child] : node.branches) {
            write_pod(out, static_cast<int32_t>(value));
            write_pod(out, child);
        }
    }

    if (!out) {
        throw std::runtime_error("Failed to write Arbor model");
    }
}

void DecisionTree::load(std::istream& in) {
    if (read_pod<uint32_t>(in) != kModelMagic) {
        throw std::runtime_error("Invalid Arbor model stream");
    }
    auto version = read_pod<uint32_t>(in);
    if (version != kModelVersion) {
        throw std::runtime_error("Unsupported Arbor model version: " + std::to_string(version));
    }
    auto n_classes = read_pod<uint32_t>(in);
    if (n_classes != config_.n_classes) {
        throw std::runtime_error("Model has " + std::to_string(n_classes) +
                                 " classes, tree expects " + std::to_string(config_.n_classes));
    }

    clear();

    feature_names_.resize(read_pod<uint32_t>(in));
    for (auto& name : feature_names_) name = read_string(in);

    value_counts_.resize(read_pod<uint32_t>(in));
    for (auto& vc : value_counts_) vc = read_pod<Index>(in);

    feature_order_.resize(read_pod<uint32_t>(in));
    for (auto& j : feature_order_) j = read_pod<FeatureIndex>(in);

    const bool has_root = read_pod<uint8_t>(in) != 0;
    const auto root = read_pod<NodeIndex>(in);

    nodes_.resize(read_pod<uint32_t>(in));
    for (auto& node : nodes_) {
        node.feature = read_pod<FeatureIndex>(in);
        node.gain = read_pod<Float>(in);
        node.freq.resize(n_classes);
        for (auto& c : node.freq) c = read_pod<Index>(in);
        node.majority = read_pod<Label>(in);
        const bool has_parent = read_pod<uint8_t>(in) != 0;
        const auto parent = read_pod<NodeIndex>(in);
        if (has_parent) node.parent = parent;
        node.branch_value = read_pod<int32_t>(in);
        node.is_leaf = read_pod<uint8_t>(in) != 0;
        const bool has_threshold = read_pod<uint8_t>(in) != 0;
        const auto threshold = read_pod<Float>(in);
        if (has_threshold) node.threshold = threshold;
        auto n_branches = read_pod<uint32_t>(in);
        for (uint32_t b = 0; b < n_branches; ++b) {
            auto value = read_pod<int32_t>(in);
            auto child = read_pod<NodeIndex>(in);
            if (child >= nodes_.size()) {
                throw std::runtime_error("Corrupt Arbor model: child index out of range");
            }
            node.branches[value] = child;
        }
    }

    const auto n_features = static_cast<FeatureIndex>(feature_names_.size());
    for (const auto& node : nodes_) {
        if (!node.is_leaf && (node.feature < 0 || node.feature >= n_features)) {
            throw std::runtime_error("Corrupt Arbor model: split feature " +
                                     std::to_string(node.feature) + " out of range");
        }
        if (node.majority < 0 || static_cast<uint32_t>(node.majority) >= n_classes) {
            throw std::runtime_error("Corrupt Arbor model: class label out of range");
        }
        if (node.parent && *node.parent >= nodes_.size()) {
            throw std::runtime_error("Corrupt Arbor model: parent index out of range");
        }
    }

    if (!has_root) return;
    if (root >= nodes_.size()) {
        throw std::runtime_error("Corrupt Arbor model: root index out of range");
    }

    // Leaf set = leaves reachable from the root; each node is reached once
    std::vector<bool> seen(nodes_.size(), false);
    std::vector<NodeIndex> stack = {root};
    while (!stack.empty()) {
        NodeIndex n = stack.back();
        stack.pop_back();
        if (seen[n]) {
            clear();
            throw std::runtime_error("Corrupt Arbor model: node " + std::to_string(n) +
                                     " reached twice");
        }
        seen[n] = true;
        if (nodes_[n].is_leaf) leaves_.insert(n);
        for (const auto& [value, child] : nodes_[n].branches) {
            stack.push_back(child);
        }
    }
    root_ = root;
}

} // namespace arbor
