/**
 * Arbor Tests
 */

#include <gtest/gtest.h>
#include "arbor/arbor.hpp"

// ============================================================================
// Types Tests
// ============================================================================

TEST(TypesTest, FrequencyTotal) {
    arbor::Frequency freq = {5, 9};
    EXPECT_EQ(arbor::total(freq), 14u);
    EXPECT_EQ(arbor::total(arbor::Frequency{}), 0u);
}

TEST(TypesTest, ArgmaxFirstOnTies) {
    arbor::Frequency clear_winner = {5, 9};
    arbor::Frequency tie = {3, 3};
    arbor::Frequency three_way = {0, 2, 2};

    EXPECT_EQ(arbor::argmax(clear_winner), 1);
    EXPECT_EQ(arbor::argmax(tie), 0);
    EXPECT_EQ(arbor::argmax(three_way), 1);
}

TEST(TypesTest, TreeNodeDefaults) {
    arbor::TreeNode node;

    EXPECT_EQ(node.feature, arbor::kNoFeature);
    EXPECT_TRUE(node.is_leaf);
    EXPECT_FALSE(node.parent.has_value());
    EXPECT_FALSE(node.is_continuous());
    EXPECT_TRUE(node.branches.empty());
}

// ============================================================================
// Config Tests
// ============================================================================

TEST(ConfigTest, DefaultValues) {
    arbor::Config config;

    EXPECT_EQ(config.tree.height, 4);
    EXPECT_DOUBLE_EQ(config.tree.cutoff, 0.01);
    EXPECT_EQ(config.ensemble.n_trees, 11);
    EXPECT_DOUBLE_EQ(config.ensemble.b_ratio, 0.7);
    EXPECT_DOUBLE_EQ(config.ensemble.fb_ratio, 0.7);
    EXPECT_EQ(config.prune.n_prune, 1);
    EXPECT_DOUBLE_EQ(config.prune.threshold, 0.98);
}

TEST(ConfigTest, ClassNames) {
    auto binary = arbor::Config::id3();
    EXPECT_EQ(binary.class_name(0), "No");
    EXPECT_EQ(binary.class_name(1), "Yes");

    auto multi = arbor::Config::c45(3);
    EXPECT_TRUE(multi.class_names.empty());
    EXPECT_EQ(multi.class_name(2), "c2");
    EXPECT_NO_THROW(multi.validate());
}

TEST(ConfigTest, Validation) {
    arbor::Config config;
    EXPECT_NO_THROW(config.validate());

    config.n_classes = 1;
    config.class_names.clear();
    EXPECT_THROW(config.validate(), std::invalid_argument);

    config = arbor::Config();
    config.class_names = {"only"};
    EXPECT_THROW(config.validate(), std::invalid_argument);

    config = arbor::Config();
    config.tree.height = -1;
    EXPECT_THROW(config.validate(), std::invalid_argument);

    config = arbor::Config();
    config.tree.cutoff = 1.5;
    EXPECT_THROW(config.validate(), std::invalid_argument);

    config = arbor::Config();
    config.prune.n_prune = -2;
    EXPECT_THROW(config.validate(), std::invalid_argument);
}

TEST(ConfigTest, EnsembleValidation) {
    auto config = arbor::Config::bagging(2, 5);
    EXPECT_NO_THROW(config.validate_ensemble(false));

    config.ensemble.n_trees = 0;
    EXPECT_THROW(config.validate_ensemble(false), std::invalid_argument);

    config = arbor::Config::bagging();
    config.ensemble.b_ratio = 1.0;
    EXPECT_THROW(config.validate_ensemble(false), std::invalid_argument);

    config = arbor::Config::bagging();
    config.ensemble.fb_ratio = 0.0;
    EXPECT_NO_THROW(config.validate_ensemble(false));
    EXPECT_THROW(config.validate_ensemble(true), std::invalid_argument);
}

TEST(ConfigTest, ModelRejectsFlawedConfig) {
    arbor::Config config;
    config.class_names = {"a", "b", "c"};
    EXPECT_THROW(arbor::ID3Tree tree(config), std::invalid_argument);

    auto bagging = arbor::Config::bagging();
    bagging.ensemble.b_ratio = 0.0;
    EXPECT_THROW(arbor::BaggingTrees bag(bagging), std::invalid_argument);

    auto forest = arbor::Config::random_forest();
    forest.ensemble.fb_ratio = 1.0;
    EXPECT_THROW(arbor::RandomForest rf(forest), std::invalid_argument);
}

// ============================================================================
// Version Tests
// ============================================================================

TEST(VersionTest, VersionString) {
    EXPECT_STREQ(arbor::Version::string, ARBOR_VERSION_STRING);
    EXPECT_EQ(arbor::Version::major, ARBOR_VERSION_MAJOR);
}

// ============================================================================
// Main
// ============================================================================

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
