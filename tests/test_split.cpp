/**
 * Arbor Split Criterion Tests
 */

#include <gtest/gtest.h>
#include "arbor/split.hpp"
#include "test_data.hpp"

using namespace arbor;

// ============================================================================
// Entropy
// ============================================================================

TEST(EntropyTest, KnownValues) {
    EXPECT_NEAR(entropy({5, 9}), 0.940286, 1e-6);
    EXPECT_DOUBLE_EQ(entropy({2, 2}), 1.0);
    EXPECT_DOUBLE_EQ(entropy({1, 1, 1, 1}), 2.0);
}

TEST(EntropyTest, PureAndEmpty) {
    EXPECT_DOUBLE_EQ(entropy({0, 4}), 0.0);
    EXPECT_DOUBLE_EQ(entropy({0, 0}), 0.0);
    EXPECT_DOUBLE_EQ(entropy(Frequency{}), 0.0);
}

// ============================================================================
// Categorical Gain
// ============================================================================

class TennisSplitTest : public ::testing::Test {
protected:
    void SetUp() override {
        data_ = Dataset(test_data::tennis_x(), test_data::tennis_y(), 2);
    }

    Dataset data_;
};

TEST_F(TennisSplitTest, CategoricalGains) {
    SplitFinder finder(data_);
    auto rows = data_.all_rows();

    auto [outlook, freq] = finder.categorical_gain(0, rows);
    EXPECT_NEAR(outlook, 0.246750, 1e-6);
    EXPECT_EQ(freq, (Frequency{5, 9}));

    EXPECT_NEAR(finder.categorical_gain(1, rows).first, 0.029223, 1e-6);
    EXPECT_NEAR(finder.categorical_gain(2, rows).first, 0.151836, 1e-6);
    EXPECT_NEAR(finder.categorical_gain(3, rows).first, 0.048127, 1e-6);
}

TEST_F(TennisSplitTest, GainIsNonNegative) {
    SplitFinder finder(data_);
    std::vector<std::vector<Index>> subsets = {
        data_.all_rows(), {0, 1, 7, 8, 10}, {3, 4, 5, 9, 13}, {2, 6}
    };

    for (const auto& rows : subsets) {
        for (FeatureIndex j = 0; j < data_.n_features(); ++j) {
            EXPECT_GE(finder.categorical_gain(j, rows).first, -1e-12);
        }
    }
}

TEST_F(TennisSplitTest, BestSplitPicksOutlook) {
    SplitFinder finder(data_);
    SplitInfo split = finder.find_best_split(data_.all_rows(), data_.all_features(), false);

    EXPECT_TRUE(split.is_valid());
    EXPECT_EQ(split.feature, 0);
    EXPECT_NEAR(split.gain, 0.246750, 1e-6);
    EXPECT_FALSE(split.threshold.has_value());
    EXPECT_EQ(split.freq, (Frequency{5, 9}));
}

TEST_F(TennisSplitTest, BestSplitOverRemainingColumns) {
    SplitFinder finder(data_);
    // Sunny rows without Outlook: Humidity separates them
    SplitInfo split = finder.find_best_split({0, 1, 7, 8, 10}, {1, 2, 3}, false);

    EXPECT_EQ(split.feature, 2);
    EXPECT_NEAR(split.gain, 0.970951, 1e-6);
    EXPECT_EQ(split.freq, (Frequency{3, 2}));
}

TEST_F(TennisSplitTest, NoSplitOnPureRows) {
    SplitFinder finder(data_);
    SplitInfo split = finder.find_best_split({2, 6, 11, 12}, data_.all_features(), false);

    EXPECT_FALSE(split.is_valid());
    EXPECT_EQ(split.feature, kNoFeature);
    EXPECT_DOUBLE_EQ(split.gain, 0.0);
    EXPECT_EQ(split.freq, (Frequency{0, 4}));
}

// ============================================================================
// Continuous Threshold
// ============================================================================

TEST(ContinuousSplitTest, MidpointBetweenClusters) {
    Dataset data(test_data::clusters_x(), test_data::clusters_y(), 2, {0});
    SplitFinder finder(data);

    auto threshold = finder.find_threshold(0, data.all_rows());
    ASSERT_TRUE(threshold.has_value());
    EXPECT_DOUBLE_EQ(*threshold, 6.5);

    auto [gain, freq] = finder.continuous_gain(0, data.all_rows(), *threshold);
    EXPECT_DOUBLE_EQ(gain, 1.0);
    EXPECT_EQ(freq, (Frequency{3, 3}));
}

TEST(ContinuousSplitTest, ThresholdUsesOnlyGivenRows) {
    Dataset data(test_data::clusters_x(), test_data::clusters_y(), 2, {0});
    SplitFinder finder(data);

    // Rows {1, 2, 3}: values 2, 3, 10 with labels 0, 0, 1
    auto threshold = finder.find_threshold(0, {1, 2, 3});
    ASSERT_TRUE(threshold.has_value());
    EXPECT_DOUBLE_EQ(*threshold, 6.5);

    // Rows {0, 1}: both class 0, the first midpoint wins
    auto pure = finder.find_threshold(0, {0, 1});
    ASSERT_TRUE(pure.has_value());
    EXPECT_DOUBLE_EQ(*pure, 1.5);
}

TEST(ContinuousSplitTest, ConstantColumnHasNoThreshold) {
    Matrix x(4, 1);
    x << 3, 3, 3, 3;
    Labels y(4);
    y << 0, 1, 0, 1;
    Dataset data(x, y, 2, {0});
    SplitFinder finder(data);

    EXPECT_FALSE(finder.find_threshold(0, data.all_rows()).has_value());
    EXPECT_FALSE(finder.find_best_split(data.all_rows(), {0}, true).is_valid());
}

TEST(ContinuousSplitTest, TennisThresholds) {
    Dataset data(test_data::tennis_cont_x(), test_data::tennis_y(), 2, test_data::tennis_conts());
    SplitFinder finder(data);
    auto rows = data.all_rows();

    auto temp = finder.find_threshold(1, rows);
    ASSERT_TRUE(temp.has_value());
    EXPECT_DOUBLE_EQ(*temp, 84.0);
    EXPECT_NEAR(finder.continuous_gain(1, rows, *temp).first, 0.113401, 1e-6);

    auto humidity = finder.find_threshold(2, rows);
    ASSERT_TRUE(humidity.has_value());
    EXPECT_DOUBLE_EQ(*humidity, 82.5);

    SplitInfo split = finder.find_best_split(rows, data.all_features(), true);
    EXPECT_EQ(split.feature, 0);
    EXPECT_FALSE(split.threshold.has_value());
}

TEST(ContinuousSplitTest, ThresholdStoredOnBestSplit) {
    Dataset data(test_data::tennis_cont_x(), test_data::tennis_y(), 2, test_data::tennis_conts());
    SplitFinder finder(data);

    SplitInfo split = finder.find_best_split({0, 1, 7, 8, 10}, {1, 2, 3}, true);
    EXPECT_EQ(split.feature, 2);
    ASSERT_TRUE(split.threshold.has_value());
    EXPECT_DOUBLE_EQ(*split.threshold, 77.5);
    EXPECT_NEAR(split.gain, 0.970951, 1e-6);
}
