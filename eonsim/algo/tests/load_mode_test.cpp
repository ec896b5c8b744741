#include <eonsim/algo/load_mode.hpp>

#include <eonsim/core/config.hpp>

#include <gtest/gtest.h>

using namespace eonsim::algo;
using namespace eonsim::core;

class LoadModeTest : public ::testing::Test {
protected:
    LoadThresholds thresholds_;
};

TEST_F(LoadModeTest, LightLoadIsNormal) {
    EXPECT_EQ(select_load_mode(0.0, 0.0, thresholds_), LoadMode::Normal);
    EXPECT_EQ(select_load_mode(0.5, 0.05, thresholds_), LoadMode::Normal);
}

TEST_F(LoadModeTest, EitherMetricRaisesToHigh) {
    EXPECT_EQ(select_load_mode(0.71, 0.0, thresholds_), LoadMode::High);
    EXPECT_EQ(select_load_mode(0.0, 0.11, thresholds_), LoadMode::High);
}

TEST_F(LoadModeTest, EitherMetricRaisesToExtreme) {
    EXPECT_EQ(select_load_mode(0.93, 0.0, thresholds_), LoadMode::Extreme);
    EXPECT_EQ(select_load_mode(0.0, 0.19, thresholds_), LoadMode::Extreme);
    EXPECT_EQ(select_load_mode(0.5, 0.5, thresholds_), LoadMode::Extreme);
}

TEST_F(LoadModeTest, BoundariesAreExclusive) {
    EXPECT_EQ(select_load_mode(0.70, 0.10, thresholds_), LoadMode::Normal);
    EXPECT_EQ(select_load_mode(0.92, 0.18, thresholds_), LoadMode::High);
}

TEST_F(LoadModeTest, CustomThresholds) {
    thresholds_.high_watermark_ratio = 0.2;
    thresholds_.high_utilization = 0.01;
    thresholds_.extreme_watermark_ratio = 0.4;
    thresholds_.extreme_utilization = 0.02;

    EXPECT_EQ(select_load_mode(0.3, 0.0, thresholds_), LoadMode::High);
    EXPECT_EQ(select_load_mode(0.0, 0.015, thresholds_), LoadMode::High);
    EXPECT_EQ(select_load_mode(0.45, 0.0, thresholds_), LoadMode::Extreme);
}

TEST_F(LoadModeTest, DefaultParameters) {
    auto config = default_config();

    auto normal = mode_parameters(LoadMode::Normal, config);
    EXPECT_EQ(normal.k_paths, 3u);
    EXPECT_EQ(normal.max_offsets, 10u);

    auto high = mode_parameters(LoadMode::High, config);
    EXPECT_EQ(high.k_paths, 5u);
    EXPECT_EQ(high.max_offsets, 3u);

    auto extreme = mode_parameters(LoadMode::Extreme, config);
    EXPECT_EQ(extreme.k_paths, 3u);
    EXPECT_EQ(extreme.max_offsets, 1u);
}

TEST_F(LoadModeTest, ParametersFollowConfig) {
    auto config = default_config();
    config.k_paths = 4;
    config.path_fanout.high = 6;
    config.offset_caps.normal = 12;

    EXPECT_EQ(mode_parameters(LoadMode::Normal, config).k_paths, 4u);
    EXPECT_EQ(mode_parameters(LoadMode::Normal, config).max_offsets, 12u);
    EXPECT_EQ(mode_parameters(LoadMode::High, config).k_paths, 6u);
}

TEST_F(LoadModeTest, Names) {
    EXPECT_EQ(to_string(LoadMode::Normal), "normal");
    EXPECT_EQ(to_string(LoadMode::High), "high");
    EXPECT_EQ(to_string(LoadMode::Extreme), "extreme");
}
