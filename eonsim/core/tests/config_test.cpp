#include <eonsim/core/config.hpp>
#include <eonsim/core/error.hpp>

#include <gtest/gtest.h>

using namespace eonsim::core;

TEST(ConfigTest, DefaultsMatchReferenceNetwork) {
    auto config = default_config();

    EXPECT_EQ(config.slot_capacity, 320u);
    EXPECT_DOUBLE_EQ(config.slot_width_ghz, 12.5);
    EXPECT_EQ(config.guard_band_slots, 1u);
    EXPECT_EQ(config.k_paths, 3u);
    EXPECT_EQ(config.offset_caps.normal, 10u);
    EXPECT_EQ(config.offset_caps.high, 3u);
    EXPECT_EQ(config.offset_caps.extreme, 1u);
    EXPECT_EQ(config.path_fanout.high, 5u);
    EXPECT_EQ(config.path_fanout.extreme, 3u);
    EXPECT_DOUBLE_EQ(config.thresholds.high_watermark_ratio, 0.70);
    EXPECT_DOUBLE_EQ(config.thresholds.high_utilization, 0.10);
    EXPECT_DOUBLE_EQ(config.thresholds.extreme_watermark_ratio, 0.92);
    EXPECT_DOUBLE_EQ(config.thresholds.extreme_utilization, 0.18);
    EXPECT_NO_THROW(validate(config));
}

TEST(ConfigTest, StandardTableOrder) {
    auto formats = standard_modulation_formats();

    ASSERT_EQ(formats.size(), 4u);
    EXPECT_EQ(formats[0].name, "BPSK");
    EXPECT_EQ(formats[1].name, "QPSK");
    EXPECT_EQ(formats[2].name, "8-QAM");
    EXPECT_EQ(formats[3].name, "16-QAM");
    EXPECT_DOUBLE_EQ(formats[3].max_reach_km, 500.0);
    EXPECT_DOUBLE_EQ(formats[3].spectral_efficiency, 4.0);
}

TEST(ConfigTest, ZeroCapacityRejected) {
    auto config = default_config();
    config.slot_capacity = 0;
    EXPECT_THROW(validate(config), ConfigError);
}

TEST(ConfigTest, NonPositiveSlotWidthRejected) {
    auto config = default_config();
    config.slot_width_ghz = 0.0;
    EXPECT_THROW(validate(config), ConfigError);
}

TEST(ConfigTest, EmptyModulationTableRejected) {
    auto config = default_config();
    config.modulations.clear();
    EXPECT_THROW(validate(config), ConfigError);
}

TEST(ConfigTest, BadModulationEntryRejected) {
    auto config = default_config();
    config.modulations[1].spectral_efficiency = 0.0;
    EXPECT_THROW(validate(config), ConfigError);

    config = default_config();
    config.modulations[0].max_reach_km = -1.0;
    EXPECT_THROW(validate(config), ConfigError);
}

TEST(ConfigTest, DuplicateModulationNameRejected) {
    auto config = default_config();
    config.modulations.push_back({"QPSK", 1500.0, 2.5});
    EXPECT_THROW(validate(config), ConfigError);
}

TEST(ConfigTest, ZeroFanoutOrCapRejected) {
    auto config = default_config();
    config.k_paths = 0;
    EXPECT_THROW(validate(config), ConfigError);

    config = default_config();
    config.path_fanout.high = 0;
    EXPECT_THROW(validate(config), ConfigError);

    config = default_config();
    config.offset_caps.extreme = 0;
    EXPECT_THROW(validate(config), ConfigError);
}

TEST(ConfigTest, ThresholdsOutOfOrderRejected) {
    auto config = default_config();
    config.thresholds.high_watermark_ratio = 0.95;
    EXPECT_THROW(validate(config), ConfigError);

    config = default_config();
    config.thresholds.high_utilization = 0.5;
    EXPECT_THROW(validate(config), ConfigError);
}

TEST(ConfigTest, ThresholdOutsideUnitIntervalRejected) {
    auto config = default_config();
    config.thresholds.extreme_watermark_ratio = 1.5;
    EXPECT_THROW(validate(config), ConfigError);
}
