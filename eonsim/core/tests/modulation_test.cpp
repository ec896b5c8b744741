#include <eonsim/core/modulation.hpp>
#include <eonsim/core/error.hpp>

#include <gtest/gtest.h>

#include <cstddef>
#include <limits>

using namespace eonsim::core;

class ModulationTest : public ::testing::Test {
protected:
    ModulationTable table_ = ModulationTable::from_config(default_config());
};

// =============================================================================
// Modulation selection
// =============================================================================

TEST_F(ModulationTest, ShortPathGetsDensestFormat) {
    EXPECT_EQ(table_.select_modulation(100.0).name, "16-QAM");
    EXPECT_EQ(table_.select_modulation(500.0).name, "16-QAM");
}

TEST_F(ModulationTest, ReachIsInclusive) {
    EXPECT_EQ(table_.select_modulation(1000.0).name, "8-QAM");
    EXPECT_EQ(table_.select_modulation(2000.0).name, "QPSK");
    EXPECT_EQ(table_.select_modulation(4000.0).name, "BPSK");
}

TEST_F(ModulationTest, BeyondEveryReachFallsBackToLongestReach) {
    EXPECT_EQ(table_.select_modulation(5000.0).name, "BPSK");
}

TEST_F(ModulationTest, TableOrderDoesNotMatter) {
    ModulationTable reversed({{"16-QAM", 500.0, 4.0}, {"BPSK", 4000.0, 1.0}, {"QPSK", 2000.0, 2.0}},
                             12.5, 1);

    EXPECT_EQ(reversed.select_modulation(300.0).name, "16-QAM");
    EXPECT_EQ(reversed.select_modulation(1500.0).name, "QPSK");
    EXPECT_EQ(reversed.select_modulation(9000.0).name, "BPSK");
}

// =============================================================================
// Slot sizing
// =============================================================================

TEST_F(ModulationTest, RequiredSlotsFloorsAndAddsGuardBand) {
    // floor(200 / (4 * 12.5)) + 1
    EXPECT_EQ(table_.required_slots(200.0, "16-QAM"), 5u);
    // floor(100 / 12.5) + 1
    EXPECT_EQ(table_.required_slots(100.0, "BPSK"), 9u);
    // floor(120 / 37.5) + 1
    EXPECT_EQ(table_.required_slots(120.0, "8-QAM"), 4u);
}

TEST_F(ModulationTest, TinyDemandStillTakesOneSlot) {
    EXPECT_EQ(table_.required_slots(1.0, "16-QAM"), 1u);

    ModulationTable no_guard(standard_modulation_formats(), 12.5, 0);
    EXPECT_EQ(no_guard.required_slots(1.0, "16-QAM"), 1u);
    EXPECT_EQ(no_guard.required_slots(0.0, "BPSK"), 1u);
}

TEST_F(ModulationTest, OversizedBandwidthIsUnplaceable) {
    constexpr auto unplaceable = std::numeric_limits<std::size_t>::max();
    const auto& format = table_.select_modulation(100.0);

    EXPECT_EQ(table_.required_slots(1e30, format), unplaceable);
    EXPECT_EQ(table_.required_slots(std::numeric_limits<double>::infinity(), format), unplaceable);
    EXPECT_EQ(table_.required_slots(std::numeric_limits<double>::quiet_NaN(), format), unplaceable);
    // Large but representable demands are still sized exactly
    EXPECT_EQ(table_.required_slots(50000.0, format), 1001u);
}

TEST_F(ModulationTest, UnknownNameThrows) {
    EXPECT_THROW((void)table_.find("64-QAM"), ConfigError);
    EXPECT_THROW((void)table_.required_slots(100.0, "64-QAM"), ConfigError);
}

TEST_F(ModulationTest, InvalidTableRejected) {
    EXPECT_THROW(ModulationTable({}, 12.5, 1), ConfigError);
    EXPECT_THROW(ModulationTable(standard_modulation_formats(), 0.0, 1), ConfigError);
    EXPECT_THROW(ModulationTable({{"X", 100.0, 0.0}}, 12.5, 1), ConfigError);
}
