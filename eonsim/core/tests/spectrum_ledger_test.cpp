#include <eonsim/core/spectrum_ledger.hpp>
#include <eonsim/core/config.hpp>
#include <eonsim/core/error.hpp>
#include <eonsim/core/topology.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <optional>
#include <random>
#include <vector>

using namespace eonsim::core;

namespace {

// Plain boolean grid mirroring the ledger, used as a reference model
class ReferenceGrid {
public:
    ReferenceGrid(std::size_t links, std::size_t capacity)
        : cells_(links, std::vector<bool>(capacity, false)) {}

    void fill(LinkIndex link, std::size_t start, std::size_t count, bool value) {
        for (std::size_t s = start; s < start + count; ++s) {
            cells_[link][s] = value;
        }
    }

    [[nodiscard]] bool window_free(const std::vector<LinkIndex>& links, std::size_t start,
                                   std::size_t count) const {
        for (auto link : links) {
            for (std::size_t s = start; s < start + count; ++s) {
                if (cells_[link][s]) {
                    return false;
                }
            }
        }
        return true;
    }

    [[nodiscard]] std::optional<std::size_t> first_fit(const std::vector<LinkIndex>& links,
                                                       std::size_t count) const {
        const std::size_t capacity = cells_.front().size();
        for (std::size_t start = 0; start + count <= capacity; ++start) {
            if (window_free(links, start, count)) {
                return start;
            }
        }
        return std::nullopt;
    }

    [[nodiscard]] std::size_t watermark() const {
        std::size_t result = 0;
        for (const auto& row : cells_) {
            for (std::size_t s = row.size(); s > 0; --s) {
                if (row[s - 1]) {
                    result = std::max(result, s);
                    break;
                }
            }
        }
        return result;
    }

private:
    std::vector<std::vector<bool>> cells_;
};

std::vector<LinkIndex> random_links(std::mt19937& rng, std::size_t link_count) {
    std::vector<LinkIndex> all(link_count);
    for (std::size_t i = 0; i < link_count; ++i) {
        all[i] = i;
    }
    std::shuffle(all.begin(), all.end(), rng);
    std::uniform_int_distribution<std::size_t> size_dist(1, std::min<std::size_t>(4, link_count));
    all.resize(size_dist(rng));
    return all;
}

} // anonymous namespace

class SpectrumLedgerTest : public ::testing::Test {
protected:
    SpectrumLedger ledger_{2, 20};
    const std::vector<LinkIndex> both_{0, 1};
    const std::vector<LinkIndex> a_{0};
    const std::vector<LinkIndex> b_{1};
};

// =============================================================================
// Construction and observers
// =============================================================================

TEST_F(SpectrumLedgerTest, EmptyLedger) {
    EXPECT_EQ(ledger_.link_count(), 2u);
    EXPECT_EQ(ledger_.slot_capacity(), 20u);
    EXPECT_EQ(ledger_.watermark(), 0u);
    EXPECT_DOUBLE_EQ(ledger_.watermark_ratio(), 0.0);
    EXPECT_DOUBLE_EQ(ledger_.utilization(), 0.0);
    EXPECT_EQ(ledger_.find_first_fit(both_, 3).value(), 0u);
}

TEST_F(SpectrumLedgerTest, ZeroCapacityRejected) {
    EXPECT_THROW(SpectrumLedger(3, 0), ConfigError);
}

TEST_F(SpectrumLedgerTest, SizedFromTopologyAndConfig) {
    Topology topology(3);
    topology.add_link(0, 1, 10.0);
    topology.add_link(1, 2, 10.0);
    auto config = default_config();

    SpectrumLedger ledger(topology, config);
    EXPECT_EQ(ledger.link_count(), 2u);
    EXPECT_EQ(ledger.slot_capacity(), 320u);
}

TEST_F(SpectrumLedgerTest, OccupancyStatistics) {
    ASSERT_TRUE(ledger_.commit(a_, 0, 5));
    ASSERT_TRUE(ledger_.commit(both_, 10, 5));

    EXPECT_EQ(ledger_.occupied_cells(), 15u);
    EXPECT_DOUBLE_EQ(ledger_.utilization(), 15.0 / 40.0);
    EXPECT_DOUBLE_EQ(ledger_.link_utilization(0), 10.0 / 20.0);
    EXPECT_DOUBLE_EQ(ledger_.link_utilization(1), 5.0 / 20.0);
    EXPECT_DOUBLE_EQ(ledger_.link_utilization(7), 0.0);
    EXPECT_TRUE(ledger_.is_occupied(0, 4));
    EXPECT_FALSE(ledger_.is_occupied(0, 5));
    EXPECT_FALSE(ledger_.is_occupied(1, 4));
    EXPECT_FALSE(ledger_.is_occupied(1, 25));
    EXPECT_DOUBLE_EQ(ledger_.watermark_ratio(), 15.0 / 20.0);
}

TEST_F(SpectrumLedgerTest, LinkWatermark) {
    ASSERT_TRUE(ledger_.commit(a_, 3, 4));

    EXPECT_EQ(ledger_.link_watermark(0), 7u);
    EXPECT_EQ(ledger_.link_watermark(1), 0u);
    EXPECT_EQ(ledger_.link_watermark(42), 0u);
}

// =============================================================================
// First fit
// =============================================================================

TEST_F(SpectrumLedgerTest, FirstFitFindsLowestCommonWindow) {
    // A holds [5, 11), B holds [8, 13): [0, 5) is still free on both
    ASSERT_TRUE(ledger_.commit(a_, 5, 6));
    ASSERT_TRUE(ledger_.commit(b_, 8, 5));
    EXPECT_EQ(ledger_.find_first_fit(both_, 3).value(), 0u);

    // Close the low gap on A: the first common window sits above both blocks
    ASSERT_TRUE(ledger_.commit(a_, 0, 5));
    EXPECT_EQ(ledger_.find_first_fit(both_, 3).value(), 13u);
}

TEST_F(SpectrumLedgerTest, FirstFitSkipsTooSmallGaps) {
    ASSERT_TRUE(ledger_.commit(a_, 2, 2));
    ASSERT_TRUE(ledger_.commit(b_, 6, 1));

    // Gaps on the union: [0,2), [4,6), [7,20)
    EXPECT_EQ(ledger_.find_first_fit(both_, 2).value(), 0u);
    EXPECT_EQ(ledger_.find_first_fit(both_, 3).value(), 7u);
    EXPECT_EQ(ledger_.find_first_fit(both_, 13).value(), 7u);
    EXPECT_FALSE(ledger_.find_first_fit(both_, 14).has_value());
}

TEST_F(SpectrumLedgerTest, SaturatedLedgerHasNoFit) {
    ASSERT_TRUE(ledger_.commit(both_, 0, 20));

    EXPECT_FALSE(ledger_.find_first_fit(both_, 1).has_value());
    EXPECT_TRUE(ledger_.find_best_fit_positions(both_, 1, 10).empty());
    EXPECT_DOUBLE_EQ(ledger_.utilization(), 1.0);
}

TEST_F(SpectrumLedgerTest, InvalidQueriesReturnNothing) {
    const std::vector<LinkIndex> none;
    const std::vector<LinkIndex> bad{0, 2};

    EXPECT_FALSE(ledger_.find_first_fit(none, 1).has_value());
    EXPECT_FALSE(ledger_.find_first_fit(bad, 1).has_value());
    EXPECT_FALSE(ledger_.find_first_fit(both_, 0).has_value());
    EXPECT_FALSE(ledger_.find_first_fit(both_, 21).has_value());
    EXPECT_TRUE(ledger_.find_best_fit_positions(bad, 1, 5).empty());
    EXPECT_TRUE(ledger_.find_best_fit_positions(both_, 1, 0).empty());
}

TEST(SpectrumLedgerWordTest, WindowsAcrossWordBoundaries) {
    SpectrumLedger ledger(1, 130);
    const std::vector<LinkIndex> link{0};

    ASSERT_TRUE(ledger.commit(link, 60, 10));
    EXPECT_TRUE(ledger.is_occupied(0, 63));
    EXPECT_TRUE(ledger.is_occupied(0, 64));
    EXPECT_FALSE(ledger.is_occupied(0, 70));
    EXPECT_EQ(ledger.link_watermark(0), 70u);
    EXPECT_EQ(ledger.occupied_cells(), 10u);

    EXPECT_EQ(ledger.find_first_fit(link, 60).value(), 0u);
    EXPECT_FALSE(ledger.find_first_fit(link, 61).has_value());

    ASSERT_TRUE(ledger.commit(link, 0, 60));
    EXPECT_EQ(ledger.find_first_fit(link, 60).value(), 70u);
    EXPECT_FALSE(ledger.commit(link, 125, 6));
    EXPECT_TRUE(ledger.commit(link, 125, 5));
    EXPECT_EQ(ledger.watermark(), 130u);
}

// =============================================================================
// Best fit
// =============================================================================

TEST_F(SpectrumLedgerTest, BestFitPrefersWindowsBelowWatermark) {
    // Link A holds [0,2) and [6,10): max link watermark of the set is 10
    ASSERT_TRUE(ledger_.commit(a_, 0, 2));
    ASSERT_TRUE(ledger_.commit(a_, 6, 4));

    auto offsets = ledger_.find_best_fit_positions(both_, 2, 5);
    EXPECT_EQ(offsets, (std::vector<std::size_t>{2, 3, 4, 10, 11}));

    auto capped = ledger_.find_best_fit_positions(both_, 2, 2);
    EXPECT_EQ(capped, (std::vector<std::size_t>{2, 3}));
}

TEST_F(SpectrumLedgerTest, BestFitIncreaseGroupOrderedByIncrease) {
    ASSERT_TRUE(ledger_.commit(a_, 0, 4));

    // Nothing fits below 4 for 5 slots: every window raises the watermark
    auto offsets = ledger_.find_best_fit_positions(both_, 5, 3);
    EXPECT_EQ(offsets, (std::vector<std::size_t>{4, 5, 6}));
}

TEST_F(SpectrumLedgerTest, BestFitUsesOnlyTheQueriedLinks) {
    // B is busy high up, but only A is queried
    ASSERT_TRUE(ledger_.commit(b_, 15, 5));
    ASSERT_TRUE(ledger_.commit(a_, 4, 2));

    auto offsets = ledger_.find_best_fit_positions(a_, 2, 3);
    EXPECT_EQ(offsets, (std::vector<std::size_t>{0, 1, 2}));
}

// =============================================================================
// Commit and release
// =============================================================================

TEST_F(SpectrumLedgerTest, CommitConflictLeavesLedgerUntouched) {
    ASSERT_TRUE(ledger_.commit(b_, 4, 2));
    auto before = ledger_.occupied_cells();

    EXPECT_FALSE(ledger_.commit(both_, 3, 3));
    EXPECT_EQ(ledger_.occupied_cells(), before);
    EXPECT_FALSE(ledger_.is_occupied(0, 3));
    EXPECT_EQ(ledger_.watermark(), 6u);
}

TEST_F(SpectrumLedgerTest, InvalidCommitRejected) {
    const std::vector<LinkIndex> none;
    const std::vector<LinkIndex> bad{5};

    EXPECT_FALSE(ledger_.commit(none, 0, 1));
    EXPECT_FALSE(ledger_.commit(bad, 0, 1));
    EXPECT_FALSE(ledger_.commit(both_, 0, 0));
    EXPECT_FALSE(ledger_.commit(both_, 18, 3));
    EXPECT_FALSE(ledger_.commit(both_, 25, 1));
    EXPECT_EQ(ledger_.occupied_cells(), 0u);
    EXPECT_EQ(ledger_.watermark(), 0u);
}

TEST_F(SpectrumLedgerTest, ReleaseRecomputesWatermark) {
    ASSERT_TRUE(ledger_.commit(a_, 0, 3));
    ASSERT_TRUE(ledger_.commit(b_, 10, 4));
    EXPECT_EQ(ledger_.watermark(), 14u);

    ASSERT_TRUE(ledger_.release(b_, 10, 4));
    EXPECT_EQ(ledger_.watermark(), 3u);
    EXPECT_EQ(ledger_.link_watermark(1), 0u);

    ASSERT_TRUE(ledger_.release(a_, 0, 3));
    EXPECT_EQ(ledger_.watermark(), 0u);
    EXPECT_FALSE(ledger_.release(a_, 19, 2));
}

TEST_F(SpectrumLedgerTest, ResetClearsEverything) {
    ASSERT_TRUE(ledger_.commit(both_, 2, 8));
    ledger_.reset();

    EXPECT_EQ(ledger_.watermark(), 0u);
    EXPECT_EQ(ledger_.occupied_cells(), 0u);
    EXPECT_EQ(ledger_.find_first_fit(both_, 20).value(), 0u);
}

// =============================================================================
// Randomised comparison against the reference grid
// =============================================================================

TEST(SpectrumLedgerPropertyTest, AgreesWithReferenceGrid) {
    constexpr std::size_t LINKS = 6;
    constexpr std::size_t CAPACITY = 150;

    std::mt19937 rng(2024);
    std::uniform_int_distribution<std::size_t> slots_dist(1, 12);

    SpectrumLedger ledger(LINKS, CAPACITY);
    ReferenceGrid grid(LINKS, CAPACITY);
    std::vector<std::pair<std::vector<LinkIndex>, std::pair<std::size_t, std::size_t>>> placed;

    std::size_t previous_watermark = 0;
    for (int iteration = 0; iteration < 400; ++iteration) {
        auto links = random_links(rng, LINKS);
        auto slots = slots_dist(rng);

        auto start = ledger.find_first_fit(links, slots);
        ASSERT_TRUE(start == grid.first_fit(links, slots));
        if (!start) {
            continue;
        }

        // The returned window never overlaps an occupied cell
        for (auto link : links) {
            for (std::size_t s = *start; s < *start + slots; ++s) {
                ASSERT_FALSE(ledger.is_occupied(link, s));
            }
        }

        ASSERT_TRUE(ledger.commit(links, *start, slots));
        for (auto link : links) {
            grid.fill(link, *start, slots, true);
        }
        placed.push_back({links, {*start, slots}});

        ASSERT_GE(ledger.watermark(), previous_watermark);
        ASSERT_EQ(ledger.watermark(), grid.watermark());
        previous_watermark = ledger.watermark();
    }
    ASSERT_FALSE(placed.empty());

    // Release every other placement and compare with a rescan of the grid
    for (std::size_t i = 0; i < placed.size(); i += 2) {
        const auto& [links, window] = placed[i];
        ASSERT_TRUE(ledger.release(links, window.first, window.second));
        for (auto link : links) {
            grid.fill(link, window.first, window.second, false);
        }
        ASSERT_EQ(ledger.watermark(), grid.watermark());
    }
}

TEST(SpectrumLedgerPropertyTest, BestFitOffsetsAreFeasible) {
    constexpr std::size_t LINKS = 4;
    constexpr std::size_t CAPACITY = 96;

    std::mt19937 rng(7);
    std::uniform_int_distribution<std::size_t> start_dist(0, CAPACITY - 6);

    SpectrumLedger ledger(LINKS, CAPACITY);
    ReferenceGrid grid(LINKS, CAPACITY);
    for (int i = 0; i < 40; ++i) {
        std::vector<LinkIndex> one{static_cast<LinkIndex>(i % LINKS)};
        auto start = start_dist(rng);
        if (ledger.commit(one, start, 5)) {
            grid.fill(one.front(), start, 5, true);
        }
    }

    const std::vector<LinkIndex> all{0, 1, 2, 3};
    auto offsets = ledger.find_best_fit_positions(all, 3, 10);
    for (auto offset : offsets) {
        EXPECT_TRUE(grid.window_free(all, offset, 3));
    }
    std::vector<std::size_t> unique(offsets);
    std::sort(unique.begin(), unique.end());
    EXPECT_EQ(std::adjacent_find(unique.begin(), unique.end()), unique.end());
}
