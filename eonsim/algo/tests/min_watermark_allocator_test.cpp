#include <eonsim/algo/min_watermark_allocator.hpp>
#include <eonsim/algo/path_source.hpp>

#include <eonsim/core/config.hpp>
#include <eonsim/core/spectrum_ledger.hpp>
#include <eonsim/core/topology.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <utility>

using namespace eonsim::algo;
using namespace eonsim::core;

namespace {

class FixedPathSource : public PathSource {
public:
    explicit FixedPathSource(std::vector<Path> paths)
        : paths_(std::move(paths)) {}

    std::vector<Path> paths(NodeId, NodeId, std::size_t k) override {
        auto count = std::min(k, paths_.size());
        return {paths_.begin(), paths_.begin() + static_cast<std::ptrdiff_t>(count)};
    }

private:
    std::vector<Path> paths_;
};

} // anonymous namespace

class MinWatermarkAllocatorTest : public ::testing::Test {
protected:
    // Triangle: direct 0-2 and a two-hop detour through 1
    void SetUp() override {
        direct_ = topology_.add_link(0, 2, 100.0);
        topology_.add_link(0, 1, 100.0);
        topology_.add_link(1, 2, 100.0);
        config_.slot_capacity = 20;
    }

    Topology topology_{3};
    EonConfig config_;
    LinkIndex direct_{0};
};

TEST_F(MinWatermarkAllocatorTest, PrefersShortestPathOnTie) {
    SpectrumLedger ledger(topology_, config_);
    KShortestPathSource paths(topology_);
    MinWatermarkAllocator allocator(ledger, topology_, paths, config_);
    EXPECT_EQ(allocator.name(), "ksp-mw");

    auto outcome = allocator.allocate(Demand{0, 0, 2, 200.0});
    ASSERT_TRUE(outcome.allocated());
    EXPECT_EQ(outcome.circuit->path.nodes, (std::vector<NodeId>{0, 2}));
    EXPECT_EQ(outcome.circuit->start_slot, 0u);
}

TEST_F(MinWatermarkAllocatorTest, DetoursToKeepWatermarkLow) {
    SpectrumLedger ledger(topology_, config_);
    const std::vector<LinkIndex> direct{direct_};
    ASSERT_TRUE(ledger.commit(direct, 0, 10));

    KShortestPathSource paths(topology_);
    MinWatermarkAllocator allocator(ledger, topology_, paths, config_);

    auto outcome = allocator.allocate(Demand{0, 0, 2, 200.0});
    ASSERT_TRUE(outcome.allocated());
    EXPECT_EQ(outcome.circuit->path.nodes, (std::vector<NodeId>{0, 1, 2}));
    EXPECT_EQ(outcome.circuit->start_slot, 0u);
    EXPECT_EQ(ledger.watermark(), 10u);
}

TEST_F(MinWatermarkAllocatorTest, KeepsFirstPathWhenDetourIsNoBetter) {
    SpectrumLedger ledger(topology_, config_);
    const std::vector<LinkIndex> all{0, 1, 2};
    ASSERT_TRUE(ledger.commit(all, 0, 4));

    KShortestPathSource paths(topology_);
    MinWatermarkAllocator allocator(ledger, topology_, paths, config_);

    auto outcome = allocator.allocate(Demand{0, 0, 2, 200.0});
    ASSERT_TRUE(outcome.allocated());
    EXPECT_EQ(outcome.circuit->path.nodes, (std::vector<NodeId>{0, 2}));
    EXPECT_EQ(outcome.circuit->start_slot, 4u);
}

TEST_F(MinWatermarkAllocatorTest, BlocksWhenNoPathHasSpectrum) {
    SpectrumLedger ledger(topology_, config_);
    const std::vector<LinkIndex> all{0, 1, 2};
    ASSERT_TRUE(ledger.commit(all, 0, 18));

    KShortestPathSource paths(topology_);
    MinWatermarkAllocator allocator(ledger, topology_, paths, config_);

    auto outcome = allocator.allocate(Demand{0, 0, 2, 200.0});
    EXPECT_EQ(outcome.block_reason, BlockReason::NoSpectrum);
}

TEST_F(MinWatermarkAllocatorTest, SkipsUnresolvedPaths) {
    SpectrumLedger ledger(topology_, config_);
    FixedPathSource paths({Path{{0, 3}, 10.0}, Path{{0, 1, 2}, 200.0}});
    MinWatermarkAllocator allocator(ledger, topology_, paths, config_);

    auto outcome = allocator.allocate(Demand{0, 0, 2, 100.0});
    ASSERT_TRUE(outcome.allocated());
    EXPECT_EQ(outcome.circuit->path.nodes, (std::vector<NodeId>{0, 1, 2}));
}

TEST_F(MinWatermarkAllocatorTest, BlocksWhenEveryPathUnresolved) {
    SpectrumLedger ledger(topology_, config_);
    FixedPathSource paths({Path{{0, 3}, 10.0}});
    MinWatermarkAllocator allocator(ledger, topology_, paths, config_);

    EXPECT_EQ(allocator.allocate(Demand{0, 0, 2, 100.0}).block_reason,
              BlockReason::UnresolvedLink);
}

TEST_F(MinWatermarkAllocatorTest, BlocksWithoutCandidates) {
    SpectrumLedger ledger(topology_, config_);
    FixedPathSource paths(std::vector<Path>{});
    MinWatermarkAllocator allocator(ledger, topology_, paths, config_);

    EXPECT_EQ(allocator.allocate(Demand{0, 0, 2, 100.0}).block_reason, BlockReason::NoPath);
}
