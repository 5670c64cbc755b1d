#include <gtest/gtest.h>
#include <weft/layout/space_distributor.h>

#include <numeric>
#include <vector>

using namespace weft::layout;

static int sum(const std::vector<int>& v) {
    return std::accumulate(v.begin(), v.end(), 0);
}

TEST(SpaceDistributorTest, EvenSplitGivesExtraCellToFirst) {
    auto shares = distribute_by_factor(7, {1, 1});
    ASSERT_EQ(shares.size(), 2u);
    EXPECT_EQ(shares[0], 4);
    EXPECT_EQ(shares[1], 3);
}

TEST(SpaceDistributorTest, EvenSplitOfEvenRemainder) {
    auto shares = distribute_by_factor(8, {1, 1});
    EXPECT_EQ(shares, (std::vector<int>{4, 4}));
}

TEST(SpaceDistributorTest, WeightedSplitOneToTwo) {
    auto shares = distribute_by_factor(3, {1, 2});
    EXPECT_EQ(shares, (std::vector<int>{1, 2}));
}

TEST(SpaceDistributorTest, LeftoverCellsGoInListOrder) {
    // floor(5/3) = 1 each, two cells left over go to the first two.
    auto shares = distribute_by_factor(5, {1, 1, 1});
    EXPECT_EQ(shares, (std::vector<int>{2, 2, 1}));
}

TEST(SpaceDistributorTest, ZeroFactorEntriesGetNothing) {
    auto shares = distribute_by_factor(5, {0, 1, 1});
    EXPECT_EQ(shares, (std::vector<int>{0, 3, 2}));
}

TEST(SpaceDistributorTest, AllZeroFactorsHandOutNothing) {
    auto shares = distribute_by_factor(9, {0, 0});
    EXPECT_EQ(shares, (std::vector<int>{0, 0}));
}

TEST(SpaceDistributorTest, NoEntries) {
    EXPECT_TRUE(distribute_by_factor(10, {}).empty());
}

TEST(SpaceDistributorTest, ZeroOrNegativeRemainingGivesZeros) {
    EXPECT_EQ(distribute_by_factor(0, {1, 2}), (std::vector<int>{0, 0}));
    EXPECT_EQ(distribute_by_factor(-4, {1, 2}), (std::vector<int>{0, 0}));
}

TEST(SpaceDistributorTest, ConservesCellsForAwkwardWeights) {
    for (int remaining = 0; remaining < 40; ++remaining) {
        auto shares = distribute_by_factor(remaining, {3, 7, 1, 5});
        EXPECT_EQ(sum(shares), remaining) << "remaining=" << remaining;
    }
}

TEST(SpaceDistributorTest, LargeFactorsDoNotOverflow) {
    auto shares = distribute_by_factor(1000000, {4000000000u, 4000000000u});
    EXPECT_EQ(shares, (std::vector<int>{500000, 500000}));
}

TEST(SpaceDistributorTest, ExpandsTakePriorityOverSpacers) {
    Distribution d = distribute_stack(9, {1}, {1});
    EXPECT_EQ(d.expands, (std::vector<int>{9}));
    EXPECT_EQ(d.spacers, (std::vector<int>{0}));
    EXPECT_EQ(d.remaining, 0);
}

TEST(SpaceDistributorTest, SpacersShareWhenExpandsHaveZeroWeight) {
    Distribution d = distribute_stack(8, {0}, {1, 3});
    EXPECT_EQ(d.expands, (std::vector<int>{0}));
    EXPECT_EQ(d.spacers, (std::vector<int>{2, 6}));
    EXPECT_EQ(d.remaining, 0);
}

TEST(SpaceDistributorTest, NothingClaimsLeavesRemaining) {
    Distribution d = distribute_stack(6, {0}, {0});
    EXPECT_EQ(d.remaining, 6);
}
