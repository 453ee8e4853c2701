#include "contagion/sim/broadcast_value.hpp"
#include "contagion/sim/buffered_value.hpp"

#include <cstdint>
#include <numeric>
#include <random>
#include <vector>

#include <gtest/gtest.h>

using namespace contagion::sim;

namespace test
{

TEST(BufferedValueTest, BufferedWritesStayHiddenUntilCommit)
{
    BufferedValue<int32_t> value{10};
    EXPECT_FALSE(value.needsCommit());

    value.setBuffered(20);
    EXPECT_EQ(value.get(), 10);
    EXPECT_TRUE(value.needsCommit());

    value.addBuffered(5);
    EXPECT_EQ(value.get(), 10);
    EXPECT_EQ(value.buffered(), 25);

    value.commit();
    EXPECT_EQ(value.get(), 25);
    EXPECT_FALSE(value.needsCommit());
}

TEST(BufferedValueTest, CommitWithoutPendingWriteKeepsValue)
{
    BufferedValue<float> value{1.5f};
    value.commit();
    value.commit();
    EXPECT_FLOAT_EQ(value.get(), 1.5f);
    EXPECT_FALSE(value.needsCommit());
}

TEST(BufferedValueTest, DirectWriteDropsStagedValue)
{
    BufferedValue<int32_t> value{3};
    value.addBuffered(7);
    value.set(42);

    EXPECT_EQ(value.get(), 42);
    EXPECT_EQ(value.buffered(), 42);
    EXPECT_FALSE(value.needsCommit());

    value.commit();
    EXPECT_EQ(value.get(), 42);
}

class BroadcastTest : public ::testing::Test
{
protected:
    // values_[0] is the source, the rest are its targets in link order
    void build(int32_t source, const std::vector<float>& priorities)
    {
        values_.clear();
        values_.emplace_back(source);
        for (float priority : priorities) {
            values_.emplace_back(0, priority);
        }
        for (BlockId id = 1; id < values_.size(); ++id) {
            values_[0].addOutLink(ValueLink{.block = id, .quantity = Quantity::HEALTHY_POP});
        }
    }

    int32_t broadcast(float ratio, float offset = 0.0f)
    {
        return values_[0].broadcast(ratio, offset, [this](const ValueLink& link) -> IntValue& { return values_[link.block]; });
    }

    void commitAll()
    {
        for (IntValue& value : values_) {
            value.commit();
        }
    }

    int64_t bufferedSum() const
    {
        return std::accumulate(values_.begin(), values_.end(), int64_t{0}, [](int64_t sum, const IntValue& value) { return sum + value.buffered(); });
    }

    std::vector<IntValue> values_;
};

TEST_F(BroadcastTest, EqualPrioritiesSplitEvenly)
{
    build(100, {0.0f, 0.0f});

    EXPECT_EQ(broadcast(0.5f), 50);
    EXPECT_EQ(values_[0].get(), 100);

    commitAll();
    EXPECT_EQ(values_[0].get(), 50);
    EXPECT_EQ(values_[1].get(), 25);
    EXPECT_EQ(values_[2].get(), 25);
}

TEST_F(BroadcastTest, PriorityWeightsAndRoundingResidue)
{
    build(110, {0.0f, 20.0f});

    // 55 shared by weights 1 and 21: 2 and 52, one unit stays at the source
    EXPECT_EQ(broadcast(0.5f), 54);

    commitAll();
    EXPECT_EQ(values_[0].get(), 56);
    EXPECT_EQ(values_[1].get(), 2);
    EXPECT_EQ(values_[2].get(), 52);
}

TEST_F(BroadcastTest, OffsetFiltersLowPriorityTargets)
{
    build(100, {0.0f, 20.0f, 1.0f});

    EXPECT_EQ(broadcast(0.5f, 2.0f), 50);

    commitAll();
    EXPECT_EQ(values_[0].get(), 50);
    EXPECT_EQ(values_[1].get(), 0);
    EXPECT_EQ(values_[2].get(), 50);
    EXPECT_EQ(values_[3].get(), 0);
}

TEST_F(BroadcastTest, NoEligibleTargetIsNoop)
{
    build(100, {0.0f});

    EXPECT_EQ(broadcast(0.5f, 2.0f), 0);
    EXPECT_FALSE(values_[0].needsCommit());
    EXPECT_FALSE(values_[1].needsCommit());

    build(100, {});
    EXPECT_EQ(broadcast(0.5f), 0);
    EXPECT_FALSE(values_[0].needsCommit());
}

TEST_F(BroadcastTest, TinyRatioGivesNothing)
{
    build(100, {0.0f, 0.0f});

    EXPECT_EQ(broadcast(1e-7f), 0);
    EXPECT_EQ(broadcast(-0.5f), 0);

    commitAll();
    EXPECT_EQ(values_[0].get(), 100);
    EXPECT_EQ(values_[1].get(), 0);
}

TEST_F(BroadcastTest, NeverGivesMoreThanOwned)
{
    build(10, {0.0f, 0.0f, 0.0f});

    EXPECT_EQ(broadcast(3.0f), 9);

    commitAll();
    EXPECT_EQ(values_[0].get(), 1);
    EXPECT_EQ(values_[1].get(), 3);
    EXPECT_EQ(values_[2].get(), 3);
    EXPECT_EQ(values_[3].get(), 3);
}

TEST_F(BroadcastTest, SeveralSourcesAccumulateIntoOneTarget)
{
    build(40, {0.0f});
    values_.emplace_back(60);
    values_.back().addOutLink(ValueLink{.block = 1, .quantity = Quantity::HEALTHY_POP});

    broadcast(0.5f);
    values_.back().broadcast(0.5f, 0.0f, [this](const ValueLink& link) -> IntValue& { return values_[link.block]; });

    EXPECT_EQ(values_[1].get(), 0);
    commitAll();
    EXPECT_EQ(values_[1].get(), 50);
    EXPECT_EQ(values_[0].get(), 20);
    EXPECT_EQ(values_[2].get(), 30);
}

TEST_F(BroadcastTest, RandomBroadcastsConserveTotal)
{
    std::mt19937 rng{42};
    std::uniform_int_distribution<int32_t> amount{0, 5000};
    std::uniform_int_distribution<int32_t> targets{0, 7};
    std::uniform_int_distribution<int32_t> priority{0, 25};
    std::uniform_real_distribution<float> ratio{0.0f, 1.0f};
    std::uniform_real_distribution<float> offset{0.0f, 5.0f};

    for (int run = 0; run < 500; ++run) {
        std::vector<float> priorities(targets(rng));
        for (float& p : priorities) {
            p = static_cast<float>(priority(rng));
        }
        build(amount(rng), priorities);

        const int64_t before = bufferedSum();
        const int32_t given  = broadcast(ratio(rng), offset(rng));

        EXPECT_EQ(bufferedSum(), before);
        EXPECT_GE(given, 0);
        EXPECT_LE(given, values_[0].get());
        EXPECT_EQ(values_[0].buffered(), values_[0].get() - given);
    }
}

} // namespace test
