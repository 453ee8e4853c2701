#include "contagion/sim/block.hpp"
#include "contagion/sim/block_graph.hpp"
#include "fixed_random_source.hpp"

#include <memory>

#include <gtest/gtest.h>

using namespace contagion::sim;

namespace test
{

class BlockTest : public ::testing::Test
{
protected:
    BlockGraph graph_{std::make_shared<const ProfileTable>()};
    FixedRandomSource no_deaths_{false};
};

TEST_F(BlockTest, InitialState)
{
    const BlockId factory  = graph_.addBlock(BlockType::FACTORY, 500, 7, 100);
    const BlockId hospital = graph_.addBlock(BlockType::HOSPITAL, 10, 0, 0);

    const Block& f = graph_.block(factory);
    EXPECT_EQ(f.type(), BlockType::FACTORY);
    EXPECT_EQ(f.healthy(), 500);
    EXPECT_EQ(f.currentInfected(), 0);
    EXPECT_EQ(f.nextInfected(), 7);
    EXPECT_EQ(f.material(), 100);
    EXPECT_TRUE(f.isWorking());
    EXPECT_FALSE(f.isQuarantined());

    const Block& h = graph_.block(hospital);
    EXPECT_FALSE(h.isWorking());
    EXPECT_FLOAT_EQ(h.value(Quantity::INFECTED_CURR_GEN).priority(), 20.0f);
    EXPECT_FLOAT_EQ(h.value(Quantity::HEALTHY_POP).priority(), 0.0f);
}

TEST_F(BlockTest, WorkingFactoryFeedsHousing)
{
    const BlockId factory = graph_.addBlock(BlockType::FACTORY, 500, 0, 100);
    const BlockId housing = graph_.addBlock(BlockType::HOUSING, 0, 0, 0);
    graph_.connect(factory, housing);

    graph_.runRound(no_deaths_);

    // 100 + floor(1 * 500) = 600, then half of it moves to the housing block
    EXPECT_EQ(graph_.block(factory).material(), 300);
    EXPECT_EQ(graph_.block(housing).material(), 300);
    EXPECT_EQ(graph_.block(factory).healthy(), 250);
    EXPECT_EQ(graph_.block(housing).healthy(), 250);
    EXPECT_EQ(graph_.block(housing).currentInfected(), 0);
    EXPECT_EQ(graph_.block(housing).nextInfected(), 0);
}

TEST_F(BlockTest, IdleFactoryBurnsMaterialDownToFloor)
{
    const BlockId factory = graph_.addBlock(BlockType::FACTORY, 500, 0, 3);
    graph_.block(factory).stopWorking();

    // floor(-0.01 * 500) drops at least 5, clamped at zero
    graph_.runRound(no_deaths_);
    EXPECT_EQ(graph_.block(factory).material(), 0);
}

TEST_F(BlockTest, TaxIsAppliedImmediately)
{
    const BlockId housing = graph_.addBlock(BlockType::HOUSING, 100, 0, 97);
    Block& block          = graph_.block(housing);

    EXPECT_EQ(block.taxed(), 4);
    EXPECT_EQ(block.material(), 93);
    EXPECT_FALSE(block.value(Quantity::MATERIAL).needsCommit());
}

TEST_F(BlockTest, OnlyFactoriesStartWorking)
{
    Block& housing = graph_.block(graph_.addBlock(BlockType::HOUSING, 100, 0, 0));
    EXPECT_FALSE(housing.startWorking());
    EXPECT_FALSE(housing.isWorking());
    EXPECT_TRUE(housing.stopWorking());

    Block& factory = graph_.block(graph_.addBlock(BlockType::FACTORY, 100, 0, 0));
    EXPECT_TRUE(factory.stopWorking());
    EXPECT_FALSE(factory.isWorking());
    EXPECT_FLOAT_EQ(factory.materialRate(), factory.profile().material_rate);
    EXPECT_TRUE(factory.startWorking());
    EXPECT_TRUE(factory.isWorking());
    EXPECT_FLOAT_EQ(factory.materialRate(), factory.profile().working_material_rate);
}

TEST_F(BlockTest, AidClearsPopulation)
{
    const BlockId housing = graph_.addBlock(BlockType::HOUSING, 321, 12, 40);
    Block& block          = graph_.block(housing);

    EXPECT_TRUE(block.aided());
    EXPECT_EQ(block.healthy(), 0);
    EXPECT_EQ(block.currentInfected(), 0);
    EXPECT_EQ(block.nextInfected(), 0);
    EXPECT_EQ(block.material(), 40);
}

TEST_F(BlockTest, QuarantineIsolatesForItsPeriod)
{
    const BlockId factory = graph_.addBlock(BlockType::FACTORY, 500, 0, 0);
    const BlockId housing = graph_.addBlock(BlockType::HOUSING, 0, 0, 0);
    graph_.connect(factory, housing);

    EXPECT_TRUE(graph_.block(factory).quarantined(2));

    graph_.runRound(no_deaths_);
    EXPECT_TRUE(graph_.block(factory).isQuarantined());
    EXPECT_EQ(graph_.block(factory).quarantineCounter(), 1);
    EXPECT_EQ(graph_.block(housing).healthy(), 0);

    // the counter reaches the period: released, still silent this round
    graph_.runRound(no_deaths_);
    EXPECT_FALSE(graph_.block(factory).isQuarantined());
    EXPECT_EQ(graph_.block(housing).healthy(), 0);
    EXPECT_EQ(graph_.block(housing).material(), 0);

    graph_.runRound(no_deaths_);
    EXPECT_EQ(graph_.block(housing).healthy(), 250);
    EXPECT_EQ(graph_.block(factory).healthy(), 250);
}

TEST_F(BlockTest, EndRoundReportsIsolation)
{
    Block& block = graph_.block(graph_.addBlock(BlockType::HOUSING, 10, 0, 0));
    const ValueResolver resolver = [&](const ValueLink& link) -> IntValue& { return graph_.block(link.block).value(link.quantity); };

    block.quarantined(1);
    EXPECT_FALSE(block.endRound(resolver));
    EXPECT_FALSE(block.isQuarantined());
    EXPECT_TRUE(block.endRound(resolver));
}

TEST_F(BlockTest, InfectionProgressesThroughGenerations)
{
    const BlockId housing = graph_.addBlock(BlockType::HOUSING, 100, 10, 0);

    // incubating cohort is silent during its first stage
    graph_.runRound(no_deaths_);
    graph_.runRound(no_deaths_);
    EXPECT_EQ(graph_.block(housing).healthy(), 100);
    EXPECT_EQ(graph_.block(housing).nextInfected(), 10);

    // second stage: each incubating person infects R0 = 2
    graph_.runRound(no_deaths_);
    EXPECT_EQ(graph_.block(housing).healthy(), 80);
    EXPECT_EQ(graph_.block(housing).nextInfected(), 30);

    graph_.runRound(no_deaths_);
    graph_.runRound(no_deaths_);
    EXPECT_EQ(graph_.block(housing).healthy(), 0);
    EXPECT_EQ(graph_.block(housing).nextInfected(), 110);

    // full stage cycle: incubating cohort becomes symptomatic
    graph_.runRound(no_deaths_);
    EXPECT_EQ(graph_.block(housing).currentInfected(), 110);
    EXPECT_EQ(graph_.block(housing).nextInfected(), 0);
    EXPECT_EQ(graph_.block(housing).healthy(), 0);

    // next full cycle: symptomatic cohort recovers
    for (int round = 0; round < 6; ++round) {
        graph_.runRound(no_deaths_);
    }
    EXPECT_EQ(graph_.block(housing).healthy(), 110);
    EXPECT_EQ(graph_.block(housing).currentInfected(), 0);
}

TEST_F(BlockTest, DeathsComeFromBothCohorts)
{
    const FixedRandomSource worst{true};
    const BlockId housing = graph_.addBlock(BlockType::HOUSING, 0, 0, 0);
    Block& block          = graph_.block(housing);
    block.value(Quantity::INFECTED_CURR_GEN).set(100);
    block.value(Quantity::INFECTED_NEXT_GEN).set(100);

    // current cohort dies at DR * 0.1, the incubating one does not die
    graph_.runRound(worst);
    EXPECT_EQ(block.currentInfected(), 90);
    EXPECT_EQ(block.nextInfected(), 100);
}

TEST_F(BlockTest, SymptomaticInfectedSeekHospitals)
{
    const BlockId source   = graph_.addBlock(BlockType::HOUSING, 0, 0, 0);
    const BlockId hospital = graph_.addBlock(BlockType::HOSPITAL, 0, 0, 0);
    const BlockId housing  = graph_.addBlock(BlockType::HOUSING, 0, 0, 0);
    graph_.connect(source, hospital);
    graph_.connect(source, housing);
    graph_.block(source).value(Quantity::INFECTED_CURR_GEN).set(44);

    graph_.runRound(no_deaths_);

    // 39 leave, split by weights 21 and 1: 37 and 1, the residue stays
    EXPECT_EQ(graph_.block(hospital).currentInfected(), 37);
    EXPECT_EQ(graph_.block(housing).currentInfected(), 1);
    EXPECT_EQ(graph_.block(source).currentInfected(), 6);
}

TEST_F(BlockTest, HospitalKeepsInfectedAwayFromOrdinaryBlocks)
{
    const BlockId hospital = graph_.addBlock(BlockType::HOSPITAL, 0, 0, 0);
    const BlockId housing  = graph_.addBlock(BlockType::HOUSING, 0, 0, 0);
    const BlockId other    = graph_.addBlock(BlockType::HOSPITAL, 0, 0, 0);
    graph_.connect(hospital, housing);
    graph_.block(hospital).value(Quantity::INFECTED_CURR_GEN).set(44);

    graph_.runRound(no_deaths_);
    EXPECT_EQ(graph_.block(hospital).currentInfected(), 44);
    EXPECT_EQ(graph_.block(housing).currentInfected(), 0);

    graph_.connect(hospital, other);
    graph_.runRound(no_deaths_);
    EXPECT_EQ(graph_.block(other).currentInfected(), 39);
    EXPECT_EQ(graph_.block(hospital).currentInfected(), 5);
}

} // namespace test
