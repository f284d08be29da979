#include "core/fitness/FitnessFunction.h"

#include <gtest/gtest.h>

using namespace CellGa;

namespace {
BitGenome bitsWithOnes(int length, int ones)
{
    BitGenome genome = BitGenome::constant(length, 0);
    for (int i = 0; i < ones; i++) {
        genome.bits[i] = 1;
    }
    return genome;
}
} // namespace

TEST(FitnessFunctionTest, OneMaxIsZeroAtAllOnesAndLengthAtAllZeros)
{
    EXPECT_DOUBLE_EQ(oneMax(BitGenome::constant(20, 1)), 0.0);
    EXPECT_DOUBLE_EQ(oneMax(BitGenome::constant(20, 0)), 20.0);
    EXPECT_DOUBLE_EQ(oneMax(bitsWithOnes(20, 7)), 13.0);
}

TEST(FitnessFunctionTest, TrapRewardsAllZerosAndDeceivesTowardAllOnes)
{
    EXPECT_DOUBLE_EQ(trap(bitsWithOnes(5, 0)), 0.0);
    EXPECT_DOUBLE_EQ(trap(bitsWithOnes(5, 5)), 1.0);
    EXPECT_DOUBLE_EQ(trap(bitsWithOnes(5, 1)), 5.0);
    EXPECT_DOUBLE_EQ(trap(bitsWithOnes(5, 4)), 2.0);
}

TEST(FitnessFunctionTest, SphereSumsSquares)
{
    RealGenome genome;
    genome.values = { 1.0, -2.0, 3.0 };

    EXPECT_DOUBLE_EQ(sphere(genome), 14.0);
    EXPECT_DOUBLE_EQ(sphere(RealGenome::constant(4, 0.0)), 0.0);
}

TEST(FitnessFunctionTest, RastriginIsZeroAtOriginAndPositiveElsewhere)
{
    EXPECT_NEAR(rastrigin(RealGenome::constant(10, 0.0)), 0.0, 1e-9);

    // Integer points sit on the cosine minima: only x^2 remains.
    RealGenome integerPoint;
    integerPoint.values = { 1.0, -2.0 };
    EXPECT_NEAR(rastrigin(integerPoint), 5.0, 1e-9);

    EXPECT_GT(rastrigin(RealGenome::constant(3, 0.5)), 0.0);
}

TEST(FitnessFunctionTest, EvaluateDispatchesOnFunction)
{
    const Genotype bits(bitsWithOnes(4, 1));
    RealGenome reals;
    reals.values = { 2.0 };

    EXPECT_DOUBLE_EQ(evaluate(FitnessFunction::OneMax, bits), 3.0);
    EXPECT_DOUBLE_EQ(evaluate(FitnessFunction::Trap, bits), 4.0);
    EXPECT_DOUBLE_EQ(evaluate(FitnessFunction::Sphere, Genotype(reals)), 4.0);
}

TEST(FitnessFunctionTest, GenomeKindFollowsFunction)
{
    EXPECT_EQ(genomeKindFor(FitnessFunction::OneMax), GenomeKind::Bits);
    EXPECT_EQ(genomeKindFor(FitnessFunction::Trap), GenomeKind::Bits);
    EXPECT_EQ(genomeKindFor(FitnessFunction::Sphere), GenomeKind::Reals);
    EXPECT_EQ(genomeKindFor(FitnessFunction::Rastrigin), GenomeKind::Reals);
}

TEST(FitnessFunctionTest, ParsesConfigIdentifiers)
{
    EXPECT_EQ(fitnessFunctionFromString("onemax"), FitnessFunction::OneMax);
    EXPECT_EQ(fitnessFunctionFromString("trap"), FitnessFunction::Trap);
    EXPECT_EQ(fitnessFunctionFromString("sphere"), FitnessFunction::Sphere);
    EXPECT_EQ(fitnessFunctionFromString("rastrigin"), FitnessFunction::Rastrigin);
    EXPECT_FALSE(fitnessFunctionFromString("griewank").has_value());
}

TEST(FitnessFunctionTest, JsonRejectsUnknownName)
{
    EXPECT_EQ(nlohmann::json("trap").get<FitnessFunction>(), FitnessFunction::Trap);
    EXPECT_THROW(nlohmann::json("griewank").get<FitnessFunction>(), std::exception);
    EXPECT_THROW(nlohmann::json(3).get<FitnessFunction>(), std::exception);
}
