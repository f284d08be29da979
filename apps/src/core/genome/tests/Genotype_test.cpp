#include "core/genome/Genotype.h"
#include "core/random/DeterministicRng.h"

#include <gtest/gtest.h>

using namespace CellGa;

TEST(BitGenomeTest, ConstantFillsEveryGene)
{
    const BitGenome ones = BitGenome::constant(6, 1);

    EXPECT_EQ(ones.size(), 6u);
    EXPECT_EQ(ones.onesCount(), 6);
    EXPECT_EQ(BitGenome::constant(6, 0).onesCount(), 0);
}

TEST(BitGenomeTest, RandomRespectsOnesProbabilityExtremes)
{
    DeterministicRng rng(7);

    EXPECT_EQ(BitGenome::random(32, 1.0, rng).onesCount(), 32);
    EXPECT_EQ(BitGenome::random(32, 0.0, rng).onesCount(), 0);
    EXPECT_EQ(rng.seed(), 7 + 64);
}

TEST(BitGenomeTest, CrossoverTakesPrefixFromFirstParentAndSuffixFromSecond)
{
    const BitGenome zeros = BitGenome::constant(10, 0);
    const BitGenome ones = BitGenome::constant(10, 1);

    for (int seed = 1; seed < 50; seed++) {
        DeterministicRng rng(seed);
        const BitGenome child = crossover(zeros, ones, rng);

        ASSERT_EQ(child.size(), 10u);
        // Cut is in [1, L-1]: at least one gene from each parent.
        EXPECT_EQ(child.bits.front(), 0);
        EXPECT_EQ(child.bits.back(), 1);

        const int cut = 10 - child.onesCount();
        for (int i = 0; i < 10; i++) {
            EXPECT_EQ(child.bits[i], i < cut ? 0 : 1);
        }
        EXPECT_EQ(rng.seed(), seed + 1);
    }
}

TEST(BitGenomeTest, CrossoverOnSingleGeneCopiesFirstParentWithoutDrawing)
{
    DeterministicRng rng(99);

    const BitGenome child = crossover(BitGenome::constant(1, 1), BitGenome::constant(1, 0), rng);

    EXPECT_EQ(child, BitGenome::constant(1, 1));
    EXPECT_EQ(rng.seed(), 99);
}

TEST(BitGenomeTest, MutationRateZeroLeavesGenomeUntouched)
{
    DeterministicRng rng(3);
    BitGenome genome = BitGenome::constant(8, 1);

    EXPECT_EQ(mutate(genome, 0.0, rng), 0);
    EXPECT_EQ(genome, BitGenome::constant(8, 1));
    // One draw per gene regardless of rate.
    EXPECT_EQ(rng.seed(), 3 + 8);
}

TEST(BitGenomeTest, MutationRateOneFlipsEveryGene)
{
    DeterministicRng rng(3);
    BitGenome genome = BitGenome::constant(8, 1);

    EXPECT_EQ(mutate(genome, 1.0, rng), 8);
    EXPECT_EQ(genome, BitGenome::constant(8, 0));
}

TEST(BitGenomeTest, HammingDistanceCountsDifferingGenes)
{
    BitGenome a = BitGenome::constant(5, 0);
    BitGenome b = a;
    b.bits[1] = 1;
    b.bits[4] = 1;

    EXPECT_DOUBLE_EQ(distance(a, b), 2.0);
    EXPECT_DOUBLE_EQ(distance(a, a), 0.0);
}

TEST(RealGenomeTest, RandomStaysWithinInitializationBounds)
{
    DeterministicRng rng(11);
    const RealGenome genome = RealGenome::random(50, -1.0, 2.0, rng);

    ASSERT_EQ(genome.size(), 50u);
    for (const double value : genome.values) {
        EXPECT_GE(value, -1.0);
        EXPECT_LT(value, 2.0);
    }
}

TEST(RealGenomeTest, BlendCrossoverStaysBetweenParents)
{
    DeterministicRng rng(5);
    const RealGenome low = RealGenome::constant(4, -2.0);
    const RealGenome high = RealGenome::constant(4, 3.0);

    const RealGenome child = crossover(low, high, rng);

    ASSERT_EQ(child.size(), 4u);
    for (const double value : child.values) {
        EXPECT_GE(value, -2.0);
        EXPECT_LE(value, 3.0);
    }
    // One weight per component.
    EXPECT_EQ(rng.seed(), 5 + 4);
}

TEST(RealGenomeTest, MutationIsNotClampedToInitializationBounds)
{
    DeterministicRng rng(21);
    RealGenome genome = RealGenome::constant(20, RealGenome::kDefaultUpperBound);

    EXPECT_EQ(mutate(genome, 1.0, 100.0, rng), 20);

    bool outside = false;
    for (const double value : genome.values) {
        if (value > RealGenome::kDefaultUpperBound) {
            outside = true;
        }
    }
    EXPECT_TRUE(outside);
}

TEST(RealGenomeTest, ZeroSigmaMutationKeepsValues)
{
    DeterministicRng rng(21);
    RealGenome genome = RealGenome::constant(3, 1.5);

    mutate(genome, 1.0, 0.0, rng);

    EXPECT_EQ(genome, RealGenome::constant(3, 1.5));
}

TEST(RealGenomeTest, EuclideanDistance)
{
    RealGenome a;
    a.values = { 0.0, 0.0 };
    RealGenome b;
    b.values = { 3.0, 4.0 };

    EXPECT_DOUBLE_EQ(distance(a, b), 5.0);
}

TEST(GenotypeTest, RandomBitGenotypeSpendsNoDrawOnFixedOnesProbability)
{
    DeterministicRng rng(100);
    const GenomeInitParams params{ .kind = GenomeKind::Bits, .length = 12 };

    const Genotype g = Genotype::random(params, rng);

    EXPECT_EQ(g.kind(), GenomeKind::Bits);
    EXPECT_EQ(g.size(), 12u);
    EXPECT_FALSE(g.hasFitness());
    EXPECT_EQ(rng.seed(), 100 + 12);
}

TEST(GenotypeTest, RandomBitGenotypeDrawsOnesProbabilityFromRange)
{
    DeterministicRng rng(100);
    const GenomeInitParams params{
        .kind = GenomeKind::Bits,
        .length = 12,
        .onesProbabilityMin = 0.2,
        .onesProbabilityMax = 0.8,
    };

    Genotype::random(params, rng);

    EXPECT_EQ(rng.seed(), 100 + 1 + 12);
}

TEST(GenotypeTest, RandomRealGenotypeHasRequestedDimension)
{
    DeterministicRng rng(1);
    const GenomeInitParams params{ .kind = GenomeKind::Reals, .length = 5 };

    const Genotype g = Genotype::random(params, rng);

    EXPECT_EQ(g.kind(), GenomeKind::Reals);
    EXPECT_EQ(g.size(), 5u);
}

TEST(GenotypeTest, CopyIsDeepAndKeepsFitness)
{
    Genotype source(BitGenome::constant(4, 0));
    source.setFitness(4.0);

    Genotype copy = source;
    std::get<BitGenome>(copy.getVariant()).bits[0] = 1;

    EXPECT_EQ(std::get<BitGenome>(source.getVariant()).bits[0], 0);
    ASSERT_TRUE(copy.hasFitness());
    EXPECT_DOUBLE_EQ(copy.fitnessValue(), 4.0);
}

TEST(GenotypeTest, CrossoverChildHasNoFitness)
{
    DeterministicRng rng(8);
    Genotype p1(BitGenome::constant(6, 0));
    Genotype p2(BitGenome::constant(6, 1));
    p1.setFitness(6.0);
    p2.setFitness(0.0);

    const Genotype child = Genotype::crossover(p1, p2, rng);

    EXPECT_EQ(child.kind(), GenomeKind::Bits);
    EXPECT_FALSE(child.hasFitness());
}

TEST(GenotypeTest, MutationClearsFitnessOnlyWhenGenesChange)
{
    DeterministicRng rng(8);
    Genotype g(BitGenome::constant(6, 0));
    g.setFitness(6.0);

    EXPECT_EQ(g.mutate(MutationParams{ .rate = 0.0 }, rng), 0);
    EXPECT_TRUE(g.hasFitness());

    EXPECT_EQ(g.mutate(MutationParams{ .rate = 1.0 }, rng), 6);
    EXPECT_FALSE(g.hasFitness());
}

TEST(GenotypeTest, DistanceDispatchesOnKind)
{
    const Genotype a(BitGenome::constant(3, 0));
    const Genotype b(BitGenome::constant(3, 1));
    RealGenome r1;
    r1.values = { 1.0 };
    RealGenome r2;
    r2.values = { -1.0 };

    EXPECT_DOUBLE_EQ(a.distanceTo(b), 3.0);
    EXPECT_DOUBLE_EQ(Genotype(r1).distanceTo(Genotype(r2)), 2.0);
}
