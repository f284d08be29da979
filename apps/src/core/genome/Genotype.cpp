#include "Genotype.h"

#include "core/Assert.h"
#include "core/LoggingChannels.h"
#include "core/random/DeterministicRng.h"

namespace CellGa {

std::string toString(GenomeKind kind)
{
    switch (kind) {
        case GenomeKind::Bits:
            return "bits";
        case GenomeKind::Reals:
            return "reals";
    }
    return "unknown";
}

Genotype Genotype::random(const GenomeInitParams& params, DeterministicRng& rng)
{
    if (params.kind == GenomeKind::Reals) {
        return Genotype(
            RealGenome::random(params.length, params.lowerBound, params.upperBound, rng));
    }

    double onesProbability = params.onesProbabilityMin;
    if (params.onesProbabilityMax > params.onesProbabilityMin) {
        onesProbability +=
            rng.nextFloat() * (params.onesProbabilityMax - params.onesProbabilityMin);
    }
    return Genotype(BitGenome::random(params.length, onesProbability, rng));
}

GenomeKind Genotype::kind() const
{
    return std::holds_alternative<BitGenome>(genome_) ? GenomeKind::Bits : GenomeKind::Reals;
}

size_t Genotype::size() const
{
    return std::visit([](const auto& genome) { return genome.size(); }, genome_);
}

double Genotype::fitnessValue() const
{
    CELLGA_ASSERT(fitness_.has_value(), "Genotype fitness read before evaluation");
    return fitness_.value();
}

Genotype Genotype::crossover(const Genotype& p1, const Genotype& p2, DeterministicRng& rng)
{
    CELLGA_ASSERT(p1.kind() == p2.kind(), "Crossover parents must share a genome kind");

    return std::visit(
        [&p2, &rng](const auto& first) -> Genotype {
            using T = std::decay_t<decltype(first)>;
            const auto& second = std::get<T>(p2.genome_);
            if constexpr (std::is_same_v<T, BitGenome>) {
                if (first.size() < 2) {
                    LOG_TRACE(Genome, "Bit crossover skipped: length {} has no cut", first.size());
                }
            }
            return Genotype(CellGa::crossover(first, second, rng));
        },
        p1.genome_);
}

int Genotype::mutate(const MutationParams& params, DeterministicRng& rng)
{
    const int changed = std::visit(
        [&params, &rng](auto& genome) -> int {
            using T = std::decay_t<decltype(genome)>;
            if constexpr (std::is_same_v<T, BitGenome>) {
                return CellGa::mutate(genome, params.rate, rng);
            }
            else {
                return CellGa::mutate(genome, params.rate, params.sigma, rng);
            }
        },
        genome_);

    if (changed > 0) {
        fitness_.reset();
    }
    return changed;
}

double Genotype::distanceTo(const Genotype& other) const
{
    CELLGA_ASSERT(kind() == other.kind(), "Distance requires genotypes of the same kind");

    return std::visit(
        [&other](const auto& genome) -> double {
            using T = std::decay_t<decltype(genome)>;
            return CellGa::distance(genome, std::get<T>(other.genome_));
        },
        genome_);
}

} // namespace CellGa
