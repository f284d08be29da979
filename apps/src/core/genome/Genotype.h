#pragma once

#include "BitGenome.h"
#include "RealGenome.h"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace CellGa {

class DeterministicRng;

enum class GenomeKind : uint8_t {
    Bits = 0,
    Reals = 1,
};

std::string toString(GenomeKind kind);

struct GenomeInitParams {
    GenomeKind kind = GenomeKind::Bits;
    int length = 20;
    double onesProbabilityMin = 0.5;
    double onesProbabilityMax = 0.5;
    double lowerBound = RealGenome::kDefaultLowerBound;
    double upperBound = RealGenome::kDefaultUpperBound;
};

struct MutationParams {
    double rate = 0.1;
    double sigma = 0.1; // Real genomes only.
};

/**
 * One individual: a bit or real genome plus its cached fitness.
 *
 * The engine works only through this interface and never inspects the concrete
 * genome type. Copies are deep (the genome owns its buffer) and keep the cached
 * fitness. Any operation that changes the genes clears the cache.
 */
class Genotype {
public:
    using Variant = std::variant<BitGenome, RealGenome>;

    Genotype() = default;

    explicit Genotype(BitGenome genome) : genome_(std::move(genome)) {}
    explicit Genotype(RealGenome genome) : genome_(std::move(genome)) {}

    /**
     * Random individual. For bit genomes the ones probability is drawn once from
     * [onesProbabilityMin, onesProbabilityMax]; no draw is spent when the range is a
     * single value.
     */
    static Genotype random(const GenomeInitParams& params, DeterministicRng& rng);

    GenomeKind kind() const;
    size_t size() const;

    const std::optional<double>& fitness() const { return fitness_; }
    void setFitness(double fitness) { fitness_ = fitness; }
    bool hasFitness() const { return fitness_.has_value(); }

    // Fitness for comparisons; the caller guarantees it has been evaluated.
    double fitnessValue() const;

    Variant& getVariant() { return genome_; }
    const Variant& getVariant() const { return genome_; }

    /**
     * Kind-specific recombination: single cut for bits, per-component blend for reals.
     * The child has no cached fitness.
     */
    static Genotype crossover(const Genotype& p1, const Genotype& p2, DeterministicRng& rng);

    /**
     * Mutate in place; clears the cached fitness when any gene changes.
     * @return Number of changed genes.
     */
    int mutate(const MutationParams& params, DeterministicRng& rng);

    // Hamming for bits, Euclidean for reals.
    double distanceTo(const Genotype& other) const;

    bool operator==(const Genotype& other) const = default;

private:
    Variant genome_;
    std::optional<double> fitness_;
};

} // namespace CellGa
