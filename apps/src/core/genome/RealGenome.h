#pragma once

#include <cstddef>
#include <vector>

namespace CellGa {

class DeterministicRng;

/**
 * Fixed-dimension real-valued genome.
 *
 * Bounds apply to initialization only. Mutation may move components outside them
 * and nothing clamps them back.
 */
struct RealGenome {
    static constexpr double kDefaultLowerBound = -5.12;
    static constexpr double kDefaultUpperBound = 5.12;

    std::vector<double> values;

    static RealGenome random(int dimension, double lower, double upper, DeterministicRng& rng);
    static RealGenome constant(int dimension, double value);

    size_t size() const { return values.size(); }

    bool operator==(const RealGenome& other) const = default;
};

/**
 * Blend crossover with an independent weight per component:
 * child[i] = a*p1[i] + (1-a)*p2[i].
 */
RealGenome crossover(const RealGenome& p1, const RealGenome& p2, DeterministicRng& rng);

/**
 * Each component, with probability rate, is shifted by (u - 0.5) * sigma.
 * @return Number of perturbed components.
 */
int mutate(RealGenome& genome, double rate, double sigma, DeterministicRng& rng);

// Euclidean distance.
double distance(const RealGenome& a, const RealGenome& b);

} // namespace CellGa
