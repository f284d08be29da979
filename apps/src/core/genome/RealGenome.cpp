#include "RealGenome.h"

#include "core/Assert.h"
#include "core/random/DeterministicRng.h"

#include <cmath>

namespace CellGa {

RealGenome RealGenome::random(int dimension, double lower, double upper, DeterministicRng& rng)
{
    RealGenome genome;
    genome.values.resize(static_cast<size_t>(dimension));
    for (auto& value : genome.values) {
        value = lower + rng.nextFloat() * (upper - lower);
    }
    return genome;
}

RealGenome RealGenome::constant(int dimension, double value)
{
    RealGenome genome;
    genome.values.assign(static_cast<size_t>(dimension), value);
    return genome;
}

RealGenome crossover(const RealGenome& p1, const RealGenome& p2, DeterministicRng& rng)
{
    CELLGA_ASSERT(p1.size() == p2.size(), "Blend crossover requires equal-dimension parents");

    RealGenome child;
    child.values.resize(p1.size());
    for (size_t i = 0; i < p1.size(); i++) {
        const double alpha = rng.nextFloat();
        child.values[i] = alpha * p1.values[i] + (1.0 - alpha) * p2.values[i];
    }
    return child;
}

int mutate(RealGenome& genome, double rate, double sigma, DeterministicRng& rng)
{
    int perturbed = 0;
    for (auto& value : genome.values) {
        if (rng.nextFloat() < rate) {
            value += (rng.nextFloat() - 0.5) * sigma;
            perturbed++;
        }
    }
    return perturbed;
}

double distance(const RealGenome& a, const RealGenome& b)
{
    CELLGA_ASSERT(a.size() == b.size(), "Euclidean distance requires equal-dimension genomes");

    double sumSquares = 0.0;
    for (size_t i = 0; i < a.size(); i++) {
        const double delta = a.values[i] - b.values[i];
        sumSquares += delta * delta;
    }
    return std::sqrt(sumSquares);
}

} // namespace CellGa
