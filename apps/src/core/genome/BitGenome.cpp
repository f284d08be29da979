#include "BitGenome.h"

#include "core/Assert.h"
#include "core/random/DeterministicRng.h"

#include <numeric>

namespace CellGa {

BitGenome BitGenome::random(int length, double onesProbability, DeterministicRng& rng)
{
    BitGenome genome;
    genome.bits.resize(static_cast<size_t>(length));
    for (auto& bit : genome.bits) {
        bit = rng.nextFloat() < onesProbability ? 1 : 0;
    }
    return genome;
}

BitGenome BitGenome::constant(int length, uint8_t bit)
{
    BitGenome genome;
    genome.bits.assign(static_cast<size_t>(length), bit);
    return genome;
}

int BitGenome::onesCount() const
{
    return std::accumulate(bits.begin(), bits.end(), 0);
}

BitGenome crossover(const BitGenome& p1, const BitGenome& p2, DeterministicRng& rng)
{
    CELLGA_ASSERT(p1.size() == p2.size(), "Bit crossover requires equal-length parents");

    const int length = static_cast<int>(p1.size());
    if (length < 2) {
        return p1;
    }

    const int cut = rng.nextInt(1, length - 1);
    BitGenome child = p1;
    for (int i = cut; i < length; i++) {
        child.bits[i] = p2.bits[i];
    }
    return child;
}

int mutate(BitGenome& genome, double rate, DeterministicRng& rng)
{
    int flips = 0;
    for (auto& bit : genome.bits) {
        if (rng.nextFloat() < rate) {
            bit = 1 - bit;
            flips++;
        }
    }
    return flips;
}

double distance(const BitGenome& a, const BitGenome& b)
{
    CELLGA_ASSERT(a.size() == b.size(), "Hamming distance requires equal-length genomes");

    int differing = 0;
    for (size_t i = 0; i < a.size(); i++) {
        if (a.bits[i] != b.bits[i]) {
            differing++;
        }
    }
    return differing;
}

} // namespace CellGa
