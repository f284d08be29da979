#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace CellGa {

class DeterministicRng;

/**
 * Fixed-length bit-string genome (one byte per gene, values 0 or 1).
 */
struct BitGenome {
    std::vector<uint8_t> bits;

    /**
     * Each gene is 1 with probability onesProbability.
     */
    static BitGenome random(int length, double onesProbability, DeterministicRng& rng);
    static BitGenome constant(int length, uint8_t bit);

    size_t size() const { return bits.size(); }
    int onesCount() const;

    bool operator==(const BitGenome& other) const = default;
};

/**
 * Single-cut crossover: genes [0, cut) from p1 and [cut, L) from p2, cut uniform in
 * [1, L-1]. With L < 2 there is no valid cut; the child is a copy of p1 and no draw
 * is consumed.
 */
BitGenome crossover(const BitGenome& p1, const BitGenome& p2, DeterministicRng& rng);

/**
 * Flip each gene independently with probability rate.
 * @return Number of flipped genes.
 */
int mutate(BitGenome& genome, double rate, DeterministicRng& rng);

// Hamming distance.
double distance(const BitGenome& a, const BitGenome& b);

} // namespace CellGa
