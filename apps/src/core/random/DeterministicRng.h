#pragma once

#include "core/Assert.h"

#include <cstdint>
#include <vector>

namespace CellGa {

/**
 * Reproducible sine-hash stream.
 *
 * Each draw returns frac(sin(seed) * 10000) and advances the seed by one, so a run
 * seeded with the same value replays every decision exactly, topology rewiring
 * included. One instance is shared by everything in a run and passed by reference;
 * it is not safe for concurrent use.
 */
class DeterministicRng {
public:
    static constexpr int64_t kDefaultSeed = 12345;

    explicit DeterministicRng(int64_t seed = kDefaultSeed);

    // [0, 1).
    double nextFloat();

    // Inclusive [min, max], mapped from a single nextFloat() draw.
    int nextInt(int min, int max);

    template <typename T>
    const T& choice(const std::vector<T>& items)
    {
        CELLGA_ASSERT(!items.empty(), "choice() requires a non-empty sequence");
        return items[static_cast<size_t>(nextInt(0, static_cast<int>(items.size()) - 1))];
    }

    int64_t seed() const { return seed_; }

private:
    int64_t seed_;
};

} // namespace CellGa
