#include "DeterministicRng.h"

#include <cmath>

namespace CellGa {

DeterministicRng::DeterministicRng(int64_t seed) : seed_(seed)
{}

double DeterministicRng::nextFloat()
{
    const double x = std::sin(static_cast<double>(seed_++)) * 10000.0;
    const double fraction = x - std::floor(x);

    // Rounding can push the fraction of a tiny negative x up to exactly 1.0.
    return fraction < 1.0 ? fraction : 0.0;
}

int DeterministicRng::nextInt(int min, int max)
{
    const double span = static_cast<double>(max) - static_cast<double>(min) + 1.0;
    return static_cast<int>(std::floor(nextFloat() * span)) + min;
}

} // namespace CellGa
