#include "Selection.h"

#include "core/Assert.h"
#include "core/genome/Genotype.h"
#include "core/random/DeterministicRng.h"

namespace CellGa {

Genotype localTournamentSelect(
    const std::vector<Genotype>& population,
    const std::vector<int>& candidates,
    DeterministicRng& rng)
{
    CELLGA_ASSERT(!candidates.empty(), "Tournament needs at least one candidate");

    const int first = rng.choice(candidates);
    const int second = rng.choice(candidates);
    const Genotype& a = population[static_cast<size_t>(first)];
    const Genotype& b = population[static_cast<size_t>(second)];

    return b.fitnessValue() < a.fitnessValue() ? b : a;
}

std::vector<int> candidateSet(const std::vector<int>& neighbors, int cell)
{
    std::vector<int> candidates;
    candidates.reserve(neighbors.size() + 1);
    candidates.insert(candidates.end(), neighbors.begin(), neighbors.end());
    candidates.push_back(cell);
    return candidates;
}

} // namespace CellGa
