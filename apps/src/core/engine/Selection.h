#pragma once

#include <vector>

namespace CellGa {

class DeterministicRng;
class Genotype;

/**
 * Size-2 tournament restricted to a local candidate set.
 *
 * Draws two candidate ids with rng.choice() (repeats allowed) and returns a copy of
 * the one with strictly lower cached fitness; ties keep the first draw.
 */
Genotype localTournamentSelect(
    const std::vector<Genotype>& population,
    const std::vector<int>& candidates,
    DeterministicRng& rng);

/**
 * Candidate set for a cell: its neighbors followed by the cell itself.
 */
std::vector<int> candidateSet(const std::vector<int>& neighbors, int cell);

} // namespace CellGa
