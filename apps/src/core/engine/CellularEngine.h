#pragma once

#include "EngineConfig.h"
#include "EngineSnapshot.h"
#include "FitnessHistory.h"
#include "PopulationStats.h"
#include "core/Result.h"
#include "core/genome/Genotype.h"
#include "core/random/DeterministicRng.h"
#include "core/topology/Topology.h"

#include <memory>
#include <vector>

namespace CellGa {

/**
 * Cellular genetic algorithm over a fixed neighborhood graph.
 *
 * Construction seeds the stream, draws the initial population, then builds the
 * topology from the same stream. Each evolve() call advances exactly one
 * generation: every cell breeds a child from two local tournaments over its
 * neighbors (plus itself), and the child takes the cell only if it is strictly
 * better. All cells read the previous generation; the new one is swapped in at
 * the end.
 *
 * The engine has no clock and no terminal state. A driver calls evolve() as often
 * as it likes; resetting means constructing a new engine.
 */
class CellularEngine {
public:
    /**
     * Validate the config and build an engine. Invalid configuration is reported
     * here and never defaulted.
     */
    static Result<std::unique_ptr<CellularEngine>, ConfigError> create(
        const EngineConfig& config, CanvasDimensions canvas = {});

    CellularEngine(const CellularEngine&) = delete;
    CellularEngine& operator=(const CellularEngine&) = delete;

    void evolve();

    EngineStats stats() const;
    const Genotype& bestIndividual() const;

    const std::vector<Genotype>& population() const { return population_; }
    const FitnessHistory& history() const { return history_; }
    int generation() const { return generation_; }
    const Topology& topology() const { return topology_; }
    const EngineConfig& config() const { return config_; }

    // Value copy of everything a renderer or report needs.
    EngineSnapshot snapshot() const;

private:
    CellularEngine(const EngineConfig& config, CanvasDimensions canvas);

    EngineConfig config_;
    GenomeInitParams initParams_;
    MutationParams mutation_;
    DeterministicRng rng_;

    // Declaration order matters: the population draws from rng_ before the topology.
    std::vector<Genotype> population_;
    Topology topology_;

    FitnessHistory history_;
    int generation_ = 0;

    std::vector<Genotype> initialPopulation();
    Genotype breed(int cell);
    bool acceptReplacement(const Genotype& child, const Genotype& incumbent);
    void recordHistory();
};

} // namespace CellGa
