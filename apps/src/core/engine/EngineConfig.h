#pragma once

#include "core/ReflectSerializer.h"
#include "core/Result.h"
#include "core/fitness/FitnessFunction.h"
#include "core/genome/Genotype.h"
#include "core/topology/Topology.h"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <variant>

namespace CellGa {

/**
 * When a strictly better child takes over its cell.
 */
enum class ReplacementPolicy : uint8_t {
    Strict = 0,    // Always, on strict improvement.
    Probabilistic, // On strict improvement, with probability replacementProbability.
};

/**
 * Which statistic EngineStats::diversity reports.
 */
enum class DiversityMetric : uint8_t {
    FitnessStdDev = 0, // Population standard deviation of fitness.
    EdgeDistance,      // Mean genotype distance over topology edges.
};

std::string toString(ReplacementPolicy policy);
std::string toString(DiversityMetric metric);

void to_json(nlohmann::json& j, const ReplacementPolicy& policy);
void from_json(const nlohmann::json& j, ReplacementPolicy& policy);
void to_json(nlohmann::json& j, const DiversityMetric& metric);
void from_json(const nlohmann::json& j, DiversityMetric& metric);

struct ConfigError {
    std::string message;
};

/**
 * Configuration for one engine instance. Immutable for the engine's lifetime;
 * changing anything means constructing a new engine.
 */
struct EngineConfig {
    int popSize = 400;
    int genomeLength = 20; // Bit count, or dimension for real genomes.
    double mutationRate = 0.1;
    double crossoverRate = 0.8;
    double rewiringProb = 0.1;
    TopologyKind topology = TopologyKind::Grid;
    FitnessFunction fitnessFunction = FitnessFunction::OneMax;
    int64_t seed = 12345;

    // Bit genome initialization bias: per-individual ones probability range.
    double onesProbabilityMin = 0.5;
    double onesProbabilityMax = 0.5;

    // Real genome initialization domain.
    double realLowerBound = RealGenome::kDefaultLowerBound;
    double realUpperBound = RealGenome::kDefaultUpperBound;
    double mutationSigma = 0.1;

    ReplacementPolicy replacementPolicy = ReplacementPolicy::Strict;
    double replacementProbability = 0.5; // Probabilistic policy only.

    DiversityMetric diversityMetric = DiversityMetric::FitnessStdDev;
};

Result<std::monostate, ConfigError> validate(const EngineConfig& config);

GenomeInitParams genomeInitParams(const EngineConfig& config);
MutationParams mutationParams(const EngineConfig& config);

inline void to_json(nlohmann::json& j, const EngineConfig& config)
{
    j = ReflectSerializer::to_json(config);
}

inline void from_json(const nlohmann::json& j, EngineConfig& config)
{
    config = ReflectSerializer::from_json<EngineConfig>(j);
}

} // namespace CellGa
