#pragma once

#include "EngineConfig.h"

#include <nlohmann/json.hpp>
#include <vector>

namespace CellGa {

class Genotype;
class Topology;

struct EngineStats {
    double best = 0.0;
    double avg = 0.0;
    double diversity = 0.0;
};

void to_json(nlohmann::json& j, const EngineStats& stats);

// Index of the lowest cached fitness; first one wins ties.
size_t bestIndex(const std::vector<Genotype>& population);

double minFitness(const std::vector<Genotype>& population);
double meanFitness(const std::vector<Genotype>& population);

// Population (not sample) standard deviation of fitness.
double fitnessStdDev(const std::vector<Genotype>& population);

/**
 * Mean genotype distance across every directed topology edge (i -> j for j in
 * neighbors(i)). Zero when the topology has no edges.
 */
double meanEdgeDistance(const std::vector<Genotype>& population, const Topology& topology);

EngineStats computeStats(
    const std::vector<Genotype>& population, const Topology& topology, DiversityMetric metric);

} // namespace CellGa
