#include "PopulationStats.h"

#include "core/Assert.h"
#include "core/genome/Genotype.h"
#include "core/topology/Topology.h"

#include <cmath>

namespace CellGa {

void to_json(nlohmann::json& j, const EngineStats& stats)
{
    j = nlohmann::json{
        { "best", stats.best },
        { "avg", stats.avg },
        { "diversity", stats.diversity },
    };
}

size_t bestIndex(const std::vector<Genotype>& population)
{
    CELLGA_ASSERT(!population.empty(), "bestIndex() on an empty population");

    size_t best = 0;
    for (size_t i = 1; i < population.size(); i++) {
        if (population[i].fitnessValue() < population[best].fitnessValue()) {
            best = i;
        }
    }
    return best;
}

double minFitness(const std::vector<Genotype>& population)
{
    return population[bestIndex(population)].fitnessValue();
}

double meanFitness(const std::vector<Genotype>& population)
{
    CELLGA_ASSERT(!population.empty(), "meanFitness() on an empty population");

    double sum = 0.0;
    for (const auto& individual : population) {
        sum += individual.fitnessValue();
    }
    return sum / static_cast<double>(population.size());
}

double fitnessStdDev(const std::vector<Genotype>& population)
{
    const double mean = meanFitness(population);
    double variance = 0.0;
    for (const auto& individual : population) {
        const double delta = individual.fitnessValue() - mean;
        variance += delta * delta;
    }
    return std::sqrt(variance / static_cast<double>(population.size()));
}

double meanEdgeDistance(const std::vector<Genotype>& population, const Topology& topology)
{
    double total = 0.0;
    size_t edges = 0;
    for (int i = 0; i < topology.size(); i++) {
        for (const int j : topology.neighbors(i)) {
            total += population[static_cast<size_t>(i)].distanceTo(
                population[static_cast<size_t>(j)]);
            edges++;
        }
    }
    return edges == 0 ? 0.0 : total / static_cast<double>(edges);
}

EngineStats computeStats(
    const std::vector<Genotype>& population, const Topology& topology, DiversityMetric metric)
{
    EngineStats stats;
    stats.best = minFitness(population);
    stats.avg = meanFitness(population);
    switch (metric) {
        case DiversityMetric::FitnessStdDev:
            stats.diversity = fitnessStdDev(population);
            break;
        case DiversityMetric::EdgeDistance:
            stats.diversity = meanEdgeDistance(population, topology);
            break;
    }
    return stats;
}

} // namespace CellGa
