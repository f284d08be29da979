#include "CellularEngine.h"

#include "Selection.h"
#include "core/LoggingChannels.h"
#include "core/fitness/FitnessFunction.h"

namespace CellGa {

Result<std::unique_ptr<CellularEngine>, ConfigError> CellularEngine::create(
    const EngineConfig& config, CanvasDimensions canvas)
{
    using CreateResult = Result<std::unique_ptr<CellularEngine>, ConfigError>;

    const auto validation = validate(config);
    if (validation.isError()) {
        LOG_ERROR(Config, "Rejected engine config: {}", validation.errorValue().message);
        return CreateResult::error(validation.errorValue());
    }
    if (!(canvas.width > Topology::kMinCanvasExtent)
        || !(canvas.height > Topology::kMinCanvasExtent)) {
        return CreateResult::error(
            ConfigError{ "canvas width and height must exceed twice the grid padding" });
    }

    if (config.genomeLength < 2 && genomeKindFor(config.fitnessFunction) == GenomeKind::Bits) {
        LOG_WARN(
            Config, "genomeLength {} leaves no crossover cut; children copy parent 1", config.genomeLength);
    }

    return CreateResult::okay(std::unique_ptr<CellularEngine>(new CellularEngine(config, canvas)));
}

CellularEngine::CellularEngine(const EngineConfig& config, CanvasDimensions canvas)
    : config_(config),
      initParams_(genomeInitParams(config)),
      mutation_(mutationParams(config)),
      rng_(config.seed),
      population_(initialPopulation()),
      topology_(config.popSize, config.topology, config.rewiringProb, rng_, canvas)
{
    LOG_INFO(
        Engine,
        "Engine ready: {} cells, {} topology, {} ({} genes), seed {}",
        config_.popSize,
        toString(config_.topology),
        toString(config_.fitnessFunction),
        config_.genomeLength,
        config_.seed);
}

std::vector<Genotype> CellularEngine::initialPopulation()
{
    std::vector<Genotype> population;
    population.reserve(static_cast<size_t>(config_.popSize));
    for (int i = 0; i < config_.popSize; i++) {
        Genotype individual = Genotype::random(initParams_, rng_);
        individual.setFitness(evaluate(config_.fitnessFunction, individual));
        population.push_back(std::move(individual));
    }
    return population;
}

void CellularEngine::evolve()
{
    std::vector<Genotype> next;
    next.reserve(population_.size());

    int replaced = 0;
    for (int cell = 0; cell < config_.popSize; cell++) {
        Genotype child = breed(cell);
        const Genotype& incumbent = population_[static_cast<size_t>(cell)];

        if (acceptReplacement(child, incumbent)) {
            next.push_back(std::move(child));
            replaced++;
        }
        else {
            next.push_back(incumbent);
        }
    }

    population_.swap(next);
    generation_++;
    recordHistory();

    LOG_DEBUG(
        Engine,
        "Generation {}: best {:.4f}, avg {:.4f}, {} cells replaced",
        generation_,
        history_.bestAt(history_.size() - 1),
        history_.avgAt(history_.size() - 1),
        replaced);
}

Genotype CellularEngine::breed(int cell)
{
    const auto candidates = candidateSet(topology_.neighbors(cell), cell);

    const Genotype parent1 = localTournamentSelect(population_, candidates, rng_);
    const Genotype parent2 = localTournamentSelect(population_, candidates, rng_);

    Genotype child = rng_.nextFloat() < config_.crossoverRate
        ? Genotype::crossover(parent1, parent2, rng_)
        : parent1;

    child.mutate(mutation_, rng_);
    child.setFitness(evaluate(config_.fitnessFunction, child));
    return child;
}

bool CellularEngine::acceptReplacement(const Genotype& child, const Genotype& incumbent)
{
    if (!(child.fitnessValue() < incumbent.fitnessValue())) {
        return false;
    }

    switch (config_.replacementPolicy) {
        case ReplacementPolicy::Strict:
            return true;
        case ReplacementPolicy::Probabilistic:
            return rng_.nextFloat() < config_.replacementProbability;
    }
    return true;
}

void CellularEngine::recordHistory()
{
    history_.push(minFitness(population_), meanFitness(population_));
}

EngineStats CellularEngine::stats() const
{
    return computeStats(population_, topology_, config_.diversityMetric);
}

const Genotype& CellularEngine::bestIndividual() const
{
    return population_[bestIndex(population_)];
}

EngineSnapshot CellularEngine::snapshot() const
{
    EngineSnapshot snapshot;
    snapshot.generation = generation_;
    snapshot.stats = stats();
    snapshot.bestIndex = static_cast<int>(bestIndex(population_));
    snapshot.historyBest = history_.best();
    snapshot.historyAvg = history_.avg();

    snapshot.cells.reserve(population_.size());
    for (int i = 0; i < config_.popSize; i++) {
        snapshot.cells.push_back(CellSnapshot{
            .id = i,
            .fitness = population_[static_cast<size_t>(i)].fitnessValue(),
            .position = topology_.position(i),
            .neighbors = topology_.neighbors(i),
        });
    }
    return snapshot;
}

} // namespace CellGa
