#include "EvolveRunner.h"

#include "core/LoggingChannels.h"
#include "core/engine/CellularEngine.h"
#include "core/engine/EngineSnapshot.h"

#include <chrono>
#include <thread>

namespace CellGa {
namespace Client {

namespace {
constexpr size_t kReportHistoryTail = 20;

std::vector<double> tail(const std::vector<double>& values, size_t count)
{
    if (values.size() <= count) {
        return values;
    }
    return std::vector<double>(values.end() - static_cast<std::ptrdiff_t>(count), values.end());
}
} // namespace

void to_json(nlohmann::json& j, const RunResults& results)
{
    j = nlohmann::json{
        { "config", results.config },
        { "generations", results.generationsRun },
        { "durationSec", results.durationSec },
        { "stats", results.finalStats },
        { "history",
          { { "best", tail(results.historyBest, kReportHistoryTail) },
            { "avg", tail(results.historyAvg, kReportHistoryTail) } } },
        { "best", results.bestGenotype },
        { "reachedOptimum", results.reachedOptimum },
        { "interrupted", results.interrupted },
        { "completed", results.completed },
    };
    if (!results.errorMessage.empty()) {
        j["error"] = results.errorMessage;
    }
}

RunResults EvolveRunner::run(const EngineConfig& config, const RunOptions& options)
{
    RunResults results;
    results.config = config;

    auto engineResult = CellularEngine::create(config);
    if (engineResult.isError()) {
        results.errorMessage = "Invalid config: " + engineResult.errorValue().message;
        SLOG_ERROR("{}", results.errorMessage);
        return results;
    }
    CellularEngine& engine = *engineResult.value();

    SLOG_INFO("Starting cellular GA run:");
    SLOG_INFO("  Fitness: {} ({} genes)", toString(config.fitnessFunction), config.genomeLength);
    SLOG_INFO("  Topology: {} (rewiring {})", toString(config.topology), config.rewiringProb);
    SLOG_INFO("  Population: {}", config.popSize);
    SLOG_INFO("  Generations: {}", options.generations);
    SLOG_INFO("  Seed: {}", config.seed);

    const auto start = std::chrono::steady_clock::now();

    for (int i = 0; i < options.generations; i++) {
        if (stopRequested_) {
            SLOG_WARN("Stop requested, ending run after generation {}", engine.generation());
            results.interrupted = true;
            break;
        }

        engine.evolve();

        if (options.reportEvery > 0 && engine.generation() % options.reportEvery == 0) {
            const EngineStats stats = engine.stats();
            SLOG_INFO(
                "Gen {:>6}  best {:>10.4f}  avg {:>10.4f}  diversity {:>8.4f}",
                engine.generation(),
                stats.best,
                stats.avg,
                stats.diversity);
        }

        if (options.stopAtOptimum && engine.stats().best <= 0.0) {
            SLOG_INFO("Optimum reached at generation {}", engine.generation());
            break;
        }

        if (options.intervalMs > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(options.intervalMs));
        }
    }

    const auto elapsed = std::chrono::steady_clock::now() - start;
    results.durationSec = std::chrono::duration<double>(elapsed).count();
    results.generationsRun = engine.generation();
    results.finalStats = engine.stats();
    results.historyBest = engine.history().best();
    results.historyAvg = engine.history().avg();
    results.bestGenotype = genotypeToJson(engine.bestIndividual());
    results.reachedOptimum = results.finalStats.best <= 0.0;

    if (options.snapshotPath.has_value()) {
        auto writeResult = writeSnapshot(engine.snapshot(), options.snapshotPath.value());
        if (writeResult.isError()) {
            results.errorMessage = writeResult.errorValue();
            SLOG_ERROR("{}", results.errorMessage);
            return results;
        }
    }

    results.completed = true;
    SLOG_INFO(
        "Run finished: {} generations in {:.2f}s, best {:.4f}",
        results.generationsRun,
        results.durationSec,
        results.finalStats.best);
    return results;
}

void EvolveRunner::requestStop()
{
    stopRequested_ = true;
}

} // namespace Client
} // namespace CellGa
