#pragma once

#include "core/engine/EngineConfig.h"
#include "core/engine/PopulationStats.h"

#include <atomic>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace CellGa {
namespace Client {

struct RunOptions {
    int generations = 100;
    int reportEvery = 10; // 0 disables progress lines.
    int intervalMs = 0;   // Pause between generations.
    bool stopAtOptimum = false;
    std::optional<std::string> snapshotPath;
};

/**
 * Results from a completed (or interrupted) run.
 */
struct RunResults {
    EngineConfig config;
    int generationsRun = 0;
    double durationSec = 0.0;

    EngineStats finalStats;
    std::vector<double> historyBest;
    std::vector<double> historyAvg;
    nlohmann::json bestGenotype;

    bool reachedOptimum = false;
    bool interrupted = false;
    bool completed = false;
    std::string errorMessage;
};

void to_json(nlohmann::json& j, const RunResults& results);

/**
 * Drives a CellularEngine for a fixed number of generations.
 *
 * Owns the cadence (optional pacing, progress logging, early stop) so the engine
 * itself stays free of any notion of time.
 */
class EvolveRunner {
public:
    RunResults run(const EngineConfig& config, const RunOptions& options);

    /**
     * Request stop of the current run (from signal handler). Takes effect between
     * generations.
     */
    void requestStop();

private:
    std::atomic<bool> stopRequested_{ false };
};

} // namespace Client
} // namespace CellGa
