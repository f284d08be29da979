#pragma once

#include "PopulationStats.h"
#include "core/Result.h"
#include "core/topology/Topology.h"

#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <variant>
#include <vector>

namespace CellGa {

class Genotype;

/**
 * Per-cell view consumed by external renderers.
 */
struct CellSnapshot {
    int id = 0;
    double fitness = 0.0;
    LayoutPosition position;
    std::vector<int> neighbors;
};

struct EngineSnapshot {
    int generation = 0;
    EngineStats stats;
    int bestIndex = 0;
    std::vector<double> historyBest;
    std::vector<double> historyAvg;
    std::vector<CellSnapshot> cells;
};

void to_json(nlohmann::json& j, const LayoutPosition& position);
void to_json(nlohmann::json& j, const CellSnapshot& cell);
void to_json(nlohmann::json& j, const EngineSnapshot& snapshot);

// {"kind": "bits"|"reals", "genes": [...], "fitness": x|null}.
nlohmann::json genotypeToJson(const Genotype& genotype);

Result<std::monostate, std::string> writeSnapshot(
    const EngineSnapshot& snapshot, const std::filesystem::path& path);

} // namespace CellGa
