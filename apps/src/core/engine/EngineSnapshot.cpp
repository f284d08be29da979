#include "EngineSnapshot.h"

#include "core/LoggingChannels.h"
#include "core/genome/Genotype.h"

#include <fstream>

namespace CellGa {

void to_json(nlohmann::json& j, const LayoutPosition& position)
{
    j = nlohmann::json{ { "x", position.x }, { "y", position.y } };
}

void to_json(nlohmann::json& j, const CellSnapshot& cell)
{
    j = nlohmann::json{
        { "id", cell.id },
        { "fitness", cell.fitness },
        { "position", cell.position },
        { "neighbors", cell.neighbors },
    };
}

void to_json(nlohmann::json& j, const EngineSnapshot& snapshot)
{
    j = nlohmann::json{
        { "generation", snapshot.generation },
        { "stats", snapshot.stats },
        { "bestIndex", snapshot.bestIndex },
        { "history", { { "best", snapshot.historyBest }, { "avg", snapshot.historyAvg } } },
        { "cells", snapshot.cells },
    };
}

nlohmann::json genotypeToJson(const Genotype& genotype)
{
    nlohmann::json j;
    j["kind"] = toString(genotype.kind());
    std::visit(
        [&j](const auto& genome) {
            using T = std::decay_t<decltype(genome)>;
            if constexpr (std::is_same_v<T, BitGenome>) {
                j["genes"] = genome.bits;
            }
            else {
                j["genes"] = genome.values;
            }
        },
        genotype.getVariant());
    j["fitness"] = genotype.hasFitness() ? nlohmann::json(genotype.fitnessValue()) : nullptr;
    return j;
}

Result<std::monostate, std::string> writeSnapshot(
    const EngineSnapshot& snapshot, const std::filesystem::path& path)
{
    std::ofstream file(path);
    if (!file.is_open()) {
        return Result<std::monostate, std::string>::error(
            "Cannot open snapshot file for writing: " + path.string());
    }

    file << nlohmann::json(snapshot).dump(2) << std::endl;
    if (!file.good()) {
        return Result<std::monostate, std::string>::error(
            "Failed writing snapshot to " + path.string());
    }

    LOG_INFO(Engine, "Wrote snapshot of generation {} to {}", snapshot.generation, path.string());
    return Result<std::monostate, std::string>::okay(std::monostate{});
}

} // namespace CellGa
