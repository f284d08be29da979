#include "EvolveRunner.h"
#include "core/ConfigLoader.h"
#include "core/LoggingChannels.h"
#include "core/engine/EngineConfig.h"
#include "core/fitness/FitnessFunction.h"
#include "core/topology/Topology.h"

#include <args.hxx>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

using namespace CellGa;

namespace {

constexpr const char* kDefaultConfigFile = "cellga.json";

Client::EvolveRunner* g_runner = nullptr;

void signalHandler(int signum)
{
    (void)signum;
    if (g_runner) {
        g_runner->requestStop();
    }
}

/**
 * Resolve the base config. An explicit --config may be a path or a name on the
 * config search path and must exist; the implicit default may be absent.
 */
Result<EngineConfig, std::string> loadBaseConfig(const std::optional<std::string>& configArg)
{
    if (!configArg.has_value()) {
        auto result = ConfigLoader::load<EngineConfig>(kDefaultConfigFile);
        if (result.isValue()) {
            return result;
        }
        if (ConfigLoader::findConfigFile(kDefaultConfigFile).has_value()) {
            return result;
        }
        LOG_INFO(Config, "No {} found, using built-in defaults", kDefaultConfigFile);
        return Result<EngineConfig, std::string>::okay(EngineConfig{});
    }

    const std::filesystem::path path(configArg.value());
    if (path.has_parent_path() || std::filesystem::is_regular_file(path)) {
        return ConfigLoader::loadFromPath<EngineConfig>(path);
    }
    return ConfigLoader::load<EngineConfig>(configArg.value());
}

} // namespace

int main(int argc, char** argv)
{
    args::ArgumentParser parser(
        "CellGA CLI", "Run a cellular genetic algorithm and print a JSON report to stdout.");
    args::HelpFlag help(parser, "help", "Display this help menu", { 'h', "help" });

    args::ValueFlag<std::string> configArg(
        parser, "config", "Engine config file or name (default: cellga.json)", { 'c', "config" });
    args::ValueFlag<std::string> configDirArg(
        parser, "dir", "Directory searched first for config files", { "config-dir" });

    args::Group overrides(parser, "Config overrides:");
    args::ValueFlag<int> popSizeArg(overrides, "n", "Population size", { "pop-size" });
    args::ValueFlag<int> genomeLengthArg(
        overrides, "n", "Genome length / dimension", { "genome-length" });
    args::ValueFlag<double> mutationArg(overrides, "p", "Mutation rate", { "mutation-rate" });
    args::ValueFlag<double> crossoverArg(overrides, "p", "Crossover rate", { "crossover-rate" });
    args::ValueFlag<double> rewiringArg(
        overrides, "p", "Small-world rewiring probability", { "rewiring" });
    args::ValueFlag<std::string> topologyArg(
        overrides, "kind", "ring, grid or smallworld", { 't', "topology" });
    args::ValueFlag<std::string> fitnessArg(
        overrides, "name", "onemax, trap, sphere or rastrigin", { 'f', "fitness" });
    args::ValueFlag<int64_t> seedArg(overrides, "seed", "Stream seed", { 's', "seed" });
    args::ValueFlag<std::string> replacementArg(
        overrides, "policy", "strict or probabilistic", { "replacement" });
    args::ValueFlag<std::string> diversityArg(
        overrides, "metric", "fitnessStdDev or edgeDistance", { "diversity" });

    args::ValueFlag<int> generationsArg(
        parser, "n", "Generations to run (default: 100)", { 'g', "generations" });
    args::ValueFlag<int> reportEveryArg(
        parser, "n", "Log progress every n generations (default: 10, 0 = off)", { "report-every" });
    args::ValueFlag<int> intervalArg(
        parser, "ms", "Pause between generations in milliseconds", { "interval-ms" });
    args::Flag stopAtOptimumArg(
        parser, "stop-at-optimum", "Stop once best fitness reaches 0", { "stop-at-optimum" });
    args::ValueFlag<std::string> snapshotArg(
        parser, "path", "Write the final population snapshot JSON here", { "snapshot" });

    args::ValueFlag<std::string> logConfig(
        parser,
        "log-config",
        "Path to logging config JSON file (default: logging-config.json)",
        { "log-config" },
        "logging-config.json");
    args::ValueFlag<std::string> logChannels(
        parser,
        "channels",
        "Override log channels (e.g., engine:debug,topology:trace)",
        { 'C', "channels" });

    try {
        parser.ParseCLI(argc, argv);
    }
    catch (const args::Help&) {
        std::cout << parser;
        return 0;
    }
    catch (const args::ParseError& e) {
        std::cerr << e.what() << std::endl;
        std::cerr << parser;
        return 1;
    }
    catch (const args::ValidationError& e) {
        std::cerr << e.what() << std::endl;
        std::cerr << parser;
        return 1;
    }

    LoggingChannels::initializeFromConfig(args::get(logConfig), "cli", true);
    if (logChannels) {
        LoggingChannels::configureFromString(args::get(logChannels));
        SLOG_INFO("Applied channel overrides: {}", args::get(logChannels));
    }

    if (configDirArg) {
        ConfigLoader::setConfigDir(args::get(configDirArg));
    }

    auto configResult =
        loadBaseConfig(configArg ? std::optional<std::string>(args::get(configArg)) : std::nullopt);
    if (configResult.isError()) {
        SLOG_ERROR("{}", configResult.errorValue());
        return 1;
    }
    EngineConfig config = configResult.value();

    if (popSizeArg) config.popSize = args::get(popSizeArg);
    if (genomeLengthArg) config.genomeLength = args::get(genomeLengthArg);
    if (mutationArg) config.mutationRate = args::get(mutationArg);
    if (crossoverArg) config.crossoverRate = args::get(crossoverArg);
    if (rewiringArg) config.rewiringProb = args::get(rewiringArg);
    if (seedArg) config.seed = args::get(seedArg);
    if (topologyArg) config.topology = topologyKindFromString(args::get(topologyArg));

    try {
        if (fitnessArg) {
            config.fitnessFunction =
                nlohmann::json(args::get(fitnessArg)).get<FitnessFunction>();
        }
        if (replacementArg) {
            config.replacementPolicy =
                nlohmann::json(args::get(replacementArg)).get<ReplacementPolicy>();
        }
        if (diversityArg) {
            config.diversityMetric =
                nlohmann::json(args::get(diversityArg)).get<DiversityMetric>();
        }
    }
    catch (const std::exception& e) {
        SLOG_ERROR("Invalid override: {}", e.what());
        return 1;
    }

    Client::RunOptions options;
    if (generationsArg) options.generations = args::get(generationsArg);
    if (reportEveryArg) options.reportEvery = args::get(reportEveryArg);
    if (intervalArg) options.intervalMs = args::get(intervalArg);
    options.stopAtOptimum = args::get(stopAtOptimumArg);
    if (snapshotArg) options.snapshotPath = args::get(snapshotArg);

    if (options.generations < 0) {
        SLOG_ERROR("--generations must be >= 0");
        return 1;
    }

    Client::EvolveRunner runner;
    g_runner = &runner;
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    const Client::RunResults results = runner.run(config, options);
    g_runner = nullptr;

    std::cout << nlohmann::json(results).dump(2) << std::endl;
    return results.completed ? 0 : 1;
}
