#include "cli/EvolveRunner.h"

#include <filesystem>
#include <gtest/gtest.h>

using namespace CellGa;
using namespace CellGa::Client;

namespace {
EngineConfig tinyConfig()
{
    EngineConfig config;
    config.popSize = 9;
    config.genomeLength = 8;
    config.seed = 3;
    return config;
}
} // namespace

TEST(EvolveRunnerTest, RunsRequestedGenerations)
{
    EvolveRunner runner;
    RunOptions options;
    options.generations = 12;
    options.reportEvery = 0;

    const RunResults results = runner.run(tinyConfig(), options);

    EXPECT_TRUE(results.completed);
    EXPECT_FALSE(results.interrupted);
    EXPECT_EQ(results.generationsRun, 12);
    EXPECT_EQ(results.historyBest.size(), 12u);
    EXPECT_EQ(results.bestGenotype["kind"], "bits");
}

TEST(EvolveRunnerTest, InvalidConfigIsReportedNotRun)
{
    EngineConfig config = tinyConfig();
    config.crossoverRate = 3.0;

    EvolveRunner runner;
    const RunResults results = runner.run(config, RunOptions{});

    EXPECT_FALSE(results.completed);
    EXPECT_EQ(results.generationsRun, 0);
    EXPECT_NE(results.errorMessage.find("crossoverRate"), std::string::npos);
}

TEST(EvolveRunnerTest, StopRequestEndsRunBeforeFirstGeneration)
{
    EvolveRunner runner;
    runner.requestStop();

    const RunResults results = runner.run(tinyConfig(), RunOptions{});

    EXPECT_TRUE(results.interrupted);
    EXPECT_EQ(results.generationsRun, 0);
}

TEST(EvolveRunnerTest, ReportJsonTrimsHistoryTail)
{
    EvolveRunner runner;
    RunOptions options;
    options.generations = 40;
    options.reportEvery = 0;

    const nlohmann::json j = runner.run(tinyConfig(), options);

    EXPECT_EQ(j["generations"], 40);
    EXPECT_EQ(j["history"]["best"].size(), 20u);
    EXPECT_EQ(j["config"]["popSize"], 9);
    EXPECT_FALSE(j.contains("error"));
}

TEST(EvolveRunnerTest, WritesSnapshotWhenRequested)
{
    const auto path = std::filesystem::temp_directory_path() / "cellga_runner_snapshot.json";
    EvolveRunner runner;
    RunOptions options;
    options.generations = 2;
    options.reportEvery = 0;
    options.snapshotPath = path.string();

    const RunResults results = runner.run(tinyConfig(), options);

    EXPECT_TRUE(results.completed);
    EXPECT_TRUE(std::filesystem::exists(path));
    std::filesystem::remove(path);
}
