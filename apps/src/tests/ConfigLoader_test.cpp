#include "core/ConfigLoader.h"
#include "core/engine/EngineConfig.h"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>

using namespace CellGa;

namespace {
struct ProbeConfig {
    std::string source;
    int count = 0;
};

void from_json(const nlohmann::json& j, ProbeConfig& c)
{
    if (j.contains("source")) {
        c.source = j["source"].get<std::string>();
    }
    if (j.contains("count")) {
        c.count = j["count"].get<int>();
    }
}
} // namespace

class ConfigLoaderTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        testDir_ = std::filesystem::temp_directory_path() / "cellga_config_loader_test";
        std::filesystem::create_directories(testDir_);
    }

    void TearDown() override
    {
        std::filesystem::remove_all(testDir_);
        ConfigLoader::clearConfigDir();
    }

    std::filesystem::path writeConfigFile(const std::string& filename, const std::string& content)
    {
        const std::filesystem::path path = testDir_ / filename;
        std::ofstream file(path);
        file << content;
        return path;
    }

    std::filesystem::path testDir_;
};

TEST_F(ConfigLoaderTest, MissingFileIsReportedAsNotFound)
{
    ConfigLoader::setConfigDir(testDir_.string());

    auto result = ConfigLoader::load<ProbeConfig>("absent.json");
    ASSERT_TRUE(result.isError());
    EXPECT_NE(result.errorValue().find("not found"), std::string::npos);
}

TEST_F(ConfigLoaderTest, ExplicitDirectoryIsSearchedFirst)
{
    writeConfigFile("probe.json", R"({"source": "explicit", "count": 3})");
    ConfigLoader::setConfigDir(testDir_.string());

    ASSERT_FALSE(ConfigLoader::getSearchPaths().empty());
    EXPECT_EQ(ConfigLoader::getSearchPaths().front(), testDir_);

    auto result = ConfigLoader::load<ProbeConfig>("probe.json");
    ASSERT_TRUE(result.isValue());
    EXPECT_EQ(result.value().source, "explicit");
    EXPECT_EQ(result.value().count, 3);
}

TEST_F(ConfigLoaderTest, LocalOverrideReplacesBaseFile)
{
    writeConfigFile("probe.json", R"({"source": "base", "count": 3})");
    writeConfigFile("probe.json.local", R"({"source": "local"})");
    ConfigLoader::setConfigDir(testDir_.string());

    auto path = ConfigLoader::findConfigFile("probe.json");
    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(path.value(), testDir_ / "probe.json.local");

    // Not merged: count keeps its struct default.
    auto result = ConfigLoader::load<ProbeConfig>("probe.json");
    ASSERT_TRUE(result.isValue());
    EXPECT_EQ(result.value().source, "local");
    EXPECT_EQ(result.value().count, 0);
}

TEST_F(ConfigLoaderTest, MalformedJsonIsAParseError)
{
    writeConfigFile("bad.json", "{ \"popSize\": ");
    ConfigLoader::setConfigDir(testDir_.string());

    auto result = ConfigLoader::load<ProbeConfig>("bad.json");
    ASSERT_TRUE(result.isError());
    EXPECT_NE(result.errorValue().find("Parse error"), std::string::npos);
}

TEST_F(ConfigLoaderTest, EmptyLocalFileDoesNotFallBackToBase)
{
    writeConfigFile("probe.json", R"({"source": "base"})");
    writeConfigFile("probe.json.local", "");
    ConfigLoader::setConfigDir(testDir_.string());

    auto result = ConfigLoader::load<ProbeConfig>("probe.json");
    ASSERT_TRUE(result.isError());
    EXPECT_NE(result.errorValue().find("Empty config file"), std::string::npos);
}

TEST_F(ConfigLoaderTest, LoadFromPathSkipsSearchPath)
{
    const auto path = writeConfigFile("run.json", R"({"popSize": 36, "topology": "smallworld"})");

    auto result = ConfigLoader::loadFromPath<EngineConfig>(path);
    ASSERT_TRUE(result.isValue());
    EXPECT_EQ(result.value().popSize, 36);
    EXPECT_EQ(result.value().topology, TopologyKind::SmallWorld);
    EXPECT_EQ(result.value().genomeLength, 20);
}

TEST_F(ConfigLoaderTest, LoadFromPathHonorsLocalOverride)
{
    const auto path = writeConfigFile("run.json", R"({"popSize": 36})");
    writeConfigFile("run.json.local", R"({"popSize": 49})");

    auto result = ConfigLoader::loadFromPath<EngineConfig>(path);
    ASSERT_TRUE(result.isValue());
    EXPECT_EQ(result.value().popSize, 49);
}

TEST_F(ConfigLoaderTest, LoadFromPathReportsMissingFile)
{
    auto result = ConfigLoader::loadFromPath<EngineConfig>(testDir_ / "nope.json");

    ASSERT_TRUE(result.isError());
    EXPECT_NE(result.errorValue().find("not found"), std::string::npos);
}

TEST_F(ConfigLoaderTest, UnknownFitnessFunctionFailsToLoad)
{
    writeConfigFile("cellga.json", R"({"fitnessFunction": "ackley"})");
    ConfigLoader::setConfigDir(testDir_.string());

    auto result = ConfigLoader::load<EngineConfig>("cellga.json");
    ASSERT_TRUE(result.isError());
    EXPECT_NE(result.errorValue().find("Failed to parse cellga.json"), std::string::npos);
}
