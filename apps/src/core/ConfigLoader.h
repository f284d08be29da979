#pragma once

#include "Result.h"

#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace CellGa {

/**
 * @brief Locates and parses JSON configuration files.
 *
 * Search order (first match wins):
 * 1. Explicit config directory (if set via setConfigDir)
 * 2. ./config/
 * 3. ~/.config/cellga/
 * 4. /etc/cellga/
 *
 * In each directory foo.json.local is preferred over foo.json. The .local file
 * replaces the base file entirely; the two are not merged.
 */
class ConfigLoader {
public:
    static void setConfigDir(const std::string& path);
    static void clearConfigDir();

    template <typename T>
    static Result<T, std::string> load(const std::string& filename);

    /**
     * Load a file by explicit path (absolute or relative to the CWD), skipping the
     * search path. The .local override still applies.
     */
    template <typename T>
    static Result<T, std::string> loadFromPath(const std::filesystem::path& path);

    static std::optional<std::filesystem::path> findConfigFile(const std::string& filename);
    static std::vector<std::filesystem::path> getSearchPaths();

private:
    static std::optional<std::string> explicitConfigDir_;

    template <typename T>
    static Result<T, std::string> parse(
        Result<nlohmann::json, std::string> jsonResult, const std::string& name);

    static Result<nlohmann::json, std::string> loadJson(const std::string& filename);
    static Result<nlohmann::json, std::string> tryLoadJson(const std::filesystem::path& path);
};

template <typename T>
Result<T, std::string> ConfigLoader::load(const std::string& filename)
{
    return parse<T>(loadJson(filename), filename);
}

template <typename T>
Result<T, std::string> ConfigLoader::loadFromPath(const std::filesystem::path& path)
{
    std::filesystem::path resolved = path;
    std::filesystem::path local = path;
    local += ".local";
    if (std::filesystem::is_regular_file(local)) {
        resolved = local;
    }
    else if (!std::filesystem::is_regular_file(path)) {
        return Result<T, std::string>::error("Config file not found: " + path.string());
    }
    return parse<T>(tryLoadJson(resolved), resolved.string());
}

template <typename T>
Result<T, std::string> ConfigLoader::parse(
    Result<nlohmann::json, std::string> jsonResult, const std::string& name)
{
    if (jsonResult.isError()) {
        return Result<T, std::string>::error(jsonResult.errorValue());
    }

    try {
        T config;
        // Unqualified call so ADL finds the type's from_json.
        from_json(jsonResult.value(), config);
        return Result<T, std::string>::okay(config);
    }
    catch (const std::exception& e) {
        return Result<T, std::string>::error("Failed to parse " + name + ": " + e.what());
    }
}

} // namespace CellGa
