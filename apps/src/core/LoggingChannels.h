#pragma once

// Enable all log levels for SPDLOG_LOGGER_* macros (must be before spdlog includes).
#ifndef SPDLOG_ACTIVE_LEVEL
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE
#endif

#include "Result.h"

#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace CellGa {

/**
 * @brief Named logging channels, one per engine subsystem.
 */
enum class LogChannel { Config, Engine, Genome, Topology };

inline const char* toString(LogChannel channel)
{
    switch (channel) {
        case LogChannel::Config:
            return "config";
        case LogChannel::Engine:
            return "engine";
        case LogChannel::Genome:
            return "genome";
        case LogChannel::Topology:
            return "topology";
    }
    return "";
}

std::optional<LogChannel> logChannelFromString(const std::string& name);

/**
 * @brief Channel logger registry sharing one set of console/file sinks.
 *
 * Lets a run be traced per subsystem (e.g. topology:trace) without flooding
 * the output with per-cell engine messages.
 */
class LoggingChannels {
public:
    /**
     * @brief Initialize with built-in sinks (colored console + cellga.log).
     * @param consoleLevel Level for console output.
     * @param fileLevel Level for file output.
     * @param componentName Prefix injected into the log pattern (e.g. "cli").
     * @param consoleToStderr Send console output to stderr (keeps stdout for reports).
     */
    static void initialize(
        spdlog::level::level_enum consoleLevel = spdlog::level::info,
        spdlog::level::level_enum fileLevel = spdlog::level::debug,
        const std::string& componentName = "default",
        bool consoleToStderr = false);

    /**
     * @brief Initialize from a JSON logging config.
     * Looks for <configPath>.local first, falls back to <configPath>, and writes a
     * default file when neither exists.
     * @return false if the file could not be read and built-in defaults were used.
     */
    static bool initializeFromConfig(
        const std::string& configPath = "logging-config.json",
        const std::string& componentName = "default",
        bool consoleToStderr = false);

    static std::shared_ptr<spdlog::logger> get(LogChannel channel);

    /**
     * @brief Configure channels from a specification string.
     * @param spec "channel:level,channel2:level2", "*" addresses every channel.
     * Examples:
     *   "engine:debug"             - Per-generation engine summaries.
     *   "*:off,topology:trace"     - Only topology construction details.
     */
    static void configureFromString(const std::string& spec);

    static void setChannelLevel(LogChannel channel, spdlog::level::level_enum level);
    static bool setChannelLevel(const std::string& channel, spdlog::level::level_enum level);

    static spdlog::level::level_enum parseLevelString(const std::string& levelStr);

    static nlohmann::json defaultConfig();

private:
    static spdlog::sink_ptr makeConsoleSink();
    static void createChannelLoggers(const std::vector<spdlog::sink_ptr>& sinks);
    static void installDefaultLogger(
        const std::vector<spdlog::sink_ptr>& sinks, const std::string& componentName);
    static std::string makePattern(const std::string& base, const std::string& componentName);

    static Result<nlohmann::json, std::string> loadConfigFile(const std::string& configPath);
    static bool createDefaultConfigFile(const std::string& path);
    static void applyConfig(const nlohmann::json& config, const std::string& componentName);

    static bool initialized_;
    static bool consoleToStderr_;
    static std::vector<spdlog::sink_ptr> sharedSinks_;
};

#define LOG_TRACE(channel, ...) \
    SPDLOG_LOGGER_TRACE(::CellGa::LoggingChannels::get(::CellGa::LogChannel::channel), __VA_ARGS__)
#define LOG_DEBUG(channel, ...) \
    SPDLOG_LOGGER_DEBUG(::CellGa::LoggingChannels::get(::CellGa::LogChannel::channel), __VA_ARGS__)
#define LOG_INFO(channel, ...) \
    SPDLOG_LOGGER_INFO(::CellGa::LoggingChannels::get(::CellGa::LogChannel::channel), __VA_ARGS__)
#define LOG_WARN(channel, ...) \
    SPDLOG_LOGGER_WARN(::CellGa::LoggingChannels::get(::CellGa::LogChannel::channel), __VA_ARGS__)
#define LOG_ERROR(channel, ...) \
    SPDLOG_LOGGER_ERROR(::CellGa::LoggingChannels::get(::CellGa::LogChannel::channel), __VA_ARGS__)

// Default logger, no channel in the output.
#define SLOG_TRACE(...) SPDLOG_LOGGER_TRACE(spdlog::default_logger(), __VA_ARGS__)
#define SLOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(spdlog::default_logger(), __VA_ARGS__)
#define SLOG_INFO(...) SPDLOG_LOGGER_INFO(spdlog::default_logger(), __VA_ARGS__)
#define SLOG_WARN(...) SPDLOG_LOGGER_WARN(spdlog::default_logger(), __VA_ARGS__)
#define SLOG_ERROR(...) SPDLOG_LOGGER_ERROR(spdlog::default_logger(), __VA_ARGS__)

} // namespace CellGa
