#include "LoggingChannels.h"
#include "Assert.h"

#include <algorithm>
#include <array>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace CellGa {

namespace {

constexpr std::array<LogChannel, 4> kAllChannels = {
    LogChannel::Config,
    LogChannel::Engine,
    LogChannel::Genome,
    LogChannel::Topology,
};

constexpr const char* kBasePattern = "[%H:%M:%S.%e] [%n] [%^%l%$] [%s:%#] %v";
constexpr const char* kDefaultLoggerPattern = "[%H:%M:%S.%e] [%^%l%$] [%s:%#] %v";
constexpr const char* kLogFile = "cellga.log";

std::string trim(const std::string& s)
{
    const size_t first = s.find_first_not_of(" \t");
    if (first == std::string::npos) {
        return "";
    }
    const size_t last = s.find_last_not_of(" \t");
    return s.substr(first, last - first + 1);
}

} // namespace

bool LoggingChannels::initialized_ = false;
bool LoggingChannels::consoleToStderr_ = false;
std::vector<spdlog::sink_ptr> LoggingChannels::sharedSinks_;

std::optional<LogChannel> logChannelFromString(const std::string& name)
{
    for (const LogChannel channel : kAllChannels) {
        if (name == toString(channel)) {
            return channel;
        }
    }
    return std::nullopt;
}

void LoggingChannels::initialize(
    spdlog::level::level_enum consoleLevel,
    spdlog::level::level_enum fileLevel,
    const std::string& componentName,
    bool consoleToStderr)
{
    if (initialized_) {
        spdlog::warn("LoggingChannels already initialized, skipping re-initialization");
        return;
    }

    consoleToStderr_ = consoleToStderr;
    auto consoleSink = makeConsoleSink();
    consoleSink->set_level(consoleLevel);
    auto fileSink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(kLogFile, true);
    fileSink->set_level(fileLevel);

    sharedSinks_ = { consoleSink, fileSink };
    for (auto& sink : sharedSinks_) {
        sink->set_pattern(makePattern(kBasePattern, componentName));
    }

    createChannelLoggers(sharedSinks_);
    installDefaultLogger(sharedSinks_, componentName);

    spdlog::flush_every(std::chrono::seconds(1));

    initialized_ = true;
    SLOG_DEBUG("LoggingChannels initialized with built-in defaults");
}

bool LoggingChannels::initializeFromConfig(
    const std::string& configPath, const std::string& componentName, bool consoleToStderr)
{
    if (initialized_) {
        spdlog::warn("LoggingChannels already initialized, skipping re-initialization");
        return false;
    }

    consoleToStderr_ = consoleToStderr;

    auto configResult = loadConfigFile(configPath);
    if (configResult.isError()) {
        spdlog::error("{}", configResult.errorValue());
        spdlog::error("Falling back to built-in logging defaults.");
        applyConfig(defaultConfig(), componentName);
        initialized_ = true;
        return false;
    }

    applyConfig(configResult.value(), componentName);
    initialized_ = true;
    return true;
}

std::shared_ptr<spdlog::logger> LoggingChannels::get(LogChannel channel)
{
    // Unit tests linked against gtest_main never call initialize().
    if (!initialized_) {
        initialize();
    }

    auto logger = spdlog::get(toString(channel));
    CELLGA_ASSERT(logger, "LogChannel not registered after initialization");
    return logger;
}

void LoggingChannels::configureFromString(const std::string& spec)
{
    if (spec.empty()) return;

    if (!initialized_) {
        initialize();
    }

    std::stringstream ss(spec);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item = trim(item);
        const size_t colonPos = item.find(':');
        if (colonPos == std::string::npos) {
            spdlog::warn("Invalid channel spec (missing colon): {}", item);
            continue;
        }

        const std::string channel = trim(item.substr(0, colonPos));
        const auto level = parseLevelString(trim(item.substr(colonPos + 1)));

        if (channel == "*") {
            for (const LogChannel each : kAllChannels) {
                setChannelLevel(each, level);
            }
        }
        else if (!setChannelLevel(channel, level)) {
            spdlog::warn("Unknown log channel '{}' in spec", channel);
        }
    }
}

void LoggingChannels::setChannelLevel(LogChannel channel, spdlog::level::level_enum level)
{
    get(channel)->set_level(level);
    spdlog::debug(
        "Set channel '{}' to level: {}", toString(channel), spdlog::level::to_string_view(level));
}

bool LoggingChannels::setChannelLevel(const std::string& channel, spdlog::level::level_enum level)
{
    const auto parsed = logChannelFromString(channel);
    if (!parsed.has_value()) {
        return false;
    }
    setChannelLevel(parsed.value(), level);
    return true;
}

spdlog::level::level_enum LoggingChannels::parseLevelString(const std::string& levelStr)
{
    std::string lower = levelStr;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);

    if (lower == "trace") {
        return spdlog::level::trace;
    }
    else if (lower == "debug") {
        return spdlog::level::debug;
    }
    else if (lower == "info") {
        return spdlog::level::info;
    }
    else if (lower == "warn" || lower == "warning") {
        return spdlog::level::warn;
    }
    else if (lower == "error" || lower == "err") {
        return spdlog::level::err;
    }
    else if (lower == "critical") {
        return spdlog::level::critical;
    }
    else if (lower == "off") {
        return spdlog::level::off;
    }
    spdlog::warn("Unknown log level '{}', defaulting to info", levelStr);
    return spdlog::level::info;
}

nlohmann::json LoggingChannels::defaultConfig()
{
    return {
        { "defaults",
          { { "console_level", "info" },
            { "file_level", "debug" },
            { "pattern", kBasePattern },
            { "flush_interval_ms", 1000 } } },
        { "sinks",
          { { "console", { { "enabled", true }, { "level", "info" } } },
            { "file",
              { { "enabled", true },
                { "level", "debug" },
                { "path", kLogFile },
                { "truncate", true } } } } },
        { "channels",
          { { "config", "info" }, { "engine", "info" }, { "genome", "info" }, { "topology", "info" } } }
    };
}

spdlog::sink_ptr LoggingChannels::makeConsoleSink()
{
    if (consoleToStderr_) {
        return std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    }
    return std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
}

void LoggingChannels::createChannelLoggers(const std::vector<spdlog::sink_ptr>& sinks)
{
    for (const LogChannel channel : kAllChannels) {
        auto logger = std::make_shared<spdlog::logger>(toString(channel), sinks.begin(), sinks.end());
        logger->set_level(spdlog::level::info);
        spdlog::register_logger(logger);
    }
}

void LoggingChannels::installDefaultLogger(
    const std::vector<spdlog::sink_ptr>& sinks, const std::string& componentName)
{
    // The default logger gets its own sink instances so its pattern (without the channel
    // name) does not leak into the channel loggers.
    std::vector<spdlog::sink_ptr> defaultSinks;
    for (const auto& shared : sinks) {
        spdlog::sink_ptr copy;
        if (dynamic_cast<spdlog::sinks::stdout_color_sink_mt*>(shared.get())
            || dynamic_cast<spdlog::sinks::stderr_color_sink_mt*>(shared.get())) {
            copy = makeConsoleSink();
        }
        else {
            copy = std::make_shared<spdlog::sinks::basic_file_sink_mt>(kLogFile, false);
        }
        copy->set_level(shared->level());
        copy->set_pattern(makePattern(kDefaultLoggerPattern, componentName));
        defaultSinks.push_back(copy);
    }

    const std::string loggerName = componentName.empty() ? "default" : componentName;
    auto defaultLogger =
        std::make_shared<spdlog::logger>(loggerName, defaultSinks.begin(), defaultSinks.end());
    defaultLogger->set_level(spdlog::level::info);
    spdlog::set_default_logger(defaultLogger);
}

std::string LoggingChannels::makePattern(const std::string& base, const std::string& componentName)
{
    if (componentName == "default" || componentName.empty()) {
        return base;
    }

    // Inject "[component] " right after the timestamp.
    const size_t pos = base.find("] ");
    if (pos == std::string::npos) {
        return "[" + componentName + "] " + base;
    }
    return base.substr(0, pos + 2) + "[" + componentName + "] " + base.substr(pos + 2);
}

Result<nlohmann::json, std::string> LoggingChannels::loadConfigFile(const std::string& configPath)
{
    namespace fs = std::filesystem;

    const std::string localPath = configPath + ".local";
    std::string pathToUse;

    if (fs::exists(localPath)) {
        pathToUse = localPath;
        spdlog::info("Using local logging config override: {}", localPath);
    }
    else if (fs::exists(configPath)) {
        pathToUse = configPath;
    }
    else {
        spdlog::info("Logging config not found, creating default: {}", configPath);
        if (!createDefaultConfigFile(configPath)) {
            spdlog::warn("Could not create logging config file, using built-in defaults");
        }
        return Result<nlohmann::json, std::string>::okay(defaultConfig());
    }

    try {
        std::ifstream configFile(pathToUse);
        if (!configFile.is_open()) {
            return Result<nlohmann::json, std::string>::error(
                "Cannot open logging config file: " + pathToUse);
        }
        return Result<nlohmann::json, std::string>::okay(nlohmann::json::parse(configFile));
    }
    catch (const nlohmann::json::parse_error& e) {
        return Result<nlohmann::json, std::string>::error(
            "Failed to parse logging config " + pathToUse + ": " + e.what());
    }
}

bool LoggingChannels::createDefaultConfigFile(const std::string& path)
{
    std::ofstream configFile(path);
    if (!configFile.is_open()) {
        spdlog::error("Failed to create logging config file: {}", path);
        return false;
    }
    configFile << defaultConfig().dump(2) << std::endl;
    return true;
}

void LoggingChannels::applyConfig(const nlohmann::json& config, const std::string& componentName)
{
    std::string pattern = kBasePattern;
    int flushIntervalMs = 1000;
    std::vector<spdlog::sink_ptr> sinks;

    try {
        const auto defaults = config.value("defaults", nlohmann::json::object());
        pattern = defaults.value("pattern", pattern);
        flushIntervalMs = defaults.value("flush_interval_ms", flushIntervalMs);
        const auto consoleLevel = parseLevelString(defaults.value("console_level", "info"));
        const auto fileLevel = parseLevelString(defaults.value("file_level", "debug"));

        const auto sinksConfig = config.value("sinks", nlohmann::json::object());
        const auto consoleCfg = sinksConfig.value("console", nlohmann::json::object());
        if (consoleCfg.value("enabled", true)) {
            auto consoleSink = makeConsoleSink();
            consoleSink->set_level(
                consoleCfg.contains("level")
                    ? parseLevelString(consoleCfg["level"].get<std::string>())
                    : consoleLevel);
            sinks.push_back(consoleSink);
        }

        const auto fileCfg = sinksConfig.value("file", nlohmann::json::object());
        if (fileCfg.value("enabled", true)) {
            const std::string path = fileCfg.value("path", kLogFile);
            spdlog::sink_ptr fileSink;
            if (fileCfg.contains("max_size_mb")) {
                const size_t maxSizeMb = fileCfg.value("max_size_mb", 10);
                const size_t maxFiles = fileCfg.value("max_files", 3);
                fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    path, maxSizeMb * 1024 * 1024, maxFiles);
            }
            else {
                fileSink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
                    path, fileCfg.value("truncate", true));
            }
            fileSink->set_level(
                fileCfg.contains("level") ? parseLevelString(fileCfg["level"].get<std::string>())
                                          : fileLevel);
            sinks.push_back(fileSink);
        }
    }
    catch (const std::exception& e) {
        spdlog::error("Error creating sinks from logging config: {}, using defaults", e.what());
        sinks.clear();
        auto consoleSink = makeConsoleSink();
        consoleSink->set_level(spdlog::level::info);
        sinks.push_back(consoleSink);
    }

    sharedSinks_ = sinks;
    for (auto& sink : sharedSinks_) {
        sink->set_pattern(makePattern(pattern, componentName));
    }

    createChannelLoggers(sharedSinks_);
    installDefaultLogger(sharedSinks_, componentName);

    // initialized_ must be true before setChannelLevel() calls get().
    initialized_ = true;
    try {
        for (const auto& [channel, levelStr] :
             config.value("channels", nlohmann::json::object()).items()) {
            if (!setChannelLevel(channel, parseLevelString(levelStr.get<std::string>()))) {
                spdlog::warn("Unknown log channel '{}' in logging config", channel);
            }
        }
    }
    catch (const std::exception& e) {
        spdlog::warn("Error applying channel levels from logging config: {}", e.what());
    }

    spdlog::flush_every(std::chrono::milliseconds(flushIntervalMs));
    SLOG_DEBUG("LoggingChannels initialized from config");
}

} // namespace CellGa
