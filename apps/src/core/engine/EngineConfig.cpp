#include "EngineConfig.h"

#include <cmath>
#include <stdexcept>

namespace CellGa {

namespace {

bool isProbability(double value)
{
    return value >= 0.0 && value <= 1.0;
}

Result<std::monostate, ConfigError> fail(const std::string& message)
{
    return Result<std::monostate, ConfigError>::error(ConfigError{ message });
}

} // namespace

std::string toString(ReplacementPolicy policy)
{
    switch (policy) {
        case ReplacementPolicy::Strict:
            return "strict";
        case ReplacementPolicy::Probabilistic:
            return "probabilistic";
    }
    return "strict";
}

std::string toString(DiversityMetric metric)
{
    switch (metric) {
        case DiversityMetric::FitnessStdDev:
            return "fitnessStdDev";
        case DiversityMetric::EdgeDistance:
            return "edgeDistance";
    }
    return "fitnessStdDev";
}

void to_json(nlohmann::json& j, const ReplacementPolicy& policy)
{
    j = toString(policy);
}

void from_json(const nlohmann::json& j, ReplacementPolicy& policy)
{
    const auto str = j.get<std::string>();
    if (str == "strict") {
        policy = ReplacementPolicy::Strict;
    }
    else if (str == "probabilistic") {
        policy = ReplacementPolicy::Probabilistic;
    }
    else {
        throw std::runtime_error("Unknown replacement policy: " + str);
    }
}

void to_json(nlohmann::json& j, const DiversityMetric& metric)
{
    j = toString(metric);
}

void from_json(const nlohmann::json& j, DiversityMetric& metric)
{
    const auto str = j.get<std::string>();
    if (str == "fitnessStdDev") {
        metric = DiversityMetric::FitnessStdDev;
    }
    else if (str == "edgeDistance") {
        metric = DiversityMetric::EdgeDistance;
    }
    else {
        throw std::runtime_error("Unknown diversity metric: " + str);
    }
}

Result<std::monostate, ConfigError> validate(const EngineConfig& config)
{
    if (config.popSize < 1) {
        return fail("popSize must be >= 1, got " + std::to_string(config.popSize));
    }
    if (config.genomeLength < 1) {
        return fail("genomeLength must be >= 1, got " + std::to_string(config.genomeLength));
    }
    if (!isProbability(config.mutationRate)) {
        return fail("mutationRate must be in [0, 1]");
    }
    if (!isProbability(config.crossoverRate)) {
        return fail("crossoverRate must be in [0, 1]");
    }
    if (!isProbability(config.rewiringProb)) {
        return fail("rewiringProb must be in [0, 1]");
    }
    if (!fitnessFunctionFromString(toString(config.fitnessFunction)).has_value()) {
        return fail("fitnessFunction is not a known landscape");
    }
    if (!isProbability(config.onesProbabilityMin) || !isProbability(config.onesProbabilityMax)) {
        return fail("onesProbabilityMin/Max must be in [0, 1]");
    }
    if (config.onesProbabilityMin > config.onesProbabilityMax) {
        return fail("onesProbabilityMin must not exceed onesProbabilityMax");
    }
    if (!std::isfinite(config.realLowerBound) || !std::isfinite(config.realUpperBound)) {
        return fail("realLowerBound/UpperBound must be finite");
    }
    if (!(config.realLowerBound < config.realUpperBound)) {
        return fail("realLowerBound must be below realUpperBound");
    }
    if (!std::isfinite(config.mutationSigma) || config.mutationSigma < 0.0) {
        return fail("mutationSigma must be finite and >= 0");
    }
    if (!isProbability(config.replacementProbability)) {
        return fail("replacementProbability must be in [0, 1]");
    }
    return Result<std::monostate, ConfigError>::okay(std::monostate{});
}

GenomeInitParams genomeInitParams(const EngineConfig& config)
{
    return GenomeInitParams{
        .kind = genomeKindFor(config.fitnessFunction),
        .length = config.genomeLength,
        .onesProbabilityMin = config.onesProbabilityMin,
        .onesProbabilityMax = config.onesProbabilityMax,
        .lowerBound = config.realLowerBound,
        .upperBound = config.realUpperBound,
    };
}

MutationParams mutationParams(const EngineConfig& config)
{
    return MutationParams{
        .rate = config.mutationRate,
        .sigma = config.mutationSigma,
    };
}

} // namespace CellGa
