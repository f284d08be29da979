#include "FitnessFunction.h"

#include "core/Assert.h"

#include <array>
#include <cmath>
#include <numbers>
#include <stdexcept>

namespace CellGa {

namespace {
constexpr std::array<FitnessFunction, 4> kAllFunctions = {
    FitnessFunction::OneMax,
    FitnessFunction::Trap,
    FitnessFunction::Sphere,
    FitnessFunction::Rastrigin,
};

constexpr double kRastriginA = 10.0;
} // namespace

std::string toString(FitnessFunction function)
{
    switch (function) {
        case FitnessFunction::OneMax:
            return "onemax";
        case FitnessFunction::Trap:
            return "trap";
        case FitnessFunction::Sphere:
            return "sphere";
        case FitnessFunction::Rastrigin:
            return "rastrigin";
    }
    return "unknown";
}

std::optional<FitnessFunction> fitnessFunctionFromString(const std::string& str)
{
    for (const FitnessFunction function : kAllFunctions) {
        if (toString(function) == str) {
            return function;
        }
    }
    return std::nullopt;
}

void to_json(nlohmann::json& j, const FitnessFunction& function)
{
    j = toString(function);
}

void from_json(const nlohmann::json& j, FitnessFunction& function)
{
    if (!j.is_string()) {
        throw std::runtime_error("fitnessFunction must be a string.");
    }

    const auto parsed = fitnessFunctionFromString(j.get<std::string>());
    if (!parsed.has_value()) {
        throw std::runtime_error("Unknown fitness function: " + j.get<std::string>());
    }
    function = parsed.value();
}

GenomeKind genomeKindFor(FitnessFunction function)
{
    switch (function) {
        case FitnessFunction::OneMax:
        case FitnessFunction::Trap:
            return GenomeKind::Bits;
        case FitnessFunction::Sphere:
        case FitnessFunction::Rastrigin:
            return GenomeKind::Reals;
    }
    return GenomeKind::Bits;
}

double oneMax(const BitGenome& genome)
{
    return static_cast<double>(genome.size()) - genome.onesCount();
}

double trap(const BitGenome& genome)
{
    const int ones = genome.onesCount();
    const int n = static_cast<int>(genome.size());

    if (ones == 0) return 0.0;
    if (ones == n) return 1.0;
    return n - ones + 1;
}

double sphere(const RealGenome& genome)
{
    double sum = 0.0;
    for (const double x : genome.values) {
        sum += x * x;
    }
    return sum;
}

double rastrigin(const RealGenome& genome)
{
    double sum = kRastriginA * static_cast<double>(genome.size());
    for (const double x : genome.values) {
        sum += x * x - kRastriginA * std::cos(2.0 * std::numbers::pi * x);
    }
    return sum;
}

double evaluate(FitnessFunction function, const Genotype& genotype)
{
    CELLGA_ASSERT(
        genotype.kind() == genomeKindFor(function),
        "Fitness function applied to a genotype of the wrong kind");

    const auto& genome = genotype.getVariant();
    switch (function) {
        case FitnessFunction::OneMax:
            return oneMax(std::get<BitGenome>(genome));
        case FitnessFunction::Trap:
            return trap(std::get<BitGenome>(genome));
        case FitnessFunction::Sphere:
            return sphere(std::get<RealGenome>(genome));
        case FitnessFunction::Rastrigin:
            return rastrigin(std::get<RealGenome>(genome));
    }
    return 0.0;
}

} // namespace CellGa
