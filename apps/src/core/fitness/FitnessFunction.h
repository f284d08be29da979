#pragma once

/**
 * \file
 * Minimization landscapes. Every function returns 0 at its global optimum and
 * lower is always better.
 */

#include "core/genome/Genotype.h"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace CellGa {

enum class FitnessFunction : uint8_t {
    OneMax = 0,
    Trap,
    Sphere,
    Rastrigin,
};

// Config identifiers: "onemax", "trap", "sphere", "rastrigin".
std::string toString(FitnessFunction function);
std::optional<FitnessFunction> fitnessFunctionFromString(const std::string& str);

void to_json(nlohmann::json& j, const FitnessFunction& function);
void from_json(const nlohmann::json& j, FitnessFunction& function);

// OneMax/Trap evolve bit genomes; Sphere/Rastrigin evolve real genomes.
GenomeKind genomeKindFor(FitnessFunction function);

// n - ones. 0 at all ones, n at all zeros.
double oneMax(const BitGenome& genome);

/**
 * Deceptive trap: 0 at all zeros, 1 at all ones, n - ones + 1 otherwise. Every step
 * toward all ones improves fitness, so all ones is a strong local optimum while the
 * global optimum sits at the opposite corner.
 */
double trap(const BitGenome& genome);

// Sum of squares.
double sphere(const RealGenome& genome);

// 10*d + sum(x^2 - 10*cos(2*pi*x)).
double rastrigin(const RealGenome& genome);

/**
 * Evaluate a genotype with the given landscape. The genotype's kind must match
 * genomeKindFor(function).
 */
double evaluate(FitnessFunction function, const Genotype& genotype);

} // namespace CellGa
