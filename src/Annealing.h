#ifndef ANNEALING_H
#define ANNEALING_H

#include <random>
#include "Initializer.h"
#include "Neighborhood.h"
#include "Result.h"

struct AnnealingConfig {
    double initialTemperature = 1.0;
    double coolingRate = 0.95;          // alpha, T <- alpha * T
    double minTemperature = 1e-3;
    int iterationsPerTemperature = 50;
    long maxIterations = 20000;         // hard cap across all temperatures
    InitStrategy initStrategy = InitStrategy::FirstFit;

    // Throws InvalidConfigError
    void validate() const;
};

// Geometric cooling: T(k) = T0 * alpha^k
class GeometricCooling {
public:
    GeometricCooling(double initialTemperature, double alpha)
        : temperature(initialTemperature), factor(alpha) {}

    double current() const { return temperature; }
    void next() { temperature *= factor; }

private:
    double temperature;
    double factor;
};

// Consecutive non-improving iterations counted as one stall in Result::stuckCount
const int STUCK_WINDOW = 10;

// Metropolis rule on Score::value(): improvements and ties always pass,
// a degradation delta passes with probability exp(-delta / T).
double acceptanceProbability(double delta, double temperature);
bool acceptMetropolis(double delta, double temperature, std::mt19937& rng);

// run_simulated_annealing(Problem, config, rng). Returns the best state seen,
// which may be better than where the trajectory ended.
Result runSimulatedAnnealing(const Problem& p, const AnnealingConfig& cfg, std::mt19937& rng);

#endif // ANNEALING_H
