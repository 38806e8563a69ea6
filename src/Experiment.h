#ifndef EXPERIMENT_H
#define EXPERIMENT_H

#include <random>
#include <string>
#include <vector>
#include "Config.h"

enum class Algorithm {
    SteepestAscent,
    Stochastic,
    SidewaysMove,
    RandomRestart,
    SimulatedAnnealing,
    GeneticAlgorithm
};

const std::vector<Algorithm>& allAlgorithms();

// Short CLI name: steepest, stochastic, sideways, restart, sa, ga
std::string algorithmKey(Algorithm a);
// Human readable name, also used as Result::algorithm
std::string algorithmName(Algorithm a);

// "all" expands to every algorithm. Returns false for an unknown name.
bool parseAlgorithms(const std::string& name, std::vector<Algorithm>& out);

// Checks only the parameters the algorithm reads. Throws InvalidConfigError.
void validateFor(Algorithm a, const EngineConfig& cfg);

Result runAlgorithm(const Problem& p, Algorithm a, const EngineConfig& cfg, std::mt19937& rng);

// Aggregate over the trials of one algorithm
struct Summary {
    Algorithm algorithm = Algorithm::SteepestAscent;
    int runs = 0;
    int bestBins = 0;
    int worstBins = 0;
    double meanBins = 0.0;
    double meanScore = 0.0;      // mean Score::value()
    double meanElapsedMs = 0.0;
    size_t bestRun = 0;          // index into Experiment::getResults()
};

// Runs every (algorithm, trial) pair as an independent unit, in parallel.
// Unit u is seeded with seed + u, so results do not depend on the thread count.
class Experiment {
private:
    const Problem& problem;
    EngineConfig config;
    std::vector<Algorithm> algorithms;
    bool quiet = false;

    std::vector<Result> results;    // algorithm-major: algorithms[a] trial r at a * runs + r
    std::vector<Summary> summaries;

    void summarize();

public:
    Experiment(const Problem& p, EngineConfig cfg, std::vector<Algorithm> algos);

    void setQuiet(bool q) { quiet = q; }

    // Throws InvalidConfigError before any run starts; rethrows the first
    // failure of a run after the parallel section.
    void run();

    const std::vector<Result>& getResults() const { return results; }
    const std::vector<Summary>& getSummaries() const { return summaries; }
    const std::vector<Algorithm>& getAlgorithms() const { return algorithms; }
    const EngineConfig& getConfig() const { return config; }

    // Best Result over every algorithm and trial (earliest wins ties)
    const Result& getBest() const;
};

#endif // EXPERIMENT_H
