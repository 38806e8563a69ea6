#ifndef RESULT_H
#define RESULT_H

#include <string>
#include <vector>
#include "Objective.h"

enum class TerminationReason {
    EmptyProblem,       // nothing to pack
    LocalOptimum,       // no improving neighbour
    NoImprovingTrial,   // stochastic scan exhausted its trials
    SidewaysLimit,      // plateau walk exceeded the sideways budget
    RestartBudget,      // random restart used all its restarts
    TemperatureFloor,   // annealing cooled below the minimum temperature
    GenerationCap,      // GA reached its generation cap
    Stagnation,         // GA best fitness unchanged for too long
    IterationCap        // hard stop reached before convergence
};

std::string terminationName(TerminationReason reason);

// Outcome of one algorithm run. Filled in once by the run and then only read.
struct Result {
    std::string algorithm;
    State state;
    Score score;
    Score initialScore;
    long iterations = 0;          // iterations, or generations for the GA
    double elapsedMs = 0.0;
    TerminationReason termination = TerminationReason::IterationCap;
    unsigned seed = 0;

    // Score::value() of the current state after each iteration
    // (best individual per generation for the GA), starting with the initial state
    std::vector<double> history;

    // Algorithm specific counters, zero where they do not apply
    long restarts = 0;
    long sidewaysMoves = 0;
    long acceptedWorse = 0;

    // Annealing: temperature and Metropolis acceptance probability of each
    // iteration, how often the walk stalled, and the temperature it ended at
    std::vector<double> temperatures;
    std::vector<double> acceptanceProbabilities;
    long stuckCount = 0;
    double finalTemperature = 0.0;

    // GA: mean fitness of the population, aligned with history
    std::vector<double> meanFitnessHistory;

    int binsUsed() const { return score.bins; }
};

#endif // RESULT_H
