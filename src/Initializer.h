#ifndef INITIALIZER_H
#define INITIALIZER_H

#include <random>
#include <string>
#include <vector>
#include "State.h"

enum class InitStrategy {
    FirstFit,
    FirstFitDecreasing,
    BestFit,
    BestFitDecreasing,
    WorstFit,
    NextFit,
    Random
};

std::string initStrategyName(InitStrategy strategy);
// Accepts the names produced by initStrategyName ("first_fit", "best_fit_decreasing", ...)
bool parseInitStrategy(const std::string& name, InitStrategy& out);

// Default construction: first-fit in the given item order.
State initialize(const Problem& p, std::mt19937& rng);

// Only InitStrategy::Random draws from rng; the others are deterministic.
State initialize(const Problem& p, InitStrategy strategy, std::mt19937& rng);

// First-fit over an explicit item order (also the GA decoder).
State firstFitInOrder(const Problem& p, const std::vector<int>& order);

// Item indices sorted by weight, heaviest first; ties keep input order.
std::vector<int> decreasingWeightOrder(const Problem& p);

#endif // INITIALIZER_H
