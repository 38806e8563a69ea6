#ifndef HILL_CLIMBING_H
#define HILL_CLIMBING_H

#include <random>
#include <string>
#include "Initializer.h"
#include "Neighborhood.h"
#include "Result.h"

enum class HillClimbingVariant { SteepestAscent, Stochastic, SidewaysMove, RandomRestart };

std::string variantName(HillClimbingVariant variant);

// How the next neighbour is picked each iteration
enum class NeighborSelection {
    BestOfAll,            // scan the whole neighbourhood, keep the best
    FirstImprovingRandom  // scan in random order, stop at the first improvement
};

std::string neighborSelectionName(NeighborSelection selection);
bool parseNeighborSelection(const std::string& name, NeighborSelection& out);

struct HillClimbingConfig {
    int maxIterations = 1000;    // hard cap on accepted moves per climb
    int maxSideways = 100;       // consecutive equal-score moves (sideways variant)
    int restarts = 10;           // extra climbs after the first (random restart)
    HillClimbingVariant restartVariant = HillClimbingVariant::SteepestAscent;
    int maxTrials = 0;           // neighbours drawn per random-order iteration, 0 = whole neighbourhood
    // Scan order for steepest and sideways (and a restart built on them).
    // The stochastic variant always scans in random order.
    NeighborSelection selection = NeighborSelection::BestOfAll;
    InitStrategy initStrategy = InitStrategy::FirstFit;

    // Throws InvalidConfigError
    void validate(HillClimbingVariant variant) const;
};

// The only thing that differs between the plain variants: which neighbour is
// looked at, and whether equal-score moves are taken (and how many in a row).
struct AcceptancePolicy {
    NeighborSelection selection = NeighborSelection::BestOfAll;
    bool allowSideways = false;  // take equal-score moves when nothing improves
    int sidewaysLimit = 0;       // consecutive equal-score moves before the run stops
    int maxTrials = 0;
};

AcceptancePolicy acceptancePolicyFor(HillClimbingVariant variant, const HillClimbingConfig& cfg);

// Shared climbing loop from a given start state.
Result climb(const Problem& p, const State& start, const AcceptancePolicy& policy,
             int maxIterations, std::mt19937& rng);

// run_hill_climbing(Problem, variant, config, rng)
Result runHillClimbing(const Problem& p, HillClimbingVariant variant,
                       const HillClimbingConfig& cfg, std::mt19937& rng);

#endif // HILL_CLIMBING_H
