#include "HillClimbing.h"
#include <algorithm>
#include <chrono>
#include <numeric>
#include <utility>
#include "Errors.h"

std::string variantName(HillClimbingVariant variant) {
    switch (variant) {
        case HillClimbingVariant::SteepestAscent: return "Steepest Ascent Hill Climbing";
        case HillClimbingVariant::Stochastic: return "Stochastic Hill Climbing";
        case HillClimbingVariant::SidewaysMove: return "Sideways Move Hill Climbing";
        case HillClimbingVariant::RandomRestart: return "Random Restart Hill Climbing";
    }
    return "Hill Climbing";
}

void HillClimbingConfig::validate(HillClimbingVariant variant) const {
    if (maxIterations <= 0) throw InvalidConfigError("max_iterations must be positive");
    if (maxTrials < 0) throw InvalidConfigError("max_trials must not be negative");
    if (variant == HillClimbingVariant::SidewaysMove && maxSideways < 0) {
        throw InvalidConfigError("max_sideways must not be negative");
    }
    if (variant == HillClimbingVariant::RandomRestart) {
        if (restarts < 0) throw InvalidConfigError("restarts must not be negative");
        if (restartVariant == HillClimbingVariant::RandomRestart) {
            throw InvalidConfigError("restart_variant must be steepest, stochastic or sideways");
        }
        if (restartVariant == HillClimbingVariant::SidewaysMove && maxSideways < 0) {
            throw InvalidConfigError("max_sideways must not be negative");
        }
    }
}

std::string neighborSelectionName(NeighborSelection selection) {
    return selection == NeighborSelection::BestOfAll ? "best" : "first_random";
}

bool parseNeighborSelection(const std::string& name, NeighborSelection& out) {
    if (name == "best") out = NeighborSelection::BestOfAll;
    else if (name == "first_random") out = NeighborSelection::FirstImprovingRandom;
    else return false;
    return true;
}

AcceptancePolicy acceptancePolicyFor(HillClimbingVariant variant, const HillClimbingConfig& cfg) {
    AcceptancePolicy policy;
    policy.maxTrials = cfg.maxTrials;
    switch (variant) {
        case HillClimbingVariant::SteepestAscent:
            policy.selection = cfg.selection;
            break;
        case HillClimbingVariant::Stochastic:
            policy.selection = NeighborSelection::FirstImprovingRandom;
            break;
        case HillClimbingVariant::SidewaysMove:
            policy.selection = cfg.selection;
            policy.allowSideways = true;
            policy.sidewaysLimit = cfg.maxSideways;
            break;
        case HillClimbingVariant::RandomRestart:
            return acceptancePolicyFor(cfg.restartVariant, cfg);
    }
    return policy;
}

Result climb(const Problem& p, const State& start, const AcceptancePolicy& policy,
             int maxIterations, std::mt19937& rng) {
    Result res;
    res.state = start;
    res.score = evaluate(start);
    res.initialScore = res.score;
    res.history.push_back(res.score.value());
    if (p.empty()) {
        res.termination = TerminationReason::EmptyProblem;
        return res;
    }

    State current = start;
    Score currentScore = res.score;
    int sideways = 0;
    res.termination = TerminationReason::IterationCap;

    for (int iter = 0; iter < maxIterations; ++iter) {
        Neighborhood hood(p, current);
        bool improved = false;
        bool level = false;     // an equal-score neighbour is available
        State next;
        Score nextScore;

        if (policy.selection == NeighborSelection::BestOfAll) {
            // Ties keep the earliest neighbour, so the walk is reproducible
            bool found = false;
            for (size_t i = 0; i < hood.size(); ++i) {
                State cand = hood.neighbor(i);
                Score sc = evaluate(cand);
                if (!found || sc.betterThan(nextScore)) {
                    found = true;
                    next = std::move(cand);
                    nextScore = sc;
                }
            }
            improved = found && nextScore.betterThan(currentScore);
            level = found && !improved && nextScore.equivalent(currentScore);
        } else {
            std::vector<size_t> order(hood.size());
            std::iota(order.begin(), order.end(), 0);
            std::shuffle(order.begin(), order.end(), rng);
            size_t trials = order.size();
            if (policy.maxTrials > 0) trials = std::min(trials, (size_t)policy.maxTrials);

            for (size_t k = 0; k < trials; ++k) {
                State cand = hood.neighbor(order[k]);
                Score sc = evaluate(cand);
                if (sc.betterThan(currentScore)) {
                    improved = true;
                    next = std::move(cand);
                    nextScore = sc;
                    break;
                }
                // First equal-score neighbour drawn is the plateau step
                if (!level && policy.allowSideways && sc.equivalent(currentScore)) {
                    level = true;
                    next = std::move(cand);
                    nextScore = sc;
                }
            }
        }

        if (improved) {
            sideways = 0;
        } else if (level && policy.allowSideways) {
            if (sideways >= policy.sidewaysLimit) {
                res.termination = TerminationReason::SidewaysLimit;
                break;
            }
            ++sideways;
            ++res.sidewaysMoves;
        } else {
            res.termination = (policy.selection == NeighborSelection::FirstImprovingRandom)
                ? TerminationReason::NoImprovingTrial
                : TerminationReason::LocalOptimum;
            break;
        }

        current = std::move(next);
        currentScore = nextScore;
        ++res.iterations;
        res.history.push_back(currentScore.value());

        if (currentScore.betterThan(res.score)) {
            res.state = current;
            res.score = currentScore;
        }
    }
    return res;
}

Result runHillClimbing(const Problem& p, HillClimbingVariant variant,
                       const HillClimbingConfig& cfg, std::mt19937& rng) {
    cfg.validate(variant);
    auto startTime = std::chrono::steady_clock::now();

    AcceptancePolicy policy = acceptancePolicyFor(variant, cfg);
    State start = initialize(p, cfg.initStrategy, rng);
    Result res = climb(p, start, policy, cfg.maxIterations, rng);

    if (variant == HillClimbingVariant::RandomRestart && !p.empty()) {
        for (int r = 0; r < cfg.restarts; ++r) {
            State fresh = initialize(p, InitStrategy::Random, rng);
            Result attempt = climb(p, fresh, policy, cfg.maxIterations, rng);

            res.iterations += attempt.iterations;
            res.sidewaysMoves += attempt.sidewaysMoves;
            res.history.insert(res.history.end(), attempt.history.begin(), attempt.history.end());
            ++res.restarts;

            if (attempt.score.betterThan(res.score)) {
                res.state = std::move(attempt.state);
                res.score = attempt.score;
            }
        }
        res.termination = TerminationReason::RestartBudget;
    }

    res.algorithm = variantName(variant);
    res.elapsedMs = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - startTime).count();
    return res;
}
