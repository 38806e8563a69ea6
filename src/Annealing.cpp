#include "Annealing.h"
#include <chrono>
#include <cmath>
#include <utility>
#include "Errors.h"

void AnnealingConfig::validate() const {
    if (!(initialTemperature > 0.0) || !std::isfinite(initialTemperature)) {
        throw InvalidConfigError("initial temperature must be positive");
    }
    if (!(coolingRate > 0.0 && coolingRate < 1.0)) {
        throw InvalidConfigError("cooling rate must lie strictly between 0 and 1");
    }
    if (!(minTemperature > 0.0) || minTemperature >= initialTemperature) {
        throw InvalidConfigError("minimum temperature must be positive and below the initial temperature");
    }
    if (iterationsPerTemperature <= 0) {
        throw InvalidConfigError("iterations per temperature must be positive");
    }
    if (maxIterations <= 0) {
        throw InvalidConfigError("annealing max_iterations must be positive");
    }
}

double acceptanceProbability(double delta, double temperature) {
    if (delta <= 0.0) return 1.0;
    return std::exp(-delta / temperature);
}

bool acceptMetropolis(double delta, double temperature, std::mt19937& rng) {
    if (delta <= 0.0) return true;
    std::uniform_real_distribution<double> uniform(0.0, 1.0);
    return uniform(rng) < acceptanceProbability(delta, temperature);
}

Result runSimulatedAnnealing(const Problem& p, const AnnealingConfig& cfg, std::mt19937& rng) {
    cfg.validate();
    auto startTime = std::chrono::steady_clock::now();

    Result res;
    res.algorithm = "Simulated Annealing";
    res.state = initialize(p, cfg.initStrategy, rng);
    res.score = evaluate(res.state);
    res.initialScore = res.score;
    res.history.push_back(res.score.value());

    if (p.empty()) {
        res.termination = TerminationReason::EmptyProblem;
    } else {
        State current = res.state;
        Score currentScore = res.score;
        GeometricCooling cooling(cfg.initialTemperature, cfg.coolingRate);
        bool running = true;
        int stalled = 0;

        while (running) {
            if (cooling.current() < cfg.minTemperature) {
                res.termination = TerminationReason::TemperatureFloor;
                break;
            }
            for (int k = 0; k < cfg.iterationsPerTemperature; ++k) {
                if (res.iterations >= cfg.maxIterations) {
                    res.termination = TerminationReason::IterationCap;
                    running = false;
                    break;
                }

                Move move;
                if (!randomMove(p, current, rng, move)) {
                    // e.g. a single item: there is nowhere to go
                    res.termination = TerminationReason::LocalOptimum;
                    running = false;
                    break;
                }

                State candidate = applyMove(p, current, move);
                Score candidateScore = evaluate(candidate);
                double delta = candidateScore.value() - currentScore.value();

                bool accepted = acceptMetropolis(delta, cooling.current(), rng);
                bool improvedBest = false;
                if (accepted) {
                    if (delta > 0.0) ++res.acceptedWorse;
                    current = std::move(candidate);
                    currentScore = candidateScore;
                    if (currentScore.betterThan(res.score)) {
                        res.state = current;
                        res.score = currentScore;
                        improvedBest = true;
                    }
                }

                stalled = improvedBest ? 0 : stalled + 1;
                if (stalled >= STUCK_WINDOW) {
                    ++res.stuckCount;
                    stalled = 0;
                }

                ++res.iterations;
                res.history.push_back(currentScore.value());
                res.temperatures.push_back(cooling.current());
                res.acceptanceProbabilities.push_back(acceptanceProbability(delta, cooling.current()));
                res.finalTemperature = cooling.current();
            }
            cooling.next();
        }
    }

    res.elapsedMs = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - startTime).count();
    return res;
}
