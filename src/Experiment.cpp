#include "Experiment.h"
#include <algorithm>
#include <exception>
#include <iomanip>
#include <iostream>
#include <omp.h>
#include <sstream>
#include <utility>
#include "Errors.h"

const std::vector<Algorithm>& allAlgorithms() {
    static const std::vector<Algorithm> all = {
        Algorithm::SteepestAscent, Algorithm::Stochastic, Algorithm::SidewaysMove,
        Algorithm::RandomRestart, Algorithm::SimulatedAnnealing, Algorithm::GeneticAlgorithm
    };
    return all;
}

std::string algorithmKey(Algorithm a) {
    switch (a) {
        case Algorithm::SteepestAscent: return "steepest";
        case Algorithm::Stochastic: return "stochastic";
        case Algorithm::SidewaysMove: return "sideways";
        case Algorithm::RandomRestart: return "restart";
        case Algorithm::SimulatedAnnealing: return "sa";
        case Algorithm::GeneticAlgorithm: return "ga";
    }
    return "unknown";
}

std::string algorithmName(Algorithm a) {
    switch (a) {
        case Algorithm::SteepestAscent: return variantName(HillClimbingVariant::SteepestAscent);
        case Algorithm::Stochastic: return variantName(HillClimbingVariant::Stochastic);
        case Algorithm::SidewaysMove: return variantName(HillClimbingVariant::SidewaysMove);
        case Algorithm::RandomRestart: return variantName(HillClimbingVariant::RandomRestart);
        case Algorithm::SimulatedAnnealing: return "Simulated Annealing";
        case Algorithm::GeneticAlgorithm: return "Genetic Algorithm";
    }
    return "Unknown";
}

bool parseAlgorithms(const std::string& name, std::vector<Algorithm>& out) {
    if (name == "all") {
        out = allAlgorithms();
        return true;
    }
    for (Algorithm a : allAlgorithms()) {
        if (algorithmKey(a) == name) {
            out = {a};
            return true;
        }
    }
    return false;
}

namespace {

bool hillClimbingVariantOf(Algorithm a, HillClimbingVariant& out) {
    switch (a) {
        case Algorithm::SteepestAscent: out = HillClimbingVariant::SteepestAscent; return true;
        case Algorithm::Stochastic: out = HillClimbingVariant::Stochastic; return true;
        case Algorithm::SidewaysMove: out = HillClimbingVariant::SidewaysMove; return true;
        case Algorithm::RandomRestart: out = HillClimbingVariant::RandomRestart; return true;
        default: return false;
    }
}

} // namespace

void validateFor(Algorithm a, const EngineConfig& cfg) {
    HillClimbingVariant variant;
    if (hillClimbingVariantOf(a, variant)) cfg.hillClimbing.validate(variant);
    else if (a == Algorithm::SimulatedAnnealing) cfg.annealing.validate();
    else cfg.genetic.validate();
}

Result runAlgorithm(const Problem& p, Algorithm a, const EngineConfig& cfg, std::mt19937& rng) {
    HillClimbingVariant variant;
    if (hillClimbingVariantOf(a, variant)) return runHillClimbing(p, variant, cfg.hillClimbing, rng);
    if (a == Algorithm::SimulatedAnnealing) return runSimulatedAnnealing(p, cfg.annealing, rng);
    return runGeneticAlgorithm(p, cfg.genetic, rng);
}

Experiment::Experiment(const Problem& p, EngineConfig cfg, std::vector<Algorithm> algos)
    : problem(p), config(std::move(cfg)), algorithms(std::move(algos)) {}

void Experiment::run() {
    if (algorithms.empty()) throw InvalidConfigError("no algorithm selected");
    if (config.runs < 1) throw InvalidConfigError("runs must be at least 1");
    for (Algorithm a : algorithms) validateFor(a, config);

    int threads = config.threads > 0 ? config.threads : omp_get_num_procs();
    int runs = config.runs;
    int units = (int)algorithms.size() * runs;

    results.assign(units, Result());
    summaries.clear();

    if (!quiet) {
        std::cout << ">>> Experiment: " << algorithms.size() << " algorithm(s) x " << runs
                  << " run(s), " << problem.size() << " items, capacity " << problem.capacity()
                  << ", lower bound " << problem.lowerBound() << " bins, "
                  << threads << " thread(s)" << std::endl;
    }

    std::exception_ptr failure;

    // Each unit owns its rng and Result slot; the Problem is shared read-only
    #pragma omp parallel for schedule(dynamic) num_threads(threads)
    for (int u = 0; u < units; ++u) {
        Algorithm a = algorithms[u / runs];
        unsigned seed = config.seed + (unsigned)u;
        std::mt19937 rng(seed);

        try {
            Result res = runAlgorithm(problem, a, config, rng);
            res.seed = seed;
            results[u] = std::move(res);
        } catch (...) {
            // Exceptions must not leave the parallel region: keep the first, rethrow below
            #pragma omp critical
            {
                if (!failure) failure = std::current_exception();
            }
            continue;
        }

        if (!quiet) {
            const Result& res = results[u];
            // Built apart from std::cout so its format flags stay as they were
            std::ostringstream line;
            line << ">>> [" << algorithmKey(a) << " #" << (u % runs + 1) << "] "
                 << res.binsUsed() << " bins, score " << std::fixed << std::setprecision(6)
                 << res.score.value() << ", " << res.iterations << " it, "
                 << std::setprecision(1) << res.elapsedMs << " ms ("
                 << terminationName(res.termination) << ")";
            #pragma omp critical
            {
                std::cout << line.str() << std::endl;
            }
        }
    }

    if (failure) std::rethrow_exception(failure);
    summarize();
}

void Experiment::summarize() {
    int runs = config.runs;
    for (size_t a = 0; a < algorithms.size(); ++a) {
        Summary s;
        s.algorithm = algorithms[a];
        s.runs = runs;
        s.bestRun = a * runs;

        double binsSum = 0.0, scoreSum = 0.0, timeSum = 0.0;
        for (int r = 0; r < runs; ++r) {
            size_t idx = a * runs + r;
            const Result& res = results[idx];
            if (r == 0) {
                s.bestBins = res.binsUsed();
                s.worstBins = res.binsUsed();
            }
            s.bestBins = std::min(s.bestBins, res.binsUsed());
            s.worstBins = std::max(s.worstBins, res.binsUsed());
            if (res.score.betterThan(results[s.bestRun].score)) s.bestRun = idx;
            binsSum += res.binsUsed();
            scoreSum += res.score.value();
            timeSum += res.elapsedMs;
        }
        s.meanBins = binsSum / runs;
        s.meanScore = scoreSum / runs;
        s.meanElapsedMs = timeSum / runs;
        summaries.push_back(s);
    }
}

const Result& Experiment::getBest() const {
    if (summaries.empty()) throw std::logic_error("experiment has not been run");
    size_t best = summaries[0].bestRun;
    for (const Summary& s : summaries) {
        if (results[s.bestRun].score.betterThan(results[best].score)) best = s.bestRun;
    }
    return results[best];
}
