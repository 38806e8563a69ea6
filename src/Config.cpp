#include "Config.h"
#include <fstream>
#include <stdexcept>
#include "Errors.h"

namespace {

int toInt(const std::string& key, const std::string& v) {
    size_t used = 0;
    int out = 0;
    try {
        out = std::stoi(v, &used);
    } catch (const std::logic_error&) {
        throw InvalidConfigError("bad integer for '" + key + "': " + v);
    }
    if (used != v.size()) throw InvalidConfigError("bad integer for '" + key + "': " + v);
    return out;
}

double toDouble(const std::string& key, const std::string& v) {
    size_t used = 0;
    double out = 0.0;
    try {
        out = std::stod(v, &used);
    } catch (const std::logic_error&) {
        throw InvalidConfigError("bad number for '" + key + "': " + v);
    }
    if (used != v.size()) throw InvalidConfigError("bad number for '" + key + "': " + v);
    return out;
}

HillClimbingVariant toVariant(const std::string& key, const std::string& v) {
    if (v == "steepest") return HillClimbingVariant::SteepestAscent;
    if (v == "stochastic") return HillClimbingVariant::Stochastic;
    if (v == "sideways") return HillClimbingVariant::SidewaysMove;
    throw InvalidConfigError("'" + key + "' must be steepest, stochastic or sideways, got " + v);
}

} // namespace

bool EngineConfig::set(const std::string& k, const std::string& v) {
    // --- Hill climbing ---
    if (k == "max_iterations") hillClimbing.maxIterations = toInt(k, v);
    else if (k == "max_sideways") hillClimbing.maxSideways = toInt(k, v);
    else if (k == "restarts") hillClimbing.restarts = toInt(k, v);
    else if (k == "restart_variant") hillClimbing.restartVariant = toVariant(k, v);
    else if (k == "max_trials") hillClimbing.maxTrials = toInt(k, v);
    else if (k == "neighbor_selection") {
        if (!parseNeighborSelection(v, hillClimbing.selection)) {
            throw InvalidConfigError("neighbor_selection must be best or first_random, got " + v);
        }
    }
    else if (k == "init_strategy") {
        InitStrategy strategy;
        if (!parseInitStrategy(v, strategy)) throw InvalidConfigError("unknown init_strategy: " + v);
        hillClimbing.initStrategy = strategy;
        annealing.initStrategy = strategy;
    }
    // --- Simulated annealing ---
    else if (k == "sa_initial_temperature") annealing.initialTemperature = toDouble(k, v);
    else if (k == "sa_cooling_rate") annealing.coolingRate = toDouble(k, v);
    else if (k == "sa_min_temperature") annealing.minTemperature = toDouble(k, v);
    else if (k == "sa_iterations_per_temperature") annealing.iterationsPerTemperature = toInt(k, v);
    else if (k == "sa_max_iterations") annealing.maxIterations = toInt(k, v);
    // --- Genetic algorithm ---
    else if (k == "ga_population_size") genetic.populationSize = toInt(k, v);
    else if (k == "ga_generations") genetic.maxGenerations = toInt(k, v);
    else if (k == "ga_crossover_rate") genetic.crossoverRate = toDouble(k, v);
    else if (k == "ga_mutation_rate") genetic.mutationRate = toDouble(k, v);
    else if (k == "ga_selection") {
        if (!parseSelection(v, genetic.selection)) throw InvalidConfigError("unknown ga_selection: " + v);
    }
    else if (k == "ga_tournament_size") genetic.tournamentSize = toInt(k, v);
    else if (k == "ga_elitism") genetic.elitism = toInt(k, v);
    else if (k == "ga_stagnation") genetic.stagnationLimit = toInt(k, v);
    else if (k == "ga_greedy_seeds") genetic.greedySeeds = toInt(k, v);
    // --- Experiment ---
    else if (k == "seed") {
        int s = toInt(k, v);
        if (s < 0) throw InvalidConfigError("seed must not be negative");
        seed = (unsigned)s;
    }
    else if (k == "runs") runs = toInt(k, v);
    else if (k == "threads") threads = toInt(k, v);
    else return false;
    return true;
}

void EngineConfig::loadFromFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) return;
    std::string line;
    while (std::getline(file, line)) {
        size_t c = line.find('#');
        if (c != std::string::npos) line = line.substr(0, c);
        size_t eq = line.find('=');
        if (eq == std::string::npos) continue;
        std::string k = line.substr(0, eq);
        std::string v = line.substr(eq + 1);
        auto trim = [](std::string& s) {
            s.erase(0, s.find_first_not_of(" \t\r\n"));
            s.erase(s.find_last_not_of(" \t\r\n") + 1);
        };
        trim(k); trim(v);
        set(k, v);
    }
}
