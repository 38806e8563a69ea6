#ifndef CONFIG_H
#define CONFIG_H

#include <string>
#include "HillClimbing.h"
#include "Annealing.h"
#include "Genetic.h"

// Every tunable of the engine, readable from a key = value file.
struct EngineConfig {
    HillClimbingConfig hillClimbing;
    AnnealingConfig annealing;
    GeneticConfig genetic;

    unsigned seed = 42;
    int runs = 1;          // trials per algorithm
    int threads = -1;      // <= 0: one per processor

    // Missing file keeps the defaults. Unknown keys are ignored.
    // Throws InvalidConfigError on a value that does not parse.
    void loadFromFile(const std::string& filename);

    // Returns false for an unknown key.
    bool set(const std::string& key, const std::string& value);
};

#endif // CONFIG_H
