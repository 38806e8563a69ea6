#ifndef GENETIC_H
#define GENETIC_H

#include <random>
#include <string>
#include <utility>
#include <vector>
#include "Initializer.h"
#include "Result.h"

// Permutation of item indices. Decoded by first-fit in that order.
using Chromosome = std::vector<int>;

enum class SelectionStrategy { Tournament, Roulette };

std::string selectionName(SelectionStrategy s);
bool parseSelection(const std::string& name, SelectionStrategy& out);

struct GeneticConfig {
    int populationSize = 50;
    int maxGenerations = 500;
    double crossoverRate = 0.9;
    double mutationRate = 0.2;
    SelectionStrategy selection = SelectionStrategy::Tournament;
    int tournamentSize = 3;
    int elitism = 2;
    int stagnationLimit = 100;  // generations without a better best; 0 disables
    int greedySeeds = 1;        // individuals seeded with the heaviest-first order

    // Throws InvalidConfigError
    void validate() const;
};

struct Individual {
    Chromosome genes;
    State state;
    Score score;
    double fitness = 0.0;   // higher is better
};

// Fitness is maximised: the negated scalar score.
inline double fitnessOf(const Score& s) { return -s.value(); }

bool isPermutation(const Chromosome& c, size_t n);

// Never violates capacity: an item that fits no open bin opens a new one.
State decode(const Problem& p, const Chromosome& c);

Individual makeIndividual(const Problem& p, Chromosome genes);

// --- Operators (all keep the permutation property) ---

// Order crossover: the child keeps a[lo, hi) in place and fills the other
// positions with the remaining genes in the order they appear in b,
// starting right after hi and wrapping around.
Chromosome orderCrossover(const Chromosome& a, const Chromosome& b, size_t lo, size_t hi);

// Random cut points, two children (a x b and b x a).
std::pair<Chromosome, Chromosome> orderCrossover(const Chromosome& a, const Chromosome& b,
                                                 std::mt19937& rng);

void swapGenes(Chromosome& c, size_t i, size_t j);
// Swaps two distinct random positions (no-op below two genes)
void swapMutation(Chromosome& c, std::mt19937& rng);

size_t tournamentSelect(const std::vector<Individual>& pop, int k, std::mt19937& rng);
size_t rouletteSelect(const std::vector<Individual>& pop, std::mt19937& rng);

// run_genetic_algorithm(Problem, config, rng)
Result runGeneticAlgorithm(const Problem& p, const GeneticConfig& cfg, std::mt19937& rng);

#endif // GENETIC_H
