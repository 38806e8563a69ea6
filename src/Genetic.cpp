#include "Genetic.h"
#include <algorithm>
#include <chrono>
#include <numeric>
#include "Errors.h"

std::string selectionName(SelectionStrategy s) {
    return s == SelectionStrategy::Roulette ? "roulette" : "tournament";
}

bool parseSelection(const std::string& name, SelectionStrategy& out) {
    if (name == "tournament") { out = SelectionStrategy::Tournament; return true; }
    if (name == "roulette") { out = SelectionStrategy::Roulette; return true; }
    return false;
}

void GeneticConfig::validate() const {
    if (populationSize <= 0) throw InvalidConfigError("population size must be positive");
    if (maxGenerations <= 0) throw InvalidConfigError("generation cap must be positive");
    if (!(crossoverRate >= 0.0 && crossoverRate <= 1.0)) {
        throw InvalidConfigError("crossover probability must lie in [0, 1]");
    }
    if (!(mutationRate >= 0.0 && mutationRate <= 1.0)) {
        throw InvalidConfigError("mutation probability must lie in [0, 1]");
    }
    if (selection == SelectionStrategy::Tournament && tournamentSize < 1) {
        throw InvalidConfigError("tournament size must be at least 1");
    }
    if (elitism < 0 || elitism > populationSize) {
        throw InvalidConfigError("elitism count must lie in [0, population size]");
    }
    if (stagnationLimit < 0) throw InvalidConfigError("stagnation limit must not be negative");
    if (greedySeeds < 0 || greedySeeds > populationSize) {
        throw InvalidConfigError("greedy seeds must lie in [0, population size]");
    }
}

bool isPermutation(const Chromosome& c, size_t n) {
    if (c.size() != n) return false;
    std::vector<char> seen(n, 0);
    for (int g : c) {
        if (g < 0 || (size_t)g >= n || seen[g]) return false;
        seen[g] = 1;
    }
    return true;
}

State decode(const Problem& p, const Chromosome& c) {
    return firstFitInOrder(p, c);
}

Individual makeIndividual(const Problem& p, Chromosome genes) {
    Individual ind;
    ind.genes = std::move(genes);
    ind.state = decode(p, ind.genes);
    ind.score = evaluate(ind.state);
    ind.fitness = fitnessOf(ind.score);
    return ind;
}

Chromosome orderCrossover(const Chromosome& a, const Chromosome& b, size_t lo, size_t hi) {
    size_t n = a.size();
    Chromosome child(n, -1);
    if (n == 0) return child;

    std::vector<char> used(n, 0);
    for (size_t i = lo; i < hi; ++i) {
        child[i] = a[i];
        used[a[i]] = 1;
    }

    size_t pos = hi % n;
    for (size_t k = 0; k < n; ++k) {
        int gene = b[(hi + k) % n];
        if (used[gene]) continue;
        while (child[pos] != -1) pos = (pos + 1) % n;
        child[pos] = gene;
        used[gene] = 1;
    }
    return child;
}

std::pair<Chromosome, Chromosome> orderCrossover(const Chromosome& a, const Chromosome& b,
                                                 std::mt19937& rng) {
    size_t n = a.size();
    if (n < 2) return {a, b};
    std::uniform_int_distribution<size_t> cut(0, n);
    size_t lo = cut(rng), hi = cut(rng);
    if (lo > hi) std::swap(lo, hi);
    return {orderCrossover(a, b, lo, hi), orderCrossover(b, a, lo, hi)};
}

void swapGenes(Chromosome& c, size_t i, size_t j) {
    std::swap(c[i], c[j]);
}

void swapMutation(Chromosome& c, std::mt19937& rng) {
    if (c.size() < 2) return;
    std::uniform_int_distribution<size_t> pick(0, c.size() - 1);
    size_t i = pick(rng);
    size_t j = pick(rng);
    while (j == i) j = pick(rng);
    swapGenes(c, i, j);
}

size_t tournamentSelect(const std::vector<Individual>& pop, int k, std::mt19937& rng) {
    std::uniform_int_distribution<size_t> pick(0, pop.size() - 1);
    size_t best = pick(rng);
    for (int round = 1; round < k; ++round) {
        size_t challenger = pick(rng);
        if (pop[challenger].fitness > pop[best].fitness) best = challenger;
    }
    return best;
}

size_t rouletteSelect(const std::vector<Individual>& pop, std::mt19937& rng) {
    // Shift so the worst individual keeps a small, non-zero slice
    double worst = pop[0].fitness;
    for (const auto& ind : pop) worst = std::min(worst, ind.fitness);
    const double floorWeight = 1e-6;

    double total = 0.0;
    for (const auto& ind : pop) total += ind.fitness - worst + floorWeight;

    std::uniform_real_distribution<double> spin(0.0, total);
    double target = spin(rng);
    double acc = 0.0;
    for (size_t i = 0; i < pop.size(); ++i) {
        acc += pop[i].fitness - worst + floorWeight;
        if (target < acc) return i;
    }
    return pop.size() - 1;
}

namespace {

void sortByFitness(std::vector<Individual>& pop) {
    std::stable_sort(pop.begin(), pop.end(),
        [](const Individual& a, const Individual& b) { return a.fitness > b.fitness; });
}

double meanFitness(const std::vector<Individual>& pop) {
    double sum = 0.0;
    for (const Individual& ind : pop) sum += ind.fitness;
    return pop.empty() ? 0.0 : sum / pop.size();
}

std::vector<Individual> initialPopulation(const Problem& p, const GeneticConfig& cfg, std::mt19937& rng) {
    std::vector<Individual> pop;
    pop.reserve(cfg.populationSize);

    // Greedy seeds: heaviest first, then pairwise swaps of it for variety
    Chromosome greedy = decreasingWeightOrder(p);
    for (int i = 0; i < cfg.greedySeeds; ++i) {
        Chromosome genes = greedy;
        if (i > 0) swapMutation(genes, rng);
        pop.push_back(makeIndividual(p, std::move(genes)));
    }

    Chromosome identity(p.size());
    std::iota(identity.begin(), identity.end(), 0);
    while ((int)pop.size() < cfg.populationSize) {
        Chromosome genes = identity;
        std::shuffle(genes.begin(), genes.end(), rng);
        pop.push_back(makeIndividual(p, std::move(genes)));
    }
    return pop;
}

} // namespace

Result runGeneticAlgorithm(const Problem& p, const GeneticConfig& cfg, std::mt19937& rng) {
    cfg.validate();
    auto startTime = std::chrono::steady_clock::now();

    Result res;
    res.algorithm = "Genetic Algorithm";

    if (p.empty()) {
        res.state = State::fromAssignment(p, {});
        res.termination = TerminationReason::EmptyProblem;
        res.history.push_back(0.0);
        res.elapsedMs = std::chrono::duration<double, std::milli>(
            std::chrono::steady_clock::now() - startTime).count();
        return res;
    }

    std::vector<Individual> pop = initialPopulation(p, cfg, rng);
    sortByFitness(pop);

    Individual best = pop[0];
    res.initialScore = best.score;
    res.history.push_back(best.score.value());
    res.meanFitnessHistory.push_back(meanFitness(pop));
    res.termination = TerminationReason::GenerationCap;

    std::uniform_real_distribution<double> chance(0.0, 1.0);
    int stagnant = 0;

    for (int gen = 0; gen < cfg.maxGenerations; ++gen) {
        std::vector<Individual> next;
        next.reserve(cfg.populationSize);

        // 1. Elites survive unchanged
        for (int e = 0; e < cfg.elitism; ++e) next.push_back(pop[e]);

        // 2. Offspring
        while ((int)next.size() < cfg.populationSize) {
            size_t ia = (cfg.selection == SelectionStrategy::Tournament)
                ? tournamentSelect(pop, cfg.tournamentSize, rng) : rouletteSelect(pop, rng);
            size_t ib = (cfg.selection == SelectionStrategy::Tournament)
                ? tournamentSelect(pop, cfg.tournamentSize, rng) : rouletteSelect(pop, rng);

            std::pair<Chromosome, Chromosome> children;
            if (chance(rng) < cfg.crossoverRate) {
                children = orderCrossover(pop[ia].genes, pop[ib].genes, rng);
            } else {
                children = {pop[ia].genes, pop[ib].genes};
            }

            if (chance(rng) < cfg.mutationRate) swapMutation(children.first, rng);
            if (chance(rng) < cfg.mutationRate) swapMutation(children.second, rng);

            next.push_back(makeIndividual(p, std::move(children.first)));
            // Odd population: the second child is dropped
            if ((int)next.size() < cfg.populationSize) {
                next.push_back(makeIndividual(p, std::move(children.second)));
            }
        }

        pop = std::move(next);
        sortByFitness(pop);
        ++res.iterations;
        res.history.push_back(pop[0].score.value());
        res.meanFitnessHistory.push_back(meanFitness(pop));

        if (pop[0].score.betterThan(best.score)) {
            best = pop[0];
            stagnant = 0;
        } else {
            ++stagnant;
        }

        if (cfg.stagnationLimit > 0 && stagnant >= cfg.stagnationLimit) {
            res.termination = TerminationReason::Stagnation;
            break;
        }
    }

    res.state = best.state;
    res.score = best.score;
    res.elapsedMs = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - startTime).count();
    return res;
}
