#include <gtest/gtest.h>
#include <fstream>
#include <string>
#include "Config.h"
#include "Errors.h"

namespace {

std::string writeTempConfig(const std::string& name, const std::string& content) {
    std::string path = ::testing::TempDir() + name;
    std::ofstream out(path);
    out << content;
    return path;
}

} // namespace

TEST(ConfigTest, LoadsKeysCommentsAndWhitespace) {
    std::string path = writeTempConfig("binpack_config_basic.txt",
        "# comment line\n"
        "max_iterations = 250\n"
        "  max_sideways=7   # trailing comment\n"
        "restart_variant = sideways\n"
        "neighbor_selection = first_random\n"
        "init_strategy = best_fit_decreasing\n"
        "sa_initial_temperature = 3.5\n"
        "sa_cooling_rate = 0.9\n"
        "sa_max_iterations = 1234\n"
        "ga_population_size = 31\n"
        "ga_selection = roulette\n"
        "ga_elitism = 3\n"
        "seed = 7\n"
        "runs = 4\n"
        "threads = 2\n"
        "\n"
        "line without equals sign\n");

    EngineConfig cfg;
    cfg.loadFromFile(path);

    EXPECT_EQ(cfg.hillClimbing.maxIterations, 250);
    EXPECT_EQ(cfg.hillClimbing.maxSideways, 7);
    EXPECT_EQ(cfg.hillClimbing.restartVariant, HillClimbingVariant::SidewaysMove);
    EXPECT_EQ(cfg.hillClimbing.selection, NeighborSelection::FirstImprovingRandom);
    EXPECT_EQ(cfg.hillClimbing.initStrategy, InitStrategy::BestFitDecreasing);
    EXPECT_EQ(cfg.annealing.initStrategy, InitStrategy::BestFitDecreasing);
    EXPECT_DOUBLE_EQ(cfg.annealing.initialTemperature, 3.5);
    EXPECT_DOUBLE_EQ(cfg.annealing.coolingRate, 0.9);
    EXPECT_EQ(cfg.annealing.maxIterations, 1234);
    EXPECT_EQ(cfg.genetic.populationSize, 31);
    EXPECT_EQ(cfg.genetic.selection, SelectionStrategy::Roulette);
    EXPECT_EQ(cfg.genetic.elitism, 3);
    EXPECT_EQ(cfg.seed, 7u);
    EXPECT_EQ(cfg.runs, 4);
    EXPECT_EQ(cfg.threads, 2);
}

TEST(ConfigTest, MissingFileKeepsDefaults) {
    EngineConfig cfg;
    cfg.loadFromFile(::testing::TempDir() + "binpack_no_such_config.txt");
    EngineConfig defaults;
    EXPECT_EQ(cfg.hillClimbing.maxIterations, defaults.hillClimbing.maxIterations);
    EXPECT_DOUBLE_EQ(cfg.annealing.coolingRate, defaults.annealing.coolingRate);
    EXPECT_EQ(cfg.genetic.populationSize, defaults.genetic.populationSize);
    EXPECT_EQ(cfg.seed, defaults.seed);
}

TEST(ConfigTest, UnknownKeysAreIgnored) {
    std::string path = writeTempConfig("binpack_config_unknown.txt",
        "container_size = 12\nruns = 3\n");
    EngineConfig cfg;
    cfg.loadFromFile(path);
    EXPECT_EQ(cfg.runs, 3);
    EXPECT_FALSE(cfg.set("container_size", "12"));
    EXPECT_TRUE(cfg.set("runs", "5"));
    EXPECT_EQ(cfg.runs, 5);
}

TEST(ConfigTest, BadValuesThrow) {
    EngineConfig cfg;
    EXPECT_THROW(cfg.set("max_iterations", "many"), InvalidConfigError);
    EXPECT_THROW(cfg.set("max_iterations", "12abc"), InvalidConfigError);
    EXPECT_THROW(cfg.set("sa_cooling_rate", ""), InvalidConfigError);
    EXPECT_THROW(cfg.set("restart_variant", "restart"), InvalidConfigError);
    EXPECT_THROW(cfg.set("init_strategy", "greedy"), InvalidConfigError);
    EXPECT_THROW(cfg.set("ga_selection", "rank"), InvalidConfigError);
    EXPECT_THROW(cfg.set("seed", "-1"), InvalidConfigError);
    EXPECT_THROW(cfg.set("neighbor_selection", "sorted"), InvalidConfigError);

    std::string path = writeTempConfig("binpack_config_bad.txt", "ga_generations = lots\n");
    EXPECT_THROW(cfg.loadFromFile(path), InvalidConfigError);
}

TEST(ConfigTest, ShippedConfigMatchesDefaults) {
    EngineConfig cfg;
    cfg.loadFromFile(std::string(BINPACK_TEST_DATA_DIR) + "/../config.txt");
    EngineConfig defaults;

    EXPECT_EQ(cfg.hillClimbing.maxIterations, defaults.hillClimbing.maxIterations);
    EXPECT_EQ(cfg.hillClimbing.maxSideways, defaults.hillClimbing.maxSideways);
    EXPECT_EQ(cfg.hillClimbing.restarts, defaults.hillClimbing.restarts);
    EXPECT_EQ(cfg.hillClimbing.maxTrials, defaults.hillClimbing.maxTrials);
    EXPECT_EQ(cfg.hillClimbing.selection, defaults.hillClimbing.selection);
    EXPECT_DOUBLE_EQ(cfg.annealing.initialTemperature, defaults.annealing.initialTemperature);
    EXPECT_DOUBLE_EQ(cfg.annealing.coolingRate, defaults.annealing.coolingRate);
    EXPECT_DOUBLE_EQ(cfg.annealing.minTemperature, defaults.annealing.minTemperature);
    EXPECT_EQ(cfg.annealing.iterationsPerTemperature, defaults.annealing.iterationsPerTemperature);
    EXPECT_EQ(cfg.annealing.maxIterations, defaults.annealing.maxIterations);
    EXPECT_EQ(cfg.genetic.populationSize, defaults.genetic.populationSize);
    EXPECT_EQ(cfg.genetic.maxGenerations, defaults.genetic.maxGenerations);
    EXPECT_DOUBLE_EQ(cfg.genetic.crossoverRate, defaults.genetic.crossoverRate);
    EXPECT_DOUBLE_EQ(cfg.genetic.mutationRate, defaults.genetic.mutationRate);
    EXPECT_EQ(cfg.genetic.tournamentSize, defaults.genetic.tournamentSize);
    EXPECT_EQ(cfg.genetic.elitism, defaults.genetic.elitism);
    EXPECT_EQ(cfg.genetic.stagnationLimit, defaults.genetic.stagnationLimit);
    EXPECT_EQ(cfg.genetic.greedySeeds, defaults.genetic.greedySeeds);
    EXPECT_EQ(cfg.seed, defaults.seed);
    EXPECT_EQ(cfg.runs, defaults.runs);
    EXPECT_EQ(cfg.threads, defaults.threads);
}
