// main.cpp
#include <chrono>
#include <iostream>
#include <iomanip>
#include <CLI/CLI.hpp>
#include "Problem.h"
#include "Config.h"
#include "Experiment.h"
#include "Report.h"

int main(int argc, char **argv) {
    auto start = std::chrono::high_resolution_clock::now();
    CLI::App app{"Bin Packing Local Search Solver"};

    std::string inputFilePath;
    std::string configFilePath = "config.txt";
    std::string algorithm = "all";
    std::string jsonFilePath;
    std::string csvFilePath;
    unsigned seed = 0;
    int runs = 1;
    int threads = -1;
    bool demo = false;
    bool quiet = false;

    auto* inputOpt = app.add_option("-i,--input", inputFilePath, "Problem file (JSON)")
        ->check(CLI::ExistingFile);
    auto* demoOpt = app.add_flag("--demo", demo, "Use the built-in 15 item instance");
    inputOpt->excludes(demoOpt);
    app.add_option("-a,--algorithm", algorithm, "Algorithm to run")
        ->check(CLI::IsMember({"all", "steepest", "stochastic", "sideways", "restart", "sa", "ga"}));
    app.add_option("-c,--config", configFilePath, "Path to configuration file");
    auto* seedOpt = app.add_option("-s,--seed", seed, "Base random seed (overrides config)");
    auto* runsOpt = app.add_option("-r,--runs", runs, "Trials per algorithm (overrides config)")
        ->check(CLI::PositiveNumber);
    auto* threadsOpt = app.add_option("-t,--threads", threads, "Worker threads (overrides config)");
    app.add_option("--json", jsonFilePath, "Write results as JSON");
    app.add_option("--csv", csvFilePath, "Write one CSV row per run");
    app.add_flag("-q,--quiet", quiet, "Only print the summary");

    CLI11_PARSE(app, argc, argv);

    if (!demo && inputFilePath.empty()) {
        std::cerr << "Error: one of --input or --demo is required" << std::endl;
        std::cerr << app.help() << std::endl;
        return 1;
    }

    try {
        // 1. Problem
        Problem problem = demo ? createDemoProblem() : Problem::loadFromFile(inputFilePath);

        // 2. Configuration (file first, command line wins)
        EngineConfig config;
        config.loadFromFile(configFilePath);
        if (seedOpt->count()) config.seed = seed;
        if (runsOpt->count()) config.runs = runs;
        if (threadsOpt->count()) config.threads = threads;

        std::vector<Algorithm> algorithms;
        if (!parseAlgorithms(algorithm, algorithms)) {
            throw InvalidConfigError("unknown algorithm: " + algorithm);
        }

        // 3. Run
        Experiment experiment(problem, config, algorithms);
        experiment.setQuiet(quiet);
        experiment.run();

        // 4. Report
        if (!quiet) {
            for (const Summary& s : experiment.getSummaries()) {
                printResult(std::cout, problem, experiment.getResults()[s.bestRun]);
            }
        }
        printSummaryTable(std::cout, experiment.getSummaries(), experiment.getResults());

        const Result& best = experiment.getBest();
        std::cout << ">>> Best: " << best.algorithm << " with " << best.binsUsed()
                  << " bins (lower bound " << problem.lowerBound() << "), score "
                  << std::setprecision(10) << std::fixed << best.score.value() << std::endl;

        if (!jsonFilePath.empty()) exportToJson(jsonFilePath, problem, experiment);
        if (!csvFilePath.empty()) exportToCsv(csvFilePath, experiment);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    auto end = std::chrono::high_resolution_clock::now();
    std::chrono::duration<double> elapsed = end - start;
    std::cout << "Running time: " << std::setprecision(3) << elapsed.count() << " seconds" << std::endl;

    return 0;
}
