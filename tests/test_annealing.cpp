#include <gtest/gtest.h>
#include <cmath>
#include "Annealing.h"
#include "Errors.h"
#include "TestProblems.h"

TEST(AnnealingTest, GeometricCoolingMultipliesByAlpha) {
    GeometricCooling cooling(10.0, 0.5);
    EXPECT_DOUBLE_EQ(cooling.current(), 10.0);
    cooling.next();
    EXPECT_DOUBLE_EQ(cooling.current(), 5.0);
    cooling.next();
    EXPECT_DOUBLE_EQ(cooling.current(), 2.5);
}

TEST(AnnealingTest, MetropolisAlwaysAcceptsImprovementsAndTies) {
    std::mt19937 rng(1);
    for (int k = 0; k < 100; ++k) {
        EXPECT_TRUE(acceptMetropolis(-0.5, 0.01, rng));
        EXPECT_TRUE(acceptMetropolis(0.0, 0.01, rng));
    }
}

TEST(AnnealingTest, MetropolisRejectsLargeDegradationsWhenCold) {
    std::mt19937 rng(1);
    for (int k = 0; k < 100; ++k) {
        EXPECT_FALSE(acceptMetropolis(1.0, 1e-6, rng));
    }
}

TEST(AnnealingTest, MetropolisAcceptanceRateMatchesBoltzmannFactor) {
    std::mt19937 rng(2024);
    const int trials = 20000;
    int accepted = 0;
    for (int k = 0; k < trials; ++k) {
        if (acceptMetropolis(1.0, 1.0, rng)) ++accepted;
    }
    EXPECT_NEAR((double)accepted / trials, std::exp(-1.0), 0.02);
}

TEST(AnnealingTest, ReturnsBestStateSeen) {
    Problem p = createDemoProblem();
    std::mt19937 rng(42);
    Result res = runSimulatedAnnealing(p, AnnealingConfig(), rng);

    EXPECT_TRUE(res.state.isValid(p));
    EXPECT_FALSE(res.initialScore.betterThan(res.score));
    ASSERT_EQ(res.history.size(), (size_t)res.iterations + 1);
    for (double v : res.history) {
        EXPECT_GE(v + 1e-8, res.score.value());
    }
    EXPECT_EQ(res.algorithm, "Simulated Annealing");
}

TEST(AnnealingTest, DefaultScheduleEndsAtTemperatureFloor) {
    Problem p = createDemoProblem();
    std::mt19937 rng(42);
    AnnealingConfig cfg;
    Result res = runSimulatedAnnealing(p, cfg, rng);
    EXPECT_EQ(res.termination, TerminationReason::TemperatureFloor);
    EXPECT_EQ(res.iterations % cfg.iterationsPerTemperature, 0);
    EXPECT_LT(res.iterations, cfg.maxIterations);
}

TEST(AnnealingTest, IterationCapIsHonoured) {
    Problem p = createDemoProblem();
    AnnealingConfig cfg;
    cfg.maxIterations = 10;
    std::mt19937 rng(42);
    Result res = runSimulatedAnnealing(p, cfg, rng);
    EXPECT_EQ(res.iterations, 10);
    EXPECT_EQ(res.termination, TerminationReason::IterationCap);
}

TEST(AnnealingTest, IsReproducible) {
    Problem p = createDemoProblem();
    AnnealingConfig cfg;
    cfg.initialTemperature = 5.0;
    std::mt19937 rngA(9), rngB(9);
    Result a = runSimulatedAnnealing(p, cfg, rngA);
    Result b = runSimulatedAnnealing(p, cfg, rngB);
    EXPECT_EQ(a.state, b.state);
    EXPECT_EQ(a.history, b.history);
    EXPECT_EQ(a.acceptedWorse, b.acceptedWorse);
}

TEST(AnnealingTest, RecordsTemperatureAndAcceptancePerIteration) {
    Problem p = createDemoProblem();
    AnnealingConfig cfg;
    std::mt19937 rng(6);
    Result res = runSimulatedAnnealing(p, cfg, rng);

    ASSERT_EQ(res.temperatures.size(), (size_t)res.iterations);
    ASSERT_EQ(res.acceptanceProbabilities.size(), (size_t)res.iterations);
    EXPECT_DOUBLE_EQ(res.temperatures.front(), cfg.initialTemperature);
    EXPECT_DOUBLE_EQ(res.finalTemperature, res.temperatures.back());
    for (size_t i = 0; i < res.temperatures.size(); ++i) {
        if (i) EXPECT_LE(res.temperatures[i], res.temperatures[i - 1]);
        EXPECT_GE(res.acceptanceProbabilities[i], 0.0);
        EXPECT_LE(res.acceptanceProbabilities[i], 1.0);
    }
    EXPECT_GT(res.stuckCount, 0);
    EXPECT_LE(res.stuckCount, res.iterations / STUCK_WINDOW);
}

TEST(AnnealingTest, AcceptanceProbabilityIsTheBoltzmannFactor) {
    EXPECT_DOUBLE_EQ(acceptanceProbability(-0.3, 1.0), 1.0);
    EXPECT_DOUBLE_EQ(acceptanceProbability(0.0, 0.01), 1.0);
    EXPECT_DOUBLE_EQ(acceptanceProbability(0.5, 2.0), std::exp(-0.25));
}

TEST(AnnealingTest, HotStartAcceptsWorseMoves) {
    Problem p = createDemoProblem();
    AnnealingConfig cfg;
    cfg.initialTemperature = 100.0;
    cfg.maxIterations = 500;
    std::mt19937 rng(3);
    Result res = runSimulatedAnnealing(p, cfg, rng);
    EXPECT_GT(res.acceptedWorse, 0);
}

TEST(AnnealingTest, SingleItemHasNowhereToGo) {
    Problem p(10.0, {{"only", 3}});
    std::mt19937 rng(1);
    Result res = runSimulatedAnnealing(p, AnnealingConfig(), rng);
    EXPECT_EQ(res.binsUsed(), 1);
    EXPECT_EQ(res.iterations, 0);
    EXPECT_EQ(res.termination, TerminationReason::LocalOptimum);
}

TEST(AnnealingTest, EmptyProblem) {
    Problem p = emptyProblem();
    std::mt19937 rng(1);
    Result res = runSimulatedAnnealing(p, AnnealingConfig(), rng);
    EXPECT_EQ(res.binsUsed(), 0);
    EXPECT_EQ(res.termination, TerminationReason::EmptyProblem);
}

TEST(AnnealingTest, RejectsDegenerateSchedules) {
    Problem p = createDemoProblem();
    std::mt19937 rng(1);

    AnnealingConfig zeroTemp;
    zeroTemp.initialTemperature = 0.0;
    EXPECT_THROW(runSimulatedAnnealing(p, zeroTemp, rng), InvalidConfigError);

    AnnealingConfig noCooling;
    noCooling.coolingRate = 1.0;
    EXPECT_THROW(runSimulatedAnnealing(p, noCooling, rng), InvalidConfigError);

    AnnealingConfig zeroAlpha;
    zeroAlpha.coolingRate = 0.0;
    EXPECT_THROW(runSimulatedAnnealing(p, zeroAlpha, rng), InvalidConfigError);

    AnnealingConfig floorAboveStart;
    floorAboveStart.minTemperature = 2.0;
    EXPECT_THROW(runSimulatedAnnealing(p, floorAboveStart, rng), InvalidConfigError);

    AnnealingConfig noSteps;
    noSteps.iterationsPerTemperature = 0;
    EXPECT_THROW(runSimulatedAnnealing(p, noSteps, rng), InvalidConfigError);
}
