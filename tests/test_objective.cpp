#include <gtest/gtest.h>
#include "Objective.h"
#include "Initializer.h"
#include "TestProblems.h"

namespace {

// a=50, b=30, c=20 in capacity 100
Problem fillProblem() {
    return Problem(100.0, {{"a", 50}, {"b", 30}, {"c", 20}});
}

} // namespace

TEST(ObjectiveTest, EmptyStateScoresZero) {
    Problem p = emptyProblem();
    Score s = evaluate(State::fromAssignment(p, {}));
    EXPECT_EQ(s.bins, 0);
    EXPECT_DOUBLE_EQ(s.fill, 0.0);
    EXPECT_DOUBLE_EQ(s.value(), 0.0);
}

TEST(ObjectiveTest, FillIsSumOfSquaredRatios) {
    Problem p = fillProblem();
    Score s = evaluate(State::fromBins(p, {{0, 1}, {2}}));
    EXPECT_EQ(s.bins, 2);
    EXPECT_NEAR(s.fill, 0.64 + 0.04, 1e-12);
}

TEST(ObjectiveTest, FewerBinsAlwaysWins) {
    Problem p = fillProblem();
    Score one = evaluate(State::fromBins(p, {{0, 1, 2}}));
    Score two = evaluate(State::fromBins(p, {{0, 1}, {2}}));
    Score three = evaluate(State::fromBins(p, {{0}, {1}, {2}}));
    EXPECT_TRUE(one.betterThan(two));
    EXPECT_TRUE(two.betterThan(three));
    EXPECT_FALSE(three.betterThan(one));
    EXPECT_LT(one.value(), two.value());
    EXPECT_LT(two.value(), three.value());
}

TEST(ObjectiveTest, UnevenFillBreaksTies) {
    Problem p = fillProblem();
    Score uneven = evaluate(State::fromBins(p, {{0, 1}, {2}}));   // 80 / 20
    Score even = evaluate(State::fromBins(p, {{0, 2}, {1}}));     // 70 / 30
    EXPECT_TRUE(uneven.betterThan(even));
    EXPECT_FALSE(even.betterThan(uneven));
    EXPECT_TRUE(uneven < even);
    EXPECT_LT(uneven.value(), even.value());
}

TEST(ObjectiveTest, EquivalentWithinTolerance) {
    Score a{3, 1.5};
    Score b{3, 1.5 + 1e-12};
    Score c{3, 1.6};
    EXPECT_TRUE(a.equivalent(b));
    EXPECT_TRUE(a == b);
    EXPECT_FALSE(a.betterThan(b));
    EXPECT_FALSE(b.betterThan(a));
    EXPECT_TRUE(a != c);
    EXPECT_TRUE(c.betterThan(a));
}

TEST(ObjectiveTest, ValueStaysWithinBinBand) {
    // fill never exceeds the bin count, so value() lies in (bins - 1, bins]
    Score full{4, 4.0};
    Score emptyish{4, 0.0};
    EXPECT_GT(full.value(), 3.0);
    EXPECT_DOUBLE_EQ(emptyish.value(), 4.0);
}

TEST(ObjectiveTest, TrivialProblemPacksIntoOneBin) {
    Problem p = uniformProblem(10, 10, 100);
    std::mt19937 rng(1);
    Score s = evaluate(initialize(p, rng));
    EXPECT_EQ(s.bins, 1);
    EXPECT_NEAR(s.fill, 1.0, 1e-12);
}

TEST(ObjectiveTest, IsDeterministic) {
    Problem p = createDemoProblem();
    std::mt19937 rng(3);
    State s = initialize(p, InitStrategy::Random, rng);
    Score a = evaluate(s);
    Score b = evaluate(s);
    EXPECT_EQ(a.bins, b.bins);
    EXPECT_DOUBLE_EQ(a.fill, b.fill);
}
