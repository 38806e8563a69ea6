#include <gtest/gtest.h>
#include <vector>
#include "Neighborhood.h"
#include "Initializer.h"
#include "TestProblems.h"

TEST(NeighborhoodTest, EnumeratesFeasibleMovesInFixedOrder) {
    Problem p = threeItemProblem();
    State s = State::fromBins(p, {{0, 1}, {2}});
    Neighborhood hood = neighbors(s, p);

    std::vector<Move> expected = {
        Move::relocate(0, 2),   // a to a new bin
        Move::relocate(1, 1),   // b next to c
        Move::relocate(1, 2),   // b to a new bin
        Move::swap(0, 2)        // a <-> c
    };
    EXPECT_EQ(hood.moves(), expected);
}

TEST(NeighborhoodTest, EveryNeighborIsValidAndDiffersFromBase) {
    Problem p = createDemoProblem();
    std::mt19937 rng(11);
    State s = initialize(p, InitStrategy::Random, rng);
    Neighborhood hood(p, s);
    ASSERT_FALSE(hood.empty());
    for (size_t i = 0; i < hood.size(); ++i) {
        State n = hood.neighbor(i);
        EXPECT_TRUE(n.isValid(p)) << describeMove(p, s, hood.move(i));
        EXPECT_NE(n, s);
        EXPECT_TRUE(isFeasible(p, s, hood.move(i)));
    }
}

TEST(NeighborhoodTest, IterationIsRestartable) {
    Problem p = threeItemProblem();
    State s = State::fromBins(p, {{0, 1}, {2}});
    Neighborhood hood(p, s);

    std::vector<State> first(hood.begin(), hood.end());
    std::vector<State> second;
    for (State n : hood) second.push_back(n);

    ASSERT_EQ(first.size(), hood.size());
    EXPECT_EQ(first, second);
}

TEST(NeighborhoodTest, NeighborsDoNotAliasTheBase) {
    Problem p = threeItemProblem();
    State s = State::fromBins(p, {{0, 1}, {2}});
    State before = s;
    Neighborhood hood(p, s);
    for (State n : hood) {
        (void)n;
    }
    EXPECT_EQ(s, before);
}

TEST(NeighborhoodTest, SingleItemHasNoNeighbors) {
    Problem p(10.0, {{"only", 4}});
    std::mt19937 rng(1);
    State s = initialize(p, rng);
    EXPECT_TRUE(neighbors(s, p).empty());

    Move m;
    EXPECT_FALSE(randomMove(p, s, rng, m));
}

TEST(NeighborhoodTest, InfeasibleMovesAreRejected) {
    Problem p = threeItemProblem();
    State s = State::fromBins(p, {{0, 1}, {2}});
    EXPECT_FALSE(isFeasible(p, s, Move::relocate(0, 1)));
    EXPECT_FALSE(isFeasible(p, s, Move::swap(1, 2)));
    EXPECT_FALSE(isFeasible(p, s, Move::swap(0, 7)));
    EXPECT_FALSE(isFeasible(p, s, Move::relocate(-1, 0)));
}

TEST(NeighborhoodTest, RandomMovesAreFeasible) {
    Problem p = createDemoProblem();
    std::mt19937 rng(21);
    State s = initialize(p, rng);
    for (int k = 0; k < 200; ++k) {
        Move m;
        ASSERT_TRUE(randomMove(p, s, rng, m));
        ASSERT_TRUE(isFeasible(p, s, m));
        s = applyMove(p, s, m);
        ASSERT_TRUE(s.isValid(p));
    }
}

TEST(NeighborhoodTest, RandomMoveFallsBackOnTightPackings) {
    // Two full bins: only new-bin relocations and equal-weight swaps are feasible
    Problem p(100.0, {{"a", 60}, {"b", 40}, {"c", 60}, {"d", 40}});
    State s = State::fromBins(p, {{0, 1}, {2, 3}});
    std::mt19937 rng(4);
    for (int k = 0; k < 50; ++k) {
        Move m;
        ASSERT_TRUE(randomMove(p, s, rng, m));
        EXPECT_TRUE(isFeasible(p, s, m));
    }
}

TEST(NeighborhoodTest, FirstFeasibleMoveWrapsAroundTheStart) {
    Problem p = threeItemProblem();
    State s = State::fromBins(p, {{0, 1}, {2}});
    Move m;
    // c fits nowhere else, so the scan wraps to a, which can open a new bin
    ASSERT_TRUE(firstFeasibleMove(p, s, 2, 0, m));
    EXPECT_EQ(m, Move::relocate(0, 2));
}

TEST(NeighborhoodTest, FirstFeasibleMoveFallsThroughToSwaps) {
    // Two singletons too heavy to share a bin: swapping them is the only move
    Problem p(100.0, {{"a", 70}, {"b", 60}});
    State s = State::fromBins(p, {{0}, {1}});
    Move m;
    ASSERT_TRUE(firstFeasibleMove(p, s, 1, 1, m));
    EXPECT_EQ(m, Move::swap(0, 1));

    Problem single(10.0, {{"only", 4}});
    State lone = State::fromBins(single, {{0}});
    EXPECT_FALSE(firstFeasibleMove(single, lone, 0, 0, m));
}

TEST(NeighborhoodTest, DescribesMoves) {
    Problem p = threeItemProblem();
    State s = State::fromBins(p, {{0, 1}, {2}});
    EXPECT_EQ(describeMove(p, s, Move::relocate(1, 2)), "move b from bin 0 to a new bin");
    EXPECT_EQ(describeMove(p, s, Move::swap(0, 2)), "swap a (bin 0) <-> c (bin 1)");
}
