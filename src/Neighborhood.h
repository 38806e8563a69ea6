#ifndef NEIGHBORHOOD_H
#define NEIGHBORHOOD_H

#include <cstddef>
#include <iterator>
#include <random>
#include <string>
#include <vector>
#include "State.h"

enum class MoveType { Relocate, Swap };

// Relocate: item -> target bin (target == numBins() opens a new bin).
// Swap: item <-> other item, which sits in a different bin.
struct Move {
    MoveType type = MoveType::Relocate;
    int item = 0;
    int target = 0;

    static Move relocate(int item, int toBin) { return {MoveType::Relocate, item, toBin}; }
    static Move swap(int a, int b) { return {MoveType::Swap, a, b}; }

    bool operator==(const Move& o) const {
        return type == o.type && item == o.item && target == o.target;
    }
};

bool isFeasible(const Problem& p, const State& s, const Move& m);
State applyMove(const Problem& p, const State& s, const Move& m);
std::string describeMove(const Problem& p, const State& s, const Move& m);

// All feasible single-item relocations followed by all feasible swaps of a
// State, in a fixed order: relocations by (item, target bin), swaps by
// (item a, item b) with a < b. Only the Move records are stored; the
// neighbouring States are built one at a time on access, so iterating twice
// rebuilds them and nothing is cached across States.
class Neighborhood {
public:
    class const_iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = State;
        using difference_type = std::ptrdiff_t;
        using pointer = const State*;
        using reference = State;

        const_iterator(const Neighborhood* owner, size_t index) : owner(owner), index(index) {}

        State operator*() const { return owner->neighbor(index); }
        const_iterator& operator++() { ++index; return *this; }
        const_iterator operator++(int) { const_iterator tmp = *this; ++index; return tmp; }
        bool operator==(const const_iterator& o) const { return owner == o.owner && index == o.index; }
        bool operator!=(const const_iterator& o) const { return !(*this == o); }

    private:
        const Neighborhood* owner;
        size_t index;
    };

    // Keeps a reference to the Problem (which outlives every run) and a copy of the State.
    Neighborhood(const Problem& p, const State& s);

    size_t size() const { return moveList.size(); }
    bool empty() const { return moveList.empty(); }

    const std::vector<Move>& moves() const { return moveList; }
    const Move& move(size_t index) const { return moveList[index]; }
    State neighbor(size_t index) const;

    const_iterator begin() const { return const_iterator(this, 0); }
    const_iterator end() const { return const_iterator(this, moveList.size()); }

private:
    const Problem& problem;
    State base;
    std::vector<Move> moveList;
};

// neighbors(State, Problem) entry point.
Neighborhood neighbors(const State& s, const Problem& p);

// Draws one feasible move at random: a relocation with probability 0.8,
// otherwise a swap, falling back to firstFeasibleMove from a random start
// when sampling keeps hitting infeasible moves. No neighbourhood is built.
// Returns false if the State has no neighbour at all.
bool randomMove(const Problem& p, const State& s, std::mt19937& rng, Move& out);

// First feasible relocation scanning items from startItem and bins from
// startBin (wrapping around), else the first feasible swap.
bool firstFeasibleMove(const Problem& p, const State& s, int startItem, int startBin, Move& out);

#endif // NEIGHBORHOOD_H
