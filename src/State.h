#ifndef STATE_H
#define STATE_H

#include <map>
#include <string>
#include <vector>
#include "Problem.h"

// Slack used for every capacity comparison so that fractional weights do not
// flip feasibility after a few load updates.
constexpr double CAPACITY_EPS = 1e-9;

// A packing: item index -> bin index, plus cached per-bin loads and item counts.
// Bins are numbered 0..numBins()-1 with no empty bin in between; emptying a bin
// closes it and shifts the following bins down by one.
//
// States are plain values. Every operator returns a new State and leaves the
// receiver untouched, so neighbours and offspring never alias their parent.
class State {
private:
    double cap = 0.0;
    std::vector<int> binOfItem;   // size = number of items
    std::vector<double> loads;    // size = number of bins
    std::vector<int> counts;      // items per bin

    void closeBin(int bin);

public:
    State() = default;

    // Renumbers the used bins to 0..k-1 (keeping their relative order).
    // Does not check capacity; use isValid() for that.
    static State fromAssignment(const Problem& p, const std::vector<int>& assignment);

    // One vector of item indices per bin; empty vectors are dropped.
    static State fromBins(const Problem& p, const std::vector<std::vector<int>>& bins);

    double capacity() const { return cap; }
    int numItems() const { return (int)binOfItem.size(); }
    int numBins() const { return (int)loads.size(); }

    int binOf(int item) const { return binOfItem[item]; }
    double load(int bin) const { return loads[bin]; }
    int binSize(int bin) const { return counts[bin]; }
    double remaining(int bin) const { return cap - loads[bin]; }

    const std::vector<int>& assignment() const { return binOfItem; }
    const std::vector<double>& getLoads() const { return loads; }

    // Item indices per bin, each list in ascending item order
    std::vector<std::vector<int>> bins() const;

    // item id -> bin index
    std::map<std::string, int> assignmentById(const Problem& p) const;

    // --- Move feasibility ---
    // toBin == numBins() means "open a new bin"
    bool canRelocate(const Problem& p, int item, int toBin) const;
    bool canSwap(const Problem& p, int itemA, int itemB) const;

    // --- Moves (return a new State) ---
    State relocated(const Problem& p, int item, int toBin) const;
    State swapped(const Problem& p, int itemA, int itemB) const;

    // Full invariant check against the problem: every item assigned exactly once,
    // contiguous non-empty bins, cached loads match, no bin over capacity.
    bool isValid(const Problem& p) const;

    bool operator==(const State& other) const {
        return binOfItem == other.binOfItem && counts == other.counts;
    }
    bool operator!=(const State& other) const { return !(*this == other); }
};

#endif // STATE_H
