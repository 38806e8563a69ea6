#include "Initializer.h"
#include <algorithm>
#include <numeric>

namespace {

std::vector<int> inputOrder(const Problem& p) {
    std::vector<int> order(p.size());
    std::iota(order.begin(), order.end(), 0);
    return order;
}

// Best fit: tightest bin that still fits. Worst fit: roomiest bin that fits.
State fitByRemaining(const Problem& p, const std::vector<int>& order, bool tightest) {
    std::vector<int> assignment(p.size(), 0);
    std::vector<double> loads;
    for (int item : order) {
        double w = p.weight(item);
        int chosen = -1;
        double chosenRemaining = 0.0;
        for (int b = 0; b < (int)loads.size(); ++b) {
            double rem = p.capacity() - loads[b];
            if (w > rem + CAPACITY_EPS) continue;
            if (chosen == -1 || (tightest ? rem < chosenRemaining : rem > chosenRemaining)) {
                chosen = b;
                chosenRemaining = rem;
            }
        }
        if (chosen == -1) {
            chosen = (int)loads.size();
            loads.push_back(0.0);
        }
        loads[chosen] += w;
        assignment[item] = chosen;
    }
    return State::fromAssignment(p, assignment);
}

State nextFit(const Problem& p) {
    std::vector<int> assignment(p.size(), 0);
    int bin = 0;
    double load = 0.0;
    for (int item = 0; item < (int)p.size(); ++item) {
        double w = p.weight(item);
        if (load + w > p.capacity() + CAPACITY_EPS) {
            ++bin;
            load = 0.0;
        }
        load += w;
        assignment[item] = bin;
    }
    return State::fromAssignment(p, assignment);
}

// Shuffled order, each item dropped into a uniformly chosen bin that fits
State randomFit(const Problem& p, std::mt19937& rng) {
    std::vector<int> order = inputOrder(p);
    std::shuffle(order.begin(), order.end(), rng);

    std::vector<int> assignment(p.size(), 0);
    std::vector<double> loads;
    std::vector<int> fitting;
    for (int item : order) {
        double w = p.weight(item);
        fitting.clear();
        for (int b = 0; b < (int)loads.size(); ++b) {
            if (loads[b] + w <= p.capacity() + CAPACITY_EPS) fitting.push_back(b);
        }
        int chosen;
        if (fitting.empty()) {
            chosen = (int)loads.size();
            loads.push_back(0.0);
        } else {
            std::uniform_int_distribution<int> pick(0, (int)fitting.size() - 1);
            chosen = fitting[pick(rng)];
        }
        loads[chosen] += w;
        assignment[item] = chosen;
    }
    return State::fromAssignment(p, assignment);
}

} // namespace

std::string initStrategyName(InitStrategy strategy) {
    switch (strategy) {
        case InitStrategy::FirstFit: return "first_fit";
        case InitStrategy::FirstFitDecreasing: return "first_fit_decreasing";
        case InitStrategy::BestFit: return "best_fit";
        case InitStrategy::BestFitDecreasing: return "best_fit_decreasing";
        case InitStrategy::WorstFit: return "worst_fit";
        case InitStrategy::NextFit: return "next_fit";
        case InitStrategy::Random: return "random";
    }
    return "unknown";
}

bool parseInitStrategy(const std::string& name, InitStrategy& out) {
    static const InitStrategy all[] = {
        InitStrategy::FirstFit, InitStrategy::FirstFitDecreasing, InitStrategy::BestFit,
        InitStrategy::BestFitDecreasing, InitStrategy::WorstFit, InitStrategy::NextFit,
        InitStrategy::Random
    };
    for (InitStrategy s : all) {
        if (initStrategyName(s) == name) {
            out = s;
            return true;
        }
    }
    return false;
}

std::vector<int> decreasingWeightOrder(const Problem& p) {
    std::vector<int> order = inputOrder(p);
    std::stable_sort(order.begin(), order.end(),
        [&p](int a, int b) { return p.weight(a) > p.weight(b); });
    return order;
}

State firstFitInOrder(const Problem& p, const std::vector<int>& order) {
    std::vector<int> assignment(p.size(), 0);
    std::vector<double> loads;
    for (int item : order) {
        double w = p.weight(item);
        int chosen = -1;
        for (int b = 0; b < (int)loads.size(); ++b) {
            if (loads[b] + w <= p.capacity() + CAPACITY_EPS) {
                chosen = b;
                break;
            }
        }
        // Nothing fits: open a new bin
        if (chosen == -1) {
            chosen = (int)loads.size();
            loads.push_back(0.0);
        }
        loads[chosen] += w;
        assignment[item] = chosen;
    }
    return State::fromAssignment(p, assignment);
}

State initialize(const Problem& p, std::mt19937& rng) {
    return initialize(p, InitStrategy::FirstFit, rng);
}

State initialize(const Problem& p, InitStrategy strategy, std::mt19937& rng) {
    switch (strategy) {
        case InitStrategy::FirstFit: return firstFitInOrder(p, inputOrder(p));
        case InitStrategy::FirstFitDecreasing: return firstFitInOrder(p, decreasingWeightOrder(p));
        case InitStrategy::BestFit: return fitByRemaining(p, inputOrder(p), true);
        case InitStrategy::BestFitDecreasing: return fitByRemaining(p, decreasingWeightOrder(p), true);
        case InitStrategy::WorstFit: return fitByRemaining(p, inputOrder(p), false);
        case InitStrategy::NextFit: return nextFit(p);
        case InitStrategy::Random: return randomFit(p, rng);
    }
    return firstFitInOrder(p, inputOrder(p));
}
