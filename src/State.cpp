#include "State.h"
#include <algorithm>
#include <cmath>
#include <stdexcept>

State State::fromAssignment(const Problem& p, const std::vector<int>& assignment) {
    if (assignment.size() != p.size()) {
        throw std::invalid_argument("assignment size does not match the number of items");
    }
    State s;
    s.cap = p.capacity();
    s.binOfItem.resize(p.size());

    // Compact the used bin labels to 0..k-1 keeping their order
    int maxLabel = -1;
    for (int b : assignment) {
        if (b < 0) throw std::invalid_argument("negative bin index in assignment");
        maxLabel = std::max(maxLabel, b);
    }
    std::vector<int> remap(maxLabel + 1, -1);
    for (int b : assignment) remap[b] = 0;
    int next = 0;
    for (auto& r : remap) {
        if (r == 0) r = next++;
    }

    s.loads.assign(next, 0.0);
    s.counts.assign(next, 0);
    for (size_t i = 0; i < assignment.size(); ++i) {
        int b = remap[assignment[i]];
        s.binOfItem[i] = b;
        s.loads[b] += p.weight((int)i);
        s.counts[b] += 1;
    }
    return s;
}

State State::fromBins(const Problem& p, const std::vector<std::vector<int>>& bins) {
    std::vector<int> assignment(p.size(), -1);
    int label = 0;
    for (const auto& bin : bins) {
        if (bin.empty()) continue;
        for (int item : bin) {
            if (item < 0 || item >= (int)p.size() || assignment[item] != -1) {
                throw std::invalid_argument("bins must list every item exactly once");
            }
            assignment[item] = label;
        }
        ++label;
    }
    if (std::find(assignment.begin(), assignment.end(), -1) != assignment.end()) {
        throw std::invalid_argument("bins must list every item exactly once");
    }
    return fromAssignment(p, assignment);
}

std::vector<std::vector<int>> State::bins() const {
    std::vector<std::vector<int>> out(loads.size());
    for (int b = 0; b < numBins(); ++b) out[b].reserve(counts[b]);
    for (int i = 0; i < numItems(); ++i) out[binOfItem[i]].push_back(i);
    return out;
}

std::map<std::string, int> State::assignmentById(const Problem& p) const {
    std::map<std::string, int> out;
    for (int i = 0; i < numItems(); ++i) out[p.item(i).id] = binOfItem[i];
    return out;
}

void State::closeBin(int bin) {
    loads.erase(loads.begin() + bin);
    counts.erase(counts.begin() + bin);
    for (auto& b : binOfItem) {
        if (b > bin) --b;
    }
}

bool State::canRelocate(const Problem& p, int item, int toBin) const {
    int from = binOfItem[item];
    if (toBin == from || toBin < 0 || toBin > numBins()) return false;
    // Opening a new bin for the only item of a bin changes nothing
    if (toBin == numBins()) return counts[from] > 1;
    return loads[toBin] + p.weight(item) <= cap + CAPACITY_EPS;
}

bool State::canSwap(const Problem& p, int itemA, int itemB) const {
    int ba = binOfItem[itemA];
    int bb = binOfItem[itemB];
    if (ba == bb) return false;
    double wa = p.weight(itemA), wb = p.weight(itemB);
    return loads[ba] - wa + wb <= cap + CAPACITY_EPS &&
           loads[bb] - wb + wa <= cap + CAPACITY_EPS;
}

State State::relocated(const Problem& p, int item, int toBin) const {
    State next = *this;
    int from = binOfItem[item];
    double w = p.weight(item);

    if (toBin == numBins()) {
        next.loads.push_back(0.0);
        next.counts.push_back(0);
    }
    next.loads[from] -= w;
    next.counts[from] -= 1;
    next.loads[toBin] += w;
    next.counts[toBin] += 1;
    next.binOfItem[item] = toBin;

    if (next.counts[from] == 0) {
        next.closeBin(from);
    } else if (std::abs(next.loads[from]) < CAPACITY_EPS) {
        next.loads[from] = 0.0;
    }
    return next;
}

State State::swapped(const Problem& p, int itemA, int itemB) const {
    State next = *this;
    int ba = binOfItem[itemA];
    int bb = binOfItem[itemB];
    double delta = p.weight(itemB) - p.weight(itemA);
    next.loads[ba] += delta;
    next.loads[bb] -= delta;
    next.binOfItem[itemA] = bb;
    next.binOfItem[itemB] = ba;
    return next;
}

bool State::isValid(const Problem& p) const {
    if (binOfItem.size() != p.size()) return false;
    if (loads.size() != counts.size()) return false;

    std::vector<double> actualLoads(loads.size(), 0.0);
    std::vector<int> actualCounts(loads.size(), 0);
    for (int i = 0; i < numItems(); ++i) {
        int b = binOfItem[i];
        if (b < 0 || b >= numBins()) return false;
        actualLoads[b] += p.weight(i);
        actualCounts[b] += 1;
    }
    for (int b = 0; b < numBins(); ++b) {
        if (actualCounts[b] == 0 || actualCounts[b] != counts[b]) return false;
        if (actualLoads[b] > p.capacity() + CAPACITY_EPS) return false;
        if (std::abs(actualLoads[b] - loads[b]) > 1e-6) return false;
    }
    return true;
}
