#include "Neighborhood.h"
#include <algorithm>
#include <sstream>
#include <utility>

bool isFeasible(const Problem& p, const State& s, const Move& m) {
    if (m.item < 0 || m.item >= s.numItems()) return false;
    if (m.type == MoveType::Relocate) return s.canRelocate(p, m.item, m.target);
    if (m.target < 0 || m.target >= s.numItems()) return false;
    return s.canSwap(p, m.item, m.target);
}

State applyMove(const Problem& p, const State& s, const Move& m) {
    if (m.type == MoveType::Relocate) return s.relocated(p, m.item, m.target);
    return s.swapped(p, m.item, m.target);
}

std::string describeMove(const Problem& p, const State& s, const Move& m) {
    std::ostringstream os;
    if (m.type == MoveType::Relocate) {
        os << "move " << p.item(m.item).id << " from bin " << s.binOf(m.item) << " to ";
        if (m.target == s.numBins()) os << "a new bin";
        else os << "bin " << m.target;
    } else {
        os << "swap " << p.item(m.item).id << " (bin " << s.binOf(m.item) << ") <-> "
           << p.item(m.target).id << " (bin " << s.binOf(m.target) << ")";
    }
    return os.str();
}

Neighborhood::Neighborhood(const Problem& p, const State& s) : problem(p), base(s) {
    int n = s.numItems();
    int bins = s.numBins();

    // 1. Relocations, including opening a new bin (target == bins)
    for (int item = 0; item < n; ++item) {
        for (int to = 0; to <= bins; ++to) {
            if (s.canRelocate(p, item, to)) moveList.push_back(Move::relocate(item, to));
        }
    }

    // 2. Swaps between items of different bins
    for (int a = 0; a < n; ++a) {
        for (int b = a + 1; b < n; ++b) {
            if (s.canSwap(p, a, b)) moveList.push_back(Move::swap(a, b));
        }
    }
}

State Neighborhood::neighbor(size_t index) const {
    return applyMove(problem, base, moveList[index]);
}

Neighborhood neighbors(const State& s, const Problem& p) {
    return Neighborhood(p, s);
}

bool randomMove(const Problem& p, const State& s, std::mt19937& rng, Move& out) {
    int n = s.numItems();
    if (n == 0) return false;

    std::uniform_real_distribution<double> coin(0.0, 1.0);
    std::uniform_int_distribution<int> pickItem(0, n - 1);
    const int attempts = 32;

    for (int k = 0; k < attempts; ++k) {
        if (coin(rng) < 0.8) {
            int item = pickItem(rng);
            // target in [0, numBins], numBins meaning a new bin
            std::uniform_int_distribution<int> pickBin(0, s.numBins());
            Move m = Move::relocate(item, pickBin(rng));
            if (s.canRelocate(p, m.item, m.target)) { out = m; return true; }
        } else {
            int a = pickItem(rng), b = pickItem(rng);
            if (a == b) continue;
            if (a > b) std::swap(a, b);
            if (s.canSwap(p, a, b)) { out = Move::swap(a, b); return true; }
        }
    }

    // Tight packings reject most samples; scan from a random starting point instead
    std::uniform_int_distribution<int> pickBin(0, s.numBins());
    return firstFeasibleMove(p, s, pickItem(rng), pickBin(rng), out);
}

bool firstFeasibleMove(const Problem& p, const State& s, int startItem, int startBin, Move& out) {
    int n = s.numItems();
    int slots = s.numBins() + 1;

    for (int k = 0; k < n; ++k) {
        int item = (startItem + k) % n;
        for (int t = 0; t < slots; ++t) {
            int to = (startBin + t) % slots;
            if (s.canRelocate(p, item, to)) {
                out = Move::relocate(item, to);
                return true;
            }
        }
    }
    for (int k = 0; k < n; ++k) {
        int a = (startItem + k) % n;
        for (int b = 0; b < n; ++b) {
            if (a != b && s.canSwap(p, a, b)) {
                out = Move::swap(std::min(a, b), std::max(a, b));
                return true;
            }
        }
    }
    return false;
}
