#include "Objective.h"

Score evaluate(const State& s) {
    Score score;
    score.bins = s.numBins();
    if (score.bins == 0) return score;

    double cap = s.capacity();
    for (double load : s.getLoads()) {
        double ratio = load / cap;
        score.fill += ratio * ratio;
    }
    return score;
}
