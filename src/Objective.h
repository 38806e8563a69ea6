#ifndef OBJECTIVE_H
#define OBJECTIVE_H

#include "State.h"

// Bins used first, then the sum of squared fill ratios: with the same bin
// count, a packing with a few nearly full bins and one nearly empty bin is
// closer to freeing a bin than an evenly spread one.
struct Score {
    int bins = 0;
    double fill = 0.0;   // sum over bins of (load / capacity)^2, in [0, bins]

    // Scalar form, lower is better. bins - fill / (bins + 1) lies in
    // (bins - 1, bins], so it orders scores exactly like (bins, -fill).
    double value() const { return bins - fill / (bins + 1.0); }

    bool betterThan(const Score& o) const {
        if (bins != o.bins) return bins < o.bins;
        return fill > o.fill + FILL_EPS;
    }
    bool equivalent(const Score& o) const {
        return bins == o.bins && !(fill > o.fill + FILL_EPS) && !(o.fill > fill + FILL_EPS);
    }

    bool operator<(const Score& o) const { return betterThan(o); }
    bool operator==(const Score& o) const { return equivalent(o); }
    bool operator!=(const Score& o) const { return !equivalent(o); }

    static constexpr double FILL_EPS = 1e-9;
};

// Pure and total: any State, including the zero-item one (Score{0, 0}).
Score evaluate(const State& s);

#endif // OBJECTIVE_H
