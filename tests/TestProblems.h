#ifndef TEST_PROBLEMS_H
#define TEST_PROBLEMS_H

#include <string>
#include <vector>
#include "Problem.h"

// n items of the same weight, named I0..I(n-1)
inline Problem uniformProblem(int n, double weight, double capacity) {
    std::vector<Item> items;
    for (int i = 0; i < n; ++i) items.push_back({"I" + std::to_string(i), weight});
    return Problem(capacity, items);
}

// a=60, b=30, c=50 in capacity 100. First fit gives {a, b} {c}.
inline Problem threeItemProblem() {
    return Problem(100.0, {{"a", 60}, {"b", 30}, {"c", 50}});
}

inline Problem emptyProblem() {
    return Problem(100.0, {});
}

#endif // TEST_PROBLEMS_H
