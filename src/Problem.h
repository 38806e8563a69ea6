#ifndef PROBLEM_H
#define PROBLEM_H

#include <string>
#include <vector>
#include <unordered_map>
#include "Errors.h"

struct Item {
    std::string id;
    double weight = 0.0;
};

// Immutable bin packing instance. Items keep the order they were given in;
// every algorithm refers to them by index into items().
class Problem {
private:
    double cap;
    std::vector<Item> itemList;
    std::unordered_map<std::string, int> indexById;
    double totalWeight = 0.0;

public:
    // Throws InvalidProblemError for non-positive capacity/weights or duplicate ids,
    // InfeasibleItemError when an item does not fit in an empty bin.
    Problem(double capacity, std::vector<Item> items);

    double capacity() const { return cap; }
    const std::vector<Item>& items() const { return itemList; }
    size_t size() const { return itemList.size(); }
    bool empty() const { return itemList.empty(); }

    const Item& item(int index) const { return itemList[index]; }
    double weight(int index) const { return itemList[index].weight; }

    // -1 if the id is unknown
    int indexOf(const std::string& id) const;

    double getTotalWeight() const { return totalWeight; }

    // ceil(total weight / capacity), the trivial lower bound on bins
    int lowerBound() const;

    // Reads { "capacity": C, "items": { "<id>": w, ... } }
    static Problem loadFromFile(const std::string& filename);
    static Problem parseJson(const std::string& text);
};

// Hard-coded instance used by --demo.
Problem createDemoProblem();

#endif // PROBLEM_H
