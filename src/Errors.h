#ifndef ERRORS_H
#define ERRORS_H

#include <stdexcept>
#include <string>

// An item heavier than the bin capacity: no packing can ever be valid.
class InfeasibleItemError : public std::runtime_error {
public:
    InfeasibleItemError(const std::string& itemId, double weight, double capacity);

    const std::string& itemId() const { return id; }

private:
    std::string id;
};

// Malformed problem data (bad capacity, bad weight, duplicate id, unreadable file).
class InvalidProblemError : public std::runtime_error {
public:
    explicit InvalidProblemError(const std::string& what) : std::runtime_error(what) {}
};

// Out-of-range algorithm parameters, rejected before any iteration runs.
class InvalidConfigError : public std::runtime_error {
public:
    explicit InvalidConfigError(const std::string& what) : std::runtime_error(what) {}
};

#endif // ERRORS_H
