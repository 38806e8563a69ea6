#ifndef REPORT_H
#define REPORT_H

#include <ostream>
#include <string>
#include <vector>
#include "Experiment.h"

// One line per bin: fill bar, load / capacity, then the items it holds.
void printBins(std::ostream& out, const Problem& p, const State& s, int barWidth = 40);

// Initial vs final score, counters and the packing of the best state.
void printResult(std::ostream& out, const Problem& p, const Result& r);

void printSummaryTable(std::ostream& out, const std::vector<Summary>& summaries,
                       const std::vector<Result>& results);

// {algorithm, bins_used, score, iterations_or_generations, elapsed (ms),
//  termination_reason, seed, assignment: {id: bin}, bins: [{load, items}],
//  history: [...]}, plus the annealing and GA metrics when present
std::string resultToJson(const Problem& p, const Result& r);

// Throws std::runtime_error if the file cannot be written.
void exportToJson(const std::string& filename, const Problem& p, const Experiment& exp);
void exportToCsv(const std::string& filename, const Experiment& exp);

#endif // REPORT_H
