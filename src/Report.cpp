#include "Report.h"
#include <cstdio>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace {

// Fixed-point formatting for tables
std::string fmt(double val, int precision = 3) {
    std::stringstream ss;
    ss << std::fixed << std::setprecision(precision) << val;
    return ss.str();
}

// General format for JSON and CSV numbers
std::string num(double val) {
    std::stringstream ss;
    ss << std::setprecision(12) << val;
    return ss.str();
}

std::string quote(const std::string& s) {
    std::string out = "\"";
    for (char c : s) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\t': out += "\\t"; break;
            case '\r': out += "\\r"; break;
            default:
                if ((unsigned char)c < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", (unsigned)(unsigned char)c);
                    out += buf;
                } else {
                    out += c;
                }
        }
    }
    return out + "\"";
}

std::string numberList(const std::vector<double>& values) {
    std::stringstream ss;
    ss << "[";
    for (size_t i = 0; i < values.size(); ++i) {
        if (i) ss << ", ";
        ss << num(values[i]);
    }
    ss << "]";
    return ss.str();
}

} // namespace

void printBins(std::ostream& out, const Problem& p, const State& s, int barWidth) {
    std::vector<std::vector<int>> bins = s.bins();
    for (size_t b = 0; b < bins.size(); ++b) {
        double ratio = s.load((int)b) / s.capacity();
        int filled = (int)(ratio * barWidth + 1e-9);
        if (filled > barWidth) filled = barWidth;

        out << "  Bin " << std::setw(3) << (b + 1) << " ["
            << std::string(filled, '#') << std::string(barWidth - filled, '.') << "] "
            << fmt(s.load((int)b), 2) << "/" << fmt(s.capacity(), 2)
            << " (" << fmt(ratio * 100.0, 1) << "%)\n";

        out << "          ";
        for (size_t k = 0; k < bins[b].size(); ++k) {
            const Item& item = p.item(bins[b][k]);
            if (k) out << ", ";
            out << item.id << "(" << num(item.weight) << ")";
        }
        out << "\n";
    }
}

void printResult(std::ostream& out, const Problem& p, const Result& r) {
    out << "\n=== " << r.algorithm << " (seed " << r.seed << ") ===\n";
    out << "Bins: " << r.initialScore.bins << " -> " << r.score.bins
        << " (lower bound " << p.lowerBound() << ")\n";
    out << "Score: " << fmt(r.initialScore.value(), 6) << " -> " << fmt(r.score.value(), 6)
        << " | fill " << fmt(r.score.fill, 6) << "\n";
    out << "Iterations: " << r.iterations << " | Time: " << fmt(r.elapsedMs, 2) << " ms"
        << " | Stop: " << terminationName(r.termination) << "\n";
    if (r.restarts) out << "Restarts: " << r.restarts << "\n";
    if (r.sidewaysMoves) out << "Sideways moves: " << r.sidewaysMoves << "\n";
    if (r.acceptedWorse) out << "Worse moves accepted: " << r.acceptedWorse << "\n";
    printBins(out, p, r.state);
    out.flush();
}

void printSummaryTable(std::ostream& out, const std::vector<Summary>& summaries,
                       const std::vector<Result>& results) {
    out << "\n" << std::left << std::setw(32) << "Algorithm"
        << std::right << std::setw(6) << "Runs" << std::setw(7) << "Best"
        << std::setw(8) << "Mean" << std::setw(7) << "Worst"
        << std::setw(13) << "Mean score" << std::setw(13) << "Mean ms"
        << "  Best stop\n";
    out << std::string(100, '-') << "\n";
    for (const Summary& s : summaries) {
        out << std::left << std::setw(32) << algorithmName(s.algorithm)
            << std::right << std::setw(6) << s.runs << std::setw(7) << s.bestBins
            << std::setw(8) << fmt(s.meanBins, 2) << std::setw(7) << s.worstBins
            << std::setw(13) << fmt(s.meanScore, 6) << std::setw(13) << fmt(s.meanElapsedMs, 2)
            << "  " << terminationName(results[s.bestRun].termination) << "\n";
    }
    out.flush();
}

std::string resultToJson(const Problem& p, const Result& r) {
    std::stringstream ss;
    ss << "{\"algorithm\": " << quote(r.algorithm)
       << ", \"bins_used\": " << r.binsUsed()
       << ", \"score\": " << num(r.score.value())
       << ", \"fill\": " << num(r.score.fill)
       << ", \"initial_bins\": " << r.initialScore.bins
       << ", \"iterations_or_generations\": " << r.iterations
       << ", \"elapsed\": " << num(r.elapsedMs)
       << ", \"termination_reason\": " << quote(terminationName(r.termination))
       << ", \"seed\": " << r.seed;

    ss << ", \"assignment\": {";
    for (int i = 0; i < r.state.numItems(); ++i) {
        if (i) ss << ", ";
        ss << quote(p.item(i).id) << ": " << r.state.binOf(i);
    }
    ss << "}";

    ss << ", \"bins\": [";
    std::vector<std::vector<int>> bins = r.state.bins();
    for (size_t b = 0; b < bins.size(); ++b) {
        if (b) ss << ", ";
        ss << "{\"load\": " << num(r.state.load((int)b)) << ", \"items\": [";
        for (size_t k = 0; k < bins[b].size(); ++k) {
            if (k) ss << ", ";
            ss << quote(p.item(bins[b][k]).id);
        }
        ss << "]}";
    }
    ss << "]";

    ss << ", \"history\": " << numberList(r.history);

    // Annealing and GA extras, only for the runs that record them
    if (!r.temperatures.empty()) {
        ss << ", \"stuck_count\": " << r.stuckCount
           << ", \"accepted_worse\": " << r.acceptedWorse
           << ", \"final_temperature\": " << num(r.finalTemperature)
           << ", \"temperatures\": " << numberList(r.temperatures)
           << ", \"acceptance_probabilities\": " << numberList(r.acceptanceProbabilities);
    }
    if (!r.meanFitnessHistory.empty()) {
        ss << ", \"mean_fitness\": " << numberList(r.meanFitnessHistory);
    }
    ss << "}";
    return ss.str();
}

void exportToJson(const std::string& filename, const Problem& p, const Experiment& exp) {
    std::ofstream file(filename);
    if (!file.is_open()) throw std::runtime_error("cannot open " + filename + " for writing");

    file << "{\n  \"problem\": {\"capacity\": " << num(p.capacity())
         << ", \"items\": " << p.size()
         << ", \"total_weight\": " << num(p.getTotalWeight())
         << ", \"lower_bound\": " << p.lowerBound() << "},\n";
    file << "  \"seed\": " << exp.getConfig().seed << ",\n";
    file << "  \"runs\": " << exp.getConfig().runs << ",\n";

    const auto& results = exp.getResults();
    file << "  \"results\": [\n";
    for (size_t i = 0; i < results.size(); ++i) {
        file << "    " << resultToJson(p, results[i]) << (i + 1 < results.size() ? ",\n" : "\n");
    }
    file << "  ],\n";

    const auto& summaries = exp.getSummaries();
    file << "  \"summary\": [\n";
    for (size_t i = 0; i < summaries.size(); ++i) {
        const Summary& s = summaries[i];
        file << "    {\"algorithm\": " << quote(algorithmName(s.algorithm))
             << ", \"runs\": " << s.runs
             << ", \"best_bins\": " << s.bestBins
             << ", \"mean_bins\": " << num(s.meanBins)
             << ", \"worst_bins\": " << s.worstBins
             << ", \"mean_score\": " << num(s.meanScore)
             << ", \"mean_elapsed_ms\": " << num(s.meanElapsedMs) << "}"
             << (i + 1 < summaries.size() ? ",\n" : "\n");
    }
    file << "  ]\n}\n";

    if (!file) throw std::runtime_error("failed writing " + filename);
    std::cout << ">>> Exported JSON: " << filename << std::endl;
}

void exportToCsv(const std::string& filename, const Experiment& exp) {
    std::ofstream file(filename);
    if (!file.is_open()) throw std::runtime_error("cannot open " + filename + " for writing");

    file << "algorithm,run,seed,bins,score,fill,iterations,elapsed_ms,termination\n";
    const auto& results = exp.getResults();
    int runs = exp.getConfig().runs;
    for (size_t i = 0; i < results.size(); ++i) {
        const Result& r = results[i];
        file << algorithmKey(exp.getAlgorithms()[i / runs]) << "," << (i % runs + 1) << ","
             << r.seed << "," << r.binsUsed() << "," << num(r.score.value()) << ","
             << num(r.score.fill) << "," << r.iterations << "," << num(r.elapsedMs) << ","
             << terminationName(r.termination) << "\n";
    }

    if (!file) throw std::runtime_error("failed writing " + filename);
    std::cout << ">>> Exported CSV: " << filename << std::endl;
}
