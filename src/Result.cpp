#include "Result.h"

std::string terminationName(TerminationReason reason) {
    switch (reason) {
        case TerminationReason::EmptyProblem: return "empty_problem";
        case TerminationReason::LocalOptimum: return "local_optimum";
        case TerminationReason::NoImprovingTrial: return "no_improving_trial";
        case TerminationReason::SidewaysLimit: return "sideways_limit";
        case TerminationReason::RestartBudget: return "restart_budget_exhausted";
        case TerminationReason::TemperatureFloor: return "temperature_floor";
        case TerminationReason::GenerationCap: return "generation_cap";
        case TerminationReason::Stagnation: return "stagnation";
        case TerminationReason::IterationCap: return "iteration_cap";
    }
    return "unknown";
}
