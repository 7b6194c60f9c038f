#pragma once
#include <cstdint>
#include <string>
#include "run_statistics.hpp"
#include "config/run_config.hpp"

// The three ways a run can end
enum class RunOutcome
{
    SUCCESS,   // Completed without errors
    FAILURE,   // Completed with errors, or could not run
    CANCELLED  // Interrupted by the user
};

// Process exit code for an outcome: 0, 1 and 130 (SIGINT convention)
inline int exitCode(RunOutcome outcome)
{
    switch (outcome)
    {
    case RunOutcome::SUCCESS:
        return 0;
    case RunOutcome::FAILURE:
        return 1;
    case RunOutcome::CANCELLED:
        return 130;
    }
    return 1;
}

// Final aggregate handed to the sinks and to main
struct RunSummary
{
    RunOutcome outcome = RunOutcome::SUCCESS;
    StatisticsSnapshot stats;
    size_t files_enumerated = 0;
    int workers_requested = 0;
    int workers_ready = 0;
    RelocationMode relocation = RelocationMode::NONE;
    std::string relocation_target;
    int64_t elapsed_ms = 0;
    std::string failure_reason; // Set when the run could not complete
};
