#pragma once
#include <string>
#include <vector>
#include "engine/types.hpp"
#include "engine/run_summary.hpp"
#include "config/run_config.hpp"

// One classification result as presented, with what happened to the file
struct ResultRecord
{
    ClassificationResult result;
    size_t sequence = 0;                              // 1-based order of arrival at the collector
    RelocationMode action = RelocationMode::NONE;     // Applied action, NONE if the file stayed
    std::string destination;                          // Set when the file was relocated
    std::string relocation_error;                     // Set when relocation was attempted and failed
    std::vector<std::string> sidecar_destinations;
    std::vector<std::string> sidecar_errors;
};

// Presentation boundary. Called from the collector thread only, one record per
// result in arrival order; order across workers does not follow discovery order.
class ResultSink
{
public:
    virtual ~ResultSink() = default;

    virtual void onRunStarted(const RunConfig &cfg, int workers_ready) = 0;
    virtual void onResult(const ResultRecord &record) = 0;
    virtual void onSummary(const RunSummary &summary) = 0;
};

// "moved" / "copied" / "none", as reported in result lines
inline std::string actionName(RelocationMode action)
{
    switch (action)
    {
    case RelocationMode::MOVE:
        return "moved";
    case RelocationMode::COPY:
        return "copied";
    case RelocationMode::NONE:
        return "none";
    }
    return "none";
}
