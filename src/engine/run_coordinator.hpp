#pragma once
#include <filesystem>
#include <functional>
#include <memory>
#include <vector>
#include "run_statistics.hpp"
#include "run_summary.hpp"
#include "config/run_config.hpp"
#include "detector/detector_interface.hpp"
#include "communication/result_sink.hpp"
#include "utils/cancellation.hpp"

// Owns one classification run: worker pool, distributor, collector and the
// final summary. Workers are built and initialized in parallel and the run only
// starts once every one of them is ready or has failed.
class RunCoordinator
{
public:
    // Builds one detector per worker; each worker initializes its own
    using DetectorBuilder = std::function<std::unique_ptr<DetectorInterface>()>;

    RunCoordinator(std::shared_ptr<const RunConfig> config,
                   DetectorBuilder builder,
                   std::vector<ResultSink *> sinks,
                   CancellationToken &cancel);

    // Sinks must be added before run()
    void addSink(ResultSink *sink) { sinks_.push_back(sink); }

    // Classify the configured input directory, or the given one
    RunSummary run();
    RunSummary run(const std::filesystem::path &directory);

    // Live counters, readable from other threads while the run is going
    const RunStatistics &statistics() const { return stats_; }

private:
    RunSummary finish(RunSummary summary);

    std::shared_ptr<const RunConfig> config_;
    DetectorBuilder builder_;
    std::vector<ResultSink *> sinks_;
    CancellationToken &cancel_;
    RunStatistics stats_;
};
