#include "run_coordinator.hpp"
#include "bounded_queue.hpp"
#include "result_collector.hpp"
#include "work_distributor.hpp"
#include "worker.hpp"
#include "relocation/file_relocator.hpp"
#include "utils.hpp"
#include <chrono>
#include <filesystem>
#include <future>
#include <thread>

using namespace std;
namespace fs = std::filesystem;

RunCoordinator::RunCoordinator(shared_ptr<const RunConfig> config,
                               DetectorBuilder builder,
                               vector<ResultSink *> sinks,
                               CancellationToken &cancel)
    : config_(std::move(config)), builder_(std::move(builder)), sinks_(std::move(sinks)), cancel_(cancel)
{
}

RunSummary RunCoordinator::finish(RunSummary summary)
{
    summary.stats = stats_.snapshot();

    for (ResultSink *sink : sinks_)
    {
        try
        {
            sink->onSummary(summary);
        }
        catch (const exception &e)
        {
            log_error("Failed to report summary: " + string(e.what()));
        }
    }
    return summary;
}

RunSummary RunCoordinator::run()
{
    return run(fs::path(config_->input_directory));
}

RunSummary RunCoordinator::run(const fs::path &directory)
{
    const RunConfig &cfg = *config_;
    auto start_time = chrono::steady_clock::now();

    RunSummary summary;
    summary.workers_requested = cfg.worker_count;
    summary.relocation = cfg.relocation;
    summary.relocation_target = cfg.relocation_target;

    const fs::path &root = directory;
    error_code ec;
    if (!fs::is_directory(root, ec))
    {
        summary.outcome = RunOutcome::FAILURE;
        summary.failure_reason = "Not a directory: " + root.string();
        log_error("Failed to scan directory: " + summary.failure_reason);
        return finish(summary);
    }

    log_info("Scanning directory for images: " + root.string());

    size_t capacity = static_cast<size_t>(cfg.worker_count) * static_cast<size_t>(cfg.queue_factor);
    BoundedQueue<ImageTask> tasks(capacity);
    BoundedQueue<ClassificationResult> results(capacity);

    // Build and initialize all workers in parallel
    vector<unique_ptr<Worker>> workers;
    vector<future<bool>> readiness;

    // Any early exit closes both channels before the workers are joined
    struct ChannelGuard
    {
        BoundedQueue<ImageTask> &tasks;
        BoundedQueue<ClassificationResult> &results;
        ~ChannelGuard()
        {
            tasks.close();
            results.close();
        }
    } guard{tasks, results};
    for (int i = 0; i < cfg.worker_count; i++)
    {
        try
        {
            workers.push_back(make_unique<Worker>(i + 1, builder_(), tasks, results, cancel_));
            readiness.push_back(workers.back()->start());
        }
        catch (const exception &e)
        {
            log_error("Failed to start worker " + to_string(i + 1) + ": " + string(e.what()));
        }
    }

    int ready = 0;
    for (auto &future : readiness)
    {
        if (future.get())
            ready++;
    }
    summary.workers_ready = ready;

    if (ready == 0)
    {
        tasks.close();
        results.close();
        workers.clear();

        summary.outcome = RunOutcome::FAILURE;
        summary.failure_reason = "No worker could be initialized";
        log_error(summary.failure_reason + ", aborting run");
        return finish(summary);
    }
    if (ready < cfg.worker_count)
    {
        log_warning("Degraded run: only " + to_string(ready) + " of " + to_string(cfg.worker_count) + " workers are ready");
    }

    log_info("Started " + to_string(ready) + " workers (detection mode: " + config::toString(cfg.mode) + ")");

    for (ResultSink *sink : sinks_)
    {
        try
        {
            sink->onRunStarted(cfg, ready);
        }
        catch (const exception &e)
        {
            log_error("Failed to report run start: " + string(e.what()));
        }
    }

    // Producer
    WorkDistributor distributor(tasks, cancel_, cfg.mode);
    if (cfg.relocation != RelocationMode::NONE)
    {
        distributor.excludeDirectory(cfg.relocation_target);
    }

    string scanError;
    thread distributorThread([&]()
                             {
        try
        {
            distributor.distribute(root);
        }
        catch (const exception &e)
        {
            scanError = e.what();
            log_error("Failed to scan directory: " + scanError);
        } });

    // Consumer
    FileRelocator relocator;
    ResultCollector collector(results, stats_, sinks_, cancel_, cfg.relocation, cfg.relocation_target, &relocator);
    collector.start();

    // Drain in order: producer, workers, then whatever results are left
    distributorThread.join();
    for (auto &worker : workers)
    {
        worker->join();
    }
    results.close();
    collector.join();

    summary.files_enumerated = distributor.enqueued();
    summary.stats = stats_.snapshot();

    if (cancel_.isCancelled())
    {
        summary.outcome = RunOutcome::CANCELLED;
        log_warning("Classification interrupted by user after " + to_string(summary.stats.total) + " of " +
                    to_string(summary.files_enumerated) + " images");
    }
    else if (!scanError.empty())
    {
        summary.outcome = RunOutcome::FAILURE;
        summary.failure_reason = scanError;
    }
    else
    {
        if (summary.files_enumerated == 0)
        {
            log_warning("No image files found in " + root.string());
        }
        if (summary.stats.total != summary.files_enumerated)
        {
            log_error("Result count " + to_string(summary.stats.total) + " does not match " +
                      to_string(summary.files_enumerated) + " enqueued images");
        }

        bool failed = summary.stats.errors > 0 || summary.stats.relocation_failures > 0 ||
                      summary.stats.total != summary.files_enumerated;
        summary.outcome = failed ? RunOutcome::FAILURE : RunOutcome::SUCCESS;
    }

    auto end_time = chrono::steady_clock::now();
    summary.elapsed_ms = chrono::duration_cast<chrono::milliseconds>(end_time - start_time).count();

    log_info("Classification complete: " + to_string(summary.stats.total) + " images, " +
             to_string(summary.stats.screenshots) + " screenshots, " +
             to_string(summary.stats.regular) + " regular, " +
             to_string(summary.stats.errors) + " errors");

    return finish(summary);
}
