#include "result_collector.hpp"
#include "utils.hpp"

using namespace std;
namespace fs = std::filesystem;

ResultCollector::ResultCollector(BoundedQueue<ClassificationResult> &results,
                                 RunStatistics &stats,
                                 vector<ResultSink *> sinks,
                                 const CancellationToken &cancel,
                                 RelocationMode relocation,
                                 fs::path relocation_target,
                                 FileRelocator *relocator)
    : results_(results), stats_(stats), sinks_(std::move(sinks)), cancel_(cancel),
      relocation_(relocation), relocation_target_(std::move(relocation_target)), relocator_(relocator)
{
}

ResultCollector::~ResultCollector()
{
    join();
}

void ResultCollector::start()
{
    thread_ = thread(&ResultCollector::run, this);
}

void ResultCollector::join()
{
    if (thread_.joinable())
    {
        thread_.join();
    }
}

void ResultCollector::run()
{
    for (;;)
    {
        // Keeps draining after a cancellation: every result a worker produced is counted.
        // The coordinator closes the channel once all workers are joined.
        ClassificationResult result;
        if (!results_.pop(result, kPollIntervalMs))
        {
            if (results_.isDrained())
            {
                if (cancel_.isCancelled())
                    log_debug("Collector drained " + to_string(handled_.load()) + " results after cancellation");
                return;
            }
            continue;
        }

        try
        {
            handle(std::move(result));
        }
        catch (const exception &e)
        {
            log_error("Failed to handle result: " + string(e.what()));
        }
    }
}

void ResultCollector::handle(ClassificationResult &&result)
{
    stats_.record(result);

    ResultRecord record;
    record.sequence = ++handled_;
    record.result = std::move(result);

    if (record.result.isScreenshot() && relocation_ != RelocationMode::NONE && relocator_)
    {
        relocate(record);
    }

    for (ResultSink *sink : sinks_)
    {
        sink->onResult(record);
    }
}

void ResultCollector::relocate(ResultRecord &record)
{
    // In-flight relocations finish, new ones are not started after an interrupt
    if (cancel_.isCancelled())
    {
        log_warning("Run cancelled, leaving " + record.result.path + " in place");
        return;
    }

    try
    {
        RelocationPlan plan = relocator_->relocate(record.result.path, relocation_target_, relocation_);
        record.action = relocation_;
        record.destination = plan.resolved_destination.string();
        for (const auto &sidecar : plan.sidecars)
        {
            record.sidecar_destinations.push_back(sidecar.destination.string());
        }
        record.sidecar_errors = plan.sidecar_errors;

        for (const auto &problem : plan.sidecar_errors)
        {
            log_warning("Sidecar not relocated: " + problem);
        }
        stats_.recordRelocation(plan.sidecars.size(), plan.sidecar_errors.size());
    }
    catch (const FilesystemError &e)
    {
        record.relocation_error = e.what();
        stats_.recordRelocationFailure();
        log_error("Failed to " + config::toString(relocation_) + " " + record.result.path + ": " + e.what());
    }
}
