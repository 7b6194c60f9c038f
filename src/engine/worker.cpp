#include "worker.hpp"
#include "utils.hpp"
#include <chrono>

using namespace std;

string toString(WorkerState state)
{
    switch (state)
    {
    case WorkerState::INITIALIZING:
        return "initializing";
    case WorkerState::READY:
        return "ready";
    case WorkerState::BUSY:
        return "busy";
    case WorkerState::DRAINING:
        return "draining";
    case WorkerState::TERMINATED:
        return "terminated";
    }
    return "unknown";
}

Worker::Worker(int id,
               unique_ptr<DetectorInterface> detector,
               BoundedQueue<ImageTask> &tasks,
               BoundedQueue<ClassificationResult> &results,
               const CancellationToken &cancel)
    : id_(id), detector_(std::move(detector)), tasks_(tasks), results_(results), cancel_(cancel)
{
}

Worker::~Worker()
{
    join();
}

future<bool> Worker::start()
{
    future<bool> ready = ready_.get_future();
    thread_ = thread(&Worker::run, this);
    return ready;
}

void Worker::join()
{
    if (thread_.joinable())
    {
        thread_.join();
    }
}

void Worker::run()
{
    state_ = WorkerState::INITIALIZING;

    // Load the model once for the whole lifetime of the worker
    try
    {
        if (!detector_)
            throw ModelLoadError("no detector assigned");
        detector_->initialize();
    }
    catch (const exception &e)
    {
        init_error_ = e.what();
        log_error("Worker " + to_string(id_) + " failed to initialize: " + init_error_);
        state_ = WorkerState::TERMINATED;
        ready_.set_value(false);
        return;
    }

    state_ = WorkerState::READY;
    log_debug("Worker " + to_string(id_) + " ready (" + detector_->name() + ")");
    ready_.set_value(true);

    while (!cancel_.isCancelled())
    {
        ImageTask task;
        if (!tasks_.pop(task, kPollIntervalMs))
        {
            if (tasks_.isDrained())
                break;
            continue;
        }

        state_ = WorkerState::BUSY;
        ClassificationResult result = classify(task);
        processed_++;
        state_ = WorkerState::READY;

        if (!emit(std::move(result)))
            break;
    }

    state_ = WorkerState::DRAINING;
    detector_->terminate();
    state_ = WorkerState::TERMINATED;
    log_debug("Worker " + to_string(id_) + " terminated after " + to_string(processed_.load()) + " images");
}

ClassificationResult Worker::classify(const ImageTask &task)
{
    auto start_time = chrono::steady_clock::now();

    ClassificationResult result;
    result.path = task.path;
    result.index = task.index;
    result.worker_id = id_;

    // Per-image failures become error results; the worker keeps going
    try
    {
        DetectionOutcome outcome = detector_->classify(task.path);
        result.verdict = outcome.screenshot ? Verdict::SCREENSHOT : Verdict::REGULAR;
        result.method = outcome.method;
        result.score = outcome.score;
        result.processing_time_ms = outcome.processing_time_ms;
        return result;
    }
    catch (const DecodeError &e)
    {
        result.error = e.what();
    }
    catch (const ResourceExhaustedError &e)
    {
        result.error = e.what();
    }
    catch (const DetectionError &e)
    {
        result.error = e.what();
    }
    catch (const exception &e)
    {
        result.error = "Failed to classify: " + string(e.what());
    }

    auto end_time = chrono::steady_clock::now();
    result.verdict = Verdict::ERROR;
    result.method = DetectionMethod::NONE;
    result.processing_time_ms = static_cast<int>(chrono::duration_cast<chrono::milliseconds>(end_time - start_time).count());
    log_debug("Worker " + to_string(id_) + " failed on " + task.path + ": " + result.error);
    return result;
}

bool Worker::emit(ClassificationResult &&result)
{
    while (!results_.push(std::move(result), kPollIntervalMs))
    {
        // Only closed after every worker is joined, so this means the collector is gone
        if (results_.isClosed())
        {
            log_error("Result channel closed before worker " + to_string(id_) + " finished, lost result for " + result.path);
            return false;
        }
    }
    return true;
}
