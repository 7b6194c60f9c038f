#pragma once
#include <atomic>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include "bounded_queue.hpp"
#include "types.hpp"
#include "detector/detector_interface.hpp"
#include "utils/cancellation.hpp"

enum class WorkerState
{
    INITIALIZING, // Loading the detector model
    READY,        // Waiting for a task
    BUSY,         // Classifying a task
    DRAINING,     // No more work, finishing up
    TERMINATED    // Thread done, model released
};

std::string toString(WorkerState state);

// Long-lived execution context holding one detector for the whole run.
// Pulls tasks until the task queue is drained or the run is cancelled and
// emits exactly one result per task it took.
class Worker
{
public:
    Worker(int id,
           std::unique_ptr<DetectorInterface> detector,
           BoundedQueue<ImageTask> &tasks,
           BoundedQueue<ClassificationResult> &results,
           const CancellationToken &cancel);
    ~Worker();

    Worker(const Worker &) = delete;
    Worker &operator=(const Worker &) = delete;

    // Spawn the thread. The future becomes true once the model is loaded,
    // false if loading failed (the worker then exits without taking any task).
    std::future<bool> start();
    void join();

    int id() const { return id_; }
    WorkerState state() const { return state_.load(); }
    size_t processed() const { return processed_.load(); }
    const std::string &initError() const { return init_error_; }

private:
    void run();
    ClassificationResult classify(const ImageTask &task);
    bool emit(ClassificationResult &&result);

    static constexpr int kPollIntervalMs = 100;

    int id_;
    std::unique_ptr<DetectorInterface> detector_;
    BoundedQueue<ImageTask> &tasks_;
    BoundedQueue<ClassificationResult> &results_;
    const CancellationToken &cancel_;

    std::atomic<WorkerState> state_{WorkerState::INITIALIZING};
    std::atomic<size_t> processed_{0};
    std::promise<bool> ready_;
    std::string init_error_;
    std::thread thread_;
};
