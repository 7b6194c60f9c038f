#pragma once
#include <atomic>
#include <filesystem>
#include <thread>
#include <vector>
#include "bounded_queue.hpp"
#include "run_statistics.hpp"
#include "types.hpp"
#include "communication/result_sink.hpp"
#include "relocation/file_relocator.hpp"
#include "utils/cancellation.hpp"

// Drains worker results on its own thread: statistics, relocation of
// screenshots, then one record to every sink.
class ResultCollector
{
public:
    ResultCollector(BoundedQueue<ClassificationResult> &results,
                    RunStatistics &stats,
                    std::vector<ResultSink *> sinks,
                    const CancellationToken &cancel,
                    RelocationMode relocation = RelocationMode::NONE,
                    std::filesystem::path relocation_target = {},
                    FileRelocator *relocator = nullptr);
    ~ResultCollector();

    ResultCollector(const ResultCollector &) = delete;
    ResultCollector &operator=(const ResultCollector &) = delete;

    void start();
    void join();

    // Poll loop; returns when the channel is closed and drained
    void run();

    size_t handled() const { return handled_.load(); }

private:
    void handle(ClassificationResult &&result);
    void relocate(ResultRecord &record);

    static constexpr int kPollIntervalMs = 100;

    BoundedQueue<ClassificationResult> &results_;
    RunStatistics &stats_;
    std::vector<ResultSink *> sinks_;
    const CancellationToken &cancel_;
    RelocationMode relocation_;
    std::filesystem::path relocation_target_;
    FileRelocator *relocator_;

    std::atomic<size_t> handled_{0};
    std::thread thread_;
};
