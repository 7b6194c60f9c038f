#pragma once
#include <atomic>
#include <deque>
#include <memory>
#include <mutex>
#include <thread>
#include <httplib.h>
#include <nlohmann/json.hpp>
#include "result_sink.hpp"
#include "engine/run_statistics.hpp"

// Live view of a running classification over HTTP (--serve PORT).
// Receives records like any other sink and answers from its own thread:
//   GET /health   service liveness
//   GET /stats    counters so far, and the summary once the run is over
//   GET /results  the most recent results, newest last
class StatusService : public ResultSink
{
public:
    static constexpr size_t kRecentResults = 10;

    StatusService(const RunStatistics &stats, int port);
    ~StatusService();

    // Binds the port and starts serving; false when the port cannot be bound
    bool start();
    void stop();
    bool isRunning() const { return running_; }

    void onRunStarted(const RunConfig &cfg, int workers_ready) override;
    void onResult(const ResultRecord &record) override;
    void onSummary(const RunSummary &summary) override;

    nlohmann::json statsJson() const;
    nlohmann::json resultsJson() const;

private:
    void run();

    const RunStatistics &stats_;
    int port_;

    mutable std::mutex mutex_;
    std::deque<nlohmann::json> recent_;
    nlohmann::json run_info_;
    nlohmann::json summary_;

    std::thread server_thread_;
    std::atomic<bool> running_{false};
    std::unique_ptr<httplib::Server> server_;
};
