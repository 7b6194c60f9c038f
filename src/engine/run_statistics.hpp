#pragma once
#include <mutex>
#include <cstdint>
#include "types.hpp"

// Plain copy of the counters, safe to hand to other threads
struct StatisticsSnapshot
{
    size_t total = 0;
    size_t screenshots = 0;
    size_t regular = 0;
    size_t errors = 0;

    // Which detector decided each verdict
    size_t by_horizontal = 0;
    size_t by_ocr = 0;
    size_t by_none = 0;

    int64_t cumulative_ms = 0;

    size_t relocated = 0;
    size_t relocation_failures = 0;
    size_t sidecars_relocated = 0;
    size_t sidecar_failures = 0;
};

// Run-wide aggregate. Mutated by the result collector, read concurrently by
// the status service; one mutex held only for the duration of each update.
class RunStatistics
{
public:
    void record(const ClassificationResult &result);
    void recordRelocation(size_t sidecars_moved, size_t sidecars_failed);
    void recordRelocationFailure();

    StatisticsSnapshot snapshot() const;

private:
    mutable std::mutex mutex_;
    StatisticsSnapshot counters_;
};
