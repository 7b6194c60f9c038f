#include "run_statistics.hpp"

using namespace std;

void RunStatistics::record(const ClassificationResult &result)
{
    lock_guard<mutex> lock(mutex_);

    counters_.total++;
    switch (result.verdict)
    {
    case Verdict::SCREENSHOT:
        counters_.screenshots++;
        break;
    case Verdict::REGULAR:
        counters_.regular++;
        break;
    case Verdict::ERROR:
        counters_.errors++;
        break;
    }

    switch (result.method)
    {
    case DetectionMethod::HORIZONTAL:
        counters_.by_horizontal++;
        break;
    case DetectionMethod::OCR:
        counters_.by_ocr++;
        break;
    case DetectionMethod::NONE:
        counters_.by_none++;
        break;
    }

    counters_.cumulative_ms += result.processing_time_ms;
}

void RunStatistics::recordRelocation(size_t sidecars_moved, size_t sidecars_failed)
{
    lock_guard<mutex> lock(mutex_);
    counters_.relocated++;
    counters_.sidecars_relocated += sidecars_moved;
    counters_.sidecar_failures += sidecars_failed;
}

void RunStatistics::recordRelocationFailure()
{
    lock_guard<mutex> lock(mutex_);
    counters_.relocation_failures++;
}

StatisticsSnapshot RunStatistics::snapshot() const
{
    lock_guard<mutex> lock(mutex_);
    return counters_;
}
