#include "combined_detector.hpp"
#include "utils.hpp"

using namespace std;

CombinedDetector::CombinedDetector(unique_ptr<DetectorInterface> fast, unique_ptr<DetectorInterface> fallback)
    : fast_(std::move(fast)), fallback_(std::move(fallback))
{
}

void CombinedDetector::initialize()
{
    fast_->initialize();
    fallback_->initialize();
}

bool CombinedDetector::isInitialized() const
{
    return fast_->isInitialized() && fallback_->isInitialized();
}

DetectionOutcome CombinedDetector::classify(const string &path)
{
    DetectionOutcome first = fast_->classify(path);
    if (first.screenshot)
    {
        return first;
    }

    DetectionOutcome second = fallback_->classify(path);
    second.processing_time_ms += first.processing_time_ms;
    return second;
}

void CombinedDetector::terminate()
{
    fast_->terminate();
    fallback_->terminate();
}
