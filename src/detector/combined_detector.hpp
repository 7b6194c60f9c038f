#pragma once
#include <memory>
#include <string>
#include "detector_interface.hpp"

// Short-circuit OR of a cheap and an expensive detector.
// The fast detector runs first; a positive verdict is final and the fallback is skipped.
// Otherwise the fallback runs and its verdict is final. A decode failure in the fast
// stage fails the image outright, the fallback would not decode it either.
class CombinedDetector : public DetectorInterface
{
public:
    CombinedDetector(std::unique_ptr<DetectorInterface> fast, std::unique_ptr<DetectorInterface> fallback);
    virtual ~CombinedDetector() = default;

    virtual void initialize() override;
    virtual bool isInitialized() const override;
    virtual DetectionOutcome classify(const std::string &path) override;
    virtual void terminate() override;
    virtual std::string name() const override { return "both"; }

private:
    std::unique_ptr<DetectorInterface> fast_;
    std::unique_ptr<DetectorInterface> fallback_;
};
