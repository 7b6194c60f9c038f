#pragma once

#include <opencv2/core.hpp>
#include <string>
#include "detector/detector_interface.hpp"
#include "edge_processing.hpp"

// Cheap detector: screenshots carry long, perfectly horizontal UI edges
class HorizontalDetector : public DetectorInterface
{
public:
    explicit HorizontalDetector(bool gpu_enabled, const edge_processing::EdgeParams &params = edge_processing::EdgeParams());
    virtual ~HorizontalDetector() = default;

    virtual void initialize() override;
    virtual bool isInitialized() const override { return initialized; }
    virtual DetectionOutcome classify(const std::string &path) override;
    virtual void terminate() override { initialized = false; }
    virtual std::string name() const override { return "horizontal"; }

    // Enables or disables OpenCV's OpenCL path for the whole process. Returns whether it is active.
    static bool configureOpenCL(bool gpu_enabled);

    // Classify an already decoded image
    DetectionOutcome classifyImage(const cv::Mat &image);

protected:
    bool initialized;
    bool gpu_requested;
    bool use_opencl;
    edge_processing::EdgeParams params;
};
