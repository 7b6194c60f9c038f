#pragma once
#include <string>
#include "engine/types.hpp"

// What a detector concluded about one image
struct DetectionOutcome
{
    bool screenshot = false;
    double score = 0.0; // Confidence or count, detector specific
    DetectionMethod method = DetectionMethod::NONE;
    int processing_time_ms = 0;

    // Easy boolean check
    operator bool() const { return screenshot; }
};

// Abstract interface for any screenshot detection method.
// One instance lives inside one worker for the whole run: initialize() loads the
// model once, classify() is called for many images, terminate() releases it.
class DetectorInterface
{
public:
    virtual ~DetectorInterface() = default;

    // Load the model. Throws ModelLoadError.
    virtual void initialize() = 0;

    // Whether the detector is ready
    virtual bool isInitialized() const = 0;

    // Classify one image file. Throws DecodeError, DetectionError or ResourceExhaustedError.
    virtual DetectionOutcome classify(const std::string &path) = 0;

    // Release the model
    virtual void terminate() = 0;

    virtual std::string name() const = 0;
};
