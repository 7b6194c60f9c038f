#pragma once
#include <string>
#include <cstddef>
#include "config/run_config.hpp"

// Final classification of one image
enum class Verdict
{
    SCREENSHOT,
    REGULAR,
    ERROR
};

// Detector that decided the verdict
enum class DetectionMethod
{
    HORIZONTAL,
    OCR,
    NONE
};

// One unit of work: an image and the detection mode of the run
struct ImageTask
{
    std::string path;  // Absolute path
    size_t index = 0;  // 1-based discovery order
    DetectionMode mode = DetectionMode::BOTH;
};

// Exactly one per ImageTask, produced by the worker that consumed it
struct ClassificationResult
{
    std::string path;
    size_t index = 0;
    Verdict verdict = Verdict::ERROR;
    DetectionMethod method = DetectionMethod::NONE;
    double score = 0.0;         // Line count (horizontal) or character count (OCR)
    int processing_time_ms = 0;
    int worker_id = -1;
    std::string error;          // Set only for Verdict::ERROR

    bool isScreenshot() const { return verdict == Verdict::SCREENSHOT; }
};

inline std::string toString(Verdict verdict)
{
    switch (verdict)
    {
    case Verdict::SCREENSHOT:
        return "screenshot";
    case Verdict::REGULAR:
        return "regular";
    case Verdict::ERROR:
        return "error";
    }
    return "unknown";
}

inline std::string toString(DetectionMethod method)
{
    switch (method)
    {
    case DetectionMethod::HORIZONTAL:
        return "horizontal";
    case DetectionMethod::OCR:
        return "ocr";
    case DetectionMethod::NONE:
        return "none";
    }
    return "unknown";
}
