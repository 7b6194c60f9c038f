#pragma once

#include <opencv2/core.hpp>
#include <memory>
#include <string>
#include <vector>
#include "detector/detector_interface.hpp"
#include "text_processing.hpp"

namespace tesseract
{
    class TessBaseAPI;
}

// Expensive detector: screenshots carry a lot of readable text.
// Owns one Tesseract engine, loaded once in initialize().
class OcrDetector : public DetectorInterface
{
public:
    OcrDetector(const std::string &tessdata_path, const std::string &language,
                double resize_factor, bool gpu_enabled,
                const text_processing::TextParams &params);
    virtual ~OcrDetector();

    virtual void initialize() override;
    virtual bool isInitialized() const override { return initialized; }
    virtual DetectionOutcome classify(const std::string &path) override;
    virtual void terminate() override;
    virtual std::string name() const override { return "ocr"; }

protected:
    // Run recognition and collect text lines
    std::vector<text_processing::TextRegion> recognize(const cv::Mat &gray);

    bool initialized;
    std::string tessdata_path;
    std::string language;
    double resize_factor;
    bool gpu_requested;
    text_processing::TextParams params;
    std::unique_ptr<tesseract::TessBaseAPI> api;
};
