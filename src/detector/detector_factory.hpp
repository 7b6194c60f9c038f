#pragma once
#include "detector_interface.hpp"
#include "combined_detector.hpp"
#include "horizontal/horizontal_detector.hpp"
#include "ocr/ocr_detector.hpp"
#include "config/run_config.hpp"
#include "utils.hpp"
#include <memory>
#include <string>

// Builds the detector for a run. Construction is cheap; the model is
// loaded later by initialize() inside the worker that owns the detector.
class DetectorFactory
{
private:
    static std::unique_ptr<DetectorInterface> createOcrDetector(const RunConfig &cfg)
    {
        text_processing::TextParams params;
        params.min_chars = cfg.ocr_min_chars;
        params.min_confidence = cfg.ocr_min_confidence;
        params.extra_heuristics = cfg.extra_heuristics;

        return std::make_unique<OcrDetector>(cfg.tessdata_path, cfg.ocr_language,
                                             cfg.ocr_resize_factor, cfg.gpu_enabled, params);
    }

public:
    static std::unique_ptr<DetectorInterface> createDetector(const RunConfig &cfg)
    {
        log_debug("Creating detector: " + config::toString(cfg.mode));

        switch (cfg.mode)
        {
        case DetectionMode::HORIZONTAL:
            return std::make_unique<HorizontalDetector>(cfg.gpu_enabled);

        case DetectionMode::OCR:
            return createOcrDetector(cfg);

        case DetectionMode::BOTH:
            return std::make_unique<CombinedDetector>(std::make_unique<HorizontalDetector>(cfg.gpu_enabled),
                                                      createOcrDetector(cfg));
        }

        log_error("Unknown detection mode, using horizontal detector");
        return std::make_unique<HorizontalDetector>(cfg.gpu_enabled);
    }
};
