#pragma once
#include <string>
#include <vector>
#include <memory>

// Which detectors run for every image
enum class DetectionMode
{
    HORIZONTAL,
    OCR,
    BOTH
};

// What happens to images classified as screenshots
enum class RelocationMode
{
    NONE,
    MOVE,
    COPY
};

// How results are presented
enum class OutputFormat
{
    CONSOLE, // Interactive, colored
    SCRIPT,  // Plain key=value lines
    JSON     // One JSON object per line
};

// Fully resolved run configuration, never modified once the run starts
struct RunConfig
{
    // Input
    std::string input_directory = ".";

    // Detection
    DetectionMode mode = DetectionMode::BOTH;
    int worker_count = 8;               // Persistent workers, each with its own detector
    int queue_factor = 2;               // Task queue capacity = worker_count * queue_factor
    int ocr_min_chars = 10;             // Minimum recognized characters for a screenshot
    double ocr_min_confidence = 0.6;    // Minimum average OCR confidence (0..1)
    double ocr_resize_factor = 1.0;     // Downscale before OCR, (0..1]
    bool extra_heuristics = true;       // Caption / dense-text rules on top of the threshold rule
    bool gpu_enabled = true;            // Use OpenCL when available
    std::string tessdata_path;          // Empty = tesseract default location
    std::string ocr_language = "eng";

    // Relocation
    RelocationMode relocation = RelocationMode::NONE;
    std::string relocation_target;

    // Presentation
    OutputFormat output = OutputFormat::CONSOLE;
    int serve_port = 0; // 0 = status service disabled
    std::string log_file;
    bool debug = false;
    bool quiet = false;
};

namespace config
{
    static const int kMinWorkers = 1;
    static const int kMaxWorkers = 32;

    // Names used on the command line, in config files and in logs
    std::string toString(DetectionMode mode);
    std::string toString(RelocationMode mode);
    std::string toString(OutputFormat format);
    bool parseDetectionMode(const std::string &text, DetectionMode &mode);
    bool parseRelocationMode(const std::string &text, RelocationMode &mode);

    // Overlay values from a JSON config file; throws std::runtime_error on unreadable or malformed files
    void loadFile(const std::string &path, RunConfig &cfg);

    // Overlay command line flags (CLI wins over the config file)
    void applyArgs(int argc, char **argv, RunConfig &cfg);

    // Defaults -> optional --config file -> command line
    RunConfig resolve(int argc, char **argv);

    // Every problem found, empty when the configuration is usable
    std::vector<std::string> validate(const RunConfig &cfg);

    bool usesOcr(const RunConfig &cfg);
    bool usesHorizontal(const RunConfig &cfg);

} // namespace config
