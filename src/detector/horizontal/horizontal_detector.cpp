#include <opencv2/imgcodecs.hpp>
#include <opencv2/core/ocl.hpp>
#include <chrono>
#include <new>

#include "horizontal_detector.hpp"
#include "utils.hpp"

using namespace cv;
using namespace std;

HorizontalDetector::HorizontalDetector(bool gpu_enabled, const edge_processing::EdgeParams &params)
    : initialized(false), gpu_requested(gpu_enabled), use_opencl(false), params(params)
{
}

bool HorizontalDetector::configureOpenCL(bool gpu_enabled)
{
    // Process-wide OpenCV switch, set once before any worker starts
    ocl::setUseOpenCL(gpu_enabled && ocl::haveOpenCL());
    bool active = ocl::useOpenCL();

    if (active)
        log_info("Using OpenCL acceleration for horizontal edge detection");
    else if (gpu_enabled)
        log_warning("GPU requested but not available, using CPU");

    return active;
}

void HorizontalDetector::initialize()
{
    use_opencl = gpu_requested && ocl::useOpenCL();
    initialized = true;
}

DetectionOutcome HorizontalDetector::classify(const string &path)
{
    Mat gray;
    try
    {
        gray = imread(path, IMREAD_GRAYSCALE);
    }
    catch (const cv::Exception &e)
    {
        throw DecodeError("Failed to open image: " + string(e.what()));
    }
    catch (const bad_alloc &)
    {
        throw ResourceExhaustedError("Image too large to process");
    }

    if (gray.empty())
    {
        throw DecodeError("Failed to open image: unsupported or corrupt file");
    }

    return classifyImage(gray);
}

DetectionOutcome HorizontalDetector::classifyImage(const Mat &image)
{
    auto start_time = chrono::steady_clock::now();

    DetectionOutcome outcome;
    outcome.method = DetectionMethod::HORIZONTAL;

    try
    {
        edge_processing::EdgeResult result = edge_processing::processEdges(image, params, use_opencl);
        outcome.screenshot = result.screenshot;
        outcome.score = static_cast<double>(result.line_rows.size());
    }
    catch (const cv::Exception &e)
    {
        throw DetectionError("Horizontal edge detection failed: " + string(e.what()));
    }
    catch (const bad_alloc &)
    {
        throw ResourceExhaustedError("Image too large to process");
    }

    auto end_time = chrono::steady_clock::now();
    outcome.processing_time_ms = static_cast<int>(chrono::duration_cast<chrono::milliseconds>(end_time - start_time).count());
    return outcome;
}
