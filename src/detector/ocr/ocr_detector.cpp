#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <chrono>
#include <new>
#include <cctype>

#include <tesseract/baseapi.h>
#include <tesseract/resultiterator.h>

#include "ocr_detector.hpp"
#include "utils.hpp"

using namespace cv;
using namespace std;

OcrDetector::OcrDetector(const string &tessdata_path, const string &language,
                         double resize_factor, bool gpu_enabled,
                         const text_processing::TextParams &params)
    : initialized(false), tessdata_path(tessdata_path), language(language),
      resize_factor(resize_factor), gpu_requested(gpu_enabled), params(params)
{
}

OcrDetector::~OcrDetector()
{
    terminate();
}

void OcrDetector::initialize()
{
    if (initialized)
        return;

    if (gpu_requested)
    {
        log_debug("Tesseract has no GPU backend, OCR runs on the CPU");
    }

    api = make_unique<tesseract::TessBaseAPI>();
    const char *datapath = tessdata_path.empty() ? nullptr : tessdata_path.c_str();
    if (api->Init(datapath, language.c_str()) != 0)
    {
        api.reset();
        throw ModelLoadError("Failed to initialize OCR: cannot load tesseract language '" + language + "'" +
                             (tessdata_path.empty() ? string() : " from " + tessdata_path));
    }

    api->SetPageSegMode(tesseract::PSM_AUTO);
    initialized = true;
    log_debug("Tesseract " + string(tesseract::TessBaseAPI::Version()) + " loaded (" + language + ")");
}

void OcrDetector::terminate()
{
    if (api)
    {
        api->End();
        api.reset();
    }
    initialized = false;
}

vector<text_processing::TextRegion> OcrDetector::recognize(const Mat &gray)
{
    vector<text_processing::TextRegion> regions;

    api->SetImage(gray.data, gray.cols, gray.rows, 1, static_cast<int>(gray.step));
    if (api->Recognize(nullptr) != 0)
    {
        api->Clear();
        throw DetectionError("OCR failed: recognition error");
    }

    const tesseract::PageIteratorLevel level = tesseract::RIL_TEXTLINE;
    unique_ptr<tesseract::ResultIterator> it(api->GetIterator());
    if (it)
    {
        do
        {
            if (it->Empty(level))
                continue;

            unique_ptr<char[]> text(it->GetUTF8Text(level));
            if (!text)
                continue;

            string line(text.get());
            while (!line.empty() && isspace(static_cast<unsigned char>(line.back())))
                line.pop_back();
            if (line.empty())
                continue;

            int left = 0, top = 0, right = 0, bottom = 0;
            it->BoundingBox(level, &left, &top, &right, &bottom);

            text_processing::TextRegion region;
            region.text = line;
            region.confidence = it->Confidence(level) / 100.0;
            region.top = top;
            region.bottom = bottom;
            regions.push_back(region);
        } while (it->Next(level));
    }

    api->Clear();
    return regions;
}

DetectionOutcome OcrDetector::classify(const string &path)
{
    if (!initialized)
    {
        throw DetectionError("OCR not initialized");
    }

    auto start_time = chrono::steady_clock::now();

    DetectionOutcome outcome;
    outcome.method = DetectionMethod::OCR;

    try
    {
        Mat image = imread(path, IMREAD_COLOR);
        if (image.empty())
        {
            throw DecodeError("Failed to open image: unsupported or corrupt file");
        }

        if (resize_factor > 0.0 && resize_factor < 1.0)
        {
            resize(image, image, Size(), resize_factor, resize_factor, INTER_AREA);
        }

        Mat gray;
        cvtColor(image, gray, COLOR_BGR2GRAY);

        vector<text_processing::TextRegion> regions = recognize(gray);
        text_processing::TextAnalysis analysis = text_processing::evaluate(regions, gray.rows, params);

        outcome.screenshot = analysis.screenshot;
        outcome.score = analysis.total_chars;
    }
    catch (const cv::Exception &e)
    {
        throw DetectionError("OCR failed: " + string(e.what()));
    }
    catch (const bad_alloc &)
    {
        throw ResourceExhaustedError("Image too large to process");
    }

    auto end_time = chrono::steady_clock::now();
    outcome.processing_time_ms = static_cast<int>(chrono::duration_cast<chrono::milliseconds>(end_time - start_time).count());
    return outcome;
}
