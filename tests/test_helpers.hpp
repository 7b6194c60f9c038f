#pragma once
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <random>
#include <string>
#include <thread>
#include <vector>
#include "detector/detector_interface.hpp"
#include "communication/result_sink.hpp"
#include "utils/errors.hpp"

namespace testing_helpers
{
    // Fresh directory under the system temp dir, removed with everything in it
    class TempDir
    {
    public:
        TempDir()
        {
            std::random_device rd;
            std::mt19937_64 gen(rd());
            path_ = std::filesystem::temp_directory_path() / ("ssdetect_test_" + std::to_string(gen()));
            std::filesystem::create_directories(path_);
        }

        ~TempDir()
        {
            std::error_code ec;
            std::filesystem::remove_all(path_, ec);
        }

        TempDir(const TempDir &) = delete;
        TempDir &operator=(const TempDir &) = delete;

        const std::filesystem::path &path() const { return path_; }

    private:
        std::filesystem::path path_;
    };

    // Writes a file with the given content, creating parent directories
    inline std::filesystem::path touch(const std::filesystem::path &path, const std::string &content = "x")
    {
        std::filesystem::create_directories(path.parent_path());
        std::ofstream out(path, std::ios::binary);
        out << content;
        return path;
    }

    inline std::string readFile(const std::filesystem::path &path)
    {
        std::ifstream in(path, std::ios::binary);
        return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    }

    // Detector driven by file names: "shot" in the name is a screenshot,
    // "broken" fails to decode, "crash" throws from the detector.
    // When given, completed counts every classification that ran to its end.
    class FakeDetector : public DetectorInterface
    {
    public:
        explicit FakeDetector(DetectionMethod method = DetectionMethod::HORIZONTAL,
                              bool fail_init = false,
                              int delay_ms = 0,
                              std::atomic<int> *completed = nullptr)
            : method_(method), fail_init_(fail_init), delay_ms_(delay_ms), completed_(completed)
        {
        }

        void initialize() override
        {
            if (fail_init_)
                throw ModelLoadError("fake model missing");
            initialized_ = true;
        }

        bool isInitialized() const override { return initialized_; }

        DetectionOutcome classify(const std::string &path) override
        {
            calls_++;
            if (delay_ms_ > 0)
                std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms_));
            if (completed_)
                (*completed_)++;

            std::string name = std::filesystem::path(path).filename().string();
            if (name.find("broken") != std::string::npos)
                throw DecodeError("Failed to open image: " + name);
            if (name.find("crash") != std::string::npos)
                throw DetectionError("detector crashed on " + name);

            DetectionOutcome outcome;
            outcome.method = method_;
            outcome.screenshot = name.find("shot") != std::string::npos;
            outcome.score = outcome.screenshot ? 1.0 : 0.0;
            outcome.processing_time_ms = 1;
            return outcome;
        }

        void terminate() override
        {
            terminated_ = true;
            initialized_ = false;
        }

        std::string name() const override { return "fake"; }

        int calls() const { return calls_.load(); }
        bool terminated() const { return terminated_; }

    private:
        DetectionMethod method_;
        bool fail_init_;
        int delay_ms_;
        std::atomic<int> *completed_;
        bool initialized_ = false;
        bool terminated_ = false;
        std::atomic<int> calls_{0};
    };

    // Keeps everything it is handed
    class RecordingSink : public ResultSink
    {
    public:
        void onRunStarted(const RunConfig &, int workers_ready) override
        {
            std::lock_guard<std::mutex> lock(mutex_);
            started = true;
            ready_workers = workers_ready;
        }

        void onResult(const ResultRecord &record) override
        {
            std::lock_guard<std::mutex> lock(mutex_);
            records.push_back(record);
        }

        void onSummary(const RunSummary &summary) override
        {
            std::lock_guard<std::mutex> lock(mutex_);
            summaries.push_back(summary);
        }

        bool started = false;
        int ready_workers = 0;
        std::vector<ResultRecord> records;
        std::vector<RunSummary> summaries;

    private:
        std::mutex mutex_;
    };

} // namespace testing_helpers
