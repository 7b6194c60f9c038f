#include "run_config.hpp"
#include "utils.hpp"
#include "utils/args.hpp"
#include <fstream>
#include <stdexcept>
#include <nlohmann/json.hpp>

using namespace std;
using json = nlohmann::json;

namespace config
{
    string toString(DetectionMode mode)
    {
        switch (mode)
        {
        case DetectionMode::HORIZONTAL:
            return "horizontal";
        case DetectionMode::OCR:
            return "ocr";
        case DetectionMode::BOTH:
            return "both";
        }
        return "unknown";
    }

    string toString(RelocationMode mode)
    {
        switch (mode)
        {
        case RelocationMode::NONE:
            return "none";
        case RelocationMode::MOVE:
            return "move";
        case RelocationMode::COPY:
            return "copy";
        }
        return "unknown";
    }

    string toString(OutputFormat format)
    {
        switch (format)
        {
        case OutputFormat::CONSOLE:
            return "console";
        case OutputFormat::SCRIPT:
            return "script";
        case OutputFormat::JSON:
            return "json";
        }
        return "unknown";
    }

    bool parseDetectionMode(const string &text, DetectionMode &mode)
    {
        if (text == "horizontal")
            mode = DetectionMode::HORIZONTAL;
        else if (text == "ocr")
            mode = DetectionMode::OCR;
        else if (text == "both")
            mode = DetectionMode::BOTH;
        else
            return false;
        return true;
    }

    bool parseRelocationMode(const string &text, RelocationMode &mode)
    {
        if (text == "none")
            mode = RelocationMode::NONE;
        else if (text == "move")
            mode = RelocationMode::MOVE;
        else if (text == "copy")
            mode = RelocationMode::COPY;
        else
            return false;
        return true;
    }

    void loadFile(const string &path, RunConfig &cfg)
    {
        ifstream file(path);
        if (!file)
        {
            throw runtime_error("Cannot open config file: " + path);
        }

        json j;
        try
        {
            file >> j;
        }
        catch (const json::exception &e)
        {
            throw runtime_error("Invalid JSON in config file " + path + ": " + e.what());
        }

        try
        {
            if (j.contains("mode"))
            {
                if (!parseDetectionMode(j["mode"].get<string>(), cfg.mode))
                    throw runtime_error("unknown mode '" + j["mode"].get<string>() + "'");
            }
            if (j.contains("relocation"))
            {
                if (!parseRelocationMode(j["relocation"].get<string>(), cfg.relocation))
                    throw runtime_error("unknown relocation '" + j["relocation"].get<string>() + "'");
            }

            if (j.contains("output"))
            {
                string output = j["output"].get<string>();
                if (output == "console")
                    cfg.output = OutputFormat::CONSOLE;
                else if (output == "script")
                    cfg.output = OutputFormat::SCRIPT;
                else if (output == "json")
                    cfg.output = OutputFormat::JSON;
                else
                    throw runtime_error("unknown output '" + output + "'");
            }

            cfg.input_directory = j.value("input_directory", cfg.input_directory);
            cfg.worker_count = j.value("worker_count", cfg.worker_count);
            cfg.queue_factor = j.value("queue_factor", cfg.queue_factor);
            cfg.ocr_min_chars = j.value("ocr_min_chars", cfg.ocr_min_chars);
            cfg.ocr_min_confidence = j.value("ocr_min_confidence", cfg.ocr_min_confidence);
            cfg.ocr_resize_factor = j.value("ocr_resize_factor", cfg.ocr_resize_factor);
            cfg.extra_heuristics = j.value("extra_heuristics", cfg.extra_heuristics);
            cfg.gpu_enabled = j.value("gpu_enabled", cfg.gpu_enabled);
            cfg.tessdata_path = j.value("tessdata_path", cfg.tessdata_path);
            cfg.ocr_language = j.value("ocr_language", cfg.ocr_language);
            cfg.relocation_target = j.value("relocation_target", cfg.relocation_target);
            cfg.serve_port = j.value("serve_port", cfg.serve_port);
            cfg.log_file = j.value("log_file", cfg.log_file);
        }
        catch (const json::exception &e)
        {
            throw runtime_error("Invalid value in config file " + path + ": " + e.what());
        }
        catch (const runtime_error &e)
        {
            throw runtime_error("Invalid value in config file " + path + ": " + e.what());
        }

        log_debug("Loaded configuration from " + path);
    }

    void applyArgs(int argc, char **argv, RunConfig &cfg)
    {
        bool wantsMove = hasFlag(argc, argv, "--move");
        bool wantsCopy = hasFlag(argc, argv, "--copy");
        if (wantsMove && wantsCopy)
        {
            throw invalid_argument("--move and --copy cannot be used together");
        }
        if (wantsMove)
        {
            cfg.relocation = RelocationMode::MOVE;
            cfg.relocation_target = getArg(argc, argv, "--move", "");
        }
        else if (wantsCopy)
        {
            cfg.relocation = RelocationMode::COPY;
            cfg.relocation_target = getArg(argc, argv, "--copy", "");
        }

        // The last detection flag wins
        int ocrAt = lastFlagIndex(argc, argv, {"--ocr"});
        int horizontalAt = lastFlagIndex(argc, argv, {"--horizontal"});
        int bothAt = lastFlagIndex(argc, argv, {"--both"});
        int latest = max(ocrAt, max(horizontalAt, bothAt));
        if (latest > 0)
        {
            if (latest == ocrAt)
                cfg.mode = DetectionMode::OCR;
            else if (latest == horizontalAt)
                cfg.mode = DetectionMode::HORIZONTAL;
            else
                cfg.mode = DetectionMode::BOTH;
        }

        if (hasFlag(argc, argv, "--json"))
            cfg.output = OutputFormat::JSON;
        else if (hasFlag(argc, argv, "--script"))
            cfg.output = OutputFormat::SCRIPT;

        cfg.worker_count = getArg(argc, argv, "--workers", cfg.worker_count);
        cfg.ocr_min_chars = getArg(argc, argv, "--ocr-chars", cfg.ocr_min_chars);
        cfg.ocr_min_confidence = getArg(argc, argv, "--ocr-quality", cfg.ocr_min_confidence);
        cfg.ocr_resize_factor = getArg(argc, argv, "--ocr-resize", cfg.ocr_resize_factor);
        cfg.tessdata_path = getArg(argc, argv, "--tessdata", cfg.tessdata_path);
        cfg.serve_port = getArg(argc, argv, "--serve", cfg.serve_port);
        cfg.log_file = getArg(argc, argv, "--log-file", cfg.log_file);

        if (hasFlag(argc, argv, "--no-gpu"))
            cfg.gpu_enabled = false;

        int extraOn = lastFlagIndex(argc, argv, {"--extra-heuristics"});
        int extraOff = lastFlagIndex(argc, argv, {"--no-extra-heuristics"});
        if (extraOn > 0 || extraOff > 0)
            cfg.extra_heuristics = extraOn > extraOff;

        cfg.debug = hasFlag(argc, argv, "--debug") || hasFlag(argc, argv, "-d");
        cfg.quiet = hasFlag(argc, argv, "--quiet") || hasFlag(argc, argv, "-q");

        static const set<string> valueFlags = {"--move", "--copy", "--workers", "--ocr-chars", "--ocr-quality",
                                               "--ocr-resize", "--tessdata", "--config", "--serve", "--log-file"};
        vector<string> positional = getPositionalArgs(argc, argv, valueFlags);
        if (positional.size() > 1)
        {
            throw invalid_argument("Only one DIRECTORY may be given");
        }
        if (!positional.empty())
        {
            cfg.input_directory = positional.front();
        }
    }

    RunConfig resolve(int argc, char **argv)
    {
        RunConfig cfg;

        string configPath = getArg(argc, argv, "--config", "");
        if (!configPath.empty())
        {
            loadFile(configPath, cfg);
        }

        applyArgs(argc, argv, cfg);
        return cfg;
    }

    vector<string> validate(const RunConfig &cfg)
    {
        vector<string> problems;

        if (cfg.worker_count < kMinWorkers || cfg.worker_count > kMaxWorkers)
        {
            problems.push_back("--workers must be between " + to_string(kMinWorkers) + " and " + to_string(kMaxWorkers));
        }
        if (cfg.queue_factor < 1)
        {
            problems.push_back("queue_factor must be at least 1");
        }
        if (usesOcr(cfg))
        {
            if (cfg.ocr_min_chars < 0)
                problems.push_back("--ocr-chars must not be negative");
            if (cfg.ocr_min_confidence < 0.0 || cfg.ocr_min_confidence > 1.0)
                problems.push_back("--ocr-quality must be between 0.0 and 1.0");
            if (cfg.ocr_resize_factor <= 0.0 || cfg.ocr_resize_factor > 1.0)
                problems.push_back("--ocr-resize must be greater than 0.0 and at most 1.0");
        }
        if (cfg.relocation != RelocationMode::NONE && cfg.relocation_target.empty())
        {
            problems.push_back("--" + toString(cfg.relocation) + " requires a destination directory");
        }
        if (cfg.serve_port < 0 || cfg.serve_port > 65535)
        {
            problems.push_back("--serve must be a valid TCP port");
        }
        if (cfg.input_directory.empty())
        {
            problems.push_back("DIRECTORY must not be empty");
        }

        return problems;
    }

    bool usesOcr(const RunConfig &cfg)
    {
        return cfg.mode == DetectionMode::OCR || cfg.mode == DetectionMode::BOTH;
    }

    bool usesHorizontal(const RunConfig &cfg)
    {
        return cfg.mode == DetectionMode::HORIZONTAL || cfg.mode == DetectionMode::BOTH;
    }

} // namespace config
