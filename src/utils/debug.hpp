#pragma once
#include <cstdlib>
#include <iostream>
#include <string>
#include "logging.hpp"
#include "config/run_config.hpp"

namespace debug
{

    // Print application startup banner
    inline void printStartup(const std::string &appName, const std::string &version)
    {
        std::cerr << "=====================================\n";
        std::cerr << "  " << appName << " v" << version << " starting...\n";
        std::cerr << "=====================================\n";
    }

    // Print configuration details
    inline void printConfig(const RunConfig &cfg)
    {
        std::cerr << "Configuration:\n";
        std::cerr << "  - Directory: " << cfg.input_directory << "\n";
        std::cerr << "  - Detection: " << config::toString(cfg.mode) << "\n";
        std::cerr << "  - Workers: " << cfg.worker_count << "\n";
        if (config::usesOcr(cfg))
        {
            std::cerr << "  - OCR: min " << cfg.ocr_min_chars << " chars, confidence " << cfg.ocr_min_confidence
                      << ", resize " << cfg.ocr_resize_factor
                      << (cfg.extra_heuristics ? ", extra heuristics" : "") << "\n";
            if (!cfg.tessdata_path.empty())
                std::cerr << "  - Tessdata: " << cfg.tessdata_path << "\n";
        }
        std::cerr << "  - GPU: " << (cfg.gpu_enabled ? "enabled" : "disabled") << "\n";
        if (cfg.relocation != RelocationMode::NONE)
            std::cerr << "  - " << (cfg.relocation == RelocationMode::MOVE ? "Move" : "Copy")
                      << " screenshots to: " << cfg.relocation_target << "\n";
        if (cfg.serve_port > 0)
            std::cerr << "  - Status service port: " << cfg.serve_port << "\n";
        std::cerr << "-------------------------------------" << std::endl;
    }

    // Print version information and exit
    inline void printVersionAndExit(const std::string &version)
    {
        std::cout << "ssdetect version: " << version << std::endl;
        exit(0);
    }

    // Print help message and exit
    inline void printHelpAndExit()
    {
        std::cout << "Usage: ssdetect [DIRECTORY] [options]\n";
        std::cout << "Classify the images below DIRECTORY (default: .) as screenshots or regular images.\n";
        std::cout << "Options:\n";
        std::cout << "  --move <dir>             Move screenshots into <dir>\n";
        std::cout << "  --copy <dir>             Copy screenshots into <dir>\n";
        std::cout << "  --json                   One JSON object per line\n";
        std::cout << "  --script                 Plain key=value lines\n";
        std::cout << "  --workers <n>            Number of workers, 1-32 (default: 8)\n";
        std::cout << "  --horizontal             Horizontal line detection only\n";
        std::cout << "  --ocr                    Text detection only\n";
        std::cout << "  --both                   Horizontal lines, then text (default)\n";
        std::cout << "  --ocr-chars <n>          Minimum recognized characters (default: 10)\n";
        std::cout << "  --ocr-quality <f>        Minimum OCR confidence, 0-1 (default: 0.6)\n";
        std::cout << "  --ocr-resize <f>         Scale images before OCR, 0-1 (default: 1.0)\n";
        std::cout << "  --extra-heuristics       Caption and dense-text rules (default)\n";
        std::cout << "  --no-extra-heuristics    Only the character and confidence thresholds\n";
        std::cout << "  --no-gpu                 Do not use OpenCL\n";
        std::cout << "  --tessdata <dir>         Tesseract language data directory\n";
        std::cout << "  --config <file>          JSON configuration file (command line wins)\n";
        std::cout << "  --serve <port>           Serve live status over HTTP\n";
        std::cout << "  --log-file <file>        Also append logs to <file>\n";
        std::cout << "  --debug, -d              Show all log messages\n";
        std::cout << "  --quiet, -q              Quiet mode (only show errors)\n";
        std::cout << "  --version                Show version information\n";
        std::cout << "  --help                   Show this help message\n";
        std::cout << "Exit codes: 0 success, 1 errors, 130 interrupted\n";
        exit(0);
    }

} // namespace debug
