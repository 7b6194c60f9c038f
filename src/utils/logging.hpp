#pragma once

#include <iostream>
#include <fstream>
#include <string>
#include <iomanip>
#include <chrono>
#include <sstream>
#include <mutex>
#include <algorithm>
#include <filesystem>
#include <nlohmann/json.hpp>

using namespace std;

namespace logging
{
    enum class LogLevel
    {
        ERROR = 0,   // Most important - always show
        WARNING = 1, // Important - usually show
        INFO = 2,    // Normal - sometimes show
        DEBUG = 3    // Least important - rarely show
    };

    // How console lines are rendered
    enum class LogFormat
    {
        CONSOLE, // Colored, human readable
        PLAIN,   // No colors, for scripts and pipes
        JSON     // One JSON object per line
    };

    // Global settings (shared by every translation unit)
    inline LogLevel globalLogLevel = LogLevel::INFO;
    inline LogFormat globalLogFormat = LogFormat::CONSOLE;
    inline bool showTimestamp = true;
    inline bool enableFileLogging = false;
    inline string logFilePath = "ssdetect.log";

    // Serializes every line written to stdout, logs and result sinks alike
    inline mutex &outputMutex()
    {
        static mutex m;
        return m;
    }

    inline void setLogLevel(LogLevel level)
    {
        globalLogLevel = level;
    }

    inline void setLogFormat(LogFormat format)
    {
        globalLogFormat = format;
    }

    inline void setShowTimestamp(bool show)
    {
        showTimestamp = show;
    }

    // Enable/disable file logging
    inline void setFileLogging(bool enable, const string &filepath = "ssdetect.log")
    {
        enableFileLogging = enable;
        logFilePath = filepath;

        if (enable)
        {
            // Create parent directory if it doesn't exist
            error_code ec;
            filesystem::path parent = filesystem::path(logFilePath).parent_path();
            if (!parent.empty())
                filesystem::create_directories(parent, ec);

            ofstream logFile(logFilePath, ios::app);
            if (logFile.is_open())
            {
                logFile << "\n========== ssdetect Session Started ==========\n";
                logFile.close();
            }
        }
    }

    // Get current timestamp as string
    inline string getCurrentTimestamp()
    {
        auto now = chrono::system_clock::now();
        auto time_t = chrono::system_clock::to_time_t(now);
        auto ms = chrono::duration_cast<chrono::milliseconds>(now.time_since_epoch()) % 1000;

        tm local{};
        localtime_r(&time_t, &local);

        stringstream ss;
        ss << put_time(&local, "%Y-%m-%d %H:%M:%S");
        ss << '.' << setfill('0') << setw(3) << ms.count();
        return ss.str();
    }

    inline string logLevelToString(LogLevel level)
    {
        switch (level)
        {
        case LogLevel::ERROR:
            return "ERROR";
        case LogLevel::WARNING:
            return "WARN";
        case LogLevel::INFO:
            return "INFO";
        case LogLevel::DEBUG:
            return "DEBUG";
        default:
            return "UNKNOWN";
        }
    }

// Helper macro to format numbers with color
#define log_string(value) ("\033[36m" + std::to_string(value) + "\033[0m")

    // Extract module name from function signature
    inline string extractModuleName(const string &function)
    {
        // Skip logging functions - they're not useful for module detection
        if (function.find("logging::") != string::npos ||
            function.find("extractModuleName") != string::npos)
        {
            return "SYSTEM";
        }

        // Look for "namespace::function" or "Class::method" -> "NAMESPACE"
        size_t parenPos = function.find('(');
        size_t colonPos = function.rfind("::", parenPos);
        if (colonPos != string::npos)
        {
            size_t startPos = 0;
            size_t spacePos = function.rfind(' ', colonPos);
            if (spacePos != string::npos)
            {
                startPos = spacePos + 1;
            }

            // Keep only the innermost scope (e.g. "engine::Worker" -> "Worker")
            string moduleName = function.substr(startPos, colonPos - startPos);
            size_t innerPos = moduleName.rfind("::");
            if (innerPos != string::npos)
            {
                moduleName = moduleName.substr(innerPos + 2);
            }

            transform(moduleName.begin(), moduleName.end(), moduleName.begin(), ::toupper);

            return moduleName;
        }

        return "SYSTEM";
    }

    // Strip ANSI color codes from strings (for file logging and plain output)
    inline string stripColorCodes(const string &text)
    {
        string result = text;
        size_t pos = 0;

        while ((pos = result.find("\033[", pos)) != string::npos)
        {
            size_t endPos = result.find('m', pos);
            if (endPos != string::npos)
            {
                result.erase(pos, endPos - pos + 1);
            }
            else
            {
                break; // Malformed escape sequence
            }
        }

        return result;
    }

    // Main logging function
    inline void log(const string &message, LogLevel level = LogLevel::INFO, const string &moduleName = "SYSTEM")
    {
        // Only print if the log level is at or below the global threshold (lower number = higher priority)
        if (level > globalLogLevel)
            return;

        string timestamp = getCurrentTimestamp();
        string levelStr = logLevelToString(level);
        string consoleMessage;

        if (globalLogFormat == LogFormat::JSON)
        {
            string lowered = levelStr;
            transform(lowered.begin(), lowered.end(), lowered.begin(), ::tolower);

            nlohmann::json line;
            line["timestamp"] = timestamp;
            line["level"] = lowered;
            line["module"] = moduleName;
            line["event"] = stripColorCodes(message);
            consoleMessage = line.dump();
        }
        else if (globalLogFormat == LogFormat::PLAIN)
        {
            if (showTimestamp)
                consoleMessage += "[" + timestamp + "]";
            consoleMessage += "[" + levelStr + "][" + moduleName + "] - " + stripColorCodes(message);
        }
        else
        {
            string timestampColor = "\033[32m"; // Green for timestamp
            string bracketColor = "\033[37m";   // White for brackets
            string moduleColor = "\033[90m";    // Gray for module name
            string levelColor = "";
            string resetCode = "\033[0m";

            switch (level)
            {
            case LogLevel::ERROR:
                levelColor = "\033[91m"; // Bright red
                break;
            case LogLevel::WARNING:
                levelColor = "\033[33m"; // Orange
                break;
            case LogLevel::INFO:
                levelColor = "\033[92m"; // Lime green
                break;
            case LogLevel::DEBUG:
                levelColor = "\033[34m"; // Blue
                break;
            }

            if (showTimestamp)
            {
                consoleMessage += bracketColor + "[" + timestampColor + timestamp + bracketColor + "]" + resetCode;
            }

            consoleMessage += bracketColor + "[" + levelColor + levelStr + bracketColor + "]";
            consoleMessage += bracketColor + "[" + moduleColor + moduleName + bracketColor + "]" + resetCode;
            consoleMessage += " - " + message;
        }

        lock_guard<mutex> lock(outputMutex());

        // Logs share stdout with result records; the interactive console keeps them on stderr
        if (globalLogFormat == LogFormat::CONSOLE)
            cerr << consoleMessage << endl;
        else
            cout << consoleMessage << endl;

        // File logging (always with timestamp, NO colors)
        if (enableFileLogging)
        {
            ofstream logFile(logFilePath, ios::app);
            if (logFile.is_open())
            {
                logFile << "[" << timestamp << "][" << levelStr << "][" << moduleName << "] - " << stripColorCodes(message) << endl;
            }
        }
    }

    inline void error(const string &message, const string &module = "SYSTEM")
    {
        log(message, LogLevel::ERROR, module);
    }

    inline void warning(const string &message, const string &module = "SYSTEM")
    {
        log(message, LogLevel::WARNING, module);
    }

    inline void info(const string &message, const string &module = "SYSTEM")
    {
        log(message, LogLevel::INFO, module);
    }

    inline void debug(const string &message, const string &module = "SYSTEM")
    {
        log(message, LogLevel::DEBUG, module);
    }

// Macros that auto-detect the module name
#define LOG_ERROR(message) logging::log(message, logging::LogLevel::ERROR, logging::extractModuleName(__PRETTY_FUNCTION__))
#define LOG_WARNING(message) logging::log(message, logging::LogLevel::WARNING, logging::extractModuleName(__PRETTY_FUNCTION__))
#define LOG_INFO(message) logging::log(message, logging::LogLevel::INFO, logging::extractModuleName(__PRETTY_FUNCTION__))
#define LOG_DEBUG(message) logging::log(message, logging::LogLevel::DEBUG, logging::extractModuleName(__PRETTY_FUNCTION__))

#define log_error(message) LOG_ERROR(message)
#define log_warning(message) LOG_WARNING(message)
#define log_info(message) LOG_INFO(message)
#define log_debug(message) LOG_DEBUG(message)

}
