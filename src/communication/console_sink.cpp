#include "console_sink.hpp"
#include "utils.hpp"
#include <iomanip>
#include <mutex>
#include <sstream>

using namespace std;

namespace
{
    const string kReset = "\033[0m";
    const string kGray = "\033[90m";
    const string kCyan = "\033[36m";

    string verdictColor(Verdict verdict)
    {
        switch (verdict)
        {
        case Verdict::SCREENSHOT:
            return "\033[92m";
        case Verdict::REGULAR:
            return "\033[37m";
        case Verdict::ERROR:
            return "\033[91m";
        }
        return kReset;
    }

    // Values containing spaces are quoted so the line still splits on blanks
    string scriptValue(const string &value)
    {
        if (value.find_first_of(" \t\"") == string::npos)
            return value;

        string quoted = "\"";
        for (char c : value)
        {
            if (c == '"' || c == '\\')
                quoted += '\\';
            quoted += c;
        }
        return quoted + "\"";
    }
}

ConsoleSink::ConsoleSink(bool script_mode, ostream &out) : script_mode_(script_mode), out_(out)
{
}

void ConsoleSink::onRunStarted(const RunConfig &cfg, int workers_ready)
{
    lock_guard<mutex> lock(logging::outputMutex());

    if (script_mode_)
    {
        out_ << "event=start directory=" << scriptValue(cfg.input_directory)
             << " mode=" << config::toString(cfg.mode)
             << " workers=" << workers_ready << endl;
        return;
    }

    out_ << "Classifying images in " << kCyan << cfg.input_directory << kReset
         << " with " << workers_ready << " workers (" << config::toString(cfg.mode) << ")" << endl;
}

void ConsoleSink::onResult(const ResultRecord &record)
{
    lock_guard<mutex> lock(logging::outputMutex());

    if (script_mode_)
        printScriptLine(record);
    else
        printResultLine(record);
}

void ConsoleSink::printResultLine(const ResultRecord &record)
{
    const ClassificationResult &result = record.result;

    out_ << kGray << "[" << record.result.index << "] " << kReset
         << verdictColor(result.verdict) << left << setw(10) << toString(result.verdict) << kReset
         << " " << result.path;

    if (result.verdict == Verdict::ERROR)
    {
        out_ << " " << verdictColor(Verdict::ERROR) << "(" << result.error << ")" << kReset << endl;
        return;
    }

    out_ << kGray << " (" << toString(result.method) << ", " << result.processing_time_ms << " ms)" << kReset;

    if (!record.destination.empty())
        out_ << " -> " << record.destination;
    else if (!record.relocation_error.empty())
        out_ << " " << verdictColor(Verdict::ERROR) << "(not relocated: " << record.relocation_error << ")" << kReset;

    out_ << endl;
}

void ConsoleSink::printScriptLine(const ResultRecord &record)
{
    const ClassificationResult &result = record.result;

    out_ << "event=result"
         << " index=" << result.index
         << " file=" << scriptValue(result.path)
         << " classification=" << toString(result.verdict)
         << " method=" << toString(result.method)
         << " duration_ms=" << result.processing_time_ms
         << " action=" << actionName(record.action);

    if (!record.destination.empty())
        out_ << " destination=" << scriptValue(record.destination);
    if (!result.error.empty())
        out_ << " error=" << scriptValue(result.error);
    if (!record.relocation_error.empty())
        out_ << " relocation_error=" << scriptValue(record.relocation_error);

    out_ << endl;
}

void ConsoleSink::onSummary(const RunSummary &summary)
{
    lock_guard<mutex> lock(logging::outputMutex());

    if (script_mode_)
        printScriptSummary(summary);
    else
        printSummaryBox(summary);
}

void ConsoleSink::printSummaryBox(const RunSummary &summary)
{
    const StatisticsSnapshot &stats = summary.stats;

    string title = "Classification complete";
    if (summary.outcome == RunOutcome::CANCELLED)
        title = "Classification interrupted";
    else if (!summary.failure_reason.empty())
        title = "Classification failed";

    out_ << "=====================================\n";
    out_ << "  " << title << "\n";
    out_ << "=====================================\n";

    if (!summary.failure_reason.empty())
        out_ << "  Reason:       " << summary.failure_reason << "\n";

    out_ << "  Images:       " << stats.total << " of " << summary.files_enumerated << "\n";
    out_ << "  Screenshots:  " << stats.screenshots << "\n";
    out_ << "  Regular:      " << stats.regular << "\n";
    out_ << "  Errors:       " << stats.errors << "\n";
    out_ << "  Workers:      " << summary.workers_ready << " of " << summary.workers_requested << "\n";

    if (summary.relocation != RelocationMode::NONE)
    {
        out_ << "  " << (summary.relocation == RelocationMode::MOVE ? "Moved to:     " : "Copied to:    ")
             << summary.relocation_target << " (" << stats.relocated << " files";
        if (stats.relocation_failures > 0)
            out_ << ", " << stats.relocation_failures << " failed";
        out_ << ")\n";
    }

    ostringstream seconds;
    seconds << fixed << setprecision(1) << summary.elapsed_ms / 1000.0;
    out_ << "  Elapsed:      " << seconds.str() << " s\n";
    out_ << "-------------------------------------" << endl;
}

void ConsoleSink::printScriptSummary(const RunSummary &summary)
{
    const StatisticsSnapshot &stats = summary.stats;

    string outcome = "success";
    if (summary.outcome == RunOutcome::CANCELLED)
        outcome = "cancelled";
    else if (summary.outcome == RunOutcome::FAILURE)
        outcome = "failure";

    out_ << "event=summary"
         << " outcome=" << outcome
         << " total_files=" << stats.total
         << " screenshots=" << stats.screenshots
         << " regular=" << stats.regular
         << " errors=" << stats.errors
         << " action=" << actionName(summary.relocation);

    if (summary.relocation != RelocationMode::NONE)
        out_ << " destination=" << scriptValue(summary.relocation_target)
             << " relocated=" << stats.relocated
             << " relocation_failures=" << stats.relocation_failures;

    out_ << endl;
}
