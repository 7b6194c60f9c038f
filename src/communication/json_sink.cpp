#include "json_sink.hpp"
#include "utils.hpp"
#include <mutex>

using namespace std;
using json = nlohmann::json;

JsonSink::JsonSink(ostream &out) : out_(out)
{
}

void JsonSink::write(const json &line)
{
    lock_guard<mutex> lock(logging::outputMutex());
    out_ << line.dump() << endl;
}

void JsonSink::onRunStarted(const RunConfig &cfg, int workers_ready)
{
    json line;
    line["level"] = "info";
    line["event"] = "Classification started";
    line["directory"] = cfg.input_directory;
    line["mode"] = config::toString(cfg.mode);
    line["workers"] = workers_ready;
    write(line);
}

json JsonSink::formatResult(const ResultRecord &record)
{
    const ClassificationResult &result = record.result;

    json line;
    line["file"] = result.path;
    line["index"] = record.result.index;

    if (result.verdict == Verdict::ERROR)
    {
        line["level"] = "error";
        line["event"] = "Failed to process image";
        line["error"] = result.error;
        return line;
    }

    line["level"] = "info";
    line["event"] = "Processed image";
    line["classification"] = toString(result.verdict);
    line["method"] = toString(result.method);
    line["duration_ms"] = result.processing_time_ms;
    line["action"] = actionName(record.action);

    if (!record.destination.empty())
        line["destination"] = record.destination;
    if (!record.sidecar_destinations.empty())
        line["sidecars"] = record.sidecar_destinations;
    if (!record.relocation_error.empty())
    {
        line["level"] = "warning";
        line["error"] = record.relocation_error;
    }

    return line;
}

json JsonSink::formatSummary(const RunSummary &summary)
{
    const StatisticsSnapshot &stats = summary.stats;

    json line;
    line["level"] = summary.outcome == RunOutcome::SUCCESS ? "info" : "warning";
    line["event"] = summary.outcome == RunOutcome::CANCELLED ? "Classification interrupted by user"
                                                             : "Classification complete";
    line["total_files"] = stats.total;
    line["screenshots"] = stats.screenshots;
    line["other_images"] = stats.regular;
    line["errors"] = stats.errors;
    line["action"] = actionName(summary.relocation);
    line["exit_code"] = exitCode(summary.outcome);
    line["duration_ms"] = summary.elapsed_ms;

    if (summary.relocation != RelocationMode::NONE)
    {
        line["destination"] = summary.relocation_target;
        line["relocated"] = stats.relocated;
        line["relocation_failures"] = stats.relocation_failures;
    }
    if (!summary.failure_reason.empty())
        line["error"] = summary.failure_reason;

    return line;
}

void JsonSink::onResult(const ResultRecord &record)
{
    write(formatResult(record));
}

void JsonSink::onSummary(const RunSummary &summary)
{
    write(formatSummary(summary));
}
