#include "status_service.hpp"
#include "json_sink.hpp"
#include "utils.hpp"

using namespace std;
using json = nlohmann::json;

StatusService::StatusService(const RunStatistics &stats, int port) : stats_(stats), port_(port)
{
}

StatusService::~StatusService()
{
    stop();
}

bool StatusService::start()
{
    if (running_)
        return true;

    server_ = make_unique<httplib::Server>();
    server_->set_default_headers({{"Access-Control-Allow-Origin", "*"},
                                  {"Access-Control-Allow-Methods", "GET, OPTIONS"},
                                  {"Access-Control-Allow-Headers", "Content-Type"}});

    server_->Get("/health", [](const httplib::Request &, httplib::Response &res)
                 { res.set_content("{\"status\":\"ok\",\"service\":\"ssdetect\"}", "application/json"); });

    server_->Get("/stats", [this](const httplib::Request &, httplib::Response &res)
                 { res.set_content(statsJson().dump(), "application/json"); });

    server_->Get("/results", [this](const httplib::Request &, httplib::Response &res)
                 { res.set_content(resultsJson().dump(), "application/json"); });

    if (!server_->bind_to_port("0.0.0.0", port_))
    {
        log_error("Failed to bind status service to port " + to_string(port_));
        server_.reset();
        return false;
    }

    running_ = true;
    server_thread_ = thread(&StatusService::run, this);
    log_info("Status service listening on port " + log_string(port_));
    return true;
}

void StatusService::run()
{
    try
    {
        if (!server_->listen_after_bind())
        {
            log_warning("Status service stopped listening");
        }
    }
    catch (const exception &e)
    {
        log_error("Status service failed: " + string(e.what()));
    }
    running_ = false;
}

void StatusService::stop()
{
    if (server_)
    {
        server_->stop();
    }
    if (server_thread_.joinable())
    {
        server_thread_.join();
        log_debug("Status service stopped");
    }
    running_ = false;
}

void StatusService::onRunStarted(const RunConfig &cfg, int workers_ready)
{
    lock_guard<mutex> lock(mutex_);
    run_info_["directory"] = cfg.input_directory;
    run_info_["mode"] = config::toString(cfg.mode);
    run_info_["workers"] = workers_ready;
}

void StatusService::onResult(const ResultRecord &record)
{
    json line = JsonSink::formatResult(record);

    lock_guard<mutex> lock(mutex_);
    recent_.push_back(std::move(line));
    while (recent_.size() > kRecentResults)
    {
        recent_.pop_front();
    }
}

void StatusService::onSummary(const RunSummary &summary)
{
    json line = JsonSink::formatSummary(summary);

    lock_guard<mutex> lock(mutex_);
    summary_ = std::move(line);
}

json StatusService::statsJson() const
{
    StatisticsSnapshot snap = stats_.snapshot();

    json stats;
    stats["total"] = snap.total;
    stats["screenshots"] = snap.screenshots;
    stats["regular"] = snap.regular;
    stats["errors"] = snap.errors;
    stats["by_method"] = {{"horizontal", snap.by_horizontal}, {"ocr", snap.by_ocr}, {"none", snap.by_none}};
    stats["cumulative_ms"] = snap.cumulative_ms;
    stats["relocated"] = snap.relocated;
    stats["relocation_failures"] = snap.relocation_failures;
    stats["sidecars_relocated"] = snap.sidecars_relocated;
    stats["sidecar_failures"] = snap.sidecar_failures;

    lock_guard<mutex> lock(mutex_);
    stats["finished"] = !summary_.is_null();
    if (!run_info_.is_null())
        stats["run"] = run_info_;
    if (!summary_.is_null())
        stats["summary"] = summary_;
    return stats;
}

json StatusService::resultsJson() const
{
    lock_guard<mutex> lock(mutex_);
    json results = json::array();
    for (const auto &line : recent_)
    {
        results.push_back(line);
    }
    return results;
}
