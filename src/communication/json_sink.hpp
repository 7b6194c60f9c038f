#pragma once
#include <iostream>
#include <nlohmann/json.hpp>
#include "result_sink.hpp"

// One JSON object per line on the output stream
class JsonSink : public ResultSink
{
public:
    explicit JsonSink(std::ostream &out = std::cout);

    void onRunStarted(const RunConfig &cfg, int workers_ready) override;
    void onResult(const ResultRecord &record) override;
    void onSummary(const RunSummary &summary) override;

    // Exposed for tests and for the status service
    static nlohmann::json formatResult(const ResultRecord &record);
    static nlohmann::json formatSummary(const RunSummary &summary);

private:
    void write(const nlohmann::json &line);

    std::ostream &out_;
};
