#pragma once
#include <iostream>
#include "result_sink.hpp"

// Human readable output. Interactive mode prints coloured progress lines and a
// summary box; script mode prints plain key=value lines meant for grep and awk.
class ConsoleSink : public ResultSink
{
public:
    explicit ConsoleSink(bool script_mode = false, std::ostream &out = std::cout);

    void onRunStarted(const RunConfig &cfg, int workers_ready) override;
    void onResult(const ResultRecord &record) override;
    void onSummary(const RunSummary &summary) override;

private:
    void printResultLine(const ResultRecord &record);
    void printScriptLine(const ResultRecord &record);
    void printSummaryBox(const RunSummary &summary);
    void printScriptSummary(const RunSummary &summary);

    bool script_mode_;
    std::ostream &out_;
};
