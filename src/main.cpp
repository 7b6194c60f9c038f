#include "config/run_config.hpp"
#include "detector/detector_factory.hpp"
#include "engine/run_coordinator.hpp"
#include "communication/console_sink.hpp"
#include "communication/json_sink.hpp"
#include "communication/status_service.hpp"
#include "utils/args.hpp"
#include "utils/debug.hpp"
#include "utils/signals.hpp"
#include "utils/logging.hpp"
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace std;

// version string for the application
const string version = "0.1.0";

int main(int argc, char **argv)
{
  // Check for help or version flags first
  if (hasFlag(argc, argv, "--version"))
    debug::printVersionAndExit(version);
  if (hasFlag(argc, argv, "--help"))
    debug::printHelpAndExit();

  RunConfig cfg;
  try
  {
    cfg = config::resolve(argc, argv);
  }
  catch (const exception &e)
  {
    log_error(string(e.what()));
    return 1;
  }

  vector<string> problems = config::validate(cfg);
  if (!problems.empty())
  {
    for (const auto &problem : problems)
      log_error(problem);
    return 1;
  }

  // Logs follow the result format so a pipe never sees colour codes
  if (cfg.output == OutputFormat::JSON)
    logging::setLogFormat(logging::LogFormat::JSON);
  else if (cfg.output == OutputFormat::SCRIPT)
    logging::setLogFormat(logging::LogFormat::PLAIN);

  // set log level based on debug mode
  if (cfg.debug)
  {
    logging::setLogLevel(logging::LogLevel::DEBUG);
    log_info("Debug mode enabled - showing all log messages");
  }
  else if (cfg.quiet)
  {
    logging::setLogLevel(logging::LogLevel::ERROR);
  }

  if (!cfg.log_file.empty())
    logging::setFileLogging(true, cfg.log_file);

  if (cfg.output == OutputFormat::CONSOLE && !cfg.quiet)
  {
    debug::printStartup("ssdetect", version);
    debug::printConfig(cfg);
  }

  CancellationToken cancel;
  signals::setupSignalHandlers(cancel);

  auto shared = make_shared<const RunConfig>(cfg);

  unique_ptr<ResultSink> output;
  if (cfg.output == OutputFormat::JSON)
    output = make_unique<JsonSink>();
  else
    output = make_unique<ConsoleSink>(cfg.output == OutputFormat::SCRIPT);

  if (config::usesHorizontal(cfg))
    HorizontalDetector::configureOpenCL(cfg.gpu_enabled);

  auto builder = [shared]()
  { return DetectorFactory::createDetector(*shared); };

  RunCoordinator coordinator(shared, builder, {output.get()}, cancel);

  // Live status reads the coordinator's counters
  unique_ptr<StatusService> status;
  if (cfg.serve_port > 0)
  {
    status = make_unique<StatusService>(coordinator.statistics(), cfg.serve_port);
    if (status->start())
      coordinator.addSink(status.get());
  }

  RunSummary summary = coordinator.run();

  signals::resetSignalHandlers();
  if (status)
    status->stop();
  return exitCode(summary.outcome);
}
