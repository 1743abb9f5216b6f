#pragma once

#include "config.hpp"
#include "http_client.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace issue_harvest {

enum class RunMode { Full, ScrapeOnly, TransformOnly };

struct CliOptions {
    Config  cfg;
    RunMode mode  = RunMode::Full;
    bool    reset = false;
};

/// Builds the transport for a scrape run; only called when scraping.
using ClientFactory = std::function<std::unique_ptr<HttpClient>(const Config&)>;

void printUsage(std::ostream& os);

/// Parse the arguments that follow the program name.  --config files are
/// applied first, then every other flag on top of them.  Returns
/// std::nullopt after printing usage for --help.  Throws
/// std::invalid_argument on unknown flags, bad values, conflicting modes or
/// an invalid resulting config.
std::optional<CliOptions> parseArgs(const std::vector<std::string>& args);

/// Run the stages selected by @p opts.  Sources that fail are listed in the
/// stage summary and do not change the result; returns 0 on completion or
/// interrupt.  Exceptions escaping a stage propagate.
int runPipeline(const CliOptions& opts, const ClientFactory& makeClient);

/// Whole command line to exit code: 0 on success, --help or interrupt;
/// 1 on argument/config errors or an error that escapes the pipeline.
int runCli(const std::vector<std::string>& args, const ClientFactory& makeClient);

} // namespace issue_harvest
