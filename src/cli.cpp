#include "cli.hpp"
#include "pipeline.hpp"

#include <iostream>
#include <stdexcept>

namespace issue_harvest {

namespace {

int parseInt(const std::string& flag, const std::string& value) {
    try {
        std::size_t used = 0;
        const int n = std::stoi(value, &used);
        if (used != value.size()) throw std::invalid_argument(value);
        return n;
    } catch (const std::logic_error&) {
        throw std::invalid_argument(flag + " expects an integer, got '" + value + "'");
    }
}

const char* describe(RunMode mode) {
    switch (mode) {
        case RunMode::ScrapeOnly:    return "scrape only";
        case RunMode::TransformOnly: return "transform only";
        case RunMode::Full:          break;
    }
    return "scrape + transform";
}

} // namespace

void printUsage(std::ostream& os) {
    os  << "Usage: issue_harvest [options]\n\n"
        << "Scrapes issue-tracker search results into raw batch files and\n"
        << "turns them into JSONL training data.\n\n"
        << "Options:\n"
        << "  --scrape-only      Only run the scraping stage\n"
        << "  --transform-only   Only run the transformation stage\n"
        << "  --config FILE      JSON config file (applied before other flags)\n"
        << "  --project KEY      Source key to process (repeatable; replaces\n"
        << "                     the configured list)\n"
        << "  --base-url URL     REST API base URL\n"
        << "  --page-size N      Records per page               (default: 100)\n"
        << "  --data-dir DIR     Root for raw/, processed/, checkpoints/\n"
        << "                                                    (default: data)\n"
        << "  --reset            Delete checkpoints before scraping\n"
        << "  --verbose          Enable verbose diagnostics\n"
        << "  --help, -h         Show this message\n";
}

std::optional<CliOptions> parseArgs(const std::vector<std::string>& args) {
    CliOptions opts;
    bool scrapeOnly    = false;
    bool transformOnly = false;

    // The config file is the base layer, so find it first.
    for (std::size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "--config") {
            if (i + 1 >= args.size()) {
                throw std::invalid_argument("--config requires a value");
            }
            opts.cfg = loadConfigFile(args[i + 1], opts.cfg);
        }
    }

    std::vector<std::string> projects;
    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        auto needValue = [&]() -> std::string {
            if (i + 1 >= args.size()) {
                throw std::invalid_argument(arg + " requires a value");
            }
            return args[++i];
        };

        if (arg == "--scrape-only") {
            scrapeOnly = true;
        } else if (arg == "--transform-only") {
            transformOnly = true;
        } else if (arg == "--config") {
            ++i;  // already applied
        } else if (arg == "--project") {
            projects.push_back(needValue());
        } else if (arg == "--base-url") {
            opts.cfg.baseUrl = needValue();
        } else if (arg == "--page-size") {
            opts.cfg.pageSize = parseInt(arg, needValue());
        } else if (arg == "--data-dir") {
            opts.cfg.dataDir = needValue();
        } else if (arg == "--reset") {
            opts.reset = true;
        } else if (arg == "--verbose") {
            opts.cfg.verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage(std::cout);
            return std::nullopt;
        } else {
            throw std::invalid_argument("Unknown argument: " + arg);
        }
    }

    if (scrapeOnly && transformOnly) {
        throw std::invalid_argument(
            "Cannot use both --scrape-only and --transform-only");
    }
    opts.mode = scrapeOnly    ? RunMode::ScrapeOnly
              : transformOnly ? RunMode::TransformOnly
                              : RunMode::Full;

    if (!projects.empty()) {
        opts.cfg.sourceKeys = projects;
    }
    validateConfig(opts.cfg);
    return opts;
}

int runPipeline(const CliOptions& opts, const ClientFactory& makeClient) {
    const Config& cfg = opts.cfg;

    std::cout
        << "=== issue_harvest ===\n"
        << "Endpoint:   " << cfg.baseUrl  << "\n"
        << "Page size:  " << cfg.pageSize << "\n"
        << "Data dir:   " << cfg.dataDir  << "\n"
        << "Mode:       " << describe(opts.mode) << "\n"
        << "=====================\n";

    bool allSucceeded = true;

    if (opts.mode != RunMode::TransformOnly) {
        const std::unique_ptr<HttpClient> client = makeClient(cfg);
        const RunSummary scraped = scrapeAll(cfg, *client, opts.reset);
        if (scraped.interrupted) {
            std::cout << "\nPipeline interrupted by user. "
                      << "Progress has been saved; run again to resume.\n";
            return 0;
        }
        allSucceeded = allSucceeded && scraped.ok();
    }

    if (opts.mode != RunMode::ScrapeOnly) {
        const RunSummary transformed = transformAll(cfg);
        if (transformed.interrupted) {
            std::cout << "\nPipeline interrupted by user.\n";
            return 0;
        }
        allSucceeded = allSucceeded && transformed.ok();
    }

    std::cout << "\nResults under " << cfg.dataDir << "/:\n"
              << "  raw/          raw JSON batches\n"
              << "  processed/    JSONL training data\n"
              << "  checkpoints/  progress checkpoints\n";

    if (allSucceeded) {
        std::cout << "Pipeline completed successfully\n";
    } else {
        std::cout << "Pipeline completed; some sources failed (see summary)\n";
    }
    return 0;
}

int runCli(const std::vector<std::string>& args, const ClientFactory& makeClient) {
    std::optional<CliOptions> parsed;
    try {
        parsed = parseArgs(args);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n\n";
        printUsage(std::cerr);
        return 1;
    }
    if (!parsed) {
        return 0;
    }

    try {
        return runPipeline(*parsed, makeClient);
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}

} // namespace issue_harvest
