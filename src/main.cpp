#include "cli.hpp"
#include "http_client.hpp"
#include "interrupt.hpp"

#include <memory>
#include <string>
#include <utility>
#include <vector>

int main(int argc, char* argv[]) {
    issue_harvest::installInterruptHandlers();

    const std::vector<std::string> args(argv + 1, argv + argc);
    return issue_harvest::runCli(args, [](const issue_harvest::Config& cfg) {
        auto client = std::make_unique<issue_harvest::BeastHttpClient>(
            cfg.baseUrl, cfg.requestTimeoutMs);
        client->setVerbose(cfg.verbose);
        return std::unique_ptr<issue_harvest::HttpClient>(std::move(client));
    });
}
