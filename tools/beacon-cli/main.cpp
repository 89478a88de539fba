#include <cstdio>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <beacon/config/retrieval_config.h>
#include <beacon/retrieval/backing_store.h>
#include <beacon/retrieval/retrieval_orchestrator.h>

namespace {

using beacon::retrieval::RetrievalOrchestrator;

struct CliOptions {
    std::string configPath;
    std::string indexPath;
    std::string logLevel;
    bool pretty = false;

    // search
    std::string query;
    std::vector<std::string> context;
    std::vector<std::string> sources;
    std::vector<std::string> filters;
    int maxResults = 8;
    float threshold = 0.0f;
    bool noRecency = false;

    // patterns
    std::vector<std::string> symptoms;
};

void printJson(const nlohmann::json& j, bool pretty) {
    std::cout << (pretty ? j.dump(2) : j.dump()) << std::endl;
}

int reportError(const beacon::Error& error) {
    spdlog::error("{}: {}", beacon::errorToString(error.code), error.message);
    std::cerr << "Error: " << error.message << std::endl;
    return 1;
}

std::map<std::string, std::string> parseFilters(const std::vector<std::string>& raw) {
    std::map<std::string, std::string> out;
    for (const auto& item : raw) {
        auto eq = item.find('=');
        if (eq == std::string::npos || eq == 0) {
            spdlog::warn("Ignoring malformed filter '{}' (expected key=value)", item);
            continue;
        }
        out[item.substr(0, eq)] = item.substr(eq + 1);
    }
    return out;
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        spdlog::set_level(spdlog::level::warn);
        spdlog::set_pattern("[%H:%M:%S] [%l] %v");

        CliOptions opts;
        CLI::App app{"Beacon federated evidence retrieval", "beacon"};
        app.require_subcommand(1);
        app.add_option("-c,--config", opts.configPath, "Path to config.toml");
        app.add_option("--index", opts.indexPath, "JSON document index for the document adapter");
        app.add_option("--log-level", opts.logLevel,
                       "Log level (trace, debug, info, warn, error, off)");
        app.add_flag("--pretty", opts.pretty, "Indent JSON output");

        auto* searchCmd = app.add_subcommand("search", "Search all enabled knowledge sources");
        searchCmd->add_option("query", opts.query, "Query text")->required();
        searchCmd->add_option("-x,--context", opts.context, "Additional context (repeatable)");
        searchCmd->add_option("-s,--source", opts.sources,
                              "Restrict to adapter (document, pattern, playbook)");
        searchCmd->add_option("-f,--filter", opts.filters, "Filter as key=value (repeatable)");
        searchCmd->add_option("-n,--max-results", opts.maxResults, "Maximum results (1-100)");
        searchCmd->add_option("-t,--threshold", opts.threshold, "Minimum final score (0.0-1.0)");
        searchCmd->add_flag("--no-recency", opts.noRecency, "Disable age-based recency bias");

        auto* patternsCmd = app.add_subcommand("patterns", "Match symptoms against known patterns");
        patternsCmd->add_option("symptoms", opts.symptoms, "Observed symptoms")->required();
        patternsCmd->add_option("-x,--context", opts.context, "Additional context (repeatable)");

        auto* statsCmd = app.add_subcommand("stats", "Print cache, adapter and service statistics");
        auto* healthCmd = app.add_subcommand("health", "Print the health report");

        CLI11_PARSE(app, argc, argv);

        auto cfg = beacon::config::loadRetrievalConfig(opts.configPath);
        if (!cfg) {
            return reportError(cfg.error());
        }
        auto config = std::move(cfg).value();
        if (!opts.indexPath.empty()) {
            config.documentIndexPath = opts.indexPath;
        }
        spdlog::set_level(spdlog::level::from_str(opts.logLevel.empty() ? config.logLevel
                                                                        : opts.logLevel));

        auto created = RetrievalOrchestrator::createDefault(config);
        if (!created) {
            return reportError(created.error());
        }
        auto orchestrator = std::move(created).value();

        if (searchCmd->parsed()) {
            beacon::retrieval::RetrievalRequest request;
            request.query = opts.query;
            request.context = opts.context;
            request.enabledSources.insert(opts.sources.begin(), opts.sources.end());
            request.filters = parseFilters(opts.filters);
            request.maxResults = opts.maxResults;
            request.semanticSimilarityThreshold = opts.threshold;
            request.includeRecencyBias = !opts.noRecency;

            auto response = orchestrator->search(request);
            if (!response) {
                return reportError(response.error());
            }
            printJson(nlohmann::json(response.value()), opts.pretty);
        } else if (patternsCmd->parsed()) {
            std::map<std::string, std::string> context;
            for (size_t i = 0; i < opts.context.size(); ++i) {
                context["context_" + std::to_string(i)] = opts.context[i];
            }
            auto response = orchestrator->searchPatterns(opts.symptoms, context);
            if (!response) {
                return reportError(response.error());
            }
            printJson(nlohmann::json(response.value()), opts.pretty);
        } else if (statsCmd->parsed()) {
            printJson(orchestrator->getCacheStats(), opts.pretty);
        } else if (healthCmd->parsed()) {
            auto report = orchestrator->healthCheck();
            printJson(report, opts.pretty);
            return report.value("status", "unhealthy") == "unhealthy" ? 2 : 0;
        }
        return 0;

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
