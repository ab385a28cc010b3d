#include "adapter_registry.hpp"
#include "bounded_poller.hpp"
#include "errors.hpp"
#include "record_sink.hpp"
#include "util.hpp"
#include "watermark_store.hpp"

#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>

struct Config {
    std::string statePath    = "app_poller_state.json";
    std::string jobId;
    std::string outputPath;               // empty: stdout
    long long   timeBudgetMs = 300000;    // one invocation
    long long   staleAfterS  = 0;         // 0: never reclaim
    bool        reset        = false;
    bool        verbose      = false;
};

static void printUsage() {
    std::cout
        << "Usage: app_poller --job ID [options]\n\n"
        << "Options:\n"
        << "  --state FILE         Job state document    (default: app_poller_state.json)\n"
        << "  --job ID             Job to run            (required)\n"
        << "  --time-budget-ms N   Invocation deadline   (default: 300000)\n"
        << "  --output FILE        JSON-lines output     (default: stdout)\n"
        << "  --stale-after-s N    Reclaim a job left running longer than N s\n"
        << "                       (default: 0, never)\n"
        << "  --reset              Return the job to idle and exit\n"
        << "  --verbose            Enable verbose diagnostics\n"
        << "  --help, -h           Show this message\n";
}

static Config parseArgs(int argc, char* argv[]) {
    Config cfg;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--state" && i + 1 < argc) {
            cfg.statePath = argv[++i];
        } else if (arg == "--job" && i + 1 < argc) {
            cfg.jobId = argv[++i];
        } else if (arg == "--time-budget-ms" && i + 1 < argc) {
            cfg.timeBudgetMs = std::stoll(argv[++i]);
        } else if (arg == "--output" && i + 1 < argc) {
            cfg.outputPath = argv[++i];
        } else if (arg == "--stale-after-s" && i + 1 < argc) {
            cfg.staleAfterS = std::stoll(argv[++i]);
        } else if (arg == "--reset") {
            cfg.reset = true;
        } else if (arg == "--verbose") {
            cfg.verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage();
            std::exit(0);
        } else {
            std::cerr << "Unknown argument: " << arg << "\n\n";
            printUsage();
            std::exit(1);
        }
    }

    if (cfg.jobId.empty()) {
        std::cerr << "Missing required --job\n\n";
        printUsage();
        std::exit(1);
    }
    if (cfg.timeBudgetMs <= 0 || cfg.staleAfterS < 0) {
        std::cerr << "--time-budget-ms must be positive and "
                  << "--stale-after-s non-negative\n";
        std::exit(1);
    }
    return cfg;
}

int main(int argc, char* argv[]) {
    using namespace app_poller;

    try {
        const Config cfg = parseArgs(argc, argv);

        // The budget starts ticking before anything else happens.
        ExecutionDeadline deadline(std::chrono::milliseconds(cfg.timeBudgetMs));
        JsonFileWatermarkStore store(cfg.statePath, deadline,
                                     std::chrono::seconds(cfg.staleAfterS));

        if (cfg.reset) {
            store.reset(cfg.jobId);
            std::cerr << "Job '" << cfg.jobId << "' reset to idle\n";
            return 0;
        }

        AdapterRegistry registry;
        registerBuiltinAdapters(registry, cfg.verbose);

        JobConfig job = store.load(cfg.jobId);
        auto adapter  = registry.create(job);

        std::ofstream file;
        if (!cfg.outputPath.empty()) {
            file.open(cfg.outputPath, std::ios::app);
            if (!file) {
                throw std::runtime_error("Cannot open output file: " + cfg.outputPath);
            }
        }
        JsonLinesSink sink(cfg.outputPath.empty() ? std::cout : file);

        BoundedPoller::Options opts;
        opts.verbose = cfg.verbose;
        BoundedPoller poller(*adapter, store, sink, std::cerr, opts);

        const RunSummary summary = poller.run(job);

        std::cerr
            << "\n=== Run Summary ===\n"
            << "Job:               " << cfg.jobId << "\n"
            << "Type:              " << adapter->type() << "\n"
            << "Started:           " << (summary.started ? "yes" : "no (already running)") << "\n"
            << "Status:            " << toString(summary.status) << "\n"
            << "Records gathered:  " << summary.recordsGathered << "\n"
            << "Polls:             " << summary.iterations << "\n"
            << "Delivery failures: " << summary.deliveryFailures << "\n"
            << "Total sleep (s):   " << formatSeconds(summary.totalSleep) << "\n"
            << "Final watermark:   " << formatIso8601(summary.finalWatermark) << "\n"
            << "===================\n";

        return summary.status == JobStatus::Failed ? 2 : 0;

    } catch (const ConfigurationError& e) {
        std::cerr << "Configuration error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}
