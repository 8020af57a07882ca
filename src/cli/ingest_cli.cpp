#include <pdfledger/cli/ingest_cli.h>
#include <pdfledger/config/config_helpers.h>
#include <pdfledger/config/ingest_config.h>
#include <pdfledger/ingest/processing_coordinator.h>
#include <pdfledger/ingest/scanner.h>
#include <pdfledger/tools/external_tools.h>
#include <pdfledger/tools/process_runner.h>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <CLI/CLI.hpp>

#include <atomic>
#include <csignal>
#include <iostream>
#include <vector>

#ifndef PDFLEDGER_VERSION
#define PDFLEDGER_VERSION "0.0.0"
#endif

namespace pdfledger::cli {

namespace {

std::atomic<bool> g_stopRequested{false};

void stop_handler(int) {
    g_stopRequested.store(true);
}

void install_stop_handlers() {
    struct sigaction sa{};
    sa.sa_handler = stop_handler;
    sigemptyset(&sa.sa_mask);
    // No SA_RESTART: a blocking poll() returns EINTR so the watch loop sees the flag
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
}

} // namespace

int exitStatusFor(const Error& error) {
    return isFatal(error.code) ? kExitFatalStorage : kExitUsage;
}

void configureLogging(const std::string& level, const std::filesystem::path& logFile) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

    if (!logFile.empty()) {
        try {
            std::filesystem::create_directories(logFile.parent_path());
            const size_t max_size = 10 * 1024 * 1024; // 10MB per file
            const size_t max_files = 5;
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                logFile.string(), max_size, max_files));
        } catch (const std::exception& e) {
            std::cerr << "Cannot open log file " << logFile.string() << ": " << e.what()
                      << std::endl;
        }
    }

    auto logger = std::make_shared<spdlog::logger>("pdfledger", sinks.begin(), sinks.end());
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
    spdlog::set_default_logger(logger);
    spdlog::flush_on(spdlog::level::warn);

    auto lvl = spdlog::level::from_str(level);
    if (lvl == spdlog::level::off && level != "off") {
        lvl = spdlog::level::info;
    }
    spdlog::set_level(lvl);
}

int runIngestCli(int argc, char** argv) {
    CLI::App app{"pdfledger - exactly-once PDF object ingestion"};
    app.set_version_flag("-V,--version", PDFLEDGER_VERSION);

    bool monitor = false;
    std::filesystem::path root = std::filesystem::current_path();
    std::string configPath;
    int pollSeconds = 5;
    int jobs = 1;
    std::string logLevel = "info";
    std::string logFile;

    app.add_flag("-m,--monitor", monitor, "Catch up, then watch the input directory");
    app.add_option("--root", root, "Working directory holding pdf/ and the tables")
        ->check(CLI::ExistingDirectory);
    app.add_option("-c,--config", configPath, "Configuration file path");
    auto* pollOpt = app.add_option("--poll", pollSeconds, "Polling interval in seconds")
                        ->check(CLI::PositiveNumber);
    auto* jobsOpt = app.add_option("-j,--jobs", jobs, "Documents processed in parallel")
                        ->check(CLI::PositiveNumber);
    auto* levelOpt = app.add_option("--log-level", logLevel,
                                    "Log level (trace/debug/info/warn/error)");
    auto* fileOpt = app.add_option("--log-file", logFile, "Also log to this rotating file");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        int code = app.exit(e);
        return code == 0 ? kExitOk : kExitUsage;
    }

    std::error_code ec;
    if (auto absolute = std::filesystem::absolute(root, ec); !ec) {
        root = absolute;
    }

    // Bootstrap logging so config errors are visible
    configureLogging(levelOpt->count() ? logLevel : "info", {});

    auto cfgFile = config::get_config_path(root, configPath);
    auto loaded = config::loadIngestConfig(root, cfgFile);
    if (!loaded) {
        spdlog::error("Configuration error: {}", loaded.error().message);
        return kExitUsage;
    }
    auto cfg = std::move(loaded).value();

    // Command line wins over the config file
    if (pollOpt->count()) {
        cfg.pollInterval = std::chrono::seconds(pollSeconds);
    }
    if (jobsOpt->count()) {
        cfg.jobs = jobs;
    }
    if (levelOpt->count()) {
        cfg.logLevel = logLevel;
    }
    if (fileOpt->count()) {
        cfg.logFile = logFile;
    }
    configureLogging(cfg.logLevel, cfg.logFile);
    if (!cfgFile.empty()) {
        spdlog::debug("Loaded configuration from {}", cfgFile.string());
    }

    if (!tools::findExecutable(cfg.tools.mutool)) {
        spdlog::error("'{}' not found. Install mupdf-tools (mutool) and retry.", cfg.tools.mutool);
        return kExitUsage;
    }

    ingest::ProcessingCoordinator coordinator(cfg, tools::createObjectExtractor(cfg.tools),
                                              tools::createMetadataProvider(cfg.tools),
                                              tools::createFontNameProvider(cfg.tools));
    if (auto init = coordinator.initialize(); !init) {
        spdlog::critical("Cannot prepare {}: {}", root.string(), init.error().message);
        return exitStatusFor(init.error());
    }

    ingest::Scanner scanner(coordinator, cfg.jobs);
    if (monitor) {
        install_stop_handlers();
        if (auto watched = scanner.watch(g_stopRequested); !watched) {
            spdlog::critical("Monitoring stopped: {}", watched.error().message);
            return exitStatusFor(watched.error());
        }
        return kExitOk;
    }

    auto summary = scanner.scanOnce();
    if (!summary) {
        spdlog::critical("Scan aborted: {}", summary.error().message);
        return exitStatusFor(summary.error());
    }
    if (summary.value().failed > 0) {
        spdlog::warn("{} document(s) failed and will be retried on the next run",
                     summary.value().failed);
    }
    return kExitOk;
}

} // namespace pdfledger::cli
