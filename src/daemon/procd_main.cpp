#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <CLI/CLI.hpp>
#include <procd/config/config_helpers.h>
#include <procd/config/procd_config.h>
#include <procd/daemon/components/ControlServer.h>
#include <procd/daemon/components/RequestDispatcher.h>
#include <procd/supervisor/process_registry.h>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <chrono>
#include <csignal>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>

namespace {

void configure_logging(const procd::config::DaemonConfig& daemon) {
    if (!daemon.logFile.empty()) {
        try {
            std::error_code ec;
            std::filesystem::create_directories(daemon.logFile.parent_path(), ec);
            const size_t max_size = daemon.maxLogSizeMb * 1024 * 1024;
            auto rotating_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                daemon.logFile.string(), max_size, daemon.maxLogFiles);
            auto logger = std::make_shared<spdlog::logger>("procd", rotating_sink);
            spdlog::set_default_logger(logger);
            spdlog::flush_on(spdlog::level::info);
            spdlog::info("Log rotation enabled: {} (max {}MB x {} files)", daemon.logFile.string(),
                         daemon.maxLogSizeMb, daemon.maxLogFiles);
        } catch (const spdlog::spdlog_ex& e) {
            std::cerr << "Cannot open log file " << daemon.logFile << ": " << e.what()
                      << ", logging to stderr" << std::endl;
        }
    } else {
        spdlog::set_default_logger(spdlog::stderr_color_mt("procd"));
    }

    spdlog::set_level(spdlog::level::from_str(daemon.logLevel));
}

} // namespace

int main(int argc, char* argv[]) {
    CLI::App app{"procd - process supervisor daemon"};

    std::string configPath;
    std::string socketPath;
    std::string logFile;
    std::string logLevel;
    std::string overflowPolicy;
    std::string apiKey;
    std::size_t maxBufferBytes = 0;
    std::size_t queueDepth = 0;
    uint64_t graceMs = 0;

    app.add_option("--config", configPath, "Configuration file path");
    auto* socketOpt = app.add_option("--socket", socketPath, "Unix domain socket path");
    auto* logFileOpt = app.add_option("--log-file", logFile, "Log file path (default: stderr)");
    auto* logLevelOpt = app.add_option("--log-level", logLevel,
                                       "Log level (trace/debug/info/warn/error/critical/off)");
    auto* bufferOpt = app.add_option("--max-buffer-bytes", maxBufferBytes,
                                     "Retained output bytes per stream of each process");
    auto* graceOpt = app.add_option("--grace-ms", graceMs, "Default stop grace period (ms)");
    auto* depthOpt =
        app.add_option("--queue-depth", queueDepth, "Per-subscriber queue depth (chunks)");
    auto* policyOpt = app.add_option("--overflow-policy", overflowPolicy,
                                     "Slow subscriber handling: drop-oldest or disconnect");
    auto* apiKeyOpt = app.add_option("--api-key", apiKey, "Require this api_key on requests");

    CLI11_PARSE(app, argc, argv);

    // Precedence: defaults < config file < PROCD_* environment < command line
    bool requireConfig = !configPath.empty();
    if (configPath.empty()) {
        if (auto env = procd::config::env_value("PROCD_CONFIG")) {
            configPath = *env;
            requireConfig = true;
        }
    }
    auto loaded = procd::config::loadConfigFile(procd::config::get_config_path(configPath),
                                                requireConfig);
    if (!loaded) {
        std::cerr << "procd: " << loaded.error().message << std::endl;
        return 1;
    }
    procd::config::ProcdConfig config = std::move(loaded).value();

    if (auto r = procd::config::applyEnvironmentOverrides(config); !r) {
        std::cerr << "procd: " << r.error().message << std::endl;
        return 1;
    }

    if (*socketOpt)
        config.daemon.socketPath = procd::config::expand_tilde(socketPath);
    if (*logFileOpt)
        config.daemon.logFile = procd::config::expand_tilde(logFile);
    if (*logLevelOpt)
        config.daemon.logLevel = logLevel;
    if (*apiKeyOpt)
        config.daemon.apiKey = apiKey;
    if (*bufferOpt)
        config.supervisor.maxBufferBytesPerStream = maxBufferBytes;
    if (*graceOpt)
        config.supervisor.defaultGrace = std::chrono::milliseconds(graceMs);
    if (*depthOpt)
        config.supervisor.subscriberQueueDepth = queueDepth;
    if (*policyOpt) {
        auto policy = procd::supervisor::parseOverflowPolicy(overflowPolicy);
        if (!policy) {
            std::cerr << "procd: --overflow-policy must be drop-oldest or disconnect" << std::endl;
            return 1;
        }
        config.supervisor.overflowPolicy = *policy;
    }

    if (auto r = procd::config::validateConfig(config); !r) {
        std::cerr << "procd: " << r.error().message << std::endl;
        return 1;
    }

    configure_logging(config.daemon);
    if (!config.daemon.configFilePath.empty()) {
        spdlog::info("Using config {}", config.daemon.configFilePath.string());
    }
    if (config.daemon.apiKey.empty()) {
        spdlog::warn("No api_key configured; any local client may control processes");
    }

    try {
        boost::asio::io_context signals_io;
        boost::asio::signal_set signals(signals_io, SIGINT, SIGTERM);

        procd::supervisor::ProcessRegistry registry(config.supervisor);
        procd::daemon::RequestDispatcher dispatcher(registry, config.daemon.apiKey);

        procd::daemon::ControlServer::Config serverConfig;
        serverConfig.socketPath = config.daemon.socketPath;
        procd::daemon::ControlServer server(serverConfig, dispatcher);

        if (auto r = server.start(); !r) {
            spdlog::error("Failed to start control server: {}", r.error().message);
            return 1;
        }

        // Keep running until shutdown signal
        signals.async_wait([](const boost::system::error_code& ec, int signo) {
            if (!ec)
                spdlog::info("Received signal {}, shutting down", signo);
        });
        signals_io.run();

        if (auto r = server.stop(); !r) {
            spdlog::warn("Control server stop: {}", r.error().message);
        }
        registry.shutdown();
        spdlog::info("procd stopped");
        spdlog::shutdown();
        return 0;
    } catch (const std::exception& e) {
        spdlog::error("Daemon error: {}", e.what());
        return 1;
    }
}
