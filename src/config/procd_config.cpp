#include <procd/config/config_helpers.h>
#include <procd/config/procd_config.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <functional>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace procd::config {

namespace {

Result<uint64_t> parseUnsigned(std::string_view key, std::string_view raw) {
    uint64_t out = 0;
    auto [ptr, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), out);
    if (ec != std::errc{} || ptr != raw.data() + raw.size() || raw.empty()) {
        return Error{ErrorCode::InvalidArgument,
                     fmt::format("{}: expected a non-negative integer, got '{}'", key, raw)};
    }
    return out;
}

using Setter = std::function<Result<void>(ProcdConfig&, std::string_view key,
                                          const std::string& value)>;

Setter sizeSetter(std::size_t supervisor::SupervisorConfig::*field) {
    return [field](ProcdConfig& c, std::string_view key, const std::string& value) -> Result<void> {
        auto v = parseUnsigned(key, value);
        if (!v)
            return v.error();
        c.supervisor.*field = static_cast<std::size_t>(v.value());
        return {};
    };
}

Setter millisSetter(std::chrono::milliseconds supervisor::SupervisorConfig::*field) {
    return [field](ProcdConfig& c, std::string_view key, const std::string& value) -> Result<void> {
        auto v = parseUnsigned(key, value);
        if (!v)
            return v.error();
        c.supervisor.*field = std::chrono::milliseconds(static_cast<int64_t>(v.value()));
        return {};
    };
}

Result<void> setOverflowPolicy(ProcdConfig& c, std::string_view key, const std::string& value) {
    auto policy = supervisor::parseOverflowPolicy(value);
    if (!policy) {
        return Error{ErrorCode::InvalidArgument,
                     fmt::format("{}: expected 'drop-oldest' or 'disconnect', got '{}'", key,
                                 value)};
    }
    c.supervisor.overflowPolicy = *policy;
    return {};
}

// Keys shared by the config file and the environment
struct Binding {
    const char* fileKey;
    const char* envVar;
    Setter set;
};

const std::vector<Binding>& bindings() {
    static const std::vector<Binding> table = {
        {"supervisor.max_buffer_bytes_per_stream", "PROCD_MAX_BUFFER_BYTES",
         sizeSetter(&supervisor::SupervisorConfig::maxBufferBytesPerStream)},
        {"supervisor.default_grace_ms", "PROCD_GRACE_MS",
         millisSetter(&supervisor::SupervisorConfig::defaultGrace)},
        {"supervisor.kill_wait_ms", "PROCD_KILL_WAIT_MS",
         millisSetter(&supervisor::SupervisorConfig::killWait)},
        {"supervisor.subscriber_queue_depth", "PROCD_QUEUE_DEPTH",
         sizeSetter(&supervisor::SupervisorConfig::subscriberQueueDepth)},
        {"supervisor.overflow_policy", "PROCD_OVERFLOW_POLICY", setOverflowPolicy},
        {"supervisor.max_line_bytes", "PROCD_MAX_LINE_BYTES",
         sizeSetter(&supervisor::SupervisorConfig::maxLineBytes)},
        {"supervisor.stdin_write_timeout_ms", nullptr,
         millisSetter(&supervisor::SupervisorConfig::stdinWriteTimeout)},
        {"daemon.socket_path", "PROCD_SOCKET",
         [](ProcdConfig& c, std::string_view, const std::string& v) -> Result<void> {
             c.daemon.socketPath = expand_tilde(v);
             return {};
         }},
        {"daemon.log_file", "PROCD_LOG_FILE",
         [](ProcdConfig& c, std::string_view, const std::string& v) -> Result<void> {
             c.daemon.logFile = expand_tilde(v);
             return {};
         }},
        {"daemon.log_level", "PROCD_LOG_LEVEL",
         [](ProcdConfig& c, std::string_view, const std::string& v) -> Result<void> {
             c.daemon.logLevel = v;
             return {};
         }},
        {"daemon.max_log_files", nullptr,
         [](ProcdConfig& c, std::string_view key, const std::string& v) -> Result<void> {
             auto n = parseUnsigned(key, v);
             if (!n)
                 return n.error();
             c.daemon.maxLogFiles = static_cast<size_t>(n.value());
             return {};
         }},
        {"daemon.max_log_size_mb", nullptr,
         [](ProcdConfig& c, std::string_view key, const std::string& v) -> Result<void> {
             auto n = parseUnsigned(key, v);
             if (!n)
                 return n.error();
             c.daemon.maxLogSizeMb = static_cast<size_t>(n.value());
             return {};
         }},
        {"daemon.api_key", "PROCD_API_KEY",
         [](ProcdConfig& c, std::string_view, const std::string& v) -> Result<void> {
             c.daemon.apiKey = v;
             return {};
         }},
    };
    return table;
}

} // namespace

std::filesystem::path defaultSocketPath() {
    return get_runtime_dir() / "procd.sock";
}

Result<void> applyConfigValues(ProcdConfig& config,
                               const std::map<std::string, std::string>& values) {
    for (const auto& b : bindings()) {
        auto it = values.find(b.fileKey);
        if (it == values.end())
            continue;
        if (auto r = b.set(config, b.fileKey, it->second); !r)
            return r;
    }
    return {};
}

Result<void> applyEnvironmentOverrides(ProcdConfig& config) {
    for (const auto& b : bindings()) {
        if (!b.envVar)
            continue;
        auto v = env_value(b.envVar);
        if (!v)
            continue;
        if (auto r = b.set(config, b.envVar, *v); !r)
            return r;
        spdlog::debug("Config override from environment: {}", b.envVar);
    }
    return {};
}

Result<ProcdConfig> loadConfigFile(const std::filesystem::path& path, bool required) {
    ProcdConfig config;
    config.daemon.socketPath = defaultSocketPath();

    std::error_code ec;
    if (path.empty() || !std::filesystem::exists(path, ec)) {
        if (required) {
            return Error{ErrorCode::NotFound,
                         fmt::format("Config file not found: {}", path.string())};
        }
        return config;
    }

    auto values = parseSimpleTomlFlat(path);
    if (auto r = applyConfigValues(config, values); !r) {
        return Error{r.error().code, fmt::format("{}: {}", path.string(), r.error().message)};
    }
    config.daemon.configFilePath = path;
    spdlog::debug("Loaded {} config value(s) from {}", values.size(), path.string());
    return config;
}

Result<void> validateConfig(const ProcdConfig& config) {
    const auto& s = config.supervisor;
    if (s.maxBufferBytesPerStream == 0) {
        return Error{ErrorCode::InvalidArgument,
                     "supervisor.max_buffer_bytes_per_stream must be greater than 0"};
    }
    if (s.subscriberQueueDepth == 0) {
        return Error{ErrorCode::InvalidArgument,
                     "supervisor.subscriber_queue_depth must be greater than 0"};
    }
    if (s.maxLineBytes == 0) {
        return Error{ErrorCode::InvalidArgument, "supervisor.max_line_bytes must be greater than 0"};
    }

    static constexpr std::array<std::string_view, 7> kLevels = {
        "trace", "debug", "info", "warn", "warning", "error", "critical"};
    const auto& level = config.daemon.logLevel;
    if (std::find(kLevels.begin(), kLevels.end(), level) == kLevels.end() && level != "off") {
        return Error{ErrorCode::InvalidArgument,
                     fmt::format("daemon.log_level: unknown level '{}'", level)};
    }
    if (config.daemon.socketPath.empty()) {
        return Error{ErrorCode::InvalidArgument, "daemon.socket_path must not be empty"};
    }
    return {};
}

} // namespace procd::config
