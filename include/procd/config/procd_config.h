#pragma once

#include <procd/core/types.h>
#include <procd/supervisor/supervisor_config.h>

#include <cstddef>
#include <filesystem>
#include <map>
#include <string>

namespace procd::config {

struct DaemonConfig {
    std::filesystem::path socketPath;
    std::filesystem::path logFile; ///< empty: log to stderr
    std::string logLevel = "info";
    size_t maxLogFiles = 5;
    size_t maxLogSizeMb = 10;
    std::string apiKey; ///< empty: no authentication
    // Path to the loaded config file, empty when defaults are used
    std::filesystem::path configFilePath;
};

struct ProcdConfig {
    supervisor::SupervisorConfig supervisor;
    DaemonConfig daemon;
};

/**
 * @brief Read `path` and apply its `[supervisor]` and `[daemon]` keys over the defaults
 *
 * A missing file is NotFound when `required`, otherwise the defaults are returned.
 * Unknown keys are ignored; malformed values are InvalidArgument naming the key.
 */
Result<ProcdConfig> loadConfigFile(const std::filesystem::path& path, bool required);

// Apply "section.key" values (as produced by parseSimpleTomlFlat)
Result<void> applyConfigValues(ProcdConfig& config,
                               const std::map<std::string, std::string>& values);

// PROCD_SOCKET, PROCD_API_KEY, PROCD_LOG_LEVEL, PROCD_LOG_FILE, PROCD_MAX_BUFFER_BYTES,
// PROCD_GRACE_MS, PROCD_KILL_WAIT_MS, PROCD_QUEUE_DEPTH, PROCD_OVERFLOW_POLICY,
// PROCD_MAX_LINE_BYTES
Result<void> applyEnvironmentOverrides(ProcdConfig& config);

// Range checks that apply no matter where a value came from
Result<void> validateConfig(const ProcdConfig& config);

// Default socket: <runtime dir>/procd.sock
std::filesystem::path defaultSocketPath();

} // namespace procd::config
