#pragma once

#include <procd/core/types.h>
#include <procd/supervisor/output_broadcaster.h>
#include <procd/supervisor/types.h>

#include <nlohmann/json.hpp>

#include <array>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace procd::supervisor {
class ProcessRegistry;
}

namespace procd::daemon {

/**
 * @brief Result of one control request
 *
 * For `subscribe`, `subscription` is set and `backlog` holds the requested tail; the server
 * writes `body`, then the backlog, then live chunks that the backlog does not already cover.
 */
struct DispatchReply {
    nlohmann::json body;
    std::unique_ptr<supervisor::Subscription> subscription;
    std::vector<supervisor::OutputChunk> backlog;
    // Newest backlog sequence per stream (stdout, stderr) of `backlogGeneration`
    uint64_t backlogGeneration{0};
    std::array<uint64_t, 2> backlogLast{0, 0};

    // True when `chunk` was already delivered as part of the backlog
    bool coveredByBacklog(const supervisor::OutputChunk& chunk) const;
};

/**
 * @brief Maps newline-delimited JSON control requests onto the ProcessRegistry
 *
 * Request: `{"op": "...", "api_key"?: "...", ...}`. Reply: `{"ok": true, ...}` or
 * `{"ok": false, "error": "<ErrorName>", "message": "..."}`.
 */
class RequestDispatcher {
public:
    RequestDispatcher(supervisor::ProcessRegistry& registry, std::string apiKey);

    // Parses one request line; malformed JSON becomes an InvalidArgument reply
    DispatchReply dispatchLine(std::string_view line);
    DispatchReply dispatch(const nlohmann::json& request);

    static nlohmann::json chunkToJson(const supervisor::OutputChunk& chunk);
    static nlohmann::json infoToJson(const supervisor::ProcessInfo& info);
    static nlohmann::json errorToJson(const Error& error);

    // ISO-8601 UTC, microseconds only when non-zero: 2024-01-01T12:00:03.250000+00:00
    static std::string formatTimestamp(TimePoint tp);

    // One reply line; bytes that are not valid UTF-8 are replaced
    static std::string toWireLine(const nlohmann::json& body);

private:
    Result<void> authorize(const nlohmann::json& request) const;

    static supervisor::ProcessRecord recordFrom(const std::string& id,
                                                const nlohmann::json& req);

    Result<nlohmann::json> handleList();
    Result<nlohmann::json> handleInfo(const nlohmann::json& req);
    Result<nlohmann::json> handleStart(const nlohmann::json& req);
    Result<nlohmann::json> handleCreate(const nlohmann::json& req);
    Result<nlohmann::json> handleStop(const nlohmann::json& req, bool restart);
    Result<nlohmann::json> handleRemove(const nlohmann::json& req);
    Result<nlohmann::json> handleRead(const nlohmann::json& req);
    Result<nlohmann::json> handleTail(const nlohmann::json& req, bool text);
    Result<nlohmann::json> handleWrite(const nlohmann::json& req);
    Result<DispatchReply> handleSubscribe(const nlohmann::json& req);

    supervisor::ProcessRegistry& registry_;
    const std::string apiKey_;
};

} // namespace procd::daemon
