#include <procd/daemon/components/RequestDispatcher.h>
#include <procd/supervisor/process_registry.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <ctime>
#include <map>
#include <optional>
#include <utility>

namespace procd::daemon {

using nlohmann::json;
using supervisor::OutputChunk;
using supervisor::OutputStream;
using supervisor::ProcessInfo;

namespace {

constexpr std::size_t streamIndex(OutputStream stream) {
    return stream == OutputStream::Stdout ? 0 : 1;
}

Result<std::string> requireString(const json& req, const char* field) {
    auto it = req.find(field);
    if (it == req.end() || !it->is_string() || it->get_ref<const std::string&>().empty()) {
        return Error{ErrorCode::InvalidArgument,
                     fmt::format("'{}' is required and must be a non-empty string", field)};
    }
    return it->get<std::string>();
}

Result<std::optional<OutputStream>> optionalStream(const json& req) {
    auto it = req.find("stream");
    if (it == req.end() || it->is_null())
        return std::optional<OutputStream>{};
    if (!it->is_string()) {
        return Error{ErrorCode::InvalidArgument, "'stream' must be \"stdout\" or \"stderr\""};
    }
    auto parsed = supervisor::parseOutputStream(it->get_ref<const std::string&>());
    if (!parsed) {
        return Error{ErrorCode::InvalidArgument,
                     fmt::format("Unknown stream '{}'", it->get_ref<const std::string&>())};
    }
    return std::optional<OutputStream>{*parsed};
}

// Upper bound for grace_ms: one hour
constexpr int64_t kMaxGraceMs = 60 * 60 * 1000;

Result<std::optional<std::chrono::milliseconds>> optionalGrace(const json& req) {
    auto it = req.find("grace_ms");
    if (it == req.end() || it->is_null())
        return std::optional<std::chrono::milliseconds>{};
    if (!it->is_number_integer()) {
        return Error{ErrorCode::InvalidArgument, "'grace_ms' must be an integer"};
    }
    // Unsigned values above int64 range are caught by the cap
    const bool inRange = it->is_number_unsigned()
                             ? it->get<uint64_t>() <= static_cast<uint64_t>(kMaxGraceMs)
                             : it->get<int64_t>() >= 0 && it->get<int64_t>() <= kMaxGraceMs;
    if (!inRange) {
        return Error{ErrorCode::InvalidArgument,
                     fmt::format("'grace_ms' must be between 0 and {}", kMaxGraceMs)};
    }
    return std::optional<std::chrono::milliseconds>{
        std::chrono::milliseconds(it->get<int64_t>())};
}

bool keysEqual(std::string_view a, std::string_view b) {
    // Length is not secret; content comparison does not exit early
    if (a.size() != b.size())
        return false;
    unsigned char diff = 0;
    for (std::size_t i = 0; i < a.size(); ++i)
        diff |= static_cast<unsigned char>(a[i] ^ b[i]);
    return diff == 0;
}

json chunksToJson(const std::vector<OutputChunk>& chunks) {
    json arr = json::array();
    for (const auto& c : chunks)
        arr.push_back(RequestDispatcher::chunkToJson(c));
    return arr;
}

} // namespace

bool DispatchReply::coveredByBacklog(const OutputChunk& chunk) const {
    return !backlog.empty() && chunk.generation == backlogGeneration &&
           chunk.sequence <= backlogLast[streamIndex(chunk.stream)];
}

RequestDispatcher::RequestDispatcher(supervisor::ProcessRegistry& registry, std::string apiKey)
    : registry_(registry), apiKey_(std::move(apiKey)) {}

std::string RequestDispatcher::formatTimestamp(TimePoint tp) {
    using namespace std::chrono;
    auto secs = std::chrono::floor<seconds>(tp);
    auto micros = duration_cast<microseconds>(tp - secs).count();
    std::time_t t = system_clock::to_time_t(secs);
    std::tm tm{};
    gmtime_r(&t, &tm);

    std::string out = fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}", tm.tm_year + 1900,
                                  tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec);
    if (micros != 0)
        out += fmt::format(".{:06}", micros);
    out += "+00:00";
    return out;
}

json RequestDispatcher::chunkToJson(const OutputChunk& chunk) {
    return json{{"stream", supervisor::toString(chunk.stream)},
                {"seq", chunk.sequence},
                {"generation", chunk.generation},
                {"data", chunk.data},
                {"timestamp", formatTimestamp(chunk.timestamp)}};
}

json RequestDispatcher::infoToJson(const ProcessInfo& info) {
    const auto& s = info.status;
    json j{{"id", info.id},
           {"command", info.command},
           {"state", supervisor::toString(s.state)},
           {"generation", s.generation},
           {"pid", nullptr},
           {"exit_code", nullptr},
           {"reason", s.reason},
           {"started_at", nullptr},
           {"ended_at", nullptr}};
    if (s.pid)
        j["pid"] = *s.pid;
    if (s.exitCode)
        j["exit_code"] = *s.exitCode;
    if (s.generation > 0)
        j["started_at"] = formatTimestamp(s.startedAt);
    if (s.endedAt)
        j["ended_at"] = formatTimestamp(*s.endedAt);
    return j;
}

json RequestDispatcher::errorToJson(const Error& error) {
    return json{{"ok", false}, {"error", errorName(error.code)}, {"message", error.message}};
}

std::string RequestDispatcher::toWireLine(const json& body) {
    auto line = body.dump(-1, ' ', false, json::error_handler_t::replace);
    line.push_back('\n');
    return line;
}

Result<void> RequestDispatcher::authorize(const json& request) const {
    if (apiKey_.empty())
        return {};
    auto it = request.find("api_key");
    if (it == request.end() || !it->is_string() ||
        it->get_ref<const std::string&>().empty()) {
        return Error{ErrorCode::Unauthorized, "api_key is required"};
    }
    if (!keysEqual(it->get_ref<const std::string&>(), apiKey_)) {
        return Error{ErrorCode::Forbidden, "api_key is not valid"};
    }
    return {};
}

DispatchReply RequestDispatcher::dispatchLine(std::string_view line) {
    json request = json::parse(line.begin(), line.end(), nullptr, false);
    if (request.is_discarded()) {
        DispatchReply reply;
        reply.body = errorToJson(Error{ErrorCode::InvalidArgument, "Request is not valid JSON"});
        return reply;
    }
    return dispatch(request);
}

DispatchReply RequestDispatcher::dispatch(const json& request) {
    DispatchReply reply;
    if (!request.is_object()) {
        reply.body =
            errorToJson(Error{ErrorCode::InvalidArgument, "Request must be a JSON object"});
        return reply;
    }
    if (auto auth = authorize(request); !auth) {
        spdlog::warn("RequestDispatcher: rejected request: {}", auth.error().message);
        reply.body = errorToJson(auth.error());
        return reply;
    }

    auto op = requireString(request, "op");
    if (!op) {
        reply.body = errorToJson(op.error());
        return reply;
    }
    spdlog::debug("RequestDispatcher: op={}", op.value());

    try {
        const std::string& name = op.value();
        if (name == "subscribe") {
            auto sub = handleSubscribe(request);
            if (!sub) {
                reply.body = errorToJson(sub.error());
                return reply;
            }
            return std::move(sub).value();
        }

        Result<json> result =
            Error{ErrorCode::InvalidArgument, fmt::format("Unknown op '{}'", name)};
        if (name == "list")
            result = handleList();
        else if (name == "info")
            result = handleInfo(request);
        else if (name == "start")
            result = handleStart(request);
        else if (name == "create")
            result = handleCreate(request);
        else if (name == "stop")
            result = handleStop(request, false);
        else if (name == "restart")
            result = handleStop(request, true);
        else if (name == "remove")
            result = handleRemove(request);
        else if (name == "read")
            result = handleRead(request);
        else if (name == "tail")
            result = handleTail(request, false);
        else if (name == "tail_text")
            result = handleTail(request, true);
        else if (name == "write")
            result = handleWrite(request);

        if (!result) {
            reply.body = errorToJson(result.error());
        } else {
            reply.body = std::move(result).value();
            reply.body["ok"] = true;
        }
    } catch (const json::exception& e) {
        // Field present with the wrong type
        reply.body = errorToJson(Error{ErrorCode::InvalidArgument, e.what()});
    }
    return reply;
}

Result<json> RequestDispatcher::handleList() {
    json arr = json::array();
    for (const auto& info : registry_.list())
        arr.push_back(infoToJson(info));
    return json{{"processes", std::move(arr)}};
}

Result<json> RequestDispatcher::handleInfo(const json& req) {
    auto id = requireString(req, "id");
    if (!id)
        return id.error();
    auto info = registry_.info(id.value());
    if (!info)
        return info.error();
    return json{{"process", infoToJson(info.value())}};
}

supervisor::ProcessRecord RequestDispatcher::recordFrom(const std::string& id, const json& req) {
    supervisor::ProcessRecord record;
    record.id = id;
    record.command = req.at("command").get<std::vector<std::string>>();
    if (auto cwd = req.find("cwd"); cwd != req.end() && !cwd->is_null())
        record.workingDirectory = cwd->get<std::string>();
    if (auto env = req.find("env"); env != req.end() && !env->is_null())
        record.env = env->get<std::map<std::string, std::string>>();
    return record;
}

Result<json> RequestDispatcher::handleStart(const json& req) {
    auto id = requireString(req, "id");
    if (!id)
        return id.error();

    Result<void> started;
    auto cmd = req.find("command");
    if (cmd == req.end() || cmd->is_null()) {
        started = registry_.start(id.value());
    } else {
        started = registry_.start(id.value(), recordFrom(id.value(), req));
    }
    if (!started)
        return started.error();
    return handleInfo(req);
}

Result<json> RequestDispatcher::handleCreate(const json& req) {
    auto id = requireString(req, "id");
    if (!id)
        return id.error();
    if (auto cmd = req.find("command"); cmd == req.end() || cmd->is_null()) {
        return Error{ErrorCode::InvalidArgument, "'command' is required for create"};
    }
    if (auto r = registry_.create(id.value(), recordFrom(id.value(), req)); !r)
        return r.error();
    return handleInfo(req);
}

Result<json> RequestDispatcher::handleStop(const json& req, bool restart) {
    auto id = requireString(req, "id");
    if (!id)
        return id.error();
    auto grace = optionalGrace(req);
    if (!grace)
        return grace.error();
    auto r = restart ? registry_.restart(id.value(), grace.value())
                     : registry_.stop(id.value(), grace.value());
    if (!r)
        return r.error();
    return handleInfo(req);
}

Result<json> RequestDispatcher::handleRemove(const json& req) {
    auto id = requireString(req, "id");
    if (!id)
        return id.error();
    if (auto r = registry_.remove(id.value()); !r)
        return r.error();
    return json{{"removed", id.value()}};
}

Result<json> RequestDispatcher::handleRead(const json& req) {
    auto id = requireString(req, "id");
    if (!id)
        return id.error();
    auto stream = optionalStream(req);
    if (!stream)
        return stream.error();
    if (!stream.value()) {
        return Error{ErrorCode::InvalidArgument, "'stream' is required for read"};
    }
    const uint64_t since = req.value("since", uint64_t{0});

    auto slice = registry_.readOutput(id.value(), *stream.value(), since);
    if (!slice)
        return slice.error();
    const auto& s = slice.value();
    return json{{"chunks", chunksToJson(s.chunks)},
                {"floor", s.floorSequence},
                {"last", s.lastSequence}};
}

Result<json> RequestDispatcher::handleTail(const json& req, bool text) {
    auto id = requireString(req, "id");
    if (!id)
        return id.error();
    if (!req.contains("n")) {
        return Error{ErrorCode::InvalidArgument, "'n' is required"};
    }
    const auto n = req.at("n").get<std::size_t>();
    const bool includeStderr = req.value("include_stderr", true);

    auto chunks = registry_.tail(id.value(), n, includeStderr);
    if (!chunks)
        return chunks.error();

    if (!text)
        return json{{"chunks", chunksToJson(chunks.value())}};

    const bool prefix = req.value("prefix_timestamp", true);
    json lines = json::array();
    for (const auto& c : chunks.value()) {
        lines.push_back(prefix ? fmt::format("{} | {}", formatTimestamp(c.timestamp), c.data)
                               : c.data);
    }
    return json{{"lines", std::move(lines)}};
}

Result<json> RequestDispatcher::handleWrite(const json& req) {
    auto id = requireString(req, "id");
    if (!id)
        return id.error();
    if (!req.contains("data")) {
        return Error{ErrorCode::InvalidArgument, "'data' is required"};
    }
    std::string data = req.at("data").get<std::string>();
    if (req.value("newline", true))
        data.push_back('\n');

    if (auto r = registry_.sendInput(id.value(), data); !r)
        return r.error();
    return json{{"written", data.size()}};
}

Result<DispatchReply> RequestDispatcher::handleSubscribe(const json& req) {
    auto id = requireString(req, "id");
    if (!id)
        return id.error();
    auto stream = optionalStream(req);
    if (!stream)
        return stream.error();
    const auto n = req.value("tail", std::size_t{0});

    // Subscribe before taking the backlog so nothing produced in between is missed
    auto sub = registry_.subscribe(id.value(), stream.value());
    if (!sub)
        return sub.error();

    DispatchReply reply;
    reply.subscription = std::move(sub).value();

    if (n > 0) {
        const auto only = stream.value();
        const bool includeStderr = !only || *only == OutputStream::Stderr;
        auto chunks = registry_.tail(id.value(), n, includeStderr);
        if (!chunks)
            return chunks.error();
        for (auto& c : chunks.value()) {
            if (only && c.stream != *only)
                continue;
            reply.backlogGeneration = c.generation;
            auto& last = reply.backlogLast[streamIndex(c.stream)];
            last = std::max(last, c.sequence);
            reply.backlog.push_back(std::move(c));
        }
    }

    reply.body = json{{"ok", true},
                      {"subscribed", id.value()},
                      {"stream", stream.value() ? json(supervisor::toString(*stream.value()))
                                                : json(nullptr)}};
    spdlog::info("RequestDispatcher: subscription opened for '{}'", id.value());
    return std::move(reply);
}

} // namespace procd::daemon
