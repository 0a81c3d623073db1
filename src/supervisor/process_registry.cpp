#include <procd/compat/thread_stop_compat.h>
#include <procd/supervisor/process_handle.h>
#include <procd/supervisor/process_registry.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <mutex>
#include <utility>

namespace procd::supervisor {

struct ProcessRegistry::Entry {
    Entry(ProcessRecord record, const SupervisorConfig& config, OutputBroadcaster& broadcaster)
        : handle(std::make_unique<ProcessHandle>(std::move(record), config, broadcaster)) {}

    // Serializes start/stop/restart/remove of this id
    std::mutex commandMutex;
    const std::unique_ptr<ProcessHandle> handle;
    // Set under commandMutex once the entry has left the map
    bool removed{false};
};

namespace {

Error notFound(const ProcessId& id) {
    return Error{ErrorCode::NotFound, fmt::format("No process with id '{}'", id)};
}

ProcessInfo makeInfo(const ProcessId& id, const ProcessHandle& handle) {
    return ProcessInfo{id, handle.record().command, handle.status()};
}

} // namespace

ProcessRegistry::ProcessRegistry(SupervisorConfig config)
    : config_(std::move(config)),
      broadcaster_(config_.subscriberQueueDepth, config_.overflowPolicy) {
    spdlog::debug("ProcessRegistry: buffer {} bytes/stream, queue depth {}, overflow {}",
                  config_.maxBufferBytesPerStream, config_.subscriberQueueDepth,
                  toString(config_.overflowPolicy));
}

ProcessRegistry::~ProcessRegistry() {
    shutdown();
}

bool ProcessRegistry::isValidId(std::string_view id) {
    if (id.empty())
        return false;
    return std::all_of(id.begin(), id.end(), [](char c) {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
               c == '_' || c == '-';
    });
}

std::shared_ptr<ProcessRegistry::Entry> ProcessRegistry::find(const ProcessId& id) const {
    std::shared_lock lock(entriesMutex_);
    auto it = entries_.find(id);
    return it == entries_.end() ? nullptr : it->second;
}

Result<std::shared_ptr<ProcessRegistry::Entry>>
ProcessRegistry::lookup(const ProcessId& id) const {
    auto entry = find(id);
    if (!entry)
        return notFound(id);
    return entry;
}

Result<void> ProcessRegistry::validate(const ProcessId& id, const ProcessRecord& record) {
    if (!isValidId(id)) {
        return Error{ErrorCode::InvalidArgument,
                     fmt::format("Invalid process id '{}' (allowed: A-Z a-z 0-9 _ -)", id)};
    }
    if (record.command.empty() || record.command.front().empty()) {
        return Error{ErrorCode::InvalidArgument,
                     fmt::format("Empty command for process '{}'", id)};
    }
    return {};
}

Result<void> ProcessRegistry::create(const ProcessId& id, ProcessRecord record) {
    if (auto v = validate(id, record); !v)
        return v;
    if (shuttingDown_.load(std::memory_order_acquire)) {
        return Error{ErrorCode::InvalidState, "Supervisor is shutting down"};
    }
    record.id = id;

    std::unique_lock lock(entriesMutex_);
    if (entries_.count(id)) {
        return Error{ErrorCode::InvalidArgument,
                     fmt::format("A process with id '{}' already exists", id)};
    }
    entries_.emplace(id, std::make_shared<Entry>(std::move(record), config_, broadcaster_));
    spdlog::info("ProcessRegistry: registered '{}' (not started)", id);
    return {};
}

Result<void> ProcessRegistry::start(const ProcessId& id, ProcessRecord record) {
    if (auto v = validate(id, record); !v)
        return v;
    record.id = id;
    return startEntry(id, &record);
}

Result<void> ProcessRegistry::start(const ProcessId& id) {
    return startEntry(id, nullptr);
}

Result<void> ProcessRegistry::startEntry(const ProcessId& id, const ProcessRecord* record) {
    // A concurrent remove() may evict the entry between lookup and lock; retry then
    for (;;) {
        if (shuttingDown_.load(std::memory_order_acquire)) {
            return Error{ErrorCode::InvalidState, "Supervisor is shutting down"};
        }

        std::shared_ptr<Entry> entry;
        bool created = false;
        {
            std::unique_lock lock(entriesMutex_);
            auto it = entries_.find(id);
            if (it != entries_.end()) {
                entry = it->second;
            } else if (record) {
                entry = std::make_shared<Entry>(*record, config_, broadcaster_);
                entries_.emplace(id, entry);
                created = true;
            } else {
                return notFound(id);
            }
        }

        std::lock_guard command(entry->commandMutex);
        if (entry->removed)
            continue;

        if (!created && record && !entry->handle->record().sameLaunchSpec(*record)) {
            return Error{ErrorCode::InvalidArgument,
                         fmt::format("'{}' is registered with a different command; remove it "
                                     "first",
                                     id)};
        }

        if (created) {
            spdlog::info("ProcessRegistry: registered '{}'", id);
        }
        return entry->handle->start();
    }
}

Result<void> ProcessRegistry::stop(const ProcessId& id,
                                   std::optional<std::chrono::milliseconds> grace) {
    auto entry = lookup(id);
    if (!entry)
        return entry.error();

    std::lock_guard command(entry.value()->commandMutex);
    if (entry.value()->removed)
        return notFound(id);
    return entry.value()->handle->stop(grace.value_or(config_.defaultGrace));
}

Result<void> ProcessRegistry::restart(const ProcessId& id,
                                      std::optional<std::chrono::milliseconds> grace) {
    auto entry = lookup(id);
    if (!entry)
        return entry.error();

    std::lock_guard command(entry.value()->commandMutex);
    if (entry.value()->removed)
        return notFound(id);
    if (shuttingDown_.load(std::memory_order_acquire)) {
        return Error{ErrorCode::InvalidState, "Supervisor is shutting down"};
    }
    return entry.value()->handle->restart(grace.value_or(config_.defaultGrace));
}

Result<void> ProcessRegistry::remove(const ProcessId& id) {
    auto found = lookup(id);
    if (!found)
        return found.error();
    std::shared_ptr<Entry> entry = std::move(found).value();

    {
        std::lock_guard command(entry->commandMutex);
        if (entry->removed)
            return notFound(id);

        // Generation 0 is a registered record that was never started
        const auto status = entry->handle->status();
        if ((status.generation > 0 && isLive(status.state)) ||
            entry->handle->hasLiveProcess()) {
            return Error{ErrorCode::StillRunning,
                         fmt::format("'{}' is {} with a live process; stop it before removing",
                                     id, toString(status.state))};
        }

        {
            std::unique_lock lock(entriesMutex_);
            auto it = entries_.find(id);
            if (it != entries_.end() && it->second == entry)
                entries_.erase(it);
        }
        entry->removed = true;
    }

    broadcaster_.close(id);
    spdlog::info("ProcessRegistry: removed '{}'", id);
    return {};
}

std::vector<ProcessInfo> ProcessRegistry::list() const {
    std::vector<std::pair<ProcessId, std::shared_ptr<Entry>>> snapshot;
    {
        std::shared_lock lock(entriesMutex_);
        snapshot.assign(entries_.begin(), entries_.end());
    }

    std::vector<ProcessInfo> out;
    out.reserve(snapshot.size());
    for (const auto& [id, entry] : snapshot) {
        out.push_back(makeInfo(id, *entry->handle));
    }
    std::sort(out.begin(), out.end(),
              [](const ProcessInfo& a, const ProcessInfo& b) { return a.id < b.id; });
    return out;
}

Result<ProcessInfo> ProcessRegistry::info(const ProcessId& id) const {
    auto entry = lookup(id);
    if (!entry)
        return entry.error();
    return makeInfo(id, *entry.value()->handle);
}

Result<OutputSlice> ProcessRegistry::readOutput(const ProcessId& id, OutputStream stream,
                                                uint64_t sinceSequence) const {
    auto entry = lookup(id);
    if (!entry)
        return entry.error();
    return entry.value()->handle->readOutput(stream, sinceSequence);
}

Result<std::vector<OutputChunk>> ProcessRegistry::tail(const ProcessId& id, std::size_t n,
                                                       bool includeStderr) const {
    auto entry = lookup(id);
    if (!entry)
        return entry.error();
    return entry.value()->handle->tail(n, includeStderr);
}

Result<void> ProcessRegistry::sendInput(const ProcessId& id, std::span<const std::byte> data) {
    auto entry = lookup(id);
    if (!entry)
        return entry.error();
    return entry.value()->handle->sendInput(data);
}

Result<void> ProcessRegistry::sendInput(const ProcessId& id, std::string_view text) {
    return sendInput(id, std::as_bytes(std::span{text.data(), text.size()}));
}

Result<std::unique_ptr<Subscription>>
ProcessRegistry::subscribe(const ProcessId& id, std::optional<OutputStream> stream) {
    // remove() erases the entry before closing the topic, so a subscription registered while
    // the entry is still mapped is always reached by that close
    for (;;) {
        auto entry = find(id);
        if (!entry)
            return notFound(id);
        auto sub = broadcaster_.subscribe(id, stream);
        if (find(id) == entry)
            return sub;
    }
}

void ProcessRegistry::shutdown(std::optional<std::chrono::milliseconds> grace) {
    if (shuttingDown_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    const auto g = grace.value_or(config_.defaultGrace);

    std::unordered_map<ProcessId, std::shared_ptr<Entry>> entries;
    {
        std::shared_lock lock(entriesMutex_);
        entries = entries_;
    }
    spdlog::info("ProcessRegistry: shutting down {} process(es)", entries.size());

    {
        std::vector<compat::jthread> stoppers;
        stoppers.reserve(entries.size());
        for (auto& [id, entry] : entries) {
            stoppers.emplace_back([&id = id, entry = entry, g] {
                std::lock_guard command(entry->commandMutex);
                if (auto r = entry->handle->stop(g); !r) {
                    spdlog::warn("ProcessRegistry: stopping '{}' failed: {}", id,
                                 r.error().message);
                }
                entry->removed = true;
            });
        }
        // jthread destructors join
    }

    {
        std::unique_lock lock(entriesMutex_);
        entries_.clear();
    }
    broadcaster_.closeAll();
}

std::size_t ProcessRegistry::size() const {
    std::shared_lock lock(entriesMutex_);
    return entries_.size();
}

} // namespace procd::supervisor
