#pragma once

#include <procd/core/types.h>
#include <procd/supervisor/supervisor_config.h>
#include <procd/supervisor/types.h>

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

namespace procd::supervisor {

namespace detail {

// Bounded queue behind one Subscription. publish() side never blocks.
class SubscriberQueue {
public:
    enum class Status { Open, Cancelled, Overflowed, Closed };

    SubscriberQueue(std::size_t capacity, OverflowPolicy policy,
                    std::optional<OutputStream> filter);

    // Returns false once the queue no longer accepts chunks
    bool offer(const OutputChunk& chunk);
    Result<OutputChunk> take(std::chrono::milliseconds timeout);

    void cancel();
    void close();

    Status status() const;
    std::size_t pending() const;
    uint64_t dropped() const;
    std::optional<OutputStream> filter() const noexcept { return filter_; }

private:
    const std::size_t capacity_;
    const OverflowPolicy policy_;
    const std::optional<OutputStream> filter_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<OutputChunk> queue_;
    Status status_{Status::Open};
    uint64_t dropped_{0};
};

// Subscriber lists per process id, shared with every Subscription so it can unregister itself
class TopicTable {
public:
    struct Topic {
        std::mutex mutex;
        std::vector<std::weak_ptr<SubscriberQueue>> subscribers;
    };

    void add(const ProcessId& id, const std::shared_ptr<SubscriberQueue>& queue);
    // Drops `queue` and any expired entries; erases the topic once nothing is left
    void release(const ProcessId& id, const SubscriberQueue* queue);

    std::shared_ptr<Topic> find(const ProcessId& id) const;
    std::shared_ptr<Topic> take(const ProcessId& id);
    std::unordered_map<ProcessId, std::shared_ptr<Topic>> takeAll();
    std::size_t size() const;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<ProcessId, std::shared_ptr<Topic>> topics_;
};

} // namespace detail

/**
 * @brief Live view of one process's output from the moment of subscription
 *
 * Owned by the consumer. cancel() stops delivery; destroying it also removes it from the
 * broadcaster. Neither affects the process or other subscribers.
 */
class Subscription {
public:
    ~Subscription();

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    /**
     * @brief Wait up to `timeout` for the next chunk
     *
     * Errors: Timeout (nothing arrived), OperationCancelled (cancel() was called),
     * ResourceExhausted (disconnected by the overflow policy), SubscriptionClosed (process
     * removed or supervisor shut down). Chunks queued before a disconnect or close are still
     * delivered first.
     */
    [[nodiscard]] Result<OutputChunk> next(std::chrono::milliseconds timeout);

    // Takes effect immediately, including for a next() blocked in another thread
    void cancel();

    [[nodiscard]] bool active() const;
    [[nodiscard]] uint64_t dropped() const;
    [[nodiscard]] std::size_t pending() const;
    const ProcessId& processId() const noexcept { return processId_; }
    std::optional<OutputStream> stream() const noexcept { return queue_->filter(); }

private:
    friend class OutputBroadcaster;
    Subscription(ProcessId id, std::shared_ptr<detail::SubscriberQueue> queue,
                 std::weak_ptr<detail::TopicTable> table);

    ProcessId processId_;
    std::shared_ptr<detail::SubscriberQueue> queue_;
    std::weak_ptr<detail::TopicTable> table_;
};

/**
 * @brief Fan-out of freshly produced chunks to the live subscribers of each process
 *
 * Holds only weak references to subscriber queues. A Subscription unregisters itself when
 * destroyed and an id's topic goes away with its last subscriber; closed entries are also
 * pruned on the next publish. Topics are independent: publishing for one id never contends
 * with another id beyond a shared lookup lock.
 */
class OutputBroadcaster {
public:
    OutputBroadcaster(std::size_t queueDepth, OverflowPolicy policy);
    ~OutputBroadcaster();

    OutputBroadcaster(const OutputBroadcaster&) = delete;
    OutputBroadcaster& operator=(const OutputBroadcaster&) = delete;

    std::unique_ptr<Subscription> subscribe(const ProcessId& id,
                                            std::optional<OutputStream> stream = std::nullopt);

    // Never blocks on a subscriber
    void publish(const ProcessId& id, const OutputChunk& chunk);

    // Ends every subscription of `id` with SubscriptionClosed
    void close(const ProcessId& id);
    void closeAll();

    [[nodiscard]] std::size_t subscriberCount(const ProcessId& id) const;
    // Ids with at least one registered subscriber
    [[nodiscard]] std::size_t topicCount() const;

private:
    static void closeTopic(detail::TopicTable::Topic& topic);

    const std::size_t queueDepth_;
    const OverflowPolicy policy_;
    const std::shared_ptr<detail::TopicTable> table_;
};

} // namespace procd::supervisor
