#include <procd/supervisor/output_broadcaster.h>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace procd::supervisor {

std::optional<OverflowPolicy> parseOverflowPolicy(std::string_view name) {
    if (name == "drop-oldest" || name == "drop_oldest")
        return OverflowPolicy::DropOldest;
    if (name == "disconnect")
        return OverflowPolicy::Disconnect;
    return std::nullopt;
}

namespace detail {

SubscriberQueue::SubscriberQueue(std::size_t capacity, OverflowPolicy policy,
                                 std::optional<OutputStream> filter)
    : capacity_(capacity ? capacity : 1), policy_(policy), filter_(filter) {}

bool SubscriberQueue::offer(const OutputChunk& chunk) {
    std::unique_lock lock(mutex_);
    if (status_ != Status::Open) {
        return false;
    }
    if (filter_ && *filter_ != chunk.stream) {
        return true;
    }
    if (queue_.size() >= capacity_) {
        if (policy_ == OverflowPolicy::DropOldest) {
            queue_.pop_front();
            ++dropped_;
        } else {
            status_ = Status::Overflowed;
            lock.unlock();
            cv_.notify_all();
            return false;
        }
    }
    queue_.push_back(chunk);
    lock.unlock();
    cv_.notify_one();
    return true;
}

Result<OutputChunk> SubscriberQueue::take(std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex_);
    cv_.wait_for(lock, timeout, [this] { return !queue_.empty() || status_ != Status::Open; });

    if (status_ == Status::Cancelled) {
        return Error{ErrorCode::OperationCancelled, "Subscription cancelled"};
    }
    if (!queue_.empty()) {
        OutputChunk chunk = std::move(queue_.front());
        queue_.pop_front();
        return chunk;
    }
    switch (status_) {
        case Status::Overflowed:
            return Error{ErrorCode::ResourceExhausted,
                         fmt::format("Subscriber disconnected after exceeding queue depth {}",
                                     capacity_)};
        case Status::Closed:
            return Error{ErrorCode::SubscriptionClosed, "Process output is no longer available"};
        default:
            break;
    }
    return Error{ErrorCode::Timeout, "No output within timeout"};
}

void SubscriberQueue::cancel() {
    {
        std::lock_guard lock(mutex_);
        status_ = Status::Cancelled;
        queue_.clear();
    }
    cv_.notify_all();
}

void SubscriberQueue::close() {
    {
        std::lock_guard lock(mutex_);
        if (status_ == Status::Open)
            status_ = Status::Closed;
    }
    cv_.notify_all();
}

SubscriberQueue::Status SubscriberQueue::status() const {
    std::lock_guard lock(mutex_);
    return status_;
}

std::size_t SubscriberQueue::pending() const {
    std::lock_guard lock(mutex_);
    return queue_.size();
}

uint64_t SubscriberQueue::dropped() const {
    std::lock_guard lock(mutex_);
    return dropped_;
}

void TopicTable::add(const ProcessId& id, const std::shared_ptr<SubscriberQueue>& queue) {
    // Appended under the table lock so release() never erases a topic that is gaining a member
    std::unique_lock lock(mutex_);
    auto& slot = topics_[id];
    if (!slot)
        slot = std::make_shared<Topic>();
    std::lock_guard topicLock(slot->mutex);
    slot->subscribers.push_back(queue);
}

void TopicTable::release(const ProcessId& id, const SubscriberQueue* queue) {
    std::unique_lock lock(mutex_);
    auto it = topics_.find(id);
    if (it == topics_.end())
        return;

    auto& t = *it->second;
    bool empty = false;
    {
        std::lock_guard topicLock(t.mutex);
        auto& subs = t.subscribers;
        subs.erase(std::remove_if(subs.begin(), subs.end(),
                                  [queue](const std::weak_ptr<SubscriberQueue>& weak) {
                                      auto q = weak.lock();
                                      return !q || q.get() == queue;
                                  }),
                   subs.end());
        empty = subs.empty();
    }
    if (empty)
        topics_.erase(it);
}

std::shared_ptr<TopicTable::Topic> TopicTable::find(const ProcessId& id) const {
    std::shared_lock lock(mutex_);
    auto it = topics_.find(id);
    return it == topics_.end() ? nullptr : it->second;
}

std::shared_ptr<TopicTable::Topic> TopicTable::take(const ProcessId& id) {
    std::unique_lock lock(mutex_);
    auto it = topics_.find(id);
    if (it == topics_.end())
        return nullptr;
    auto t = std::move(it->second);
    topics_.erase(it);
    return t;
}

std::unordered_map<ProcessId, std::shared_ptr<TopicTable::Topic>> TopicTable::takeAll() {
    std::unordered_map<ProcessId, std::shared_ptr<Topic>> out;
    std::unique_lock lock(mutex_);
    out.swap(topics_);
    return out;
}

std::size_t TopicTable::size() const {
    std::shared_lock lock(mutex_);
    return topics_.size();
}

} // namespace detail

// ============================================================================
// Subscription
// ============================================================================

Subscription::Subscription(ProcessId id, std::shared_ptr<detail::SubscriberQueue> queue,
                           std::weak_ptr<detail::TopicTable> table)
    : processId_(std::move(id)), queue_(std::move(queue)), table_(std::move(table)) {}

Subscription::~Subscription() {
    queue_->cancel();
    if (auto table = table_.lock())
        table->release(processId_, queue_.get());
}

Result<OutputChunk> Subscription::next(std::chrono::milliseconds timeout) {
    return queue_->take(timeout);
}

void Subscription::cancel() {
    queue_->cancel();
}

bool Subscription::active() const {
    return queue_->status() == detail::SubscriberQueue::Status::Open;
}

uint64_t Subscription::dropped() const {
    return queue_->dropped();
}

std::size_t Subscription::pending() const {
    return queue_->pending();
}

// ============================================================================
// OutputBroadcaster
// ============================================================================

OutputBroadcaster::OutputBroadcaster(std::size_t queueDepth, OverflowPolicy policy)
    : queueDepth_(queueDepth), policy_(policy),
      table_(std::make_shared<detail::TopicTable>()) {}

OutputBroadcaster::~OutputBroadcaster() {
    closeAll();
}

std::unique_ptr<Subscription> OutputBroadcaster::subscribe(const ProcessId& id,
                                                           std::optional<OutputStream> stream) {
    auto queue = std::make_shared<detail::SubscriberQueue>(queueDepth_, policy_, stream);
    table_->add(id, queue);

    spdlog::debug("OutputBroadcaster: new subscriber for '{}' ({})", id,
                  stream ? toString(*stream) : "all streams");
    return std::unique_ptr<Subscription>(new Subscription(id, std::move(queue), table_));
}

void OutputBroadcaster::publish(const ProcessId& id, const OutputChunk& chunk) {
    auto t = table_->find(id);
    if (!t)
        return;

    std::vector<std::shared_ptr<detail::SubscriberQueue>> live;
    {
        std::lock_guard lock(t->mutex);
        auto& subs = t->subscribers;
        live.reserve(subs.size());
        subs.erase(std::remove_if(subs.begin(), subs.end(),
                                  [&live](const std::weak_ptr<detail::SubscriberQueue>& weak) {
                                      auto q = weak.lock();
                                      if (!q || q->status() !=
                                                    detail::SubscriberQueue::Status::Open) {
                                          return true;
                                      }
                                      live.push_back(std::move(q));
                                      return false;
                                  }),
                   subs.end());
    }

    for (auto& q : live) {
        if (!q->offer(chunk) && q->status() == detail::SubscriberQueue::Status::Overflowed) {
            spdlog::warn("OutputBroadcaster: subscriber of '{}' disconnected (queue depth {} "
                         "exceeded)",
                         id, queueDepth_);
        }
    }
}

void OutputBroadcaster::closeTopic(detail::TopicTable::Topic& topic) {
    std::lock_guard lock(topic.mutex);
    for (auto& weak : topic.subscribers) {
        if (auto q = weak.lock())
            q->close();
    }
    topic.subscribers.clear();
}

void OutputBroadcaster::close(const ProcessId& id) {
    if (auto t = table_->take(id))
        closeTopic(*t);
}

void OutputBroadcaster::closeAll() {
    for (auto& [id, t] : table_->takeAll())
        closeTopic(*t);
}

std::size_t OutputBroadcaster::subscriberCount(const ProcessId& id) const {
    auto t = table_->find(id);
    if (!t)
        return 0;
    std::lock_guard lock(t->mutex);
    return static_cast<std::size_t>(
        std::count_if(t->subscribers.begin(), t->subscribers.end(), [](const auto& weak) {
            auto q = weak.lock();
            return q && q->status() == detail::SubscriberQueue::Status::Open;
        }));
}

std::size_t OutputBroadcaster::topicCount() const {
    return table_->size();
}

} // namespace procd::supervisor
