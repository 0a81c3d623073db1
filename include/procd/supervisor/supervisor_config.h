#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string_view>

namespace procd::supervisor {

// What happens when a subscriber's queue is full and another chunk arrives
enum class OverflowPolicy {
    DropOldest, ///< discard the oldest queued chunk and count it
    Disconnect  ///< close the subscription once its queue has been drained
};

constexpr const char* toString(OverflowPolicy policy) {
    return policy == OverflowPolicy::DropOldest ? "drop-oldest" : "disconnect";
}

std::optional<OverflowPolicy> parseOverflowPolicy(std::string_view name);

struct SupervisorConfig {
    std::size_t maxBufferBytesPerStream{1024 * 1024};
    std::chrono::milliseconds defaultGrace{5000};
    std::chrono::milliseconds killWait{2000};
    std::size_t subscriberQueueDepth{256};
    OverflowPolicy overflowPolicy{OverflowPolicy::DropOldest};
    std::size_t maxLineBytes{64 * 1024};
    std::chrono::milliseconds stdinWriteTimeout{1000};
    std::chrono::milliseconds pumpPollInterval{100};
};

} // namespace procd::supervisor
