#pragma once

#include <procd/core/types.h>
#include <procd/supervisor/types.h>

#include <cstddef>
#include <cstdint>
#include <deque>
#include <shared_mutex>
#include <string>
#include <vector>

namespace procd::supervisor {

/**
 * @brief Bounded, sequence-numbered store of one output stream of one generation
 *
 * Chunks are numbered from 1. When the retained payload exceeds `maxBytes` the oldest chunks
 * are evicted and `floorSequence()` advances to the last evicted sequence. The newest chunk is
 * always retained, even if it alone exceeds the limit.
 *
 * **Thread Safety:** one writer (the stream's pump) and any number of concurrent readers.
 */
class OutputBuffer {
public:
    OutputBuffer(OutputStream stream, uint64_t generation, std::size_t maxBytes);

    OutputBuffer(const OutputBuffer&) = delete;
    OutputBuffer& operator=(const OutputBuffer&) = delete;

    /**
     * @brief Store a chunk and return a copy carrying its assigned sequence and timestamp
     */
    OutputChunk append(std::string data);

    /**
     * @brief Chunks with sequence in (sinceSequence, current], oldest first
     * @return ErrorCode::Truncated if sinceSequence < floorSequence()
     */
    [[nodiscard]] Result<OutputSlice> read(uint64_t sinceSequence) const;

    // Newest `n` retained chunks, oldest first
    [[nodiscard]] std::vector<OutputChunk> tail(std::size_t n) const;

    [[nodiscard]] uint64_t floorSequence() const;
    [[nodiscard]] uint64_t lastSequence() const;
    [[nodiscard]] std::size_t retainedBytes() const;
    [[nodiscard]] std::size_t size() const;

    OutputStream stream() const noexcept { return stream_; }
    uint64_t generation() const noexcept { return generation_; }

private:
    void evictLocked();

    const OutputStream stream_;
    const uint64_t generation_;
    const std::size_t maxBytes_;

    mutable std::shared_mutex mutex_;
    std::deque<OutputChunk> chunks_;
    std::size_t bytes_{0};
    uint64_t nextSequence_{1};
    uint64_t floorSequence_{0};
};

} // namespace procd::supervisor
