#include <procd/supervisor/output_buffer.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <iterator>
#include <mutex>

namespace procd::supervisor {

std::optional<OutputStream> parseOutputStream(std::string_view name) {
    if (name == "stdout" || name == "out")
        return OutputStream::Stdout;
    if (name == "stderr" || name == "err")
        return OutputStream::Stderr;
    return std::nullopt;
}

OutputBuffer::OutputBuffer(OutputStream stream, uint64_t generation, std::size_t maxBytes)
    : stream_(stream), generation_(generation), maxBytes_(maxBytes) {}

OutputChunk OutputBuffer::append(std::string data) {
    OutputChunk chunk;
    chunk.stream = stream_;
    chunk.generation = generation_;
    chunk.timestamp = std::chrono::system_clock::now();
    chunk.data = std::move(data);

    std::unique_lock lock(mutex_);
    chunk.sequence = nextSequence_++;
    bytes_ += chunk.data.size();
    chunks_.push_back(chunk);
    evictLocked();
    return chunk;
}

void OutputBuffer::evictLocked() {
    std::size_t evicted = 0;
    while (bytes_ > maxBytes_ && chunks_.size() > 1) {
        auto& oldest = chunks_.front();
        bytes_ -= oldest.data.size();
        floorSequence_ = oldest.sequence;
        chunks_.pop_front();
        ++evicted;
    }
    if (evicted > 0) {
        spdlog::trace("OutputBuffer[{} gen {}]: evicted {} chunks, floor now {}",
                      toString(stream_), generation_, evicted, floorSequence_);
    }
}

Result<OutputSlice> OutputBuffer::read(uint64_t sinceSequence) const {
    std::shared_lock lock(mutex_);
    if (sinceSequence < floorSequence_) {
        return Error{ErrorCode::Truncated,
                     fmt::format("{} output after sequence {} was evicted (floor is {})",
                                 toString(stream_), sinceSequence, floorSequence_)};
    }

    OutputSlice slice;
    slice.floorSequence = floorSequence_;
    slice.lastSequence = nextSequence_ - 1;

    // Retained sequences are contiguous: chunks_[i].sequence == floorSequence_ + 1 + i
    const uint64_t skip = sinceSequence - floorSequence_;
    if (skip < chunks_.size()) {
        auto first = chunks_.begin() + static_cast<std::ptrdiff_t>(skip);
        slice.chunks.assign(first, chunks_.end());
    }
    return slice;
}

std::vector<OutputChunk> OutputBuffer::tail(std::size_t n) const {
    std::shared_lock lock(mutex_);
    n = std::min(n, chunks_.size());
    return {chunks_.end() - static_cast<std::ptrdiff_t>(n), chunks_.end()};
}

uint64_t OutputBuffer::floorSequence() const {
    std::shared_lock lock(mutex_);
    return floorSequence_;
}

uint64_t OutputBuffer::lastSequence() const {
    std::shared_lock lock(mutex_);
    return nextSequence_ - 1;
}

std::size_t OutputBuffer::retainedBytes() const {
    std::shared_lock lock(mutex_);
    return bytes_;
}

std::size_t OutputBuffer::size() const {
    std::shared_lock lock(mutex_);
    return chunks_.size();
}

} // namespace procd::supervisor
