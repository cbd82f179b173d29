#pragma once
#include <string>
#include <deque>
#include <mutex>
#include <optional>
#include <condition_variable>

namespace audio {

// Raw little-endian 16-bit mono PCM bytes
using AudioChunk = std::string;

// Unbounded FIFO between the capture callback (sole producer) and the
// session generator (sole consumer). std::nullopt is the end-of-stream
// sentinel; nothing is ever dropped, so a slow consumer grows memory
// instead of losing audio.
class FrameQueue {
public:
    // Never blocks beyond the queue mutex
    void push(AudioChunk chunk);
    void pushSentinel();

    // Blocks until an item is available; std::nullopt means end of stream
    std::optional<AudioChunk> pop();

    // Non-blocking pop. Returns false when the queue is empty,
    // otherwise stores the item (possibly the sentinel) in `out`.
    bool tryPop(std::optional<AudioChunk>& out);

    size_t size() const;

private:
    mutable std::mutex mtx_;
    std::condition_variable cv_;
    std::deque<std::optional<AudioChunk>> items_;
};

} // namespace audio
