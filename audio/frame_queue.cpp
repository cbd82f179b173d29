#include "audio/frame_queue.hpp"

#include <utility>

namespace audio {

void FrameQueue::push(AudioChunk chunk) {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        items_.emplace_back(std::move(chunk));
    }
    cv_.notify_one();
}

void FrameQueue::pushSentinel() {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        items_.emplace_back(std::nullopt);
    }
    cv_.notify_one();
}

std::optional<AudioChunk> FrameQueue::pop() {
    std::unique_lock<std::mutex> lock(mtx_);
    cv_.wait(lock, [this] { return !items_.empty(); });

    std::optional<AudioChunk> item = std::move(items_.front());
    items_.pop_front();
    return item;
}

bool FrameQueue::tryPop(std::optional<AudioChunk>& out) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (items_.empty()) return false;

    out = std::move(items_.front());
    items_.pop_front();
    return true;
}

size_t FrameQueue::size() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return items_.size();
}

} // namespace audio
