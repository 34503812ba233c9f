#pragma once

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

namespace reclo {

/// Bounded producer/consumer queue of encoded audio frames.
///
/// The encoder pushes, the chunk recorder pops.  Neither side holds a
/// reference to the other, so each can be started and stopped on its own.
class FrameChannel {
public:
    using Frame = std::vector<uint8_t>;

    explicit FrameChannel(size_t capacity = 256);

    // Non-copyable.
    FrameChannel(const FrameChannel&) = delete;
    FrameChannel& operator=(const FrameChannel&) = delete;

    /// Enqueue a frame.  Returns false (and counts a drop) if the channel
    /// is closed or full.
    bool push(Frame frame);

    /// Block until a frame is available.  Returns nullopt once the channel
    /// is closed and drained.
    std::optional<Frame> pop();

    /// Wake the consumer and refuse further pushes.  Queued frames remain
    /// poppable.
    void close();

    /// Accept pushes again after close().
    void reopen();

    bool is_closed() const;
    size_t size() const;
    size_t dropped() const;

private:
    const size_t            capacity_;
    std::deque<Frame>       queue_;
    bool                    closed_  = false;
    size_t                  dropped_ = 0;
    mutable std::mutex      mu_;
    std::condition_variable cv_;
};

} // namespace reclo
