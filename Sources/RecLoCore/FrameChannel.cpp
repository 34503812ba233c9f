#include "FrameChannel.hpp"

namespace reclo {

FrameChannel::FrameChannel(size_t capacity) : capacity_(capacity) {}

bool FrameChannel::push(Frame frame) {
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (closed_ || queue_.size() >= capacity_) {
            ++dropped_;
            return false;
        }
        queue_.push_back(std::move(frame));
    }
    cv_.notify_one();
    return true;
}

std::optional<FrameChannel::Frame> FrameChannel::pop() {
    std::unique_lock<std::mutex> lock(mu_);
    cv_.wait(lock, [this] { return closed_ || !queue_.empty(); });

    if (queue_.empty()) return std::nullopt;

    Frame frame = std::move(queue_.front());
    queue_.pop_front();
    return frame;
}

void FrameChannel::close() {
    {
        std::lock_guard<std::mutex> lock(mu_);
        closed_ = true;
    }
    cv_.notify_all();
}

void FrameChannel::reopen() {
    std::lock_guard<std::mutex> lock(mu_);
    closed_ = false;
}

bool FrameChannel::is_closed() const {
    std::lock_guard<std::mutex> lock(mu_);
    return closed_;
}

size_t FrameChannel::size() const {
    std::lock_guard<std::mutex> lock(mu_);
    return queue_.size();
}

size_t FrameChannel::dropped() const {
    std::lock_guard<std::mutex> lock(mu_);
    return dropped_;
}

} // namespace reclo
