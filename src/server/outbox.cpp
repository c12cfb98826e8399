/*
 * ChatRelay - bounded per-connection send queue implementation
 */

#include "outbox.hpp"

#include <utility>

namespace chatrelay {

Outbox::Outbox(std::size_t max_bytes) : max_bytes_(max_bytes) {}

bool Outbox::push(std::string encoded) {
    bool accepted = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return false;
        }
        if (encoded.size() > max_bytes_ - queued_bytes_) {
            closed_ = true;
            queue_.clear();
            queued_bytes_ = 0;
        } else {
            queued_bytes_ += encoded.size();
            queue_.push_back(std::move(encoded));
            accepted = true;
        }
    }
    cv_.notify_all();
    return accepted;
}

bool Outbox::pop(std::string& encoded) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return closed_ || !queue_.empty(); });
    if (closed_) {
        return false;
    }
    encoded = std::move(queue_.front());
    queue_.pop_front();
    queued_bytes_ -= encoded.size();
    return true;
}

void Outbox::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        queue_.clear();
        queued_bytes_ = 0;
    }
    cv_.notify_all();
}

bool Outbox::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

std::size_t Outbox::queued_bytes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queued_bytes_;
}

std::size_t Outbox::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

} // namespace chatrelay
