/*
 * ChatRelay - bounded per-connection send queue
 */

#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <string>

namespace chatrelay {

constexpr std::size_t kMaxOutboxBytes = 64u * 1024u * 1024u;

// Encoded events waiting for a connection's writer thread. The queue keeps a
// running byte total; a push that would take it past the limit closes the
// outbox instead, since a peer that far behind is not reading.
class Outbox {
public:
    explicit Outbox(std::size_t max_bytes = kMaxOutboxBytes);

    Outbox(const Outbox&) = delete;
    Outbox& operator=(const Outbox&) = delete;

    // False once the outbox is closed, including when this push overflowed it.
    bool push(std::string encoded);

    // Blocks until an event is queued or the outbox closes. False when closed.
    bool pop(std::string& encoded);

    // Drops anything still queued and wakes the writer.
    void close();

    bool closed() const;
    std::size_t queued_bytes() const;
    std::size_t size() const;

private:
    const std::size_t max_bytes_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::string> queue_;
    std::size_t queued_bytes_ = 0;
    bool closed_ = false;
};

} // namespace chatrelay
