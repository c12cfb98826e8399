/*
 * ChatRelay - bounded send queue tests
 */

#include <atomic>
#include <string>
#include <thread>

#include "outbox.hpp"
#include "test_support.hpp"

using namespace chatrelay;

int main() {
    if (kMaxOutboxBytes != 64u * 1024u * 1024u) {
        FAIL();
    }

    {
        Outbox outbox(10);
        if (!outbox.push("abcd") || !outbox.push("efgh") || outbox.queued_bytes() != 8 || outbox.size() != 2) {
            FAIL();
        }
        std::string encoded;
        if (!outbox.pop(encoded) || encoded != "abcd" || outbox.queued_bytes() != 4) {
            FAIL();
        }
        // Filling to exactly the limit is allowed.
        if (!outbox.push("123456") || outbox.queued_bytes() != 10) {
            FAIL();
        }
        // One more byte overflows: the outbox closes and drops what it held.
        if (outbox.push("x") || !outbox.closed() || outbox.size() != 0 || outbox.queued_bytes() != 0) {
            FAIL();
        }
        if (outbox.push("y") || outbox.pop(encoded)) {
            FAIL();
        }
    }

    {
        // A single event larger than the whole limit is an overflow too.
        Outbox outbox(4);
        if (outbox.push("too large") || !outbox.closed()) {
            FAIL();
        }
    }

    {
        // A peer that never drains is cut off once the default limit is reached.
        Outbox outbox;
        const std::string event(1024 * 1024, 'e');
        std::size_t accepted = 0;
        while (outbox.push(event)) {
            ++accepted;
            if (accepted > 64) {
                break;
            }
        }
        if (accepted != 64 || !outbox.closed()) {
            FAIL();
        }
    }

    {
        // close() releases a writer blocked on an empty outbox.
        Outbox outbox;
        std::atomic<bool> popped{true};
        std::thread writer([&] {
            std::string encoded;
            popped = outbox.pop(encoded);
        });
        outbox.close();
        writer.join();
        if (popped || !outbox.closed()) {
            FAIL();
        }
    }

    {
        // Events reach a waiting writer in order.
        Outbox outbox;
        std::string first;
        std::string second;
        std::thread writer([&] {
            outbox.pop(first);
            outbox.pop(second);
        });
        outbox.push("one");
        outbox.push("two");
        writer.join();
        if (first != "one" || second != "two" || outbox.queued_bytes() != 0) {
            FAIL();
        }
    }
    return 0;
}
