/*
 * ChatRelay - typing indicator relay
 */

#pragma once

#include "event_sink.hpp"
#include "events.hpp"
#include "session_registry.hpp"

namespace chatrelay {

// Stateless and best-effort: unknown originators, unknown contexts and
// unresolved private recipients are dropped without an error event.
// Deduplication of repeated states is the sending client's job.
class TypingRelay {
public:
    TypingRelay(SessionRegistry& registry, EventSink& sink);

    // Returns true when an event was emitted.
    bool relay(ConnectionHandle origin, const TypingRequest& request);

private:
    SessionRegistry& registry_;
    EventSink& sink_;
};

} // namespace chatrelay
