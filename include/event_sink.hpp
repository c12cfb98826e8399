/*
 * ChatRelay - outbound event channel seams
 */

#pragma once

#include "events.hpp"

#include <cstdint>

namespace chatrelay {

// Assigned by the server transport per accepted connection; never reused
// within one process.
using ConnectionHandle = uint64_t;

struct EmitTarget {
    enum class Kind {
        One,
        All,
        AllExcept
    };

    Kind kind = Kind::All;
    ConnectionHandle handle = 0;

    static EmitTarget one(ConnectionHandle target) { return {Kind::One, target}; }
    static EmitTarget all() { return {Kind::All, 0}; }
    static EmitTarget all_except(ConnectionHandle excluded) { return {Kind::AllExcept, excluded}; }
};

// Server side emit. Implementations must not block on a slow peer: emission
// is fire-and-forget for the registry, tracker and relays.
class EventSink {
public:
    virtual ~EventSink() = default;

    virtual void emit(const Event& event, const EmitTarget& target) = 0;
};

// Client side send. Returns false (with a reason) when the event could not
// be handed to the connection.
class EventTransport {
public:
    virtual ~EventTransport() = default;

    virtual bool send_event(const Event& event, std::string& error) = 0;
};

} // namespace chatrelay
