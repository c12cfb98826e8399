/*
 * ChatRelay - session and presence registry
 */

#pragma once

#include "errors.hpp"
#include "event_sink.hpp"
#include "events.hpp"

#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace chatrelay {

constexpr std::size_t kDefaultHistoryCapacity = 200;

// Owns the connection <-> username binding and the public history window.
// The forward map and the reverse name index change together under mutex_,
// so a name is never claimed by two connections and a connection never holds
// two names.
class SessionRegistry {
public:
    explicit SessionRegistry(EventSink& sink,
                             std::size_t history_capacity = kDefaultHistoryCapacity);

    // On success broadcasts update_user_list to every session and sends the
    // history snapshot to `handle` when it is non-empty. A connection that
    // already holds a name is renamed atomically.
    bool register_session(ConnectionHandle handle,
                          const std::string& proposed_username,
                          RelayError& error);

    // Broadcasts the remaining user list when a binding was removed. The
    // connection stops counting as connected.
    void unregister_session(ConnectionHandle handle);

    // Tracks open connections whether or not they ever register a name.
    void mark_connected(ConnectionHandle handle);
    bool is_connected(ConnectionHandle handle) const;

    std::optional<ConnectionHandle> lookup(const std::string& username) const;
    std::optional<std::string> username_of(ConnectionHandle handle) const;
    std::vector<std::string> snapshot_usernames() const;
    std::size_t session_count() const;

    void append_history(PublicMessage entry);
    std::vector<PublicMessage> history_snapshot() const;
    std::size_t history_capacity() const { return history_capacity_; }

private:
    std::vector<std::string> usernames_locked() const;

    EventSink& sink_;
    const std::size_t history_capacity_;

    mutable std::mutex mutex_;
    std::unordered_map<ConnectionHandle, std::string> names_by_handle_;
    std::unordered_map<std::string, ConnectionHandle> handles_by_name_;
    std::unordered_set<ConnectionHandle> connected_;
    std::deque<PublicMessage> history_;
};

} // namespace chatrelay
