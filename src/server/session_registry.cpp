/*
 * ChatRelay - session and presence registry implementation
 */

#include "session_registry.hpp"

#include "server_log.hpp"
#include "utils.hpp"

namespace chatrelay {

SessionRegistry::SessionRegistry(EventSink& sink, std::size_t history_capacity)
    : sink_(sink), history_capacity_(history_capacity == 0 ? 1 : history_capacity) {}

bool SessionRegistry::register_session(ConnectionHandle handle,
                                       const std::string& proposed_username,
                                       RelayError& error) {
    const std::string username = trim(proposed_username);
    if (username.empty()) {
        error.set(ErrorCode::InvalidUsername, "A valid username is required.");
        server_log_warn("Invalid registration attempt from connection #" + std::to_string(handle));
        return false;
    }

    std::vector<PublicMessage> history_copy;
    std::string previous_name;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (handles_by_name_.count(username) != 0) {
            error.set(ErrorCode::UsernameTaken, "Username '" + username + "' is already taken.");
            server_log_warn("Registration failed for connection #" + std::to_string(handle) +
                            ": username '" + username + "' taken.");
            return false;
        }

        auto existing = names_by_handle_.find(handle);
        if (existing != names_by_handle_.end()) {
            previous_name = existing->second;
            handles_by_name_.erase(previous_name);
        }
        names_by_handle_[handle] = username;
        handles_by_name_[username] = handle;
        connected_.insert(handle);

        history_copy.assign(history_.begin(), history_.end());

        // Emitted under the lock so list updates reach clients in commit order.
        sink_.emit(UserListUpdate{usernames_locked()}, EmitTarget::all());
    }

    if (!previous_name.empty()) {
        server_log_info("Connection #" + std::to_string(handle) + " renamed " + previous_name +
                        " -> " + username);
    } else {
        server_log_info("User registered: " + username + " on connection #" + std::to_string(handle));
    }

    if (!history_copy.empty()) {
        sink_.emit(ChatHistory{std::move(history_copy)}, EmitTarget::one(handle));
    }
    return true;
}

void SessionRegistry::unregister_session(ConnectionHandle handle) {
    std::string username;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        connected_.erase(handle);
        auto it = names_by_handle_.find(handle);
        if (it == names_by_handle_.end()) {
            return;
        }
        username = it->second;
        handles_by_name_.erase(username);
        names_by_handle_.erase(it);
        sink_.emit(UserListUpdate{usernames_locked()}, EmitTarget::all());
    }
    server_log_info("User left: " + username);
}

void SessionRegistry::mark_connected(ConnectionHandle handle) {
    std::lock_guard<std::mutex> lock(mutex_);
    connected_.insert(handle);
}

bool SessionRegistry::is_connected(ConnectionHandle handle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connected_.count(handle) != 0;
}

std::optional<ConnectionHandle> SessionRegistry::lookup(const std::string& username) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = handles_by_name_.find(username);
    if (it == handles_by_name_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<std::string> SessionRegistry::username_of(ConnectionHandle handle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = names_by_handle_.find(handle);
    if (it == names_by_handle_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<std::string> SessionRegistry::snapshot_usernames() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return usernames_locked();
}

std::size_t SessionRegistry::session_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return names_by_handle_.size();
}

void SessionRegistry::append_history(PublicMessage entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    history_.push_back(std::move(entry));
    while (history_.size() > history_capacity_) {
        history_.pop_front();
    }
}

std::vector<PublicMessage> SessionRegistry::history_snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<PublicMessage>(history_.begin(), history_.end());
}

std::vector<std::string> SessionRegistry::usernames_locked() const {
    std::vector<std::string> names;
    names.reserve(names_by_handle_.size());
    for (const auto& [handle, name] : names_by_handle_) {
        names.push_back(name);
    }
    return names;
}

} // namespace chatrelay
