/*
 * ChatRelay - client outbound event queue implementation
 */

#include "outbound_queue.hpp"

#include "utils.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace chatrelay {

const char* connection_state_name(ConnectionState state) {
    switch (state) {
        case ConnectionState::Disconnected:
            return "disconnected";
        case ConnectionState::Connecting:
            return "connecting";
        case ConnectionState::Connected:
            return "connected";
    }
    return "unknown";
}

bool TypingDeduplicator::should_emit(const std::string& context,
                                     const std::optional<std::string>& peer,
                                     bool is_typing) {
    if (context == "public") {
        if (public_typing_ == is_typing) {
            return false;
        }
        public_typing_ = is_typing;
        return true;
    }
    const std::string key = peer.value_or("");
    auto it = private_typing_.find(key);
    if (it != private_typing_.end() && it->second == is_typing) {
        return false;
    }
    private_typing_[key] = is_typing;
    return true;
}

void TypingDeduplicator::reset() {
    public_typing_ = false;
    private_typing_.clear();
}

OutboundQueue::OutboundQueue(EventTransport& transport) : transport_(transport) {}

void OutboundQueue::set_error_callback(ErrorCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    on_error_ = std::move(callback);
}

void OutboundQueue::set_connect_request(ConnectRequest request) {
    std::lock_guard<std::mutex> lock(mutex_);
    connect_request_ = std::move(request);
}

void OutboundQueue::set_desired_username(const std::string& username) {
    std::lock_guard<std::mutex> lock(mutex_);
    desired_username_ = trim(username);
}

std::string OutboundQueue::desired_username() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return desired_username_;
}

bool OutboundQueue::on_error_notice(const std::string& message) {
    // Quoted text is a user name echoed back, not part of the error.
    std::string lowered;
    bool quoted = false;
    for (unsigned char ch : message) {
        if (ch == '\'') {
            quoted = !quoted;
        } else if (!quoted) {
            lowered.push_back(static_cast<char>(std::tolower(ch)));
        }
    }
    if (lowered.find("username") == std::string::npos) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (desired_username_.empty()) {
        return false;
    }
    log_debug("Forgetting rejected username '" + desired_username_ + "'");
    desired_username_.clear();
    return true;
}

void OutboundQueue::emit(const Event& event) {
    std::vector<RelayError> failures;
    ConnectRequest connect;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (const auto* reg = std::get_if<RegisterRequest>(&event)) {
            desired_username_ = trim(reg->username);
        }
        if (state_ == ConnectionState::Connected) {
            send_locked(event, failures);
        } else {
            buffer_.push_back(event);
            if (state_ == ConnectionState::Disconnected) {
                state_ = ConnectionState::Connecting;
                connect = connect_request_;
            }
        }
    }
    report(failures);
    if (connect) {
        connect();
    }
}

bool OutboundQueue::emit_typing(const TypingRequest& request) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!typing_.should_emit(request.context, request.recipient, request.is_typing)) {
            return false;
        }
    }
    emit(request);
    return true;
}

void OutboundQueue::on_connecting() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == ConnectionState::Disconnected) {
        state_ = ConnectionState::Connecting;
    }
}

void OutboundQueue::on_connected() {
    std::vector<RelayError> failures;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = ConnectionState::Connected;

        std::vector<Event> pending;
        pending.swap(buffer_);
        const bool register_queued = std::any_of(pending.begin(), pending.end(), [](const Event& e) {
            return std::holds_alternative<RegisterRequest>(e);
        });
        if (!desired_username_.empty() && !register_queued) {
            pending.insert(pending.begin(), RegisterRequest{desired_username_});
        }
        for (const auto& event : pending) {
            send_locked(event, failures);
        }
    }
    report(failures);
}

void OutboundQueue::on_disconnected() {
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = ConnectionState::Disconnected;
    buffer_.clear();
    typing_.reset();
}

ConnectionState OutboundQueue::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::size_t OutboundQueue::buffered_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return buffer_.size();
}

void OutboundQueue::send_locked(const Event& event, std::vector<RelayError>& failures) {
    std::string error;
    if (!transport_.send_event(event, error)) {
        RelayError failure;
        failure.set(ErrorCode::TransportFailure, std::string("Failed to send '") + event_name(event) + "': " + error);
        failures.push_back(std::move(failure));
    }
}

void OutboundQueue::report(const std::vector<RelayError>& failures) {
    if (failures.empty()) {
        return;
    }
    ErrorCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        callback = on_error_;
    }
    for (const auto& failure : failures) {
        log_warn(failure.message);
        if (callback) {
            callback(failure);
        }
    }
}

} // namespace chatrelay
