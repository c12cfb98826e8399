/*
 * ChatRelay - typing indicator relay implementation
 */

#include "typing_relay.hpp"

#include "server_log.hpp"
#include "utils.hpp"

namespace chatrelay {

TypingRelay::TypingRelay(SessionRegistry& registry, EventSink& sink)
    : registry_(registry), sink_(sink) {}

bool TypingRelay::relay(ConnectionHandle origin, const TypingRequest& request) {
    auto username = registry_.username_of(origin);
    if (!username.has_value()) {
        server_log_warn("Typing event from unregistered connection #" + std::to_string(origin));
        return false;
    }

    if (request.context == "public") {
        sink_.emit(PublicTyping{username.value(), request.is_typing}, EmitTarget::all_except(origin));
        return true;
    }

    if (request.context == "private") {
        if (!request.recipient.has_value()) {
            return false;
        }
        const std::string recipient = trim(request.recipient.value());
        if (recipient.empty()) {
            return false;
        }
        auto target = registry_.lookup(recipient);
        if (!target.has_value()) {
            return false;
        }
        sink_.emit(PrivateTyping{username.value(), request.is_typing}, EmitTarget::one(target.value()));
        return true;
    }

    server_log_debug("Ignoring typing event with invalid context '" + request.context + "' from " +
                     username.value());
    return false;
}

} // namespace chatrelay
