/*
 * ChatRelay - typing relay tests
 */

#include <string>

#include "session_registry.hpp"
#include "test_support.hpp"
#include "typing_relay.hpp"
#include "utils.hpp"

using namespace chatrelay;
using chatrelay::testing::RecordingSink;
using chatrelay::testing::targets_one;

int main() {
    set_log_level(LogLevel::Error);

    RecordingSink sink;
    SessionRegistry registry(sink);
    TypingRelay typing(registry, sink);
    RelayError err;
    if (!registry.register_session(1, "alice", err) || !registry.register_session(2, "bob", err)) {
        FAIL();
    }
    sink.clear();

    if (!typing.relay(1, TypingRequest{"public", true, std::nullopt})) {
        FAIL();
    }
    auto pub = sink.of<PublicTyping>();
    if (pub.size() != 1 || pub[0].first.username != "alice" || !pub[0].first.is_typing ||
        pub[0].second.kind != EmitTarget::Kind::AllExcept || pub[0].second.handle != 1) {
        FAIL();
    }

    if (!typing.relay(1, TypingRequest{"private", false, std::string(" bob ")})) {
        FAIL();
    }
    auto priv = sink.of<PrivateTyping>();
    if (priv.size() != 1 || priv[0].first.username != "alice" || priv[0].first.is_typing ||
        !targets_one(priv[0].second, 2)) {
        FAIL();
    }

    sink.clear();
    // Dropped without an error event.
    if (typing.relay(1, TypingRequest{"private", true, std::string("carol")}) ||
        typing.relay(1, TypingRequest{"private", true, std::nullopt}) ||
        typing.relay(1, TypingRequest{"room", true, std::nullopt}) ||
        typing.relay(7, TypingRequest{"public", true, std::nullopt})) {
        FAIL();
    }
    if (!sink.all().empty()) {
        FAIL();
    }
    return 0;
}
