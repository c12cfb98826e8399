/*
 * ChatRelay - session registry tests
 */

#include <atomic>
#include <string>
#include <thread>
#include <vector>

#include "session_registry.hpp"
#include "test_support.hpp"
#include "utils.hpp"

using namespace chatrelay;
using chatrelay::testing::RecordingSink;
using chatrelay::testing::targets_one;

int main() {
    set_log_level(LogLevel::Error);

    RecordingSink sink;
    SessionRegistry registry(sink);
    RelayError err;

    if (!registry.register_session(1, "  alice ", err)) {
        FAIL();
    }
    if (registry.username_of(1).value_or("") != "alice" || registry.lookup("alice").value_or(0) != 1) {
        FAIL();
    }
    auto lists = sink.of<UserListUpdate>();
    if (lists.size() != 1 || lists[0].second.kind != EmitTarget::Kind::All || lists[0].first.users.size() != 1) {
        FAIL();
    }
    // Empty history: no chat_history on registration.
    if (!sink.of<ChatHistory>().empty()) {
        FAIL();
    }

    RelayError taken;
    if (registry.register_session(2, "alice", taken) || taken.code != ErrorCode::UsernameTaken ||
        taken.message != "Username 'alice' is already taken.") {
        FAIL();
    }
    // Re-registering one's own current name is also a conflict.
    RelayError own;
    if (registry.register_session(1, "alice", own) || own.code != ErrorCode::UsernameTaken) {
        FAIL();
    }
    RelayError blank;
    if (registry.register_session(2, "   ", blank) || blank.code != ErrorCode::InvalidUsername ||
        blank.message != "A valid username is required.") {
        FAIL();
    }
    if (error_category(blank.code) != ErrorCategory::InvalidInput ||
        error_category(taken.code) != ErrorCategory::Conflict) {
        FAIL();
    }

    // History goes to the newly registered session only.
    registry.append_history(PublicMessage{"alice", "hi", std::nullopt, std::nullopt});
    sink.clear();
    if (!registry.register_session(2, "bob", err)) {
        FAIL();
    }
    auto histories = sink.of<ChatHistory>();
    if (histories.size() != 1 || !targets_one(histories[0].second, 2) || histories[0].first.messages.size() != 1) {
        FAIL();
    }

    // Rename releases the old name in the same step.
    if (!registry.register_session(2, "robert", err)) {
        FAIL();
    }
    if (registry.lookup("bob").has_value() || registry.lookup("robert").value_or(0) != 2 ||
        registry.session_count() != 2) {
        FAIL();
    }

    sink.clear();
    registry.unregister_session(2);
    lists = sink.of<UserListUpdate>();
    if (lists.size() != 1 || lists[0].first.users != std::vector<std::string>{"alice"}) {
        FAIL();
    }
    sink.clear();
    registry.unregister_session(2);
    if (!sink.all().empty()) {
        FAIL();
    }

    // Liveness covers registered and anonymous connections alike.
    registry.mark_connected(9);
    if (!registry.is_connected(1) || registry.is_connected(2) || !registry.is_connected(9) ||
        registry.username_of(9).has_value()) {
        FAIL();
    }
    registry.unregister_session(9);
    if (registry.is_connected(9) || !sink.all().empty()) {
        FAIL();
    }

    // History keeps the newest entries up to its capacity.
    for (int i = 0; i < 250; ++i) {
        registry.append_history(PublicMessage{"alice", "m" + std::to_string(i), std::nullopt, std::nullopt});
    }
    auto history = registry.history_snapshot();
    if (history.size() != kDefaultHistoryCapacity || history.front().message != "m50" ||
        history.back().message != "m249") {
        FAIL();
    }

    // Concurrent claims on one name: exactly one wins.
    RecordingSink race_sink;
    SessionRegistry race(race_sink);
    std::atomic<int> winners{0};
    std::vector<std::thread> threads;
    for (ConnectionHandle h = 100; h < 132; ++h) {
        threads.emplace_back([&race, &winners, h] {
            RelayError e;
            if (race.register_session(h, "dup", e)) {
                winners++;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }
    if (winners.load() != 1 || race.session_count() != 1) {
        FAIL();
    }
    auto names = race.snapshot_usernames();
    if (names.size() != 1 || names[0] != "dup") {
        FAIL();
    }

    return 0;
}
