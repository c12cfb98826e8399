/*
 * ChatRelay - per peer public key directory
 */

#pragma once

#include "crypto.hpp"

#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>

namespace chatrelay {

// Public keys received through public_key_exchange, keyed by the sending
// username. A newer key for the same user replaces the older one.
class PeerKeyDirectory {
public:
    // Returns false and fills `error` when the PEM does not parse.
    bool store(const std::string& username, const std::string& pem, std::string& error);

    std::optional<PkeyHandle> find(const std::string& username) const;
    bool contains(const std::string& username) const;
    void remove(const std::string& username);

    // True the first time it is called for `username` since the last clear();
    // used to offer our own key back exactly once per peer.
    bool mark_offered(const std::string& username);

    void clear();
    std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, PkeyHandle> keys_;
    std::set<std::string> offered_;
};

} // namespace chatrelay
