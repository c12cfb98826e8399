/*
 * ChatRelay - per peer public key directory implementation
 */

#include "peer_keys.hpp"

#include <stdexcept>

namespace chatrelay {

bool PeerKeyDirectory::store(const std::string& username, const std::string& pem, std::string& error) {
    if (username.empty()) {
        error = "missing username";
        return false;
    }
    PkeyHandle key;
    try {
        key = load_public_key_pem(pem);
    } catch (const std::exception& ex) {
        error = ex.what();
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    keys_[username] = std::move(key);
    return true;
}

std::optional<PkeyHandle> PeerKeyDirectory::find(const std::string& username) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = keys_.find(username);
    if (it == keys_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool PeerKeyDirectory::contains(const std::string& username) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return keys_.count(username) > 0;
}

void PeerKeyDirectory::remove(const std::string& username) {
    std::lock_guard<std::mutex> lock(mutex_);
    keys_.erase(username);
    offered_.erase(username);
}

bool PeerKeyDirectory::mark_offered(const std::string& username) {
    std::lock_guard<std::mutex> lock(mutex_);
    return offered_.insert(username).second;
}

void PeerKeyDirectory::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    keys_.clear();
    offered_.clear();
}

std::size_t PeerKeyDirectory::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return keys_.size();
}

} // namespace chatrelay
