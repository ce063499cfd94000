#include "edgli/path/static_relay_directory.hpp"
#include <algorithm>
#include <mutex>

namespace edgli::path {
    using identity::PeerId;
    using identity::RelayIdentity;

    StaticRelayDirectory::StaticRelayDirectory(std::vector<RelayIdentity> relays) {
        for (const auto& relay : relays) {
            const auto exists = std::any_of(relays_.begin(), relays_.end(),
                [&](const RelayIdentity& r) { return r.address == relay.address; });
            if (!exists) {
                relays_.push_back(relay);
            }
        }
    }

    std::vector<RelayIdentity> StaticRelayDirectory::KnownRelays() const {
        std::shared_lock guard(lock_);
        return relays_;
    }

    Result<Unit, SessionFailure> StaticRelayDirectory::Add(const RelayIdentity& relay) {
        std::unique_lock guard(lock_);
        const auto exists = std::any_of(relays_.begin(), relays_.end(),
            [&](const RelayIdentity& r) { return r.address == relay.address; });
        if (exists) {
            return Result<Unit, SessionFailure>::Err(
                SessionFailure::InvalidInput("Relay already present in directory"));
        }
        relays_.push_back(relay);
        return Result<Unit, SessionFailure>::Ok(unit);
    }

    bool StaticRelayDirectory::Remove(const PeerId& address) {
        std::unique_lock guard(lock_);
        const auto it = std::remove_if(relays_.begin(), relays_.end(),
            [&](const RelayIdentity& r) { return r.address == address; });
        if (it == relays_.end()) {
            return false;
        }
        relays_.erase(it, relays_.end());
        return true;
    }

    size_t StaticRelayDirectory::Size() const {
        std::shared_lock guard(lock_);
        return relays_.size();
    }
}
