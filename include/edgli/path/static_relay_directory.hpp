#pragma once
#include "edgli/core/result.hpp"
#include "edgli/core/failures.hpp"
#include "edgli/interfaces/i_relay_directory.hpp"
#include <shared_mutex>
#include <vector>

namespace edgli::path {

/// Fixed relay pool, mutable at runtime. Duplicate addresses are rejected.
class StaticRelayDirectory final : public IRelayDirectory {
public:
    StaticRelayDirectory() = default;
    explicit StaticRelayDirectory(std::vector<identity::RelayIdentity> relays);

    std::vector<identity::RelayIdentity> KnownRelays() const override;

    Result<Unit, SessionFailure> Add(const identity::RelayIdentity& relay);
    bool Remove(const identity::PeerId& address);
    size_t Size() const;

private:
    mutable std::shared_mutex lock_;
    std::vector<identity::RelayIdentity> relays_;
};

}
