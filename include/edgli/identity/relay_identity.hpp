#pragma once
#include "edgli/identity/peer_id.hpp"
#include "edgli/crypto/primitives.hpp"

namespace edgli::identity {

/// A relay known to the local node: address, packet key and selection weight.
struct RelayIdentity {
    PeerId address;
    crypto::Key32 public_key{};
    double weight = 1.0;

    static Result<RelayIdentity, SessionFailure> Create(
        const PeerId& address,
        std::span<const uint8_t> public_key,
        double weight = 1.0);

    bool operator==(const RelayIdentity& other) const noexcept {
        return address == other.address && public_key == other.public_key;
    }
};

}
