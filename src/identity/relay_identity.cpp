#include "edgli/identity/relay_identity.hpp"
#include <algorithm>
#include <cmath>

namespace edgli::identity {
    Result<RelayIdentity, SessionFailure> RelayIdentity::Create(
        const PeerId& address,
        std::span<const uint8_t> public_key,
        const double weight) {
        if (public_key.size() != kX25519PublicKeyBytes) {
            return Result<RelayIdentity, SessionFailure>::Err(
                SessionFailure::InvalidInput("Relay public key must be 32 bytes"));
        }
        if (!std::isfinite(weight) || weight <= 0.0) {
            return Result<RelayIdentity, SessionFailure>::Err(
                SessionFailure::InvalidInput("Relay weight must be positive"));
        }
        RelayIdentity relay;
        relay.address = address;
        std::copy(public_key.begin(), public_key.end(), relay.public_key.begin());
        relay.weight = weight;
        return Result<RelayIdentity, SessionFailure>::Ok(relay);
    }
}
