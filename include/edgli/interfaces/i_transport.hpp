#pragma once
#include "edgli/core/result.hpp"
#include "edgli/core/failures.hpp"
#include "edgli/identity/peer_id.hpp"
#include <cstdint>
#include <span>

namespace edgli {

/**
 * @brief Datagram transport below the session layer
 *
 * SendRaw hands one fixed-size packet to the node addressed by `to`.
 * Implementations must not call back into the session manager from inside
 * SendRaw; inbound bytes are delivered separately through
 * SessionManager::OnRawReceived.
 */
class ITransport {
public:
    virtual ~ITransport() = default;
    virtual Result<Unit, SessionFailure> SendRaw(
        const identity::PeerId& to,
        std::span<const uint8_t> bytes) = 0;
};

}
