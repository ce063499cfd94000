#pragma once
#include "edgli/core/failures.hpp"
#include "edgli/identity/peer_id.hpp"
#include "edgli/session/session_id.hpp"
#include "edgli/session/session_state.hpp"
#include <cstdint>
#include <span>
#include <string_view>

namespace edgli {

/// Operational events. Called outside every session and table lock.
class ISessionEventHandler {
public:
    virtual ~ISessionEventHandler() = default;
    virtual void OnNodeStarted(const identity::PeerId& id, std::span<const uint8_t> public_key) = 0;
    virtual void OnSessionStateChanged(
        const session::SessionId& id,
        session::SessionState from,
        session::SessionState to) = 0;
    virtual void OnRetransmission(const session::SessionId& id, uint64_t sequence, uint32_t attempt) = 0;
    virtual void OnSessionFailed(const session::SessionId& id, const SessionFailure& failure) = 0;
    virtual void OnPacketDropped(std::string_view reason) = 0;
};

}
