#pragma once
#include "edgli/core/result.hpp"
#include "edgli/core/failures.hpp"
#include "edgli/identity/relay_identity.hpp"
#include "edgli/session/session_id.hpp"
#include "session/session_frame.pb.h"
#include <cstdint>
#include <span>
#include <vector>

namespace edgli::session {

/// Serialization of SessionFrame messages carried inside data units.
class FrameCodec {
public:
    static proto::session::SessionFrame MakeOpen(
        const SessionId& id,
        const identity::RelayIdentity& reply_to);

    static proto::session::SessionFrame MakeData(
        const SessionId& id,
        uint64_t sequence,
        std::span<const uint8_t> payload,
        bool final_fragment);

    static proto::session::SessionFrame MakeClose(const SessionId& id, uint64_t sequence);

    static Result<std::vector<uint8_t>, SessionFailure> Serialize(
        const proto::session::SessionFrame& frame);

    /// Rejects unknown versions, malformed ids and unspecified kinds.
    static Result<proto::session::SessionFrame, SessionFailure> Parse(std::span<const uint8_t> bytes);

    static Result<identity::RelayIdentity, SessionFailure> ReplyAddressOf(
        const proto::session::SessionFrame& frame);

private:
    FrameCodec() = delete;
};

}
