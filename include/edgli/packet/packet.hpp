#pragma once
#include "edgli/core/constants.hpp"
#include "edgli/identity/peer_id.hpp"
#include "edgli/session/session_id.hpp"
#include <array>
#include <cstdint>
#include <variant>
#include <vector>

namespace edgli::packet {

/// alpha (32) || beta (kRoutingHeaderBytes) || gamma (32) || delta (body)
using Packet = std::array<uint8_t, kPacketBytes>;

using ReplayTag = std::array<uint8_t, kReplayTagBytes>;

inline constexpr size_t kAlphaOffset = 0;
inline constexpr size_t kBetaOffset = kAlphaOffset + kX25519PublicKeyBytes;
inline constexpr size_t kGammaOffset = kBetaOffset + kRoutingHeaderBytes;
inline constexpr size_t kDeltaOffset = kGammaOffset + kHmacBytes;

static_assert(kDeltaOffset == kPacketHeaderBytes);

enum class UnitKind : uint8_t {
    Data = 0x01,
    Acknowledgement = 0x02
};

enum class RoutingFlag : uint8_t {
    Final = 0x00,
    Forward = 0x01
};

struct OutgoingPacket {
    identity::PeerId first_hop;
    Packet bytes{};
};

/// This node is an intermediate hop: hand `packet` to `next_hop`.
struct ForwardInstruction {
    identity::PeerId next_hop;
    Packet packet{};
};

/// This node is the final hop of a data unit.
struct DeliverPayload {
    std::vector<uint8_t> fragment;
};

struct Acknowledgement {
    session::SessionId session_id;
    std::vector<uint64_t> sequences;
};

struct DecodedUnit {
    std::variant<ForwardInstruction, DeliverPayload, Acknowledgement> unit;
    ReplayTag replay_tag{};
};

}
