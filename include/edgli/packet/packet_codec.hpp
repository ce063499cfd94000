#pragma once
#include "edgli/core/result.hpp"
#include "edgli/core/failures.hpp"
#include "edgli/identity/node_key_pair.hpp"
#include "edgli/packet/packet.hpp"
#include "edgli/path/path_descriptor.hpp"
#include <span>

namespace edgli::packet {

/**
 * @brief Fixed-size onion packet codec
 *
 * Sphinx-style construction: one ephemeral X25519 key per packet, blinded
 * from hop to hop; each hop peels one ChaCha20 layer from the routing header
 * after verifying its HMAC-SHA256 tag, and one keystream layer from the body.
 * The final hop opens a ChaCha20-Poly1305 sealed body.
 *
 * Stateless. Every call may run concurrently with any other.
 *
 * Every integrity or format failure in Decode returns
 * SessionFailure::MalformedPacket() with the same message, so callers
 * cannot tell which check rejected the packet.
 */
class PacketCodec {
public:
    /**
     * @brief Build a data unit carrying `fragment` to path.Destination()
     *
     * @return FragmentTooLarge when fragment exceeds kMaxFragmentBytes
     */
    [[nodiscard]] static Result<OutgoingPacket, SessionFailure> Encode(
        std::span<const uint8_t> fragment,
        const path::PathDescriptor& path);

    [[nodiscard]] static Result<OutgoingPacket, SessionFailure> EncodeAcknowledgement(
        const Acknowledgement& ack,
        const path::PathDescriptor& path);

    /**
     * @brief Peel this node's layer off `packet`
     *
     * @return ForwardInstruction for an intermediate hop, DeliverPayload or
     *         Acknowledgement for the final hop; MalformedPacket otherwise
     */
    [[nodiscard]] static Result<DecodedUnit, SessionFailure> Decode(
        std::span<const uint8_t> packet,
        const identity::NodeKeyPair& own_keys);

private:
    static Result<OutgoingPacket, SessionFailure> EncodeUnit(
        UnitKind kind,
        std::span<const uint8_t> content,
        const path::PathDescriptor& path);

    PacketCodec() = delete;
};

}
