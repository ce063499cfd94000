#pragma once
#include "edgli/core/result.hpp"
#include "edgli/core/failures.hpp"
#include "edgli/crypto/primitives.hpp"
#include "edgli/crypto/sodium_secure_memory_handle.hpp"
#include "edgli/identity/peer_id.hpp"
#include "edgli/identity/relay_identity.hpp"
#include <span>

namespace edgli::identity {

/**
 * @brief The local node's X25519 packet key pair
 *
 * The secret scalar lives in guarded libsodium memory and never leaves it
 * except as an operand to X25519. Move-only.
 */
class NodeKeyPair {
public:
    static Result<NodeKeyPair, SessionFailure> Generate();

    static Result<NodeKeyPair, SessionFailure> FromSecretKey(std::span<const uint8_t> secret_key);

    NodeKeyPair(NodeKeyPair&&) noexcept = default;
    NodeKeyPair& operator=(NodeKeyPair&&) noexcept = default;
    NodeKeyPair(const NodeKeyPair&) = delete;
    NodeKeyPair& operator=(const NodeKeyPair&) = delete;
    ~NodeKeyPair() = default;

    [[nodiscard]] const crypto::Key32& PublicKey() const noexcept { return public_key_; }
    [[nodiscard]] const PeerId& Id() const noexcept { return peer_id_; }

    /// X25519(secret, peer_point).
    [[nodiscard]] Result<crypto::Key32, SessionFailure> SharedSecret(
        std::span<const uint8_t> peer_point) const;

    [[nodiscard]] RelayIdentity ToRelayIdentity(double weight = 1.0) const;

private:
    NodeKeyPair(crypto::SecureMemoryHandle secret_key, const crypto::Key32& public_key) noexcept;

    crypto::SecureMemoryHandle secret_key_;
    crypto::Key32 public_key_;
    PeerId peer_id_;
};

}
