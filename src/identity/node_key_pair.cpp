#include "edgli/identity/node_key_pair.hpp"
#include "edgli/crypto/sodium_interop.hpp"
#include <sodium.h>
#include <array>

namespace edgli::identity {
    using crypto::Key32;
    using crypto::Primitives;
    using crypto::SecureMemoryHandle;
    using crypto::SodiumInterop;

    NodeKeyPair::NodeKeyPair(SecureMemoryHandle secret_key, const Key32& public_key) noexcept
        : secret_key_(std::move(secret_key))
          , public_key_(public_key)
          , peer_id_(PeerId::FromPublicKey(public_key)) {
    }

    Result<NodeKeyPair, SessionFailure> NodeKeyPair::Generate() {
        std::array<uint8_t, kX25519PrivateKeyBytes> secret{};
        SodiumInterop::FillRandom(secret);
        auto result = FromSecretKey(secret);
        sodium_memzero(secret.data(), secret.size());
        return result;
    }

    Result<NodeKeyPair, SessionFailure> NodeKeyPair::FromSecretKey(std::span<const uint8_t> secret_key) {
        if (secret_key.size() != kX25519PrivateKeyBytes) {
            return Result<NodeKeyPair, SessionFailure>::Err(
                SessionFailure::InvalidInput("X25519 secret key must be 32 bytes"));
        }
        auto public_result = Primitives::X25519Base(secret_key);
        if (public_result.IsErr()) {
            return Result<NodeKeyPair, SessionFailure>::Err(public_result.UnwrapErr());
        }
        auto handle_result = SecureMemoryHandle::Allocate(kX25519PrivateKeyBytes);
        if (handle_result.IsErr()) {
            return Result<NodeKeyPair, SessionFailure>::Err(
                SessionFailure::FromSodiumFailure(handle_result.UnwrapErr()));
        }
        auto handle = std::move(handle_result).Unwrap();
        if (auto write_result = handle.Write(secret_key); write_result.IsErr()) {
            return Result<NodeKeyPair, SessionFailure>::Err(
                SessionFailure::FromSodiumFailure(write_result.UnwrapErr()));
        }
        return Result<NodeKeyPair, SessionFailure>::Ok(
            NodeKeyPair(std::move(handle), public_result.Unwrap()));
    }

    Result<Key32, SessionFailure> NodeKeyPair::SharedSecret(std::span<const uint8_t> peer_point) const {
        auto access = secret_key_.WithReadAccess([&](std::span<const uint8_t> secret) {
            return Primitives::X25519(secret, peer_point);
        });
        if (access.IsErr()) {
            return Result<Key32, SessionFailure>::Err(
                SessionFailure::FromSodiumFailure(access.UnwrapErr()));
        }
        return std::move(access).Unwrap();
    }

    RelayIdentity NodeKeyPair::ToRelayIdentity(const double weight) const {
        RelayIdentity relay;
        relay.address = peer_id_;
        relay.public_key = public_key_;
        relay.weight = weight;
        return relay;
    }
}
