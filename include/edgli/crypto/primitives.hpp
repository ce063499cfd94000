#pragma once

#include "edgli/core/result.hpp"
#include "edgli/core/failures.hpp"
#include "edgli/core/constants.hpp"

#include <array>
#include <cstdint>
#include <span>
#include <vector>

namespace edgli::crypto {

using Key32 = std::array<uint8_t, 32>;

/**
 * @brief Stateless libsodium primitives used by the onion codec
 *
 * All stream and AEAD operations use an all-zero nonce: every key passed in
 * is derived from a per-packet ephemeral secret and used exactly once.
 */
class Primitives {
public:
    /// X25519 scalar multiplication. Fails on a low-order point (all-zero output).
    [[nodiscard]] static Result<Key32, SessionFailure> X25519(
        std::span<const uint8_t> scalar,
        std::span<const uint8_t> point);

    [[nodiscard]] static Result<Key32, SessionFailure> X25519Base(
        std::span<const uint8_t> scalar);

    /// ChaCha20 (IETF) keystream of output.size() bytes.
    static void Keystream(std::span<const uint8_t> key, std::span<uint8_t> output) noexcept;

    /// XOR ChaCha20 (IETF) keystream into data in place.
    static void XorKeystream(std::span<const uint8_t> key, std::span<uint8_t> data) noexcept;

    [[nodiscard]] static Key32 HmacSha256(
        std::span<const uint8_t> key,
        std::span<const uint8_t> data) noexcept;

    [[nodiscard]] static bool VerifyHmacSha256(
        std::span<const uint8_t> key,
        std::span<const uint8_t> data,
        std::span<const uint8_t> expected) noexcept;

    /// ChaCha20-Poly1305 (IETF) seal; output is plaintext.size() + kAeadTagBytes.
    [[nodiscard]] static std::vector<uint8_t> AeadSeal(
        std::span<const uint8_t> key,
        std::span<const uint8_t> plaintext);

    [[nodiscard]] static Result<std::vector<uint8_t>, SessionFailure> AeadOpen(
        std::span<const uint8_t> key,
        std::span<const uint8_t> ciphertext);

    [[nodiscard]] static Key32 Blake2b256(std::span<const uint8_t> data) noexcept;

private:
    Primitives() = delete;
};

} // namespace edgli::crypto
