#include "edgli/crypto/primitives.hpp"

#include <sodium.h>

namespace edgli::crypto {

namespace {
    constexpr std::array<uint8_t, crypto_stream_chacha20_ietf_NONCEBYTES> kZeroStreamNonce{};
    constexpr std::array<uint8_t, crypto_aead_chacha20poly1305_ietf_NPUBBYTES> kZeroAeadNonce{};

    static_assert(crypto_stream_chacha20_ietf_KEYBYTES == kStreamKeyBytes);
    static_assert(crypto_aead_chacha20poly1305_ietf_KEYBYTES == kStreamKeyBytes);
    static_assert(crypto_aead_chacha20poly1305_ietf_ABYTES == kAeadTagBytes);
    static_assert(crypto_auth_hmacsha256_BYTES == kHmacBytes);
    static_assert(crypto_scalarmult_BYTES == kX25519SharedSecretBytes);
}

Result<Key32, SessionFailure> Primitives::X25519(
    std::span<const uint8_t> scalar,
    std::span<const uint8_t> point) {
    if (scalar.size() != crypto_scalarmult_SCALARBYTES || point.size() != crypto_scalarmult_BYTES) {
        return Result<Key32, SessionFailure>::Err(
            SessionFailure::InvalidInput("Invalid X25519 operand sizes"));
    }
    Key32 out{};
    if (crypto_scalarmult(out.data(), scalar.data(), point.data()) != 0) {
        return Result<Key32, SessionFailure>::Err(
            SessionFailure::Crypto("X25519 produced a degenerate shared secret"));
    }
    return Result<Key32, SessionFailure>::Ok(out);
}

Result<Key32, SessionFailure> Primitives::X25519Base(std::span<const uint8_t> scalar) {
    if (scalar.size() != crypto_scalarmult_SCALARBYTES) {
        return Result<Key32, SessionFailure>::Err(
            SessionFailure::InvalidInput("Invalid X25519 scalar size"));
    }
    Key32 out{};
    if (crypto_scalarmult_base(out.data(), scalar.data()) != 0) {
        return Result<Key32, SessionFailure>::Err(
            SessionFailure::Crypto("X25519 base multiplication failed"));
    }
    return Result<Key32, SessionFailure>::Ok(out);
}

void Primitives::Keystream(std::span<const uint8_t> key, std::span<uint8_t> output) noexcept {
    if (output.empty()) {
        return;
    }
    crypto_stream_chacha20_ietf(output.data(), output.size(), kZeroStreamNonce.data(), key.data());
}

void Primitives::XorKeystream(std::span<const uint8_t> key, std::span<uint8_t> data) noexcept {
    if (data.empty()) {
        return;
    }
    crypto_stream_chacha20_ietf_xor(
        data.data(), data.data(), data.size(), kZeroStreamNonce.data(), key.data());
}

Key32 Primitives::HmacSha256(
    std::span<const uint8_t> key,
    std::span<const uint8_t> data) noexcept {
    Key32 mac{};
    crypto_auth_hmacsha256(mac.data(), data.data(), data.size(), key.data());
    return mac;
}

bool Primitives::VerifyHmacSha256(
    std::span<const uint8_t> key,
    std::span<const uint8_t> data,
    std::span<const uint8_t> expected) noexcept {
    if (expected.size() != crypto_auth_hmacsha256_BYTES) {
        return false;
    }
    return crypto_auth_hmacsha256_verify(expected.data(), data.data(), data.size(), key.data()) == 0;
}

std::vector<uint8_t> Primitives::AeadSeal(
    std::span<const uint8_t> key,
    std::span<const uint8_t> plaintext) {
    std::vector<uint8_t> out(plaintext.size() + crypto_aead_chacha20poly1305_ietf_ABYTES);
    unsigned long long out_len = 0;
    crypto_aead_chacha20poly1305_ietf_encrypt(
        out.data(), &out_len,
        plaintext.data(), plaintext.size(),
        nullptr, 0,
        nullptr,
        kZeroAeadNonce.data(), key.data());
    out.resize(static_cast<size_t>(out_len));
    return out;
}

Result<std::vector<uint8_t>, SessionFailure> Primitives::AeadOpen(
    std::span<const uint8_t> key,
    std::span<const uint8_t> ciphertext) {
    if (ciphertext.size() < crypto_aead_chacha20poly1305_ietf_ABYTES) {
        return Result<std::vector<uint8_t>, SessionFailure>::Err(
            SessionFailure::Crypto("Ciphertext shorter than authentication tag"));
    }
    std::vector<uint8_t> out(ciphertext.size() - crypto_aead_chacha20poly1305_ietf_ABYTES);
    unsigned long long out_len = 0;
    if (crypto_aead_chacha20poly1305_ietf_decrypt(
            out.data(), &out_len,
            nullptr,
            ciphertext.data(), ciphertext.size(),
            nullptr, 0,
            kZeroAeadNonce.data(), key.data()) != 0) {
        sodium_memzero(out.data(), out.size());
        return Result<std::vector<uint8_t>, SessionFailure>::Err(
            SessionFailure::Crypto("Authentication tag verification failed"));
    }
    out.resize(static_cast<size_t>(out_len));
    return Result<std::vector<uint8_t>, SessionFailure>::Ok(std::move(out));
}

Key32 Primitives::Blake2b256(std::span<const uint8_t> data) noexcept {
    Key32 digest{};
    crypto_generichash(digest.data(), digest.size(), data.data(), data.size(), nullptr, 0);
    return digest;
}

} // namespace edgli::crypto
