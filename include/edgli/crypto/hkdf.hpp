#pragma once

#include "edgli/core/result.hpp"
#include "edgli/core/failures.hpp"

#include <cstdint>
#include <span>

namespace edgli::crypto {

/**
 * @brief HKDF (HMAC-based Key Derivation Function) wrapper
 *
 * RFC 5869 HKDF-SHA256 backed by OpenSSL's EVP_KDF. Used to expand the
 * per-hop shared secret into independent stream, MAC, body and blinding keys.
 */
class Hkdf {
public:
    /**
     * @brief Derive key using HKDF-SHA256 (extract + expand)
     *
     * @param ikm Input key material
     * @param output Output buffer to fill with derived key
     * @param salt Optional salt (can be empty for no salt)
     * @param info Optional context/application-specific info
     */
    static Result<Unit, SessionFailure> DeriveKey(
        std::span<const uint8_t> ikm,
        std::span<uint8_t> output,
        std::span<const uint8_t> salt = {},
        std::span<const uint8_t> info = {});

    static constexpr size_t HASH_LEN = 32;
    static constexpr size_t MAX_OUTPUT_LEN = 255 * HASH_LEN;

private:
    Hkdf() = delete;
};

} // namespace edgli::crypto
