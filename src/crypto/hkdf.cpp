#include "edgli/crypto/hkdf.hpp"
#include "edgli/core/format.hpp"

#include <openssl/evp.h>
#include <openssl/kdf.h>
#include <openssl/params.h>
#include <memory>

namespace edgli::crypto {

namespace {
    struct EvpKdfCtxDeleter {
        void operator()(EVP_KDF_CTX* ctx) const {
            if (ctx) {
                EVP_KDF_CTX_free(ctx);
            }
        }
    };
    using EvpKdfCtxPtr = std::unique_ptr<EVP_KDF_CTX, EvpKdfCtxDeleter>;
}

Result<Unit, SessionFailure> Hkdf::DeriveKey(
    std::span<const uint8_t> ikm,
    std::span<uint8_t> output,
    std::span<const uint8_t> salt,
    std::span<const uint8_t> info) {

    if (output.size() > MAX_OUTPUT_LEN) {
        return Result<Unit, SessionFailure>::Err(
            SessionFailure::InvalidInput(
                compat::format("HKDF output size exceeds maximum allowed: {} > {}",
                    output.size(), MAX_OUTPUT_LEN)));
    }

    if (ikm.empty()) {
        return Result<Unit, SessionFailure>::Err(
            SessionFailure::InvalidInput("HKDF input key material cannot be empty"));
    }

    EVP_KDF* kdf = EVP_KDF_fetch(nullptr, "HKDF", nullptr);
    if (!kdf) {
        return Result<Unit, SessionFailure>::Err(
            SessionFailure::Crypto("Failed to fetch HKDF algorithm"));
    }

    EvpKdfCtxPtr kctx(EVP_KDF_CTX_new(kdf));
    EVP_KDF_free(kdf);

    if (!kctx) {
        return Result<Unit, SessionFailure>::Err(
            SessionFailure::Crypto("Failed to create HKDF context"));
    }

    OSSL_PARAM params[5];
    int param_idx = 0;

    params[param_idx++] = OSSL_PARAM_construct_utf8_string(
        "digest", const_cast<char*>("SHA256"), 0);

    params[param_idx++] = OSSL_PARAM_construct_octet_string(
        "key", const_cast<uint8_t*>(ikm.data()), ikm.size());

    if (!salt.empty()) {
        params[param_idx++] = OSSL_PARAM_construct_octet_string(
            "salt", const_cast<uint8_t*>(salt.data()), salt.size());
    }

    if (!info.empty()) {
        params[param_idx++] = OSSL_PARAM_construct_octet_string(
            "info", const_cast<uint8_t*>(info.data()), info.size());
    }

    params[param_idx] = OSSL_PARAM_construct_end();

    if (EVP_KDF_derive(kctx.get(), output.data(), output.size(), params) != 1) {
        return Result<Unit, SessionFailure>::Err(
            SessionFailure::Crypto("HKDF key derivation failed"));
    }

    return Result<Unit, SessionFailure>::Ok(unit);
}

} // namespace edgli::crypto
