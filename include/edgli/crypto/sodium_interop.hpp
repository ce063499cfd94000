#pragma once

#include "edgli/core/result.hpp"
#include "edgli/core/failures.hpp"

#include <sodium.h>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <span>
#include <vector>

namespace edgli::crypto {

/**
 * @brief Interop layer for libsodium process-level facilities
 *
 * Library initialization, secure wiping, constant-time comparison,
 * CSPRNG access and guarded allocation. Everything else in the crypto
 * layer assumes Initialize() has succeeded.
 */
class SodiumInterop {
public:
    // ========================================================================
    // Initialization
    // ========================================================================

    /**
     * @brief Initialize libsodium
     *
     * Thread-safe and idempotent.
     *
     * @return Ok if initialization succeeded, Err otherwise
     */
    static Result<Unit, SodiumFailure> Initialize();

    static bool IsInitialized() noexcept;

    // ========================================================================
    // Secure Memory Operations
    // ========================================================================

    /**
     * @brief Securely wipe a buffer with sodium_memzero
     */
    static Result<Unit, SodiumFailure> SecureWipe(std::span<uint8_t> buffer);

    // ========================================================================
    // Random Number Generation
    // ========================================================================

    static void FillRandom(std::span<uint8_t> output) noexcept;

    /**
     * @brief Uniform random value in [0, upper_bound)
     */
    static uint32_t RandomUniform(uint32_t upper_bound) noexcept;

    // ========================================================================
    // Memory Allocation (Internal)
    // ========================================================================

    /**
     * @brief Allocate guard-paged, locked memory using sodium_malloc
     *
     * @return Pointer to secure memory, or nullptr on failure
     */
    static void* AllocateSecure(size_t size) noexcept;

    static void FreeSecure(void* ptr) noexcept;

    static constexpr size_t MAX_BUFFER_SIZE = 1'000'000'000;

private:
    static inline std::atomic<bool> initialized_{false};
    static inline std::once_flag init_flag_;

    SodiumInterop() = delete;
    ~SodiumInterop() = delete;
    SodiumInterop(const SodiumInterop&) = delete;
    SodiumInterop& operator=(const SodiumInterop&) = delete;
};

} // namespace edgli::crypto
