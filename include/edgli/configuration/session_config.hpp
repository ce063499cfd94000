#pragma once

#include "edgli/core/constants.hpp"
#include "edgli/core/result.hpp"
#include "edgli/core/failures.hpp"
#include <chrono>
#include <cstddef>
#include <cstdint>

namespace edgli::configuration {

/**
 * @brief Tunables of the session layer
 *
 * Every session opened through a SessionManager uses the manager's copy.
 * Per-session overrides are limited to the hop count (see OpenOptions).
 *
 * **Presets**:
 * - Default(): 3-hop paths, 800 ms retransmission timeout, 5 retransmits
 * - LowLatency(): 2-hop paths, shorter timeouts, fewer retries
 * - HighlyReliable(): 3-hop paths, longer timeouts, more retries
 *
 * ```cpp
 * auto config = SessionConfig::LowLatency();
 * config.max_sessions = 16;
 * if (auto valid = config.Validate(); valid.IsErr()) {
 *     // reject
 * }
 * ```
 */
struct SessionConfig {
    /// Total path length including the destination, in [1, kMaxPathLength].
    size_t hop_count = kDefaultHopCount;

    std::chrono::milliseconds retransmit_timeout = kDefaultRetransmitTimeout;
    std::chrono::milliseconds setup_timeout = kDefaultSetupTimeout;
    std::chrono::milliseconds drain_timeout = kDefaultDrainTimeout;

    /// An Active session that hears nothing from its peer for this long fails.
    std::chrono::milliseconds idle_timeout = kDefaultIdleTimeout;

    /// Resends per packet before the session fails.
    uint32_t max_retransmits = kDefaultMaxRetransmits;

    /// OPEN attempts, each over a freshly selected path.
    uint32_t setup_attempts = kDefaultSetupAttempts;

    /// Upper bound on non-terminal sessions.
    size_t max_sessions = kDefaultMaxSessions;

    /// Frames accepted ahead of the next expected sequence number.
    size_t reorder_window = kDefaultReorderWindow;

    size_t max_fragments_per_message = kDefaultMaxFragmentsPerMessage;

    /// How long a Failed session stays queryable before it is reaped.
    std::chrono::milliseconds failed_session_retention = kDefaultFailedSessionRetention;

    [[nodiscard]] static SessionConfig Default() noexcept {
        return SessionConfig{};
    }

    [[nodiscard]] static SessionConfig LowLatency() noexcept {
        SessionConfig config;
        config.hop_count = 2;
        config.retransmit_timeout = std::chrono::milliseconds(300);
        config.setup_timeout = std::chrono::milliseconds(600);
        config.drain_timeout = std::chrono::milliseconds(1500);
        config.idle_timeout = std::chrono::seconds(30);
        config.max_retransmits = 3;
        config.setup_attempts = 2;
        return config;
    }

    [[nodiscard]] static SessionConfig HighlyReliable() noexcept {
        SessionConfig config;
        config.retransmit_timeout = std::chrono::milliseconds(1500);
        config.setup_timeout = std::chrono::milliseconds(3000);
        config.drain_timeout = std::chrono::milliseconds(15000);
        config.idle_timeout = std::chrono::seconds(600);
        config.max_retransmits = 10;
        config.setup_attempts = 5;
        return config;
    }

    /// Largest message accepted by Send.
    [[nodiscard]] size_t MaxMessageBytes() const noexcept {
        return kMaxFramePayloadBytes * max_fragments_per_message;
    }

    Result<Unit, SessionFailure> Validate() const;
};

}
