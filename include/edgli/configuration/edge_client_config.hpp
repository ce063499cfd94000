#pragma once

#include "edgli/configuration/session_config.hpp"
#include <chrono>
#include <cstdint>
#include <string>

namespace edgli::configuration {

enum class HostType : uint8_t {
    IPv4,
    Domain
};

/// Address the node would announce to the network.
struct HostAddress {
    HostType type = HostType::IPv4;
    std::string address;
    uint16_t port = 0;
};

struct EdgeClientConfig {
    SessionConfig session = SessionConfig::Default();

    /// Unset address means the node does not announce itself.
    HostAddress host;

    /// Allows announcing loopback addresses (local test networks).
    bool prefer_local_addresses = false;

    /// Interval of the background driver that fires session timers.
    std::chrono::milliseconds tick_interval = kDefaultTickInterval;

    std::chrono::milliseconds replay_tag_lifetime = kReplayTagLifetime;

    /**
     * @brief Validate the session tunables and the announce address
     *
     * An IPv4 host must parse as a dotted quad; a loopback address is
     * rejected with "Cannot announce a loopback address" unless
     * prefer_local_addresses is set.
     */
    Result<Unit, SessionFailure> Validate() const;
};

}
