#include "edgli/configuration/edge_client_config.hpp"
#include "edgli/core/format.hpp"
#include <arpa/inet.h>
#include <netinet/in.h>

namespace edgli::configuration {
    namespace {
        constexpr uint32_t kLoopbackNetwork = 0x7F000000;
        constexpr uint32_t kLoopbackMask = 0xFF000000;
    }

    Result<Unit, SessionFailure> EdgeClientConfig::Validate() const {
        if (auto session_result = session.Validate(); session_result.IsErr()) {
            return session_result;
        }
        if (tick_interval.count() <= 0) {
            return Result<Unit, SessionFailure>::Err(
                SessionFailure::Config("tick_interval must be positive"));
        }
        if (replay_tag_lifetime.count() <= 0) {
            return Result<Unit, SessionFailure>::Err(
                SessionFailure::Config("replay_tag_lifetime must be positive"));
        }
        if (host.type != HostType::IPv4 || host.address.empty()) {
            return Result<Unit, SessionFailure>::Ok(unit);
        }
        in_addr parsed{};
        if (inet_pton(AF_INET, host.address.c_str(), &parsed) != 1) {
            return Result<Unit, SessionFailure>::Err(
                SessionFailure::Config(
                    compat::format("Invalid IPv4 address: {}", host.address)));
        }
        const uint32_t host_order = ntohl(parsed.s_addr);
        if ((host_order & kLoopbackMask) == kLoopbackNetwork && !prefer_local_addresses) {
            return Result<Unit, SessionFailure>::Err(
                SessionFailure::Config("Cannot announce a loopback address"));
        }
        return Result<Unit, SessionFailure>::Ok(unit);
    }
}
