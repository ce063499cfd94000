#include "edgli/configuration/session_config.hpp"
#include "edgli/core/format.hpp"

namespace edgli::configuration {
    Result<Unit, SessionFailure> SessionConfig::Validate() const {
        if (hop_count == 0 || hop_count > kMaxPathLength) {
            return Result<Unit, SessionFailure>::Err(
                SessionFailure::Config(
                    compat::format("hop_count must be in [1, {}], got {}", kMaxPathLength, hop_count)));
        }
        if (retransmit_timeout.count() <= 0 || setup_timeout.count() <= 0 || drain_timeout.count() <= 0) {
            return Result<Unit, SessionFailure>::Err(
                SessionFailure::Config("Timeouts must be positive"));
        }
        if (idle_timeout <= retransmit_timeout) {
            return Result<Unit, SessionFailure>::Err(
                SessionFailure::Config(
                    compat::format("idle_timeout must exceed retransmit_timeout, got {} ms",
                        idle_timeout.count())));
        }
        if (setup_attempts == 0) {
            return Result<Unit, SessionFailure>::Err(
                SessionFailure::Config("setup_attempts must be at least 1"));
        }
        if (max_sessions == 0) {
            return Result<Unit, SessionFailure>::Err(
                SessionFailure::Config("max_sessions must be at least 1"));
        }
        if (reorder_window == 0) {
            return Result<Unit, SessionFailure>::Err(
                SessionFailure::Config("reorder_window must be at least 1"));
        }
        if (max_fragments_per_message == 0 || max_fragments_per_message > reorder_window) {
            return Result<Unit, SessionFailure>::Err(
                SessionFailure::Config(
                    compat::format("max_fragments_per_message must be in [1, reorder_window={}]",
                        reorder_window)));
        }
        if (failed_session_retention.count() < 0) {
            return Result<Unit, SessionFailure>::Err(
                SessionFailure::Config("failed_session_retention cannot be negative"));
        }
        return Result<Unit, SessionFailure>::Ok(unit);
    }
}
