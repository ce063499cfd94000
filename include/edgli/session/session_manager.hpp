#pragma once
#include "edgli/core/result.hpp"
#include "edgli/core/failures.hpp"
#include "edgli/configuration/session_config.hpp"
#include "edgli/identity/node_key_pair.hpp"
#include "edgli/interfaces/i_clock.hpp"
#include "edgli/interfaces/i_random_source.hpp"
#include "edgli/interfaces/i_session_event_handler.hpp"
#include "edgli/interfaces/i_transport.hpp"
#include "edgli/path/path_selector.hpp"
#include "edgli/security/replay_filter.hpp"
#include "edgli/session/message_stream.hpp"
#include "edgli/session/session.hpp"
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string_view>
#include <unordered_map>

namespace edgli::session {

struct OpenOptions {
    /// Overrides SessionConfig::hop_count for this session.
    std::optional<size_t> hop_count;

    /// Relays the session's paths must avoid, including on setup retries.
    path::PeerIdSet exclude;
};

/**
 * @brief Session table, inbound demultiplexer and relay of forward units
 *
 * The table is guarded by one coarse lock, held only for lookups and
 * inserts; onion construction for new sessions happens outside it and the
 * session limit is re-checked on insert. Each session serializes its own
 * state. Transport sends and event callbacks run after every lock is
 * released. Timers are driven by Poll().
 */
class SessionManager {
public:
    static Result<std::shared_ptr<SessionManager>, SessionFailure> Create(
        std::shared_ptr<const identity::NodeKeyPair> local_keys,
        const configuration::SessionConfig& config,
        std::shared_ptr<ITransport> transport,
        std::shared_ptr<path::PathSelector> selector,
        std::shared_ptr<IRandomSource> random,
        std::shared_ptr<IClock> clock,
        std::chrono::milliseconds replay_tag_lifetime = kReplayTagLifetime);

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    void SetEventHandler(std::shared_ptr<ISessionEventHandler> handler);

    /**
     * @brief Select a path to `destination` and start establishing a session
     *
     * @return NoRouteAvailable when no path can be built,
     *         TooManySessions when max_sessions non-terminal sessions exist
     */
    Result<SessionId, SessionFailure> Open(
        const identity::RelayIdentity& destination,
        const OpenOptions& options = {});

    /// @return SessionClosed for unknown or finished sessions, FragmentTooLarge for oversized messages
    Result<Unit, SessionFailure> Send(const SessionId& id, std::span<const uint8_t> message);

    Result<std::shared_ptr<MessageStream>, SessionFailure> Receive(const SessionId& id);

    Result<Unit, SessionFailure> Close(const SessionId& id);

    Result<path::PathDescriptor, SessionFailure> PathOf(const SessionId& id) const;
    Result<SessionState, SessionFailure> StateOf(const SessionId& id) const;

    /// Sessions that are neither Closed nor Failed.
    size_t ActiveSessionCount() const;

    /// Every tracked session, terminal ones not yet reaped included.
    size_t SessionCount() const;

    /// Entry point for bytes delivered by the transport.
    void OnRawReceived(std::span<const uint8_t> bytes);

    /// Fire due deadlines and reap finished sessions.
    void Poll(TimePoint now);
    void Poll();

    [[nodiscard]] const identity::NodeKeyPair& LocalKeys() const noexcept { return *local_keys_; }
    [[nodiscard]] const configuration::SessionConfig& Config() const noexcept { return config_; }

private:
    using SessionTable = std::unordered_map<SessionId, std::shared_ptr<Session>, SessionId::Hash>;

    SessionManager(
        std::shared_ptr<const identity::NodeKeyPair> local_keys,
        const configuration::SessionConfig& config,
        std::shared_ptr<ITransport> transport,
        std::shared_ptr<path::PathSelector> selector,
        std::shared_ptr<IRandomSource> random,
        std::shared_ptr<IClock> clock,
        std::chrono::milliseconds replay_tag_lifetime);

    std::shared_ptr<Session> Find(const SessionId& id) const;
    size_t CountNonTerminalLocked() const;
    SessionFailure SessionLimitReached() const;
    void HandleFrame(std::span<const uint8_t> fragment, TimePoint now);
    void HandleAcknowledgement(const packet::Acknowledgement& ack, TimePoint now);
    void Dispatch(const SessionId& id, SessionEffects&& effects);
    void ReportDropped(std::string_view reason);

    const std::shared_ptr<const identity::NodeKeyPair> local_keys_;
    const identity::RelayIdentity local_identity_;
    const configuration::SessionConfig config_;
    const std::shared_ptr<ITransport> transport_;
    const std::shared_ptr<path::PathSelector> selector_;
    const std::shared_ptr<IRandomSource> random_;
    const std::shared_ptr<IClock> clock_;
    security::ReplayFilter replay_filter_;

    mutable std::mutex table_lock_;
    SessionTable sessions_;

    mutable std::mutex handler_lock_;
    std::shared_ptr<ISessionEventHandler> event_handler_;
};

}
