#pragma once
#include "edgli/core/result.hpp"
#include "edgli/core/failures.hpp"
#include "edgli/configuration/session_config.hpp"
#include "edgli/identity/relay_identity.hpp"
#include "edgli/interfaces/i_clock.hpp"
#include "edgli/packet/packet.hpp"
#include "edgli/path/path_descriptor.hpp"
#include "edgli/path/path_selector.hpp"
#include "edgli/session/message_stream.hpp"
#include "edgli/session/reorder_buffer.hpp"
#include "edgli/session/session_id.hpp"
#include "edgli/session/session_state.hpp"
#include "session/session_frame.pb.h"
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace edgli::session {

struct StateTransition {
    SessionState from;
    SessionState to;
};

struct RetransmissionNotice {
    uint64_t sequence;
    uint32_t attempt;
};

/**
 * @brief Work produced by a session call, performed by the caller after the
 *        session lock is released
 */
struct SessionEffects {
    std::vector<packet::OutgoingPacket> packets;
    std::vector<StateTransition> transitions;
    std::vector<RetransmissionNotice> retransmissions;
    std::optional<SessionFailure> failure;
    std::vector<std::string> dropped;
};

/**
 * @brief One logical bidirectional stream over an onion path
 *
 * Establishing -> Active -> Draining -> Closed, and Establishing/Active ->
 * Failed. An Active session that hears nothing for idle_timeout fails. All mutation happens under the session's own lock; nothing in here
 * touches the network. Packets to send are returned in SessionEffects.
 *
 * Sequence 0 belongs to OPEN; data and CLOSE frames start at 1.
 */
class Session {
public:
    /**
     * @brief Create an initiator and emit its first OPEN
     *
     * `path` was already selected by the caller; retries reselect with
     * `selector`, avoiding the previous path.
     */
    static std::shared_ptr<Session> CreateInitiator(
        const SessionId& id,
        path::PathDescriptor path,
        size_t hop_count,
        path::PeerIdSet exclude,
        const configuration::SessionConfig& config,
        std::shared_ptr<path::PathSelector> selector,
        identity::RelayIdentity local,
        TimePoint now,
        SessionEffects& effects);

    /// Create a responder for an OPEN received with `id`; acknowledges it.
    static std::shared_ptr<Session> CreateResponder(
        const SessionId& id,
        path::PathDescriptor return_path,
        const configuration::SessionConfig& config,
        std::shared_ptr<path::PathSelector> selector,
        identity::RelayIdentity local,
        TimePoint now,
        SessionEffects& effects);

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    /**
     * @brief Queue a message for delivery
     *
     * The message is split into frames of at most kMaxFramePayloadBytes.
     * While Establishing, frames wait until the session turns Active.
     *
     * @return SessionClosed once Draining, Closed or Failed
     */
    Result<Unit, SessionFailure> Send(std::span<const uint8_t> message, TimePoint now, SessionEffects& effects);

    /// Inbound frame addressed to this session.
    void OnFrame(const proto::session::SessionFrame& frame, TimePoint now, SessionEffects& effects);

    /// Inbound acknowledgement. Repeated sequences are ignored.
    void OnAcknowledgement(std::span<const uint64_t> sequences, TimePoint now, SessionEffects& effects);

    /// Cancel every retransmission deadline and start draining.
    void Close(TimePoint now, SessionEffects& effects);

    /// Fire due deadlines.
    void Poll(TimePoint now, SessionEffects& effects);

    [[nodiscard]] const SessionId& Id() const noexcept { return id_; }
    [[nodiscard]] SessionRole Role() const noexcept { return role_; }
    [[nodiscard]] SessionState State() const;
    [[nodiscard]] path::PathDescriptor Path() const;
    [[nodiscard]] std::shared_ptr<MessageStream> Stream() const noexcept { return stream_; }

    /// Entries awaiting acknowledgement, with or without a deadline.
    [[nodiscard]] size_t OutstandingCount() const;

    /// Number of armed retransmission and setup deadlines.
    [[nodiscard]] size_t ActiveTimerCount() const;

    /// When an Active session fails for lack of inbound traffic.
    [[nodiscard]] std::optional<TimePoint> IdleDeadline() const;

    /// Time the session entered Closed or Failed.
    [[nodiscard]] std::optional<TimePoint> TerminalSince() const;

private:
    struct Outstanding {
        std::vector<uint8_t> frame;
        TimePoint deadline;
        uint32_t attempts = 0;
    };

    struct QueuedFrame {
        uint64_t sequence;
        std::vector<uint8_t> frame;
    };

    Session(
        const SessionId& id,
        SessionRole role,
        path::PathDescriptor path,
        size_t hop_count,
        path::PeerIdSet exclude,
        const configuration::SessionConfig& config,
        std::shared_ptr<path::PathSelector> selector,
        identity::RelayIdentity local);

    void TransitionLocked(SessionState to, TimePoint now, SessionEffects& effects);
    void FailLocked(SessionFailure failure, TimePoint now, SessionEffects& effects);
    bool EmitLocked(std::span<const uint8_t> frame, SessionEffects& effects);
    void SendOpenLocked(TimePoint now, SessionEffects& effects);
    void SendAckLocked(uint64_t sequence, SessionEffects& effects);
    void ActivateLocked(TimePoint now, SessionEffects& effects);
    void StartDrainLocked(bool send_close, TimePoint now, SessionEffects& effects);
    void DeliverReadyLocked(TimePoint now, SessionEffects& effects);
    void RetrySetupLocked(TimePoint now, SessionEffects& effects);
    void TouchLocked(TimePoint now);

    const SessionId id_;
    const SessionRole role_;
    const size_t hop_count_;
    const path::PeerIdSet exclude_;
    const configuration::SessionConfig config_;
    const std::shared_ptr<path::PathSelector> selector_;
    const identity::RelayIdentity local_;
    const std::shared_ptr<MessageStream> stream_;

    mutable std::mutex lock_;
    SessionState state_;
    path::PathDescriptor path_;
    uint64_t next_send_sequence_;
    std::map<uint64_t, Outstanding> outstanding_;
    std::map<uint64_t, std::vector<uint8_t>> draining_;
    std::deque<QueuedFrame> queued_;
    ReorderBuffer reorder_;
    std::vector<uint8_t> assembly_;
    size_t assembly_fragments_;
    bool discarding_message_;
    std::optional<TimePoint> setup_deadline_;
    uint32_t setup_attempts_;
    std::optional<TimePoint> drain_deadline_;
    TimePoint last_heard_;
    bool close_sent_;
    bool peer_closed_;
    std::optional<TimePoint> terminal_since_;
};

}
