#include "edgli/session/session.hpp"
#include "edgli/session/frame_codec.hpp"
#include "edgli/packet/packet_codec.hpp"
#include "edgli/core/format.hpp"
#include "edgli/debug/trace_logger.hpp"
#include <algorithm>
#include <utility>

namespace edgli::session {
    using configuration::SessionConfig;
    using packet::PacketCodec;
    using path::PathDescriptor;
    using path::PathSelector;
    using path::PeerIdSet;
    using proto::session::SessionFrame;

    Session::Session(
        const SessionId& id,
        const SessionRole role,
        PathDescriptor path,
        const size_t hop_count,
        PeerIdSet exclude,
        const SessionConfig& config,
        std::shared_ptr<PathSelector> selector,
        identity::RelayIdentity local)
        : id_(id)
          , role_(role)
          , hop_count_(hop_count)
          , exclude_(std::move(exclude))
          , config_(config)
          , selector_(std::move(selector))
          , local_(std::move(local))
          , stream_(std::make_shared<MessageStream>())
          , state_(SessionState::Establishing)
          , path_(std::move(path))
          , next_send_sequence_(1)
          , reorder_(1, config.reorder_window)
          , assembly_fragments_(0)
          , discarding_message_(false)
          , setup_attempts_(0)
          , close_sent_(false)
          , peer_closed_(false) {
    }

    std::shared_ptr<Session> Session::CreateInitiator(
        const SessionId& id,
        PathDescriptor path,
        const size_t hop_count,
        PeerIdSet exclude,
        const SessionConfig& config,
        std::shared_ptr<PathSelector> selector,
        identity::RelayIdentity local,
        const TimePoint now,
        SessionEffects& effects) {
        std::shared_ptr<Session> session(new Session(
            id, SessionRole::Initiator, std::move(path), hop_count, std::move(exclude),
            config, std::move(selector), std::move(local)));
        std::lock_guard guard(session->lock_);
        session->setup_attempts_ = 1;
        session->SendOpenLocked(now, effects);
        return session;
    }

    std::shared_ptr<Session> Session::CreateResponder(
        const SessionId& id,
        PathDescriptor return_path,
        const SessionConfig& config,
        std::shared_ptr<PathSelector> selector,
        identity::RelayIdentity local,
        const TimePoint now,
        SessionEffects& effects) {
        const size_t hop_count = return_path.Length();
        std::shared_ptr<Session> session(new Session(
            id, SessionRole::Responder, std::move(return_path), hop_count, {},
            config, std::move(selector), std::move(local)));
        std::lock_guard guard(session->lock_);
        session->TouchLocked(now);
        session->TransitionLocked(SessionState::Active, now, effects);
        session->SendAckLocked(0, effects);
        return session;
    }

    void Session::TransitionLocked(const SessionState to, const TimePoint now, SessionEffects& effects) {
        if (to == state_) {
            return;
        }
        debug::TraceSessionTransition(id_.AsSpan(), ToString(state_), ToString(to));
        effects.transitions.push_back(StateTransition{state_, to});
        state_ = to;
        if (!IsTerminal(to)) {
            return;
        }
        terminal_since_ = now;
        outstanding_.clear();
        draining_.clear();
        queued_.clear();
        reorder_.Clear();
        assembly_.clear();
        setup_deadline_.reset();
        drain_deadline_.reset();
        if (to == SessionState::Closed) {
            stream_->Finish();
        }
    }

    void Session::FailLocked(SessionFailure failure, const TimePoint now, SessionEffects& effects) {
        if (IsTerminal(state_)) {
            return;
        }
        stream_->Fail(failure);
        TransitionLocked(SessionState::Failed, now, effects);
        effects.failure = std::move(failure);
    }

    bool Session::EmitLocked(std::span<const uint8_t> frame, SessionEffects& effects) {
        auto encoded = PacketCodec::Encode(frame, path_);
        if (encoded.IsErr()) {
            effects.dropped.push_back(encoded.UnwrapErr().message);
            return false;
        }
        effects.packets.push_back(std::move(encoded).Unwrap());
        return true;
    }

    void Session::SendOpenLocked(const TimePoint now, SessionEffects& effects) {
        auto bytes = FrameCodec::Serialize(FrameCodec::MakeOpen(id_, local_));
        if (bytes.IsErr()) {
            FailLocked(bytes.UnwrapErr(), now, effects);
            return;
        }
        EmitLocked(bytes.Unwrap(), effects);
        setup_deadline_ = now + config_.setup_timeout;
    }

    void Session::SendAckLocked(const uint64_t sequence, SessionEffects& effects) {
        packet::Acknowledgement ack;
        ack.session_id = id_;
        ack.sequences.push_back(sequence);
        auto encoded = PacketCodec::EncodeAcknowledgement(ack, path_);
        if (encoded.IsErr()) {
            effects.dropped.push_back(encoded.UnwrapErr().message);
            return;
        }
        effects.packets.push_back(std::move(encoded).Unwrap());
    }

    void Session::TouchLocked(const TimePoint now) {
        last_heard_ = now;
    }

    void Session::ActivateLocked(const TimePoint now, SessionEffects& effects) {
        setup_deadline_.reset();
        TouchLocked(now);
        TransitionLocked(SessionState::Active, now, effects);
        for (auto& queued : queued_) {
            auto [it, inserted] = outstanding_.try_emplace(
                queued.sequence,
                Outstanding{std::move(queued.frame), now + config_.retransmit_timeout, 0});
            if (inserted) {
                EmitLocked(it->second.frame, effects);
            }
        }
        queued_.clear();
    }

    void Session::StartDrainLocked(const bool send_close, const TimePoint now, SessionEffects& effects) {
        for (auto& [sequence, entry] : outstanding_) {
            draining_.emplace(sequence, std::move(entry.frame));
        }
        outstanding_.clear();
        if (send_close && !close_sent_) {
            const uint64_t sequence = next_send_sequence_++;
            auto bytes = FrameCodec::Serialize(FrameCodec::MakeClose(id_, sequence));
            if (bytes.IsOk()) {
                EmitLocked(bytes.Unwrap(), effects);
                draining_.emplace(sequence, std::move(bytes).Unwrap());
            } else {
                effects.dropped.push_back(bytes.UnwrapErr().message);
            }
            close_sent_ = true;
        }
        drain_deadline_ = now + config_.drain_timeout;
        TransitionLocked(SessionState::Draining, now, effects);
        if (draining_.empty()) {
            TransitionLocked(SessionState::Closed, now, effects);
        }
    }

    void Session::DeliverReadyLocked(const TimePoint now, SessionEffects& effects) {
        for (auto& frame : reorder_.TakeReady()) {
            if (peer_closed_) {
                continue;
            }
            if (frame.close) {
                peer_closed_ = true;
                assembly_.clear();
                assembly_fragments_ = 0;
                stream_->Finish();
                if (state_ == SessionState::Active) {
                    StartDrainLocked(false, now, effects);
                } else if (state_ == SessionState::Establishing) {
                    TransitionLocked(SessionState::Closed, now, effects);
                }
                continue;
            }
            if (discarding_message_) {
                if (frame.final_fragment) {
                    discarding_message_ = false;
                }
                continue;
            }
            if (++assembly_fragments_ > config_.max_fragments_per_message) {
                const auto reason = compat::format(
                    "Peer message exceeds {} fragments", config_.max_fragments_per_message);
                assembly_.clear();
                assembly_fragments_ = 0;
                if (state_ != SessionState::Draining) {
                    FailLocked(SessionFailure::Failed(reason), now, effects);
                    return;
                }
                effects.dropped.push_back(reason);
                discarding_message_ = !frame.final_fragment;
                continue;
            }
            assembly_.insert(assembly_.end(), frame.payload.begin(), frame.payload.end());
            if (frame.final_fragment) {
                stream_->Push(std::move(assembly_));
                assembly_.clear();
                assembly_fragments_ = 0;
            }
        }
    }

    void Session::RetrySetupLocked(const TimePoint now, SessionEffects& effects) {
        if (setup_attempts_ >= config_.setup_attempts) {
            FailLocked(
                SessionFailure::Failed(
                    compat::format("Session setup unacknowledged after {} attempts", setup_attempts_)),
                now, effects);
            return;
        }
        auto selected = selector_->SelectPath(path_.Destination(), hop_count_, exclude_, &path_);
        if (selected.IsErr()) {
            FailLocked(std::move(selected).UnwrapErr(), now, effects);
            return;
        }
        path_ = std::move(selected).Unwrap();
        ++setup_attempts_;
        effects.retransmissions.push_back(RetransmissionNotice{0, setup_attempts_ - 1});
        SendOpenLocked(now, effects);
    }

    Result<Unit, SessionFailure> Session::Send(
        std::span<const uint8_t> message,
        const TimePoint now,
        SessionEffects& effects) {
        std::lock_guard guard(lock_);
        if (state_ != SessionState::Establishing && state_ != SessionState::Active) {
            return Result<Unit, SessionFailure>::Err(
                SessionFailure::SessionClosed(
                    compat::format("Session {} is {}", id_.ToHex(), ToString(state_))));
        }
        if (message.size() > config_.MaxMessageBytes()) {
            return Result<Unit, SessionFailure>::Err(
                SessionFailure::FragmentTooLarge(
                    compat::format("Message of {} bytes exceeds limit of {} bytes",
                        message.size(), config_.MaxMessageBytes())));
        }

        std::vector<QueuedFrame> frames;
        uint64_t sequence = next_send_sequence_;
        size_t offset = 0;
        do {
            const size_t chunk = std::min(kMaxFramePayloadBytes, message.size() - offset);
            const bool final_fragment = offset + chunk == message.size();
            auto bytes = FrameCodec::Serialize(
                FrameCodec::MakeData(id_, sequence, message.subspan(offset, chunk), final_fragment));
            if (bytes.IsErr()) {
                return Result<Unit, SessionFailure>::Err(bytes.UnwrapErr());
            }
            frames.push_back(QueuedFrame{sequence, std::move(bytes).Unwrap()});
            ++sequence;
            offset += chunk;
        } while (offset < message.size());
        next_send_sequence_ = sequence;

        for (auto& frame : frames) {
            if (state_ == SessionState::Establishing) {
                queued_.push_back(std::move(frame));
                continue;
            }
            const auto it = outstanding_.try_emplace(
                frame.sequence,
                Outstanding{std::move(frame.frame), now + config_.retransmit_timeout, 0}).first;
            EmitLocked(it->second.frame, effects);
        }
        return Result<Unit, SessionFailure>::Ok(unit);
    }

    void Session::OnFrame(const SessionFrame& frame, const TimePoint now, SessionEffects& effects) {
        std::lock_guard guard(lock_);
        if (IsTerminal(state_)) {
            return;
        }
        TouchLocked(now);
        if (frame.kind() == SessionFrame::OPEN) {
            if (role_ == SessionRole::Responder) {
                SendAckLocked(0, effects);
            }
            return;
        }
        SequencedFrame sequenced;
        sequenced.sequence = frame.sequence();
        sequenced.final_fragment = frame.final_fragment();
        sequenced.close = frame.kind() == SessionFrame::CLOSE;
        sequenced.payload.assign(frame.payload().begin(), frame.payload().end());

        switch (reorder_.Insert(std::move(sequenced))) {
            case ReorderBuffer::InsertOutcome::OutOfWindow:
                effects.dropped.push_back(
                    compat::format("Frame {} outside receive window", frame.sequence()));
                return;
            case ReorderBuffer::InsertOutcome::Duplicate:
                SendAckLocked(frame.sequence(), effects);
                return;
            case ReorderBuffer::InsertOutcome::Accepted:
                SendAckLocked(frame.sequence(), effects);
                DeliverReadyLocked(now, effects);
                return;
        }
    }

    void Session::OnAcknowledgement(
        std::span<const uint64_t> sequences,
        const TimePoint now,
        SessionEffects& effects) {
        std::lock_guard guard(lock_);
        if (IsTerminal(state_)) {
            return;
        }
        TouchLocked(now);
        for (const uint64_t sequence : sequences) {
            if (sequence == 0) {
                if (state_ == SessionState::Establishing && role_ == SessionRole::Initiator) {
                    ActivateLocked(now, effects);
                }
                continue;
            }
            outstanding_.erase(sequence);
            draining_.erase(sequence);
        }
        if (state_ == SessionState::Draining && draining_.empty()) {
            TransitionLocked(SessionState::Closed, now, effects);
        }
    }

    void Session::Close(const TimePoint now, SessionEffects& effects) {
        std::lock_guard guard(lock_);
        switch (state_) {
            case SessionState::Establishing:
                TransitionLocked(SessionState::Closed, now, effects);
                return;
            case SessionState::Active:
                StartDrainLocked(true, now, effects);
                return;
            case SessionState::Draining:
            case SessionState::Closed:
            case SessionState::Failed:
                return;
        }
    }

    void Session::Poll(const TimePoint now, SessionEffects& effects) {
        std::lock_guard guard(lock_);
        switch (state_) {
            case SessionState::Establishing:
                if (setup_deadline_.has_value() && now >= *setup_deadline_) {
                    RetrySetupLocked(now, effects);
                }
                return;
            case SessionState::Active:
                if (now - last_heard_ >= config_.idle_timeout) {
                    FailLocked(
                        SessionFailure::Failed(
                            compat::format("No traffic from peer for {} ms",
                                std::chrono::duration_cast<std::chrono::milliseconds>(now - last_heard_).count())),
                        now, effects);
                    return;
                }
                for (auto& [sequence, entry] : outstanding_) {
                    if (now < entry.deadline) {
                        continue;
                    }
                    if (entry.attempts >= config_.max_retransmits) {
                        FailLocked(
                            SessionFailure::Failed(
                                compat::format("Packet {} unacknowledged after {} retransmissions",
                                    sequence, entry.attempts)),
                            now, effects);
                        return;
                    }
                    ++entry.attempts;
                    entry.deadline = now + config_.retransmit_timeout;
                    effects.retransmissions.push_back(RetransmissionNotice{sequence, entry.attempts});
                    debug::TraceRetransmit(id_.AsSpan(), sequence, entry.attempts);
                    EmitLocked(entry.frame, effects);
                }
                return;
            case SessionState::Draining:
                if (drain_deadline_.has_value() && now >= *drain_deadline_) {
                    TransitionLocked(SessionState::Closed, now, effects);
                }
                return;
            case SessionState::Closed:
            case SessionState::Failed:
                return;
        }
    }

    SessionState Session::State() const {
        std::lock_guard guard(lock_);
        return state_;
    }

    PathDescriptor Session::Path() const {
        std::lock_guard guard(lock_);
        return path_;
    }

    size_t Session::OutstandingCount() const {
        std::lock_guard guard(lock_);
        return outstanding_.size() + draining_.size() + queued_.size();
    }

    size_t Session::ActiveTimerCount() const {
        std::lock_guard guard(lock_);
        return outstanding_.size() +
               (setup_deadline_.has_value() ? 1 : 0) +
               (drain_deadline_.has_value() ? 1 : 0);
    }

    std::optional<TimePoint> Session::IdleDeadline() const {
        std::lock_guard guard(lock_);
        if (state_ != SessionState::Active) {
            return std::nullopt;
        }
        return last_heard_ + config_.idle_timeout;
    }

    std::optional<TimePoint> Session::TerminalSince() const {
        std::lock_guard guard(lock_);
        return terminal_since_;
    }
}
