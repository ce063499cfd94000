#include "edgli/session/session_manager.hpp"
#include "edgli/session/frame_codec.hpp"
#include "edgli/packet/packet_codec.hpp"
#include "edgli/crypto/sodium_interop.hpp"
#include "edgli/core/format.hpp"
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace edgli::session {
    using configuration::SessionConfig;
    using crypto::SodiumInterop;
    using identity::NodeKeyPair;
    using identity::RelayIdentity;
    using packet::PacketCodec;
    using path::PathSelector;
    using path::PeerIdSet;
    using proto::session::SessionFrame;

    Result<std::shared_ptr<SessionManager>, SessionFailure> SessionManager::Create(
        std::shared_ptr<const NodeKeyPair> local_keys,
        const SessionConfig& config,
        std::shared_ptr<ITransport> transport,
        std::shared_ptr<PathSelector> selector,
        std::shared_ptr<IRandomSource> random,
        std::shared_ptr<IClock> clock,
        const std::chrono::milliseconds replay_tag_lifetime) {
        if (auto init = SodiumInterop::Initialize(); init.IsErr()) {
            return Result<std::shared_ptr<SessionManager>, SessionFailure>::Err(
                SessionFailure::FromSodiumFailure(init.UnwrapErr()));
        }
        if (!local_keys || !transport || !selector || !random || !clock) {
            return Result<std::shared_ptr<SessionManager>, SessionFailure>::Err(
                SessionFailure::InvalidInput("Session manager dependencies must not be null"));
        }
        if (auto valid = config.Validate(); valid.IsErr()) {
            return Result<std::shared_ptr<SessionManager>, SessionFailure>::Err(valid.UnwrapErr());
        }
        return Result<std::shared_ptr<SessionManager>, SessionFailure>::Ok(
            std::shared_ptr<SessionManager>(new SessionManager(
                std::move(local_keys), config, std::move(transport), std::move(selector),
                std::move(random), std::move(clock), replay_tag_lifetime)));
    }

    SessionManager::SessionManager(
        std::shared_ptr<const NodeKeyPair> local_keys,
        const SessionConfig& config,
        std::shared_ptr<ITransport> transport,
        std::shared_ptr<PathSelector> selector,
        std::shared_ptr<IRandomSource> random,
        std::shared_ptr<IClock> clock,
        const std::chrono::milliseconds replay_tag_lifetime)
        : local_keys_(std::move(local_keys))
          , local_identity_(local_keys_->ToRelayIdentity())
          , config_(config)
          , transport_(std::move(transport))
          , selector_(std::move(selector))
          , random_(std::move(random))
          , clock_(std::move(clock))
          , replay_filter_(replay_tag_lifetime)
          , event_handler_(nullptr) {
    }

    void SessionManager::SetEventHandler(std::shared_ptr<ISessionEventHandler> handler) {
        std::lock_guard guard(handler_lock_);
        event_handler_ = std::move(handler);
    }

    std::shared_ptr<Session> SessionManager::Find(const SessionId& id) const {
        std::lock_guard guard(table_lock_);
        const auto it = sessions_.find(id);
        return it == sessions_.end() ? nullptr : it->second;
    }

    SessionFailure SessionManager::SessionLimitReached() const {
        return SessionFailure::TooManySessions(
            compat::format("Session limit of {} reached", config_.max_sessions));
    }

    size_t SessionManager::CountNonTerminalLocked() const {
        size_t count = 0;
        for (const auto& [id, session] : sessions_) {
            if (!IsTerminal(session->State())) {
                ++count;
            }
        }
        return count;
    }

    Result<SessionId, SessionFailure> SessionManager::Open(
        const RelayIdentity& destination,
        const OpenOptions& options) {
        const size_t hop_count = options.hop_count.value_or(config_.hop_count);
        PeerIdSet exclude = options.exclude;
        exclude.insert(local_identity_.address);

        if (ActiveSessionCount() >= config_.max_sessions) {
            return Result<SessionId, SessionFailure>::Err(SessionLimitReached());
        }
        auto path_result = selector_->SelectPath(destination, hop_count, exclude);
        if (path_result.IsErr()) {
            return Result<SessionId, SessionFailure>::Err(path_result.UnwrapErr());
        }
        SessionId id;
        do {
            id = SessionId::Generate(*random_);
        } while (Find(id) != nullptr);

        SessionEffects effects;
        auto session = Session::CreateInitiator(
            id, std::move(path_result).Unwrap(), hop_count, std::move(exclude),
            config_, selector_, local_identity_, clock_->Now(), effects);
        {
            std::lock_guard guard(table_lock_);
            if (CountNonTerminalLocked() >= config_.max_sessions) {
                return Result<SessionId, SessionFailure>::Err(SessionLimitReached());
            }
            if (!sessions_.emplace(id, std::move(session)).second) {
                return Result<SessionId, SessionFailure>::Err(
                    SessionFailure::InvalidState(compat::format("Session id {} already in use", id.ToHex())));
            }
        }
        Dispatch(id, std::move(effects));
        return Result<SessionId, SessionFailure>::Ok(id);
    }

    Result<Unit, SessionFailure> SessionManager::Send(const SessionId& id, std::span<const uint8_t> message) {
        const auto session = Find(id);
        if (!session) {
            return Result<Unit, SessionFailure>::Err(
                SessionFailure::SessionClosed(compat::format("Unknown session {}", id.ToHex())));
        }
        SessionEffects effects;
        auto result = session->Send(message, clock_->Now(), effects);
        Dispatch(id, std::move(effects));
        return result;
    }

    Result<std::shared_ptr<MessageStream>, SessionFailure> SessionManager::Receive(const SessionId& id) {
        const auto session = Find(id);
        if (!session) {
            return Result<std::shared_ptr<MessageStream>, SessionFailure>::Err(
                SessionFailure::SessionClosed(compat::format("Unknown session {}", id.ToHex())));
        }
        return Result<std::shared_ptr<MessageStream>, SessionFailure>::Ok(session->Stream());
    }

    Result<Unit, SessionFailure> SessionManager::Close(const SessionId& id) {
        const auto session = Find(id);
        if (!session) {
            return Result<Unit, SessionFailure>::Err(
                SessionFailure::SessionClosed(compat::format("Unknown session {}", id.ToHex())));
        }
        SessionEffects effects;
        session->Close(clock_->Now(), effects);
        Dispatch(id, std::move(effects));
        return Result<Unit, SessionFailure>::Ok(unit);
    }

    Result<path::PathDescriptor, SessionFailure> SessionManager::PathOf(const SessionId& id) const {
        const auto session = Find(id);
        if (!session) {
            return Result<path::PathDescriptor, SessionFailure>::Err(
                SessionFailure::SessionClosed(compat::format("Unknown session {}", id.ToHex())));
        }
        return Result<path::PathDescriptor, SessionFailure>::Ok(session->Path());
    }

    Result<SessionState, SessionFailure> SessionManager::StateOf(const SessionId& id) const {
        const auto session = Find(id);
        if (!session) {
            return Result<SessionState, SessionFailure>::Err(
                SessionFailure::SessionClosed(compat::format("Unknown session {}", id.ToHex())));
        }
        return Result<SessionState, SessionFailure>::Ok(session->State());
    }

    size_t SessionManager::ActiveSessionCount() const {
        std::lock_guard guard(table_lock_);
        return CountNonTerminalLocked();
    }

    size_t SessionManager::SessionCount() const {
        std::lock_guard guard(table_lock_);
        return sessions_.size();
    }

    void SessionManager::OnRawReceived(std::span<const uint8_t> bytes) {
        const TimePoint now = clock_->Now();
        auto decoded_result = PacketCodec::Decode(bytes, *local_keys_);
        if (decoded_result.IsErr()) {
            ReportDropped(decoded_result.UnwrapErr().message);
            return;
        }
        auto decoded = std::move(decoded_result).Unwrap();
        if (auto fresh = replay_filter_.CheckAndRecord(decoded.replay_tag, now); fresh.IsErr()) {
            ReportDropped("Replayed packet");
            return;
        }

        std::visit([&](auto& unit) {
            using T = std::decay_t<decltype(unit)>;
            if constexpr (std::is_same_v<T, packet::ForwardInstruction>) {
                if (auto sent = transport_->SendRaw(unit.next_hop, unit.packet); sent.IsErr()) {
                    ReportDropped(sent.UnwrapErr().message);
                }
            } else if constexpr (std::is_same_v<T, packet::DeliverPayload>) {
                HandleFrame(unit.fragment, now);
            } else {
                HandleAcknowledgement(unit, now);
            }
        }, decoded.unit);
    }

    void SessionManager::HandleFrame(std::span<const uint8_t> fragment, const TimePoint now) {
        auto frame_result = FrameCodec::Parse(fragment);
        if (frame_result.IsErr()) {
            ReportDropped(frame_result.UnwrapErr().message);
            return;
        }
        const auto frame = std::move(frame_result).Unwrap();
        const auto& raw_id = frame.session_id();
        auto id_result = SessionId::FromBytes(
            std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(raw_id.data()), raw_id.size()));
        if (id_result.IsErr()) {
            ReportDropped(id_result.UnwrapErr().message);
            return;
        }
        const SessionId id = id_result.Unwrap();

        SessionEffects effects;
        if (auto session = Find(id)) {
            session->OnFrame(frame, now, effects);
            Dispatch(id, std::move(effects));
            return;
        }
        if (frame.kind() != SessionFrame::OPEN) {
            ReportDropped("Frame for unknown session");
            return;
        }
        auto reply_result = FrameCodec::ReplyAddressOf(frame);
        if (reply_result.IsErr()) {
            ReportDropped(reply_result.UnwrapErr().message);
            return;
        }

        if (ActiveSessionCount() >= config_.max_sessions) {
            ReportDropped("Session limit reached, OPEN refused");
            return;
        }
        const PeerIdSet exclude{local_identity_.address};
        auto path_result = selector_->SelectPath(reply_result.Unwrap(), config_.hop_count, exclude);
        if (path_result.IsErr()) {
            ReportDropped(path_result.UnwrapErr().message);
            return;
        }
        auto created = Session::CreateResponder(
            id, std::move(path_result).Unwrap(), config_, selector_, local_identity_, now, effects);

        std::shared_ptr<Session> existing;
        bool refused = false;
        {
            std::lock_guard guard(table_lock_);
            if (const auto it = sessions_.find(id); it != sessions_.end()) {
                existing = it->second;
            } else if (CountNonTerminalLocked() >= config_.max_sessions) {
                refused = true;
            } else {
                sessions_.emplace(id, std::move(created));
            }
        }
        if (refused) {
            ReportDropped("Session limit reached, OPEN refused");
            return;
        }
        if (existing) {
            // A concurrent OPEN with this id won the insert; answer through it.
            effects = SessionEffects{};
            existing->OnFrame(frame, now, effects);
        }
        Dispatch(id, std::move(effects));
    }

    void SessionManager::HandleAcknowledgement(const packet::Acknowledgement& ack, const TimePoint now) {
        const auto session = Find(ack.session_id);
        if (!session) {
            ReportDropped("Acknowledgement for unknown session");
            return;
        }
        SessionEffects effects;
        session->OnAcknowledgement(ack.sequences, now, effects);
        Dispatch(ack.session_id, std::move(effects));
    }

    void SessionManager::Poll(const TimePoint now) {
        std::vector<std::shared_ptr<Session>> snapshot;
        {
            std::lock_guard guard(table_lock_);
            snapshot.reserve(sessions_.size());
            for (const auto& [id, session] : sessions_) {
                snapshot.push_back(session);
            }
        }
        for (const auto& session : snapshot) {
            SessionEffects effects;
            session->Poll(now, effects);
            Dispatch(session->Id(), std::move(effects));
        }

        std::lock_guard guard(table_lock_);
        auto it = sessions_.begin();
        while (it != sessions_.end()) {
            const auto state = it->second->State();
            const auto since = it->second->TerminalSince();
            const bool reap = state == SessionState::Closed ||
                              (state == SessionState::Failed && since.has_value() &&
                               now - *since >= config_.failed_session_retention);
            if (reap) {
                it = sessions_.erase(it);
            } else {
                ++it;
            }
        }
    }

    void SessionManager::Poll() {
        Poll(clock_->Now());
    }

    void SessionManager::Dispatch(const SessionId& id, SessionEffects&& effects) {
        for (const auto& outgoing : effects.packets) {
            if (auto sent = transport_->SendRaw(outgoing.first_hop, outgoing.bytes); sent.IsErr()) {
                effects.dropped.push_back(sent.UnwrapErr().message);
            }
        }

        std::shared_ptr<ISessionEventHandler> handler;
        {
            std::lock_guard guard(handler_lock_);
            handler = event_handler_;
        }
        if (!handler) {
            return;
        }
        for (const auto& transition : effects.transitions) {
            handler->OnSessionStateChanged(id, transition.from, transition.to);
        }
        for (const auto& notice : effects.retransmissions) {
            handler->OnRetransmission(id, notice.sequence, notice.attempt);
        }
        if (effects.failure.has_value()) {
            handler->OnSessionFailed(id, *effects.failure);
        }
        for (const auto& reason : effects.dropped) {
            handler->OnPacketDropped(reason);
        }
    }

    void SessionManager::ReportDropped(const std::string_view reason) {
        std::shared_ptr<ISessionEventHandler> handler;
        {
            std::lock_guard guard(handler_lock_);
            handler = event_handler_;
        }
        if (handler) {
            handler->OnPacketDropped(reason);
        }
    }
}
