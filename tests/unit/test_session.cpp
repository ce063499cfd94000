#include <catch2/catch_test_macros.hpp>
#include "edgli/session/session.hpp"
#include "edgli/session/frame_codec.hpp"
#include "edgli/packet/packet_codec.hpp"
#include "edgli/path/static_relay_directory.hpp"
#include "helpers/keyed_relays.hpp"
#include "helpers/test_doubles.hpp"
#include <variant>

using namespace edgli;
using namespace edgli::session;
using edgli::packet::PacketCodec;
using proto::session::SessionFrame;
using namespace std::chrono_literals;

namespace {
    configuration::SessionConfig TestConfig() {
        auto config = configuration::SessionConfig::Default();
        config.hop_count = 1;
        config.retransmit_timeout = 100ms;
        config.setup_timeout = 200ms;
        config.drain_timeout = 500ms;
        config.max_retransmits = 2;
        config.setup_attempts = 2;
        return config;
    }

    /// Initiator at relay 0 talking directly to relay 1.
    struct Pair {
        test_helpers::KeyedRelays relays{2};
        std::shared_ptr<path::StaticRelayDirectory> directory = std::make_shared<path::StaticRelayDirectory>();
        std::shared_ptr<path::PathSelector> selector;
        configuration::SessionConfig config = TestConfig();
        SessionId id{SessionId::Bytes{0x11, 0x22, 0x33}};
        TimePoint now = TimePoint{} + 1h;

        Pair() {
            REQUIRE(directory->Add(relays.Keys(1).ToRelayIdentity()).IsOk());
            selector = std::make_shared<path::PathSelector>(
                directory, std::make_shared<test_helpers::DeterministicRandom>());
        }

        std::shared_ptr<Session> Initiator(SessionEffects& effects) {
            return Session::CreateInitiator(
                id, path::PathDescriptor::Create({relays.Keys(1).ToRelayIdentity()}).Unwrap(),
                1, {}, config, selector, relays.Keys(0).ToRelayIdentity(), now, effects);
        }

        std::shared_ptr<Session> Responder(SessionEffects& effects) {
            return Session::CreateResponder(
                id, path::PathDescriptor::Create({relays.Keys(0).ToRelayIdentity()}).Unwrap(),
                config, selector, relays.Keys(1).ToRelayIdentity(), now, effects);
        }

        /// Decode a packet addressed to relay `index` into the session frame it carries.
        SessionFrame FrameAt(size_t index, const packet::OutgoingPacket& out) const {
            auto decoded = PacketCodec::Decode(out.bytes, relays.Keys(index)).Unwrap();
            const auto& payload = std::get<packet::DeliverPayload>(decoded.unit);
            return FrameCodec::Parse(payload.fragment).Unwrap();
        }

        packet::Acknowledgement AckAt(size_t index, const packet::OutgoingPacket& out) const {
            auto decoded = PacketCodec::Decode(out.bytes, relays.Keys(index)).Unwrap();
            return std::get<packet::Acknowledgement>(decoded.unit);
        }
    };

    void Activate(Session& session, TimePoint now) {
        SessionEffects effects;
        const std::vector<uint64_t> open_ack{0};
        session.OnAcknowledgement(open_ack, now, effects);
        REQUIRE(session.State() == SessionState::Active);
    }

    SessionFrame DataFrame(const SessionId& id, uint64_t sequence, uint8_t value, bool final_fragment = true) {
        const std::vector<uint8_t> payload{value};
        return FrameCodec::MakeData(id, sequence, payload, final_fragment);
    }
}

TEST_CASE("Session - Establishment", "[session]") {
    Pair pair;

    SECTION("Initiator sends OPEN with its reply address") {
        SessionEffects effects;
        auto session = pair.Initiator(effects);
        REQUIRE(session->State() == SessionState::Establishing);
        REQUIRE(session->Role() == SessionRole::Initiator);
        REQUIRE(effects.packets.size() == 1);
        const auto frame = pair.FrameAt(1, effects.packets[0]);
        REQUIRE(frame.kind() == SessionFrame::OPEN);
        REQUIRE(FrameCodec::ReplyAddressOf(frame).Unwrap().address == pair.relays.Keys(0).Id());
        REQUIRE(session->ActiveTimerCount() == 1);
    }

    SECTION("Acknowledged OPEN activates and flushes queued frames") {
        SessionEffects created;
        auto session = pair.Initiator(created);
        SessionEffects sent;
        const std::vector<uint8_t> message{1, 2, 3};
        REQUIRE(session->Send(message, pair.now, sent).IsOk());
        REQUIRE(sent.packets.empty());
        REQUIRE(session->OutstandingCount() == 1);

        SessionEffects activated;
        const std::vector<uint64_t> open_ack{0};
        session->OnAcknowledgement(open_ack, pair.now, activated);
        REQUIRE(session->State() == SessionState::Active);
        REQUIRE(activated.transitions.size() == 1);
        REQUIRE(activated.transitions[0].from == SessionState::Establishing);
        REQUIRE(activated.transitions[0].to == SessionState::Active);
        REQUIRE(activated.packets.size() == 1);
        REQUIRE(pair.FrameAt(1, activated.packets[0]).sequence() == 1);
    }

    SECTION("Unacknowledged OPEN is retried, then the session fails") {
        SessionEffects created;
        auto session = pair.Initiator(created);

        SessionEffects retry;
        session->Poll(pair.now + 200ms, retry);
        REQUIRE(retry.packets.size() == 1);
        REQUIRE(retry.retransmissions.size() == 1);
        REQUIRE(retry.retransmissions[0].sequence == 0);
        REQUIRE(session->State() == SessionState::Establishing);

        SessionEffects failed;
        session->Poll(pair.now + 400ms, failed);
        REQUIRE(session->State() == SessionState::Failed);
        REQUIRE(failed.failure.has_value());
        REQUIRE(failed.failure->type == SessionFailureType::Failed);
    }

    SECTION("Responder starts Active and acknowledges OPEN") {
        SessionEffects effects;
        auto session = pair.Responder(effects);
        REQUIRE(session->State() == SessionState::Active);
        REQUIRE(session->Role() == SessionRole::Responder);
        REQUIRE(effects.packets.size() == 1);
        const auto ack = pair.AckAt(0, effects.packets[0]);
        REQUIRE(ack.session_id == pair.id);
        REQUIRE(ack.sequences == std::vector<uint64_t>{0});
    }
}

TEST_CASE("Session - Acknowledgements", "[session]") {
    Pair pair;
    SessionEffects created;
    auto session = pair.Initiator(created);
    Activate(*session, pair.now);

    SECTION("Repeated acknowledgement is harmless and leaves no timers") {
        SessionEffects sent;
        const std::vector<uint8_t> message{9};
        REQUIRE(session->Send(message, pair.now, sent).IsOk());
        REQUIRE(session->OutstandingCount() == 1);
        REQUIRE(session->ActiveTimerCount() == 1);

        const std::vector<uint64_t> ack{1};
        SessionEffects first;
        session->OnAcknowledgement(ack, pair.now, first);
        SessionEffects second;
        session->OnAcknowledgement(ack, pair.now, second);

        REQUIRE(session->OutstandingCount() == 0);
        REQUIRE(session->ActiveTimerCount() == 0);
        REQUIRE(second.packets.empty());
        REQUIRE(second.transitions.empty());

        SessionEffects later;
        session->Poll(pair.now + 1s, later);
        REQUIRE(later.packets.empty());
    }

    SECTION("Unacknowledged frames are resent with a fresh onion") {
        SessionEffects sent;
        const std::vector<uint8_t> message{9};
        REQUIRE(session->Send(message, pair.now, sent).IsOk());

        SessionEffects resent;
        session->Poll(pair.now + 100ms, resent);
        REQUIRE(resent.packets.size() == 1);
        REQUIRE(resent.retransmissions.size() == 1);
        REQUIRE(resent.retransmissions[0].attempt == 1);
        REQUIRE(resent.packets[0].bytes != sent.packets[0].bytes);
        REQUIRE(pair.FrameAt(1, resent.packets[0]).sequence() == 1);
    }

    SECTION("Oversized message is refused") {
        std::vector<uint8_t> message(pair.config.MaxMessageBytes() + 1, 0);
        SessionEffects effects;
        auto result = session->Send(message, pair.now, effects);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == SessionFailureType::FragmentTooLarge);
        REQUIRE(effects.packets.empty());
    }
}

TEST_CASE("Session - Retransmission Exhaustion", "[session]") {
    Pair pair;
    SessionEffects created;
    auto session = pair.Initiator(created);
    Activate(*session, pair.now);
    auto stream = session->Stream();

    SessionEffects sent;
    const std::vector<uint8_t> message{1};
    REQUIRE(session->Send(message, pair.now, sent).IsOk());

    size_t failures = 0;
    size_t retransmissions = 0;
    for (int tick = 1; tick <= 10; ++tick) {
        SessionEffects effects;
        session->Poll(pair.now + tick * 100ms, effects);
        retransmissions += effects.retransmissions.size();
        failures += effects.failure.has_value() ? 1 : 0;
    }

    REQUIRE(session->State() == SessionState::Failed);
    REQUIRE(retransmissions == pair.config.max_retransmits);
    REQUIRE(failures == 1);
    REQUIRE(session->ActiveTimerCount() == 0);
    REQUIRE(session->TerminalSince().has_value());

    SECTION("Send after failure reports SessionClosed") {
        SessionEffects effects;
        auto result = session->Send(message, pair.now + 2s, effects);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == SessionFailureType::SessionClosed);
    }

    SECTION("Stream reports the failure once, then ends") {
        auto first = stream->Next();
        REQUIRE(first.IsErr());
        REQUIRE(first.UnwrapErr().type == SessionFailureType::Failed);
        REQUIRE_FALSE(stream->Next().Unwrap().has_value());
    }
}

TEST_CASE("Session - Close and Drain", "[session]") {
    Pair pair;
    SessionEffects created;
    auto session = pair.Initiator(created);
    Activate(*session, pair.now);

    for (uint8_t i = 0; i < 3; ++i) {
        SessionEffects sent;
        const std::vector<uint8_t> message{i};
        REQUIRE(session->Send(message, pair.now, sent).IsOk());
    }
    REQUIRE(session->OutstandingCount() == 3);

    SessionEffects closing;
    session->Close(pair.now, closing);
    REQUIRE(session->State() == SessionState::Draining);
    REQUIRE(closing.packets.size() == 1);
    const auto close_frame = pair.FrameAt(1, closing.packets[0]);
    REQUIRE(close_frame.kind() == SessionFrame::CLOSE);
    REQUIRE(close_frame.sequence() == 4);

    SECTION("No retransmissions while draining") {
        for (int tick = 1; tick <= 4; ++tick) {
            SessionEffects effects;
            session->Poll(pair.now + tick * 100ms, effects);
            REQUIRE(effects.packets.empty());
            REQUIRE(effects.retransmissions.empty());
        }
        REQUIRE(session->State() == SessionState::Draining);
    }

    SECTION("Drain timeout closes the session") {
        SessionEffects effects;
        session->Poll(pair.now + 500ms, effects);
        REQUIRE(session->State() == SessionState::Closed);
        REQUIRE_FALSE(session->Stream()->Next().Unwrap().has_value());
    }

    SECTION("Acknowledging everything in flight closes early") {
        SessionEffects effects;
        const std::vector<uint64_t> acks{1, 2, 3, 4};
        session->OnAcknowledgement(acks, pair.now, effects);
        REQUIRE(session->State() == SessionState::Closed);
        REQUIRE(session->OutstandingCount() == 0);
    }

    SECTION("Second Close does nothing") {
        SessionEffects effects;
        session->Close(pair.now, effects);
        REQUIRE(effects.packets.empty());
        REQUIRE(effects.transitions.empty());
    }

    SECTION("Send while draining is refused") {
        SessionEffects effects;
        const std::vector<uint8_t> message{1};
        REQUIRE(session->Send(message, pair.now, effects).UnwrapErr().type == SessionFailureType::SessionClosed);
    }
}

TEST_CASE("Session - Receiving", "[session]") {
    Pair pair;
    SessionEffects created;
    auto session = pair.Responder(created);
    auto stream = session->Stream();

    SECTION("Frames 2, 3, 1 are delivered as 1, 2, 3 and each is acknowledged") {
        size_t acks = 0;
        for (const uint64_t sequence : {2, 3, 1}) {
            SessionEffects effects;
            session->OnFrame(DataFrame(pair.id, sequence, static_cast<uint8_t>(sequence)), pair.now, effects);
            REQUIRE(effects.packets.size() == 1);
            REQUIRE(pair.AckAt(0, effects.packets[0]).sequences == std::vector<uint64_t>{sequence});
            ++acks;
        }
        REQUIRE(acks == 3);
        REQUIRE(*stream->Next().Unwrap() == std::vector<uint8_t>{1});
        REQUIRE(*stream->Next().Unwrap() == std::vector<uint8_t>{2});
        REQUIRE(*stream->Next().Unwrap() == std::vector<uint8_t>{3});
    }

    SECTION("Duplicate frame is acknowledged again but delivered once") {
        SessionEffects first;
        session->OnFrame(DataFrame(pair.id, 1, 0x41), pair.now, first);
        SessionEffects second;
        session->OnFrame(DataFrame(pair.id, 1, 0x41), pair.now, second);
        REQUIRE(second.packets.size() == 1);
        REQUIRE(stream->Pending() == 1);
    }

    SECTION("Fragments are reassembled at the final marker") {
        SessionEffects effects;
        session->OnFrame(DataFrame(pair.id, 1, 0x01, false), pair.now, effects);
        session->OnFrame(DataFrame(pair.id, 2, 0x02, false), pair.now, effects);
        REQUIRE(stream->Pending() == 0);
        session->OnFrame(DataFrame(pair.id, 3, 0x03, true), pair.now, effects);
        REQUIRE(*stream->Next().Unwrap() == std::vector<uint8_t>{1, 2, 3});
    }

    SECTION("Peer CLOSE ends the stream and closes the session") {
        SessionEffects effects;
        session->OnFrame(DataFrame(pair.id, 1, 0x07), pair.now, effects);
        session->OnFrame(FrameCodec::MakeClose(pair.id, 2), pair.now, effects);
        REQUIRE(session->State() == SessionState::Closed);
        REQUIRE(*stream->Next().Unwrap() == std::vector<uint8_t>{7});
        REQUIRE_FALSE(stream->Next().Unwrap().has_value());
    }

    SECTION("Repeated OPEN is acknowledged again") {
        SessionEffects effects;
        session->OnFrame(FrameCodec::MakeOpen(pair.id, pair.relays.Keys(0).ToRelayIdentity()), pair.now, effects);
        REQUIRE(effects.packets.size() == 1);
        REQUIRE(pair.AckAt(0, effects.packets[0]).sequences == std::vector<uint64_t>{0});
    }
}

TEST_CASE("Session - End-to-End Fragmentation", "[session]") {
    Pair pair;
    SessionEffects created;
    auto initiator = pair.Initiator(created);
    Activate(*initiator, pair.now);
    SessionEffects responded;
    auto responder = pair.Responder(responded);

    std::vector<uint8_t> message(2 * kMaxFramePayloadBytes + 5);
    for (size_t i = 0; i < message.size(); ++i) {
        message[i] = static_cast<uint8_t>(i % 251);
    }

    SessionEffects sent;
    REQUIRE(initiator->Send(message, pair.now, sent).IsOk());
    REQUIRE(sent.packets.size() == 3);

    SessionEffects received;
    for (auto it = sent.packets.rbegin(); it != sent.packets.rend(); ++it) {
        responder->OnFrame(pair.FrameAt(1, *it), pair.now, received);
    }
    REQUIRE(*responder->Stream()->Next().Unwrap() == message);

    SessionEffects acked;
    for (const auto& ack_packet : received.packets) {
        const auto ack = pair.AckAt(0, ack_packet);
        initiator->OnAcknowledgement(ack.sequences, pair.now, acked);
    }
    REQUIRE(initiator->OutstandingCount() == 0);
}

TEST_CASE("Session - Idle deadline", "[session][liveness]") {
    Pair pair;
    pair.config.idle_timeout = 2s;

    SECTION("Responder that hears nothing fails and releases its stream") {
        SessionEffects created;
        auto session = pair.Responder(created);
        auto stream = session->Stream();
        REQUIRE(session->IdleDeadline() == pair.now + 2s);

        SessionEffects early;
        session->Poll(pair.now + 2s - 1ms, early);
        REQUIRE(session->State() == SessionState::Active);
        REQUIRE_FALSE(early.failure.has_value());

        SessionEffects expired;
        session->Poll(pair.now + 2s, expired);
        REQUIRE(session->State() == SessionState::Failed);
        REQUIRE(expired.failure.has_value());
        REQUIRE(expired.failure->type == SessionFailureType::Failed);
        REQUIRE(expired.transitions.size() == 1);
        REQUIRE(expired.transitions[0].from == SessionState::Active);
        REQUIRE_FALSE(session->IdleDeadline().has_value());

        auto item = stream->Next();
        REQUIRE(item.IsErr());
        REQUIRE(item.UnwrapErr().type == SessionFailureType::Failed);
    }

    SECTION("Inbound frames push the deadline back") {
        SessionEffects created;
        auto session = pair.Responder(created);

        SessionEffects effects;
        session->OnFrame(DataFrame(pair.id, 1, 0x01), pair.now + 1500ms, effects);
        REQUIRE(session->IdleDeadline() == pair.now + 3500ms);

        SessionEffects polled;
        session->Poll(pair.now + 3s, polled);
        REQUIRE(session->State() == SessionState::Active);
        session->Poll(pair.now + 3500ms, polled);
        REQUIRE(session->State() == SessionState::Failed);
    }

    SECTION("Initiator deadline starts at activation and follows acknowledgements") {
        SessionEffects created;
        auto session = pair.Initiator(created);
        REQUIRE_FALSE(session->IdleDeadline().has_value());

        Activate(*session, pair.now + 100ms);
        REQUIRE(session->IdleDeadline() == pair.now + 2100ms);

        SessionEffects sent;
        const std::vector<uint8_t> message{5};
        REQUIRE(session->Send(message, pair.now + 1s, sent).IsOk());
        SessionEffects acked;
        const std::vector<uint64_t> ack{1};
        session->OnAcknowledgement(ack, pair.now + 1900ms, acked);
        REQUIRE(session->IdleDeadline() == pair.now + 3900ms);

        SessionEffects polled;
        session->Poll(pair.now + 3s, polled);
        REQUIRE(session->State() == SessionState::Active);
    }

    SECTION("Draining sessions are bounded by the drain timeout, not the idle deadline") {
        SessionEffects created;
        auto session = pair.Responder(created);
        SessionEffects closing;
        session->Close(pair.now, closing);
        REQUIRE(session->State() == SessionState::Draining);
        REQUIRE_FALSE(session->IdleDeadline().has_value());

        SessionEffects polled;
        session->Poll(pair.now + pair.config.drain_timeout, polled);
        REQUIRE(session->State() == SessionState::Closed);
        REQUIRE_FALSE(polled.failure.has_value());
    }
}

TEST_CASE("Session - Oversized peer message", "[session]") {
    Pair pair;
    pair.config.max_fragments_per_message = 2;
    SessionEffects created;
    auto session = pair.Responder(created);
    auto stream = session->Stream();

    SECTION("While Active the session fails") {
        SessionEffects effects;
        for (const uint64_t sequence : {1, 2, 3}) {
            session->OnFrame(DataFrame(pair.id, sequence, 0x01, false), pair.now, effects);
        }
        REQUIRE(session->State() == SessionState::Failed);
        REQUIRE(effects.failure.has_value());
    }

    SECTION("While Draining the message is discarded and the session still closes") {
        SessionEffects closing;
        session->Close(pair.now, closing);
        REQUIRE(session->State() == SessionState::Draining);

        SessionEffects effects;
        for (const uint64_t sequence : {1, 2, 3}) {
            session->OnFrame(DataFrame(pair.id, sequence, 0x01, false), pair.now, effects);
        }
        session->OnFrame(DataFrame(pair.id, 4, 0x01, true), pair.now, effects);
        session->OnFrame(DataFrame(pair.id, 5, 0x09, true), pair.now, effects);

        REQUIRE(session->State() == SessionState::Draining);
        REQUIRE_FALSE(effects.failure.has_value());
        REQUIRE(effects.transitions.empty());
        REQUIRE(effects.dropped == std::vector<std::string>{"Peer message exceeds 2 fragments"});
        REQUIRE(stream->Pending() == 1);

        SessionEffects acked;
        const std::vector<uint64_t> close_ack{1};
        session->OnAcknowledgement(close_ack, pair.now, acked);
        REQUIRE(session->State() == SessionState::Closed);
        REQUIRE(*stream->Next().Unwrap() == std::vector<uint8_t>{9});
        REQUIRE_FALSE(stream->Next().Unwrap().has_value());
    }
}
