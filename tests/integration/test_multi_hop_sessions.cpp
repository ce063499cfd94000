#include <catch2/catch_test_macros.hpp>
#include "helpers/test_mesh.hpp"
#include <algorithm>
#include <string>
#include <vector>

using namespace edgli;
using namespace edgli::session;
using namespace std::chrono_literals;

namespace {
    std::vector<uint8_t> Bytes(const std::string& text) {
        return std::vector<uint8_t>(text.begin(), text.end());
    }

    std::vector<std::vector<uint8_t>> Drain(MessageStream& stream) {
        std::vector<std::vector<uint8_t>> messages;
        while (auto item = stream.TryNext()) {
            auto value = std::move(*item).Unwrap();
            if (!value.has_value()) {
                break;
            }
            messages.push_back(std::move(*value));
        }
        return messages;
    }

    bool HasDrop(const test_helpers::RecordingEventHandler& events, const std::string& reason) {
        const auto dropped = events.Dropped();
        return std::find(dropped.begin(), dropped.end(), reason) != dropped.end();
    }
}

TEST_CASE("Multi-Hop Sessions - Full lifecycle", "[integration][session]") {
    test_helpers::TestMesh mesh(5);
    auto& alice = mesh.Node(0);
    auto& bob = mesh.Node(4);

    auto opened = alice.manager->Open(bob.identity);
    REQUIRE(opened.IsOk());
    const SessionId id = opened.Unwrap();
    REQUIRE(alice.manager->StateOf(id).Unwrap() == SessionState::Establishing);

    mesh.Settle();
    REQUIRE(alice.manager->StateOf(id).Unwrap() == SessionState::Active);
    REQUIRE(bob.manager->StateOf(id).Unwrap() == SessionState::Active);
    REQUIRE(alice.events->CountTransitionsTo(id, SessionState::Active) == 1);

    SECTION("Path has the configured length and ends at the destination") {
        const auto path = alice.manager->PathOf(id).Unwrap();
        REQUIRE(path.Length() == 3);
        REQUIRE(path.Destination() == bob.identity);
        REQUIRE_FALSE(path.Contains(alice.identity.address));
    }

    SECTION("Messages flow both ways in order") {
        for (int i = 0; i < 20; ++i) {
            REQUIRE(alice.manager->Send(id, Bytes("ping " + std::to_string(i))).IsOk());
        }
        REQUIRE(bob.manager->Send(id, Bytes("pong")).IsOk());
        mesh.Settle();

        const auto at_bob = Drain(*bob.manager->Receive(id).Unwrap());
        REQUIRE(at_bob.size() == 20);
        for (int i = 0; i < 20; ++i) {
            REQUIRE(at_bob[i] == Bytes("ping " + std::to_string(i)));
        }
        const auto at_alice = Drain(*alice.manager->Receive(id).Unwrap());
        REQUIRE(at_alice.size() == 1);
        REQUIRE(at_alice[0] == Bytes("pong"));
    }

    SECTION("Large message is fragmented and reassembled") {
        std::vector<uint8_t> message(10 * kMaxFramePayloadBytes + 17);
        for (size_t i = 0; i < message.size(); ++i) {
            message[i] = static_cast<uint8_t>((i * 31) & 0xFF);
        }
        REQUIRE(alice.manager->Send(id, message).IsOk());
        mesh.Settle();
        auto received = bob.manager->Receive(id).Unwrap()->TryNext();
        REQUIRE(received.has_value());
        REQUIRE(*received->Unwrap() == message);
    }

    SECTION("Close drains, both ends close and are reaped") {
        REQUIRE(alice.manager->Send(id, Bytes("last words")).IsOk());
        REQUIRE(alice.manager->Close(id).IsOk());
        REQUIRE(alice.manager->StateOf(id).Unwrap() == SessionState::Draining);
        REQUIRE(alice.manager->Send(id, Bytes("too late")).UnwrapErr().type == SessionFailureType::SessionClosed);

        mesh.Settle();
        REQUIRE(alice.manager->StateOf(id).Unwrap() == SessionState::Closed);
        REQUIRE(bob.manager->StateOf(id).Unwrap() == SessionState::Closed);

        auto bob_stream = bob.manager->Receive(id).Unwrap();
        REQUIRE(*bob_stream->Next().Unwrap() == Bytes("last words"));
        REQUIRE_FALSE(bob_stream->Next().Unwrap().has_value());

        mesh.Advance(1ms);
        REQUIRE(alice.manager->SessionCount() == 0);
        REQUIRE(bob.manager->SessionCount() == 0);
        REQUIRE(alice.manager->StateOf(id).UnwrapErr().type == SessionFailureType::SessionClosed);
    }

    SECTION("Idle session stays up without traffic") {
        mesh.Advance(10s);
        REQUIRE(alice.manager->StateOf(id).Unwrap() == SessionState::Active);
        REQUIRE(alice.events->Retransmissions().empty());
    }
}

TEST_CASE("Multi-Hop Sessions - Loss and retransmission", "[integration][session][retransmit]") {
    test_helpers::TestMesh mesh(5);
    auto& alice = mesh.Node(0);
    auto& bob = mesh.Node(4);
    const auto config = alice.manager->Config();

    const SessionId id = alice.manager->Open(bob.identity).Unwrap();
    mesh.Settle();
    REQUIRE(alice.manager->StateOf(id).Unwrap() == SessionState::Active);

    SECTION("A lost packet is resent and delivered once") {
        size_t to_drop = 1;
        const auto alice_address = alice.identity.address;
        mesh.Network().SetDropFilter([&to_drop, alice_address](const test_helpers::Datagram& datagram) {
            if (datagram.from == alice_address && to_drop > 0) {
                --to_drop;
                return true;
            }
            return false;
        });

        REQUIRE(alice.manager->Send(id, Bytes("hello")).IsOk());
        mesh.Settle();
        auto stream = bob.manager->Receive(id).Unwrap();
        REQUIRE(stream->Pending() == 0);

        mesh.Advance(config.retransmit_timeout);
        REQUIRE(stream->Pending() == 1);
        REQUIRE(alice.events->Retransmissions().size() == 1);
        REQUIRE(alice.events->Retransmissions()[0].attempt == 1);

        mesh.Advance(config.retransmit_timeout);
        REQUIRE(alice.events->Retransmissions().size() == 1);
        REQUIRE(stream->Pending() == 1);
    }

    SECTION("A lost acknowledgement causes a duplicate that is delivered once") {
        size_t to_drop = 1;
        const auto bob_address = bob.identity.address;
        mesh.Network().SetDropFilter([&to_drop, bob_address](const test_helpers::Datagram& datagram) {
            if (datagram.from == bob_address && to_drop > 0) {
                --to_drop;
                return true;
            }
            return false;
        });

        REQUIRE(alice.manager->Send(id, Bytes("hello")).IsOk());
        mesh.Settle();
        mesh.Advance(config.retransmit_timeout);
        mesh.Advance(config.retransmit_timeout);

        auto stream = bob.manager->Receive(id).Unwrap();
        REQUIRE(stream->Pending() == 1);
        REQUIRE(alice.events->Retransmissions().size() == 1);
    }

    SECTION("Exhausted retransmissions fail the session once") {
        const auto alice_address = alice.identity.address;
        mesh.Network().SetDropFilter([alice_address](const test_helpers::Datagram& datagram) {
            return datagram.from == alice_address;
        });
        REQUIRE(alice.manager->Send(id, Bytes("into the void")).IsOk());

        for (uint32_t i = 0; i <= config.max_retransmits + 2; ++i) {
            mesh.Advance(config.retransmit_timeout);
        }

        REQUIRE(alice.manager->StateOf(id).Unwrap() == SessionState::Failed);
        REQUIRE(alice.events->Retransmissions().size() == config.max_retransmits);
        const auto failures = alice.events->Failures();
        REQUIRE(failures.size() == 1);
        REQUIRE(failures[0].id == id);
        REQUIRE(failures[0].type == SessionFailureType::Failed);
        REQUIRE(alice.events->CountTransitionsTo(id, SessionState::Failed) == 1);

        REQUIRE(alice.manager->Send(id, Bytes("again")).UnwrapErr().type == SessionFailureType::SessionClosed);
        auto stream = alice.manager->Receive(id).Unwrap();
        REQUIRE(stream->Next().IsErr());

        mesh.Advance(config.failed_session_retention);
        REQUIRE(alice.manager->SessionCount() == 0);
    }
}

TEST_CASE("Multi-Hop Sessions - Setup", "[integration][session][setup]") {
    SECTION("Unanswered OPEN is retried, then the session fails") {
        test_helpers::TestMesh mesh(5);
        auto& alice = mesh.Node(0);
        auto& bob = mesh.Node(4);
        const auto config = alice.manager->Config();
        const auto bob_address = bob.identity.address;
        mesh.Network().SetDropFilter([bob_address](const test_helpers::Datagram& datagram) {
            return datagram.to == bob_address;
        });

        const SessionId id = alice.manager->Open(bob.identity).Unwrap();
        mesh.Settle();
        for (uint32_t i = 0; i < config.setup_attempts; ++i) {
            mesh.Advance(config.setup_timeout);
        }

        REQUIRE(alice.manager->StateOf(id).Unwrap() == SessionState::Failed);
        const auto retries = alice.events->Retransmissions();
        REQUIRE(retries.size() == config.setup_attempts - 1);
        for (const auto& retry : retries) {
            REQUIRE(retry.sequence == 0);
        }
        REQUIRE(alice.events->Failures().size() == 1);
    }

    SECTION("Messages sent while establishing go out on activation") {
        test_helpers::TestMesh mesh(5);
        auto& alice = mesh.Node(0);
        auto& bob = mesh.Node(4);
        const SessionId id = alice.manager->Open(bob.identity).Unwrap();
        REQUIRE(alice.manager->Send(id, Bytes("early")).IsOk());
        mesh.Settle();
        auto received = bob.manager->Receive(id).Unwrap()->TryNext();
        REQUIRE(received.has_value());
        REQUIRE(*received->Unwrap() == Bytes("early"));
    }

    SECTION("No route for a path longer than the relay pool allows") {
        test_helpers::TestMesh mesh(3);
        OpenOptions options;
        options.hop_count = 4;
        auto opened = mesh.Node(0).manager->Open(mesh.Node(2).identity, options);
        REQUIRE(opened.IsErr());
        REQUIRE(opened.UnwrapErr().type == SessionFailureType::NoRouteAvailable);
        REQUIRE(mesh.Node(0).manager->SessionCount() == 0);
    }

    SECTION("Opening a session to oneself has no route") {
        test_helpers::TestMesh mesh(5);
        auto opened = mesh.Node(0).manager->Open(mesh.Node(0).identity);
        REQUIRE(opened.IsErr());
        REQUIRE(opened.UnwrapErr().type == SessionFailureType::NoRouteAvailable);
    }

    SECTION("Excluded relays are never on the path") {
        test_helpers::TestMesh mesh(5);
        OpenOptions options;
        options.exclude.insert(mesh.Node(1).identity.address);
        options.exclude.insert(mesh.Node(2).identity.address);
        const SessionId id = mesh.Node(0).manager->Open(mesh.Node(4).identity, options).Unwrap();
        const auto path = mesh.Node(0).manager->PathOf(id).Unwrap();
        REQUIRE_FALSE(path.Contains(mesh.Node(1).identity.address));
        REQUIRE_FALSE(path.Contains(mesh.Node(2).identity.address));
        REQUIRE(path.Length() == 3);
    }

    SECTION("Operations on an unknown session report SessionClosed") {
        test_helpers::TestMesh mesh(3);
        const SessionId unknown(SessionId::Bytes{0xDE, 0xAD});
        REQUIRE(mesh.Node(0).manager->Send(unknown, Bytes("x")).UnwrapErr().type == SessionFailureType::SessionClosed);
        REQUIRE(mesh.Node(0).manager->Close(unknown).IsErr());
        REQUIRE(mesh.Node(0).manager->Receive(unknown).IsErr());
    }
}

TEST_CASE("Multi-Hop Sessions - Session limits", "[integration][session][limits]") {
    SECTION("Initiator refuses sessions beyond the limit") {
        auto config = configuration::SessionConfig::Default();
        config.max_sessions = 2;
        test_helpers::TestMesh mesh(6, config);
        auto& alice = mesh.Node(0);

        const SessionId first = alice.manager->Open(mesh.Node(4).identity).Unwrap();
        REQUIRE(alice.manager->Open(mesh.Node(5).identity).IsOk());
        mesh.Settle();

        auto refused = alice.manager->Open(mesh.Node(3).identity);
        REQUIRE(refused.IsErr());
        REQUIRE(refused.UnwrapErr().type == SessionFailureType::TooManySessions);
        REQUIRE(alice.manager->ActiveSessionCount() == 2);

        REQUIRE(alice.manager->Close(first).IsOk());
        mesh.Settle();
        REQUIRE(alice.manager->StateOf(first).Unwrap() == SessionState::Closed);
        REQUIRE(alice.manager->Open(mesh.Node(3).identity).IsOk());
    }

    SECTION("Responder at its limit drops new OPENs") {
        auto config = configuration::SessionConfig::Default();
        config.max_sessions = 1;
        test_helpers::TestMesh mesh(5, config);
        auto& bob = mesh.Node(4);

        const SessionId accepted = mesh.Node(0).manager->Open(bob.identity).Unwrap();
        mesh.Settle();
        REQUIRE(bob.manager->StateOf(accepted).Unwrap() == SessionState::Active);

        const SessionId refused = mesh.Node(1).manager->Open(bob.identity).Unwrap();
        mesh.Settle();
        REQUIRE(HasDrop(*bob.events, "Session limit reached, OPEN refused"));
        REQUIRE(bob.manager->SessionCount() == 1);
        REQUIRE(mesh.Node(1).manager->StateOf(refused).Unwrap() == SessionState::Establishing);

        for (uint32_t i = 0; i < config.setup_attempts; ++i) {
            mesh.Advance(config.setup_timeout);
        }
        REQUIRE(mesh.Node(1).manager->StateOf(refused).Unwrap() == SessionState::Failed);
        REQUIRE(mesh.Node(0).manager->StateOf(accepted).Unwrap() == SessionState::Active);
    }
}

TEST_CASE("Multi-Hop Sessions - Liveness", "[integration][session][liveness]") {
    auto config = configuration::SessionConfig::Default();
    config.max_sessions = 1;
    test_helpers::TestMesh mesh(5, config);
    auto& alice = mesh.Node(0);
    auto& bob = mesh.Node(4);

    const SessionId id = alice.manager->Open(bob.identity).Unwrap();
    mesh.Settle();
    REQUIRE(alice.manager->StateOf(id).Unwrap() == SessionState::Active);
    REQUIRE(bob.manager->StateOf(id).Unwrap() == SessionState::Active);

    SECTION("Responder of a vanished initiator is failed, reaped and frees its slot") {
        auto bob_stream = bob.manager->Receive(id).Unwrap();
        mesh.Network().SetDropFilter([](const test_helpers::Datagram&) { return true; });

        REQUIRE(alice.manager->Send(id, Bytes("lost")).IsOk());
        for (uint32_t i = 0; i <= config.max_retransmits + 1; ++i) {
            mesh.Advance(config.retransmit_timeout);
        }
        REQUIRE(alice.manager->StateOf(id).Unwrap() == SessionState::Failed);
        mesh.Advance(config.failed_session_retention);
        REQUIRE(alice.manager->SessionCount() == 0);

        REQUIRE(bob.manager->StateOf(id).Unwrap() == SessionState::Active);
        REQUIRE(bob.manager->Open(alice.identity).UnwrapErr().type == SessionFailureType::TooManySessions);

        mesh.Advance(config.idle_timeout);
        REQUIRE(bob.manager->StateOf(id).Unwrap() == SessionState::Failed);
        REQUIRE(bob.manager->ActiveSessionCount() == 0);
        const auto failures = bob.events->Failures();
        REQUIRE(failures.size() == 1);
        REQUIRE(failures[0].id == id);
        REQUIRE(failures[0].type == SessionFailureType::Failed);

        auto item = bob_stream->Next();
        REQUIRE(item.IsErr());
        REQUIRE(item.UnwrapErr().type == SessionFailureType::Failed);

        mesh.Advance(config.failed_session_retention);
        REQUIRE(bob.manager->SessionCount() == 0);

        mesh.Network().ClearDropFilter();
        const SessionId fresh = bob.manager->Open(alice.identity).Unwrap();
        mesh.Settle();
        REQUIRE(bob.manager->StateOf(fresh).Unwrap() == SessionState::Active);
        REQUIRE(alice.manager->StateOf(fresh).Unwrap() == SessionState::Active);
    }

    SECTION("Regular traffic keeps both ends alive past the idle timeout") {
        const auto step = config.idle_timeout / 2;
        for (int i = 0; i < 5; ++i) {
            mesh.Advance(std::chrono::duration_cast<std::chrono::milliseconds>(step));
            REQUIRE(alice.manager->Send(id, Bytes("ping " + std::to_string(i))).IsOk());
            mesh.Settle();
        }
        REQUIRE(alice.manager->StateOf(id).Unwrap() == SessionState::Active);
        REQUIRE(bob.manager->StateOf(id).Unwrap() == SessionState::Active);
        REQUIRE(bob.manager->Receive(id).Unwrap()->Pending() == 5);
        REQUIRE(bob.events->Failures().empty());
    }

    SECTION("Silent session on both ends fails after the idle timeout") {
        mesh.Advance(config.idle_timeout);
        REQUIRE(alice.manager->StateOf(id).Unwrap() == SessionState::Failed);
        REQUIRE(bob.manager->StateOf(id).Unwrap() == SessionState::Failed);
    }
}
