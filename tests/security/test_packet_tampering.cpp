#include <catch2/catch_test_macros.hpp>
#include "edgli/packet/packet_codec.hpp"
#include "helpers/keyed_relays.hpp"
#include "helpers/test_mesh.hpp"
#include <algorithm>
#include <string>
#include <vector>

using namespace edgli;
using namespace edgli::packet;
using namespace std::chrono_literals;

namespace {
    std::vector<uint8_t> Fragment() {
        std::vector<uint8_t> fragment(200);
        for (size_t i = 0; i < fragment.size(); ++i) {
            fragment[i] = static_cast<uint8_t>(i);
        }
        return fragment;
    }

    void RequireMalformed(const Result<DecodedUnit, SessionFailure>& result) {
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == SessionFailureType::MalformedPacket);
        REQUIRE(result.UnwrapErr().message == SessionFailure::MalformedPacket().message);
    }

    size_t CountDrops(const test_helpers::RecordingEventHandler& events, const std::string& reason) {
        const auto dropped = events.Dropped();
        return static_cast<size_t>(std::count(dropped.begin(), dropped.end(), reason));
    }
}

TEST_CASE("Packet Tampering - Header fields", "[security][packet][tampering]") {
    test_helpers::KeyedRelays relays(3);
    const auto fragment = Fragment();
    auto packet = PacketCodec::Encode(fragment, relays.Path(3)).Unwrap();

    SECTION("Flipped alpha bit is rejected at the first hop") {
        packet.bytes[kAlphaOffset + 5] ^= 0x01;
        RequireMalformed(PacketCodec::Decode(packet.bytes, relays.Keys(0)));
    }

    SECTION("Flipped routing header bit is rejected at the first hop") {
        packet.bytes[kBetaOffset + 17] ^= 0x80;
        RequireMalformed(PacketCodec::Decode(packet.bytes, relays.Keys(0)));
    }

    SECTION("Flipped MAC bit is rejected at the first hop") {
        packet.bytes[kGammaOffset] ^= 0x01;
        RequireMalformed(PacketCodec::Decode(packet.bytes, relays.Keys(0)));
    }

    SECTION("Zeroed alpha is rejected") {
        std::fill(packet.bytes.begin() + kAlphaOffset, packet.bytes.begin() + kBetaOffset, 0);
        RequireMalformed(PacketCodec::Decode(packet.bytes, relays.Keys(0)));
    }
}

TEST_CASE("Packet Tampering - Body", "[security][packet][tampering]") {
    test_helpers::KeyedRelays relays(3);
    const auto fragment = Fragment();
    auto packet = PacketCodec::Encode(fragment, relays.Path(3)).Unwrap();

    SECTION("Body tampering passes intermediates but fails at the destination") {
        packet.bytes[kDeltaOffset + 40] ^= 0x01;
        auto first = PacketCodec::Decode(packet.bytes, relays.Keys(0));
        REQUIRE(first.IsOk());
        RequireMalformed(relays.Traverse(packet, 3));
    }

    SECTION("Tampering with the last body byte is caught") {
        packet.bytes[kPacketBytes - 1] ^= 0xFF;
        RequireMalformed(relays.Traverse(packet, 3));
    }

    SECTION("Untampered packet still delivers") {
        auto decoded = relays.Traverse(packet, 3);
        REQUIRE(decoded.IsOk());
        REQUIRE(std::get<DeliverPayload>(decoded.Unwrap().unit).fragment == fragment);
    }
}

TEST_CASE("Packet Tampering - Wrong recipient", "[security][packet][tampering]") {
    test_helpers::KeyedRelays relays(4);
    const auto fragment = Fragment();
    auto packet = PacketCodec::Encode(fragment, relays.Path(3)).Unwrap();

    SECTION("A relay off the path cannot peel the packet") {
        RequireMalformed(PacketCodec::Decode(packet.bytes, relays.Keys(3)));
    }

    SECTION("The second hop cannot skip the first") {
        RequireMalformed(PacketCodec::Decode(packet.bytes, relays.Keys(1)));
    }
}

TEST_CASE("Packet Tampering - Session manager drops", "[security][packet][tampering][replay]") {
    test_helpers::TestMesh mesh(4);
    auto& initiator = mesh.Node(0);
    auto& destination = mesh.Node(3);

    auto opened = initiator.manager->Open(destination.identity, {});
    REQUIRE(opened.IsOk());
    auto pending = mesh.Network().TakePending();
    REQUIRE(pending.size() == 1);
    const auto datagram = pending.front();

    size_t first_hop = mesh.Size();
    for (size_t i = 0; i < mesh.Size(); ++i) {
        if (mesh.Node(i).identity.address == datagram.to) {
            first_hop = i;
        }
    }
    REQUIRE(first_hop != mesh.Size());
    REQUIRE(first_hop != 0);
    REQUIRE(first_hop != 3);
    auto& relay_events = *mesh.Node(first_hop).events;

    SECTION("Replayed packet is dropped at the relay that saw it first") {
        mesh.Network().Enqueue(datagram);
        mesh.Network().Enqueue(datagram);
        mesh.Settle();
        REQUIRE(CountDrops(relay_events, "Replayed packet") == 1);
        REQUIRE(initiator.manager->StateOf(opened.Unwrap()).Unwrap() == session::SessionState::Active);
    }

    SECTION("Tampered packet is dropped as malformed") {
        auto tampered = datagram;
        tampered.bytes[kBetaOffset + 3] ^= 0x10;
        mesh.Network().Enqueue(tampered);
        mesh.Settle();
        REQUIRE(CountDrops(relay_events, SessionFailure::MalformedPacket().message) == 1);
        REQUIRE(destination.manager->SessionCount() == 0);
    }

    SECTION("Truncated datagram is dropped as malformed") {
        auto truncated = datagram;
        truncated.bytes.resize(kPacketBytes - 1);
        mesh.Network().Enqueue(truncated);
        mesh.Settle();
        REQUIRE(CountDrops(relay_events, SessionFailure::MalformedPacket().message) == 1);
    }

    SECTION("Tampered copy does not poison the genuine packet") {
        auto tampered = datagram;
        tampered.bytes[kGammaOffset + 1] ^= 0x01;
        mesh.Network().Enqueue(tampered);
        mesh.Network().Enqueue(datagram);
        mesh.Settle();
        REQUIRE(destination.manager->SessionCount() == 1);
        REQUIRE(initiator.manager->StateOf(opened.Unwrap()).Unwrap() == session::SessionState::Active);
    }
}
