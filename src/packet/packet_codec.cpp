#include "edgli/packet/packet_codec.hpp"
#include "edgli/packet/acknowledgement_codec.hpp"
#include "edgli/crypto/hkdf.hpp"
#include "edgli/crypto/primitives.hpp"
#include "edgli/crypto/sodium_interop.hpp"
#include "edgli/core/format.hpp"
#include "edgli/debug/trace_logger.hpp"
#include <sodium.h>
#include <algorithm>
#include <array>
#include <string_view>
#include <utility>
#include <vector>

namespace edgli::packet {
    using crypto::Hkdf;
    using crypto::Key32;
    using crypto::Primitives;
    using crypto::SodiumInterop;
    using identity::NodeKeyPair;
    using identity::PeerId;
    using path::PathDescriptor;

    namespace {
        constexpr size_t kHeaderStreamBytes = kRoutingHeaderBytes + kRoutingSlotBytes;
        constexpr size_t kSlotPeerOffset = 1;
        constexpr size_t kSlotMacOffset = kSlotPeerOffset + kPeerIdBytes;

        static_assert(kSlotMacOffset + kHmacBytes == kRoutingSlotBytes);
        static_assert(kBodyPrefixBytes + kMaxFragmentBytes == kBodyPlaintextBytes);
        static_assert(kMaxFragmentBytes <= 0xFFFF);

        struct SecretKey32 {
            Key32 bytes{};
            SecretKey32() = default;
            SecretKey32(const SecretKey32&) = delete;
            SecretKey32& operator=(const SecretKey32&) = delete;
            ~SecretKey32() { sodium_memzero(bytes.data(), bytes.size()); }
        };

        struct HopKeys {
            Key32 rho{};
            Key32 mu{};
            Key32 pi{};
            Key32 aead{};
            ReplayTag tag{};
            HopKeys() = default;
            HopKeys(const HopKeys&) = delete;
            HopKeys& operator=(const HopKeys&) = delete;
            ~HopKeys() {
                sodium_memzero(rho.data(), rho.size());
                sodium_memzero(mu.data(), mu.size());
                sodium_memzero(pi.data(), pi.size());
                sodium_memzero(aead.data(), aead.size());
            }
        };

        std::span<const uint8_t> AsBytes(const std::string_view text) {
            return {reinterpret_cast<const uint8_t*>(text.data()), text.size()};
        }

        void XorInto(std::span<uint8_t> target, std::span<const uint8_t> source) {
            for (size_t i = 0; i < target.size(); ++i) {
                target[i] ^= source[i];
            }
        }

        Result<Unit, SessionFailure> DeriveHopKeys(std::span<const uint8_t> secret, HopKeys& keys) {
            const std::array<std::pair<std::span<uint8_t>, std::string_view>, 5> targets{{
                {keys.rho, kHeaderStreamInfo},
                {keys.mu, kHeaderMacInfo},
                {keys.pi, kBodyStreamInfo},
                {keys.aead, kBodyAeadInfo},
                {keys.tag, kReplayTagInfo},
            }};
            for (const auto& [output, info] : targets) {
                if (auto result = Hkdf::DeriveKey(secret, output, {}, AsBytes(info)); result.IsErr()) {
                    return result;
                }
            }
            return Result<Unit, SessionFailure>::Ok(unit);
        }

        Result<Unit, SessionFailure> DeriveBlinding(
            std::span<const uint8_t> secret,
            std::span<const uint8_t> alpha,
            Key32& blinding) {
            return Hkdf::DeriveKey(secret, blinding, alpha, AsBytes(kBlindingInfo));
        }

        Result<DecodedUnit, SessionFailure> Malformed() {
            return Result<DecodedUnit, SessionFailure>::Err(SessionFailure::MalformedPacket());
        }
    }

    Result<OutgoingPacket, SessionFailure> PacketCodec::Encode(
        std::span<const uint8_t> fragment,
        const PathDescriptor& path) {
        return EncodeUnit(UnitKind::Data, fragment, path);
    }

    Result<OutgoingPacket, SessionFailure> PacketCodec::EncodeAcknowledgement(
        const Acknowledgement& ack,
        const PathDescriptor& path) {
        auto body_result = AcknowledgementCodec::Serialize(ack);
        if (body_result.IsErr()) {
            return Result<OutgoingPacket, SessionFailure>::Err(body_result.UnwrapErr());
        }
        return EncodeUnit(UnitKind::Acknowledgement, body_result.Unwrap(), path);
    }

    Result<OutgoingPacket, SessionFailure> PacketCodec::EncodeUnit(
        const UnitKind kind,
        std::span<const uint8_t> content,
        const PathDescriptor& path) {
        if (content.size() > kMaxFragmentBytes) {
            return Result<OutgoingPacket, SessionFailure>::Err(
                SessionFailure::FragmentTooLarge(
                    compat::format("Fragment of {} bytes exceeds packet capacity of {} bytes",
                        content.size(), kMaxFragmentBytes)));
        }

        const auto& hops = path.Hops();
        const size_t hop_count = hops.size();

        SecretKey32 ephemeral;
        SodiumInterop::FillRandom(ephemeral.bytes);
        auto alpha_result = Primitives::X25519Base(ephemeral.bytes);
        if (alpha_result.IsErr()) {
            return Result<OutgoingPacket, SessionFailure>::Err(alpha_result.UnwrapErr());
        }
        const Key32 first_alpha = alpha_result.Unwrap();

        std::array<HopKeys, kMaxPathLength> keys;
        std::array<SecretKey32, kMaxPathLength> blindings;
        Key32 alpha = first_alpha;
        for (size_t i = 0; i < hop_count; ++i) {
            auto secret_result = Primitives::X25519(ephemeral.bytes, hops[i].public_key);
            if (secret_result.IsErr()) {
                return Result<OutgoingPacket, SessionFailure>::Err(secret_result.UnwrapErr());
            }
            SecretKey32 secret;
            secret.bytes = secret_result.Unwrap();
            for (size_t j = 0; j < i; ++j) {
                auto blinded = Primitives::X25519(blindings[j].bytes, secret.bytes);
                if (blinded.IsErr()) {
                    return Result<OutgoingPacket, SessionFailure>::Err(blinded.UnwrapErr());
                }
                secret.bytes = blinded.Unwrap();
            }
            if (auto derived = DeriveHopKeys(secret.bytes, keys[i]); derived.IsErr()) {
                return Result<OutgoingPacket, SessionFailure>::Err(derived.UnwrapErr());
            }
            if (auto blinded = DeriveBlinding(secret.bytes, alpha, blindings[i].bytes); blinded.IsErr()) {
                return Result<OutgoingPacket, SessionFailure>::Err(blinded.UnwrapErr());
            }
            if (i + 1 < hop_count) {
                auto next_alpha = Primitives::X25519(blindings[i].bytes, alpha);
                if (next_alpha.IsErr()) {
                    return Result<OutgoingPacket, SessionFailure>::Err(next_alpha.UnwrapErr());
                }
                alpha = next_alpha.Unwrap();
            }
        }

        std::array<std::array<uint8_t, kHeaderStreamBytes>, kMaxPathLength> streams{};
        for (size_t i = 0; i < hop_count; ++i) {
            Primitives::Keystream(keys[i].rho, streams[i]);
        }

        std::vector<uint8_t> filler;
        filler.reserve((hop_count - 1) * kRoutingSlotBytes);
        for (size_t i = 0; i + 1 < hop_count; ++i) {
            filler.resize(filler.size() + kRoutingSlotBytes, 0);
            const size_t start = kRoutingHeaderBytes - i * kRoutingSlotBytes;
            XorInto(filler, std::span<const uint8_t>(streams[i]).subspan(start, filler.size()));
        }

        std::array<uint8_t, kRoutingHeaderBytes> beta{};
        const size_t open_bytes = kRoutingHeaderBytes - filler.size();
        beta[0] = static_cast<uint8_t>(RoutingFlag::Final);
        SodiumInterop::FillRandom(
            std::span<uint8_t>(beta).subspan(kRoutingSlotBytes, open_bytes - kRoutingSlotBytes));
        XorInto(std::span<uint8_t>(beta).first(open_bytes),
                std::span<const uint8_t>(streams[hop_count - 1]).first(open_bytes));
        std::copy(filler.begin(), filler.end(), beta.begin() + static_cast<std::ptrdiff_t>(open_bytes));
        Key32 gamma = Primitives::HmacSha256(keys[hop_count - 1].mu, beta);

        for (size_t i = hop_count - 1; i-- > 0;) {
            std::array<uint8_t, kRoutingHeaderBytes> wrapped{};
            wrapped[0] = static_cast<uint8_t>(RoutingFlag::Forward);
            const auto& next = hops[i + 1].address.AsBytes();
            std::copy(next.begin(), next.end(), wrapped.begin() + kSlotPeerOffset);
            std::copy(gamma.begin(), gamma.end(), wrapped.begin() + kSlotMacOffset);
            std::copy(beta.begin(), beta.end() - kRoutingSlotBytes, wrapped.begin() + kRoutingSlotBytes);
            XorInto(wrapped, std::span<const uint8_t>(streams[i]).first(kRoutingHeaderBytes));
            beta = wrapped;
            gamma = Primitives::HmacSha256(keys[i].mu, beta);
        }

        std::array<uint8_t, kBodyPlaintextBytes> plaintext{};
        plaintext[0] = static_cast<uint8_t>(kind);
        plaintext[1] = static_cast<uint8_t>(content.size() & 0xFF);
        plaintext[2] = static_cast<uint8_t>((content.size() >> 8) & 0xFF);
        std::copy(content.begin(), content.end(), plaintext.begin() + kBodyPrefixBytes);
        auto body = Primitives::AeadSeal(keys[hop_count - 1].aead, plaintext);
        sodium_memzero(plaintext.data(), plaintext.size());
        for (size_t i = hop_count; i-- > 0;) {
            Primitives::XorKeystream(keys[i].pi, body);
        }

        OutgoingPacket out;
        out.first_hop = hops.front().address;
        std::copy(first_alpha.begin(), first_alpha.end(), out.bytes.begin() + kAlphaOffset);
        std::copy(beta.begin(), beta.end(), out.bytes.begin() + kBetaOffset);
        std::copy(gamma.begin(), gamma.end(), out.bytes.begin() + kGammaOffset);
        std::copy(body.begin(), body.end(), out.bytes.begin() + kDeltaOffset);

        debug::TracePacketEncoded(out.first_hop.AsSpan(), hop_count,
            kind == UnitKind::Data ? "data" : "ack");
        return Result<OutgoingPacket, SessionFailure>::Ok(out);
    }

    Result<DecodedUnit, SessionFailure> PacketCodec::Decode(
        std::span<const uint8_t> packet,
        const NodeKeyPair& own_keys) {
        if (packet.size() != kPacketBytes) {
            return Malformed();
        }
        const auto alpha = packet.subspan(kAlphaOffset, kX25519PublicKeyBytes);
        const auto beta = packet.subspan(kBetaOffset, kRoutingHeaderBytes);
        const auto gamma = packet.subspan(kGammaOffset, kHmacBytes);
        const auto delta = packet.subspan(kDeltaOffset, kPacketBodyBytes);

        auto secret_result = own_keys.SharedSecret(alpha);
        if (secret_result.IsErr()) {
            return Malformed();
        }
        SecretKey32 secret;
        secret.bytes = secret_result.Unwrap();

        HopKeys keys;
        if (DeriveHopKeys(secret.bytes, keys).IsErr()) {
            return Malformed();
        }
        if (!Primitives::VerifyHmacSha256(keys.mu, beta, gamma)) {
            return Malformed();
        }

        std::array<uint8_t, kHeaderStreamBytes> opened{};
        std::copy(beta.begin(), beta.end(), opened.begin());
        Primitives::XorKeystream(keys.rho, opened);

        std::vector<uint8_t> body(delta.begin(), delta.end());
        Primitives::XorKeystream(keys.pi, body);

        DecodedUnit decoded;
        decoded.replay_tag = keys.tag;

        const auto flag = opened[0];
        if (flag == static_cast<uint8_t>(RoutingFlag::Forward)) {
            auto next_result = PeerId::FromBytes(
                std::span<const uint8_t>(opened).subspan(kSlotPeerOffset, kPeerIdBytes));
            if (next_result.IsErr()) {
                return Malformed();
            }
            SecretKey32 blinding;
            if (DeriveBlinding(secret.bytes, alpha, blinding.bytes).IsErr()) {
                return Malformed();
            }
            auto next_alpha = Primitives::X25519(blinding.bytes, alpha);
            if (next_alpha.IsErr()) {
                return Malformed();
            }
            ForwardInstruction forward;
            forward.next_hop = next_result.Unwrap();
            const auto& next_alpha_bytes = next_alpha.Unwrap();
            std::copy(next_alpha_bytes.begin(), next_alpha_bytes.end(),
                forward.packet.begin() + kAlphaOffset);
            std::copy(opened.begin() + kRoutingSlotBytes, opened.end(),
                forward.packet.begin() + kBetaOffset);
            std::copy(opened.begin() + kSlotMacOffset, opened.begin() + kRoutingSlotBytes,
                forward.packet.begin() + kGammaOffset);
            std::copy(body.begin(), body.end(), forward.packet.begin() + kDeltaOffset);
            debug::TraceHopDecoded(decoded.replay_tag, false);
            decoded.unit = std::move(forward);
            return Result<DecodedUnit, SessionFailure>::Ok(std::move(decoded));
        }
        if (flag != static_cast<uint8_t>(RoutingFlag::Final)) {
            return Malformed();
        }

        auto plaintext_result = Primitives::AeadOpen(keys.aead, body);
        if (plaintext_result.IsErr()) {
            return Malformed();
        }
        auto plaintext = std::move(plaintext_result).Unwrap();
        if (plaintext.size() != kBodyPlaintextBytes) {
            return Malformed();
        }
        const uint8_t kind = plaintext[0];
        const size_t length = static_cast<size_t>(plaintext[1]) |
                              (static_cast<size_t>(plaintext[2]) << 8);
        if (length > kMaxFragmentBytes) {
            sodium_memzero(plaintext.data(), plaintext.size());
            return Malformed();
        }
        const auto content = std::span<const uint8_t>(plaintext).subspan(kBodyPrefixBytes, length);

        debug::TraceHopDecoded(decoded.replay_tag, true);
        if (kind == static_cast<uint8_t>(UnitKind::Data)) {
            decoded.unit = DeliverPayload{std::vector<uint8_t>(content.begin(), content.end())};
        } else if (kind == static_cast<uint8_t>(UnitKind::Acknowledgement)) {
            auto ack_result = AcknowledgementCodec::Parse(content);
            if (ack_result.IsErr()) {
                sodium_memzero(plaintext.data(), plaintext.size());
                return Malformed();
            }
            decoded.unit = std::move(ack_result).Unwrap();
        } else {
            sodium_memzero(plaintext.data(), plaintext.size());
            return Malformed();
        }
        sodium_memzero(plaintext.data(), plaintext.size());
        return Result<DecodedUnit, SessionFailure>::Ok(std::move(decoded));
    }
}
