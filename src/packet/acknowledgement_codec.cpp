#include "edgli/packet/acknowledgement_codec.hpp"
#include "edgli/core/format.hpp"

namespace edgli::packet {
    namespace {
        void AppendUint64LE(std::vector<uint8_t>& out, const uint64_t value) {
            for (size_t i = 0; i < 8; ++i) {
                out.push_back(static_cast<uint8_t>((value >> (i * 8)) & 0xFF));
            }
        }

        uint64_t ReadUint64LE(std::span<const uint8_t> bytes) {
            uint64_t value = 0;
            for (size_t i = 0; i < 8; ++i) {
                value |= static_cast<uint64_t>(bytes[i]) << (i * 8);
            }
            return value;
        }
    }

    Result<std::vector<uint8_t>, SessionFailure> AcknowledgementCodec::Serialize(const Acknowledgement& ack) {
        if (ack.sequences.empty() || ack.sequences.size() > kMaxAcknowledgedPerUnit) {
            return Result<std::vector<uint8_t>, SessionFailure>::Err(
                SessionFailure::Encode(
                    compat::format("Acknowledgement must carry 1..{} sequences, got {}",
                        kMaxAcknowledgedPerUnit, ack.sequences.size())));
        }
        std::vector<uint8_t> out;
        out.reserve(kAcknowledgementHeaderBytes + ack.sequences.size() * sizeof(uint64_t));
        const auto& id = ack.session_id.AsBytes();
        out.insert(out.end(), id.begin(), id.end());
        out.push_back(static_cast<uint8_t>(ack.sequences.size()));
        for (const uint64_t sequence : ack.sequences) {
            AppendUint64LE(out, sequence);
        }
        return Result<std::vector<uint8_t>, SessionFailure>::Ok(std::move(out));
    }

    Result<Acknowledgement, SessionFailure> AcknowledgementCodec::Parse(std::span<const uint8_t> bytes) {
        if (bytes.size() < kAcknowledgementHeaderBytes) {
            return Result<Acknowledgement, SessionFailure>::Err(
                SessionFailure::Decode("Acknowledgement shorter than header"));
        }
        const size_t count = bytes[kSessionIdBytes];
        if (count == 0 || count > kMaxAcknowledgedPerUnit ||
            bytes.size() != kAcknowledgementHeaderBytes + count * sizeof(uint64_t)) {
            return Result<Acknowledgement, SessionFailure>::Err(
                SessionFailure::Decode("Acknowledgement length mismatch"));
        }
        auto id_result = session::SessionId::FromBytes(bytes.subspan(0, kSessionIdBytes));
        if (id_result.IsErr()) {
            return Result<Acknowledgement, SessionFailure>::Err(id_result.UnwrapErr());
        }
        Acknowledgement ack;
        ack.session_id = id_result.Unwrap();
        ack.sequences.reserve(count);
        for (size_t i = 0; i < count; ++i) {
            ack.sequences.push_back(
                ReadUint64LE(bytes.subspan(kAcknowledgementHeaderBytes + i * sizeof(uint64_t), 8)));
        }
        return Result<Acknowledgement, SessionFailure>::Ok(std::move(ack));
    }
}
