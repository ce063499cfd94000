#include "edgli/session/frame_codec.hpp"
#include "edgli/core/format.hpp"
#include <google/protobuf/io/coded_stream.h>
#include <google/protobuf/io/zero_copy_stream_impl_lite.h>
#include <string>

namespace edgli::session {
    using proto::session::SessionFrame;

    namespace {
        std::string ToProtoBytes(std::span<const uint8_t> bytes) {
            return {reinterpret_cast<const char*>(bytes.data()), bytes.size()};
        }

        std::span<const uint8_t> FromProtoBytes(const std::string& bytes) {
            return {reinterpret_cast<const uint8_t*>(bytes.data()), bytes.size()};
        }

        SessionFrame MakeBase(const SessionId& id, const uint64_t sequence, const SessionFrame::Kind kind) {
            SessionFrame frame;
            frame.set_version(kWireVersion);
            frame.set_session_id(ToProtoBytes(id.AsSpan()));
            frame.set_sequence(sequence);
            frame.set_kind(kind);
            return frame;
        }
    }

    SessionFrame FrameCodec::MakeOpen(const SessionId& id, const identity::RelayIdentity& reply_to) {
        auto frame = MakeBase(id, 0, SessionFrame::OPEN);
        auto* address = frame.mutable_reply_to();
        address->set_peer_id(ToProtoBytes(reply_to.address.AsSpan()));
        address->set_public_key(ToProtoBytes(reply_to.public_key));
        return frame;
    }

    SessionFrame FrameCodec::MakeData(
        const SessionId& id,
        const uint64_t sequence,
        std::span<const uint8_t> payload,
        const bool final_fragment) {
        auto frame = MakeBase(id, sequence, SessionFrame::DATA);
        frame.set_payload(ToProtoBytes(payload));
        frame.set_final_fragment(final_fragment);
        return frame;
    }

    SessionFrame FrameCodec::MakeClose(const SessionId& id, const uint64_t sequence) {
        auto frame = MakeBase(id, sequence, SessionFrame::CLOSE);
        frame.set_final_fragment(true);
        return frame;
    }

    Result<std::vector<uint8_t>, SessionFailure> FrameCodec::Serialize(const SessionFrame& frame) {
        std::string output;
        {
            google::protobuf::io::StringOutputStream stream(&output);
            google::protobuf::io::CodedOutputStream coded_out(&stream);
            coded_out.SetSerializationDeterministic(true);
            if (!frame.SerializeToCodedStream(&coded_out) || coded_out.HadError()) {
                return Result<std::vector<uint8_t>, SessionFailure>::Err(
                    SessionFailure::Encode("Failed to serialize session frame"));
            }
        }
        if (output.size() > kMaxFragmentBytes) {
            return Result<std::vector<uint8_t>, SessionFailure>::Err(
                SessionFailure::FragmentTooLarge(
                    compat::format("Session frame of {} bytes exceeds packet capacity", output.size())));
        }
        return Result<std::vector<uint8_t>, SessionFailure>::Ok(
            std::vector<uint8_t>(output.begin(), output.end()));
    }

    Result<SessionFrame, SessionFailure> FrameCodec::Parse(std::span<const uint8_t> bytes) {
        SessionFrame frame;
        if (!frame.ParseFromArray(bytes.data(), static_cast<int>(bytes.size()))) {
            return Result<SessionFrame, SessionFailure>::Err(
                SessionFailure::Decode("Failed to parse session frame"));
        }
        if (frame.version() != kWireVersion) {
            return Result<SessionFrame, SessionFailure>::Err(
                SessionFailure::Decode(
                    compat::format("Unsupported session frame version {}", frame.version())));
        }
        if (frame.session_id().size() != kSessionIdBytes) {
            return Result<SessionFrame, SessionFailure>::Err(
                SessionFailure::Decode("Session frame carries an invalid session id"));
        }
        switch (frame.kind()) {
            case SessionFrame::OPEN:
                if (frame.sequence() != 0 || !frame.has_reply_to()) {
                    return Result<SessionFrame, SessionFailure>::Err(
                        SessionFailure::Decode("OPEN frame must have sequence 0 and a reply address"));
                }
                break;
            case SessionFrame::DATA:
            case SessionFrame::CLOSE:
                if (frame.sequence() == 0) {
                    return Result<SessionFrame, SessionFailure>::Err(
                        SessionFailure::Decode("Sequence 0 is reserved for OPEN"));
                }
                break;
            default:
                return Result<SessionFrame, SessionFailure>::Err(
                    SessionFailure::Decode("Session frame has no kind"));
        }
        return Result<SessionFrame, SessionFailure>::Ok(std::move(frame));
    }

    Result<identity::RelayIdentity, SessionFailure> FrameCodec::ReplyAddressOf(const SessionFrame& frame) {
        if (!frame.has_reply_to()) {
            return Result<identity::RelayIdentity, SessionFailure>::Err(
                SessionFailure::Decode("Session frame has no reply address"));
        }
        auto peer_result = identity::PeerId::FromBytes(FromProtoBytes(frame.reply_to().peer_id()));
        if (peer_result.IsErr()) {
            return Result<identity::RelayIdentity, SessionFailure>::Err(
                SessionFailure::Decode("Reply address has an invalid peer id"));
        }
        return identity::RelayIdentity::Create(
            peer_result.Unwrap(),
            FromProtoBytes(frame.reply_to().public_key()));
    }
}
