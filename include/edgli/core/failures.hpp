#pragma once
#include <string>
#include <string_view>
namespace edgli {
enum class SodiumFailureType {
    InitializationFailed,
    BufferTooSmall,
    BufferTooLarge,
    SecureWipeFailed,
    AllocationFailed,
    WriteOperationFailed,
    ReadOperationFailed,
    InvalidOperation
};
enum class SessionFailureType {
    NoRouteAvailable,
    FragmentTooLarge,
    MalformedPacket,
    SessionClosed,
    TooManySessions,
    Failed,
    InvalidInput,
    InvalidState,
    Crypto,
    Encode,
    Decode,
    Transport,
    Config
};
class SodiumFailure {
public:
    SodiumFailureType type;
    std::string message;
    SodiumFailure(const SodiumFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static SodiumFailure InitializationFailed(std::string msg) {
        return {SodiumFailureType::InitializationFailed, std::move(msg)};
    }
    static SodiumFailure BufferTooSmall(std::string msg) {
        return {SodiumFailureType::BufferTooSmall, std::move(msg)};
    }
    static SodiumFailure BufferTooLarge(std::string msg) {
        return {SodiumFailureType::BufferTooLarge, std::move(msg)};
    }
    static SodiumFailure SecureWipeFailed(std::string msg) {
        return {SodiumFailureType::SecureWipeFailed, std::move(msg)};
    }
    static SodiumFailure AllocationFailed(std::string msg) {
        return {SodiumFailureType::AllocationFailed, std::move(msg)};
    }
    static SodiumFailure WriteOperationFailed(std::string msg) {
        return {SodiumFailureType::WriteOperationFailed, std::move(msg)};
    }
    static SodiumFailure ReadOperationFailed(std::string msg) {
        return {SodiumFailureType::ReadOperationFailed, std::move(msg)};
    }
    static SodiumFailure InvalidOperation(std::string msg) {
        return {SodiumFailureType::InvalidOperation, std::move(msg)};
    }
};
class SessionFailure {
public:
    SessionFailureType type;
    std::string message;
    SessionFailure(const SessionFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static SessionFailure NoRouteAvailable(std::string msg) {
        return {SessionFailureType::NoRouteAvailable, std::move(msg)};
    }
    static SessionFailure FragmentTooLarge(std::string msg) {
        return {SessionFailureType::FragmentTooLarge, std::move(msg)};
    }
    static SessionFailure MalformedPacket() {
        return {SessionFailureType::MalformedPacket, "Malformed packet"};
    }
    static SessionFailure SessionClosed(std::string msg) {
        return {SessionFailureType::SessionClosed, std::move(msg)};
    }
    static SessionFailure TooManySessions(std::string msg) {
        return {SessionFailureType::TooManySessions, std::move(msg)};
    }
    static SessionFailure Failed(std::string msg) {
        return {SessionFailureType::Failed, std::move(msg)};
    }
    static SessionFailure InvalidInput(std::string msg) {
        return {SessionFailureType::InvalidInput, std::move(msg)};
    }
    static SessionFailure InvalidState(std::string msg) {
        return {SessionFailureType::InvalidState, std::move(msg)};
    }
    static SessionFailure Crypto(std::string msg) {
        return {SessionFailureType::Crypto, std::move(msg)};
    }
    static SessionFailure Encode(std::string msg) {
        return {SessionFailureType::Encode, std::move(msg)};
    }
    static SessionFailure Decode(std::string msg) {
        return {SessionFailureType::Decode, std::move(msg)};
    }
    static SessionFailure Transport(std::string msg) {
        return {SessionFailureType::Transport, std::move(msg)};
    }
    static SessionFailure Config(std::string msg) {
        return {SessionFailureType::Config, std::move(msg)};
    }
    static SessionFailure FromSodiumFailure(const SodiumFailure& sf) {
        return Crypto(sf.message);
    }
};
[[nodiscard]] constexpr std::string_view ToString(const SessionFailureType type) noexcept {
    switch (type) {
        case SessionFailureType::NoRouteAvailable: return "NoRouteAvailable";
        case SessionFailureType::FragmentTooLarge: return "FragmentTooLarge";
        case SessionFailureType::MalformedPacket: return "MalformedPacket";
        case SessionFailureType::SessionClosed: return "SessionClosed";
        case SessionFailureType::TooManySessions: return "TooManySessions";
        case SessionFailureType::Failed: return "Failed";
        case SessionFailureType::InvalidInput: return "InvalidInput";
        case SessionFailureType::InvalidState: return "InvalidState";
        case SessionFailureType::Crypto: return "Crypto";
        case SessionFailureType::Encode: return "Encode";
        case SessionFailureType::Decode: return "Decode";
        case SessionFailureType::Transport: return "Transport";
        case SessionFailureType::Config: return "Config";
    }
    return "Unknown";
}
}
