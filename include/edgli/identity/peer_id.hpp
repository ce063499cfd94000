#pragma once
#include "edgli/core/result.hpp"
#include "edgli/core/failures.hpp"
#include "edgli/core/constants.hpp"
#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

namespace edgli::identity {

/// Opaque 32-byte overlay address of a node.
class PeerId {
public:
    using Bytes = std::array<uint8_t, kPeerIdBytes>;

    PeerId() noexcept : bytes_{} {}
    explicit PeerId(const Bytes& bytes) noexcept : bytes_(bytes) {}

    static Result<PeerId, SessionFailure> FromBytes(std::span<const uint8_t> bytes);

    /// BLAKE2b-256 of an X25519 public key.
    static PeerId FromPublicKey(std::span<const uint8_t> public_key) noexcept;

    [[nodiscard]] const Bytes& AsBytes() const noexcept { return bytes_; }
    [[nodiscard]] std::span<const uint8_t> AsSpan() const noexcept { return bytes_; }

    [[nodiscard]] bool IsZero() const noexcept;

    [[nodiscard]] std::string ToHex() const;

    /// First four bytes in hex, for log lines.
    [[nodiscard]] std::string ShortHex() const;

    bool operator==(const PeerId&) const = default;
    auto operator<=>(const PeerId&) const = default;

    struct Hash {
        size_t operator()(const PeerId& id) const noexcept;
    };

private:
    Bytes bytes_;
};

}
