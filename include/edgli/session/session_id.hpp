#pragma once
#include "edgli/core/result.hpp"
#include "edgli/core/failures.hpp"
#include "edgli/core/constants.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

namespace edgli {
class IRandomSource;
}

namespace edgli::session {

class SessionId {
public:
    using Bytes = std::array<uint8_t, kSessionIdBytes>;

    SessionId() noexcept : bytes_{} {}
    explicit SessionId(const Bytes& bytes) noexcept : bytes_(bytes) {}

    static SessionId Generate(IRandomSource& random);

    static Result<SessionId, SessionFailure> FromBytes(std::span<const uint8_t> bytes);

    [[nodiscard]] const Bytes& AsBytes() const noexcept { return bytes_; }
    [[nodiscard]] std::span<const uint8_t> AsSpan() const noexcept { return bytes_; }

    [[nodiscard]] std::string ToHex() const;

    bool operator==(const SessionId&) const = default;

    struct Hash {
        size_t operator()(const SessionId& id) const noexcept;
    };

private:
    Bytes bytes_;
};

}
