#include "edgli/session/session_id.hpp"
#include "edgli/interfaces/i_random_source.hpp"
#include <sodium.h>
#include <algorithm>
#include <cstring>

namespace edgli::session {
    SessionId SessionId::Generate(IRandomSource& random) {
        Bytes raw{};
        random.Fill(raw);
        return SessionId(raw);
    }

    Result<SessionId, SessionFailure> SessionId::FromBytes(std::span<const uint8_t> bytes) {
        if (bytes.size() != kSessionIdBytes) {
            return Result<SessionId, SessionFailure>::Err(
                SessionFailure::Decode("Session id must be 16 bytes"));
        }
        Bytes raw{};
        std::copy(bytes.begin(), bytes.end(), raw.begin());
        return Result<SessionId, SessionFailure>::Ok(SessionId(raw));
    }

    std::string SessionId::ToHex() const {
        std::string hex(bytes_.size() * 2 + 1, '\0');
        sodium_bin2hex(hex.data(), hex.size(), bytes_.data(), bytes_.size());
        hex.pop_back();
        return hex;
    }

    size_t SessionId::Hash::operator()(const SessionId& id) const noexcept {
        size_t value = 0;
        std::memcpy(&value, id.bytes_.data(), sizeof(value));
        return value;
    }
}
