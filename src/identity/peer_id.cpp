#include "edgli/identity/peer_id.hpp"
#include "edgli/crypto/primitives.hpp"
#include <sodium.h>
#include <algorithm>
#include <cstring>

namespace edgli::identity {
    Result<PeerId, SessionFailure> PeerId::FromBytes(std::span<const uint8_t> bytes) {
        if (bytes.size() != kPeerIdBytes) {
            return Result<PeerId, SessionFailure>::Err(
                SessionFailure::InvalidInput("Peer id must be 32 bytes"));
        }
        Bytes raw{};
        std::copy(bytes.begin(), bytes.end(), raw.begin());
        return Result<PeerId, SessionFailure>::Ok(PeerId(raw));
    }

    PeerId PeerId::FromPublicKey(std::span<const uint8_t> public_key) noexcept {
        return PeerId(crypto::Primitives::Blake2b256(public_key));
    }

    bool PeerId::IsZero() const noexcept {
        return sodium_is_zero(bytes_.data(), bytes_.size()) == 1;
    }

    std::string PeerId::ToHex() const {
        std::string hex(bytes_.size() * 2 + 1, '\0');
        sodium_bin2hex(hex.data(), hex.size(), bytes_.data(), bytes_.size());
        hex.pop_back();
        return hex;
    }

    std::string PeerId::ShortHex() const {
        return ToHex().substr(0, 8);
    }

    size_t PeerId::Hash::operator()(const PeerId& id) const noexcept {
        size_t value = 0;
        std::memcpy(&value, id.bytes_.data(), sizeof(value));
        return value;
    }
}
