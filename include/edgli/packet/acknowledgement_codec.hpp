#pragma once
#include "edgli/core/result.hpp"
#include "edgli/core/failures.hpp"
#include "edgli/packet/packet.hpp"
#include <span>
#include <vector>

namespace edgli::packet {

/**
 * @brief Fixed binary body of an acknowledgement unit
 *
 * session id (16) || count (1) || count * sequence (u64 little-endian)
 */
class AcknowledgementCodec {
public:
    static Result<std::vector<uint8_t>, SessionFailure> Serialize(const Acknowledgement& ack);

    static Result<Acknowledgement, SessionFailure> Parse(std::span<const uint8_t> bytes);

private:
    AcknowledgementCodec() = delete;
};

}
