#pragma once
#include <cstddef>
#include <cstdint>
#include <map>
#include <vector>

namespace edgli::session {

/// Sequenced inbound frame as held for in-order delivery.
struct SequencedFrame {
    uint64_t sequence = 0;
    bool final_fragment = false;
    bool close = false;
    std::vector<uint8_t> payload;
};

/**
 * @brief Holds frames until every lower sequence number has been released
 *
 * Frames more than `window` positions past the next expected sequence are
 * refused so that a misbehaving peer cannot grow the buffer without bound.
 */
class ReorderBuffer {
public:
    enum class InsertOutcome {
        Accepted,
        Duplicate,
        OutOfWindow
    };

    ReorderBuffer(uint64_t first_expected, size_t window) noexcept
        : next_expected_(first_expected)
          , window_(window) {}

    InsertOutcome Insert(SequencedFrame frame);

    /// Frames contiguous from the next expected sequence, in order.
    std::vector<SequencedFrame> TakeReady();

    [[nodiscard]] uint64_t NextExpected() const noexcept { return next_expected_; }
    [[nodiscard]] size_t Buffered() const noexcept { return pending_.size(); }

    void Clear() noexcept { pending_.clear(); }

private:
    uint64_t next_expected_;
    size_t window_;
    std::map<uint64_t, SequencedFrame> pending_;
};

}
