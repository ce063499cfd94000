#include "edgli/session/reorder_buffer.hpp"
#include <utility>

namespace edgli::session {
    ReorderBuffer::InsertOutcome ReorderBuffer::Insert(SequencedFrame frame) {
        if (frame.sequence < next_expected_) {
            return InsertOutcome::Duplicate;
        }
        if (frame.sequence - next_expected_ >= window_) {
            return InsertOutcome::OutOfWindow;
        }
        const uint64_t sequence = frame.sequence;
        const auto [it, inserted] = pending_.try_emplace(sequence, std::move(frame));
        return inserted ? InsertOutcome::Accepted : InsertOutcome::Duplicate;
    }

    std::vector<SequencedFrame> ReorderBuffer::TakeReady() {
        std::vector<SequencedFrame> ready;
        auto it = pending_.begin();
        while (it != pending_.end() && it->first == next_expected_) {
            ready.push_back(std::move(it->second));
            it = pending_.erase(it);
            ++next_expected_;
        }
        return ready;
    }
}
