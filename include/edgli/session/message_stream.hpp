#pragma once
#include "edgli/core/result.hpp"
#include "edgli/core/failures.hpp"
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

namespace edgli::session {

/**
 * @brief Ordered, pull-based sequence of reassembled messages of one session
 *
 * Next() blocks until a message is available, the stream ends or the
 * session fails:
 * - Ok(message): next message in order
 * - Ok(std::nullopt): end of stream (session closed, or failure already reported)
 * - Err(failure): the session failed; reported exactly once
 *
 * Messages queued before the end or failure are still returned first.
 */
class MessageStream {
public:
    using Item = Result<std::optional<std::vector<uint8_t>>, SessionFailure>;

    MessageStream() = default;
    MessageStream(const MessageStream&) = delete;
    MessageStream& operator=(const MessageStream&) = delete;

    Item Next();

    /// As Next(), but gives up after `timeout` with an InvalidState failure.
    Item NextFor(std::chrono::milliseconds timeout);

    /// Non-blocking: nullopt when nothing is ready yet.
    std::optional<Item> TryNext();

    void Push(std::vector<uint8_t> message);
    void Finish();
    void Fail(SessionFailure failure);

    [[nodiscard]] bool IsFinished() const;
    [[nodiscard]] size_t Pending() const;

private:
    bool ReadyLocked() const noexcept;
    Item PopLocked();

    mutable std::mutex lock_;
    std::condition_variable ready_;
    std::deque<std::vector<uint8_t>> messages_;
    std::optional<SessionFailure> failure_;
    bool finished_ = false;
    bool failure_reported_ = false;
};

}
