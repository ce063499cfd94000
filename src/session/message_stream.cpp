#include "edgli/session/message_stream.hpp"

namespace edgli::session {
    bool MessageStream::ReadyLocked() const noexcept {
        return !messages_.empty() || finished_;
    }

    MessageStream::Item MessageStream::PopLocked() {
        if (!messages_.empty()) {
            auto message = std::move(messages_.front());
            messages_.pop_front();
            return Item::Ok(std::move(message));
        }
        if (failure_.has_value() && !failure_reported_) {
            failure_reported_ = true;
            return Item::Err(*failure_);
        }
        return Item::Ok(std::nullopt);
    }

    MessageStream::Item MessageStream::Next() {
        std::unique_lock guard(lock_);
        ready_.wait(guard, [this] { return ReadyLocked(); });
        return PopLocked();
    }

    MessageStream::Item MessageStream::NextFor(const std::chrono::milliseconds timeout) {
        std::unique_lock guard(lock_);
        if (!ready_.wait_for(guard, timeout, [this] { return ReadyLocked(); })) {
            return Item::Err(SessionFailure::InvalidState("Timed out waiting for message"));
        }
        return PopLocked();
    }

    std::optional<MessageStream::Item> MessageStream::TryNext() {
        std::lock_guard guard(lock_);
        if (!ReadyLocked()) {
            return std::nullopt;
        }
        return PopLocked();
    }

    void MessageStream::Push(std::vector<uint8_t> message) {
        {
            std::lock_guard guard(lock_);
            if (finished_) {
                return;
            }
            messages_.push_back(std::move(message));
        }
        ready_.notify_all();
    }

    void MessageStream::Finish() {
        {
            std::lock_guard guard(lock_);
            finished_ = true;
        }
        ready_.notify_all();
    }

    void MessageStream::Fail(SessionFailure failure) {
        {
            std::lock_guard guard(lock_);
            if (finished_) {
                return;
            }
            failure_ = std::move(failure);
            finished_ = true;
        }
        ready_.notify_all();
    }

    bool MessageStream::IsFinished() const {
        std::lock_guard guard(lock_);
        return finished_;
    }

    size_t MessageStream::Pending() const {
        std::lock_guard guard(lock_);
        return messages_.size();
    }
}
