#include "edgli/security/replay_filter.hpp"
#include <cstring>

namespace edgli::security {
    size_t ReplayFilter::TagHash::operator()(const packet::ReplayTag& tag) const noexcept {
        size_t hash = 0;
        std::memcpy(&hash, tag.data(), sizeof(hash));
        return hash;
    }

    ReplayFilter::ReplayFilter()
        : ReplayFilter(kReplayTagLifetime, kReplayCleanupInterval, kMaxTrackedReplayTags) {
    }

    ReplayFilter::ReplayFilter(
        const std::chrono::milliseconds tag_lifetime,
        const std::chrono::milliseconds cleanup_interval,
        const size_t max_tags)
        : tag_lifetime_(tag_lifetime)
          , cleanup_interval_(cleanup_interval)
          , max_tags_(max_tags)
          , last_cleanup_() {
    }

    Result<Unit, SessionFailure> ReplayFilter::CheckAndRecord(
        const packet::ReplayTag& tag,
        const TimePoint now) {
        std::lock_guard guard(lock_);
        if (now - last_cleanup_ >= cleanup_interval_) {
            last_cleanup_ = now;
            CleanupExpiredInternal(now);
        }
        if (const auto it = seen_tags_.find(tag); it != seen_tags_.end()) {
            if (now - it->second < tag_lifetime_) {
                return Result<Unit, SessionFailure>::Err(
                    SessionFailure::MalformedPacket());
            }
            it->second = now;
            return Result<Unit, SessionFailure>::Ok(unit);
        }
        if (seen_tags_.size() >= max_tags_) {
            CleanupExpiredInternal(now);
            if (seen_tags_.size() >= max_tags_) {
                return Result<Unit, SessionFailure>::Err(
                    SessionFailure::InvalidState("Replay filter is full"));
            }
        }
        seen_tags_.emplace(tag, now);
        return Result<Unit, SessionFailure>::Ok(unit);
    }

    void ReplayFilter::CleanupExpired(const TimePoint now) {
        std::lock_guard guard(lock_);
        CleanupExpiredInternal(now);
    }

    void ReplayFilter::CleanupExpiredInternal(const TimePoint now) {
        auto it = seen_tags_.begin();
        while (it != seen_tags_.end()) {
            if (now - it->second >= tag_lifetime_) {
                it = seen_tags_.erase(it);
            } else {
                ++it;
            }
        }
    }

    size_t ReplayFilter::GetTrackedTagCount() const {
        std::lock_guard guard(lock_);
        return seen_tags_.size();
    }

    void ReplayFilter::Reset() {
        std::lock_guard guard(lock_);
        seen_tags_.clear();
        last_cleanup_ = TimePoint{};
    }
}
