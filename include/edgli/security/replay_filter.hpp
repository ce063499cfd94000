#pragma once
#include "edgli/core/result.hpp"
#include "edgli/core/constants.hpp"
#include "edgli/core/failures.hpp"
#include "edgli/interfaces/i_clock.hpp"
#include "edgli/packet/packet.hpp"
#include <chrono>
#include <cstddef>
#include <mutex>
#include <unordered_map>

namespace edgli::security {

/**
 * @brief Rejects packets whose per-hop replay tag was already seen
 *
 * A tag is remembered for `tag_lifetime`. Expired tags are purged at most
 * once per `cleanup_interval`. When `max_tags` live tags are tracked, new
 * packets are refused until entries expire.
 */
class ReplayFilter {
public:
    ReplayFilter();
    explicit ReplayFilter(
        std::chrono::milliseconds tag_lifetime,
        std::chrono::milliseconds cleanup_interval = kReplayCleanupInterval,
        size_t max_tags = kMaxTrackedReplayTags);
    ReplayFilter(const ReplayFilter&) = delete;
    ReplayFilter& operator=(const ReplayFilter&) = delete;
    ReplayFilter(ReplayFilter&&) = delete;
    ReplayFilter& operator=(ReplayFilter&&) = delete;
    ~ReplayFilter() = default;

    Result<Unit, SessionFailure> CheckAndRecord(const packet::ReplayTag& tag, TimePoint now);

    void CleanupExpired(TimePoint now);

    size_t GetTrackedTagCount() const;

    void Reset();

private:
    struct TagHash {
        size_t operator()(const packet::ReplayTag& tag) const noexcept;
    };

    void CleanupExpiredInternal(TimePoint now);

    std::chrono::milliseconds tag_lifetime_;
    std::chrono::milliseconds cleanup_interval_;
    size_t max_tags_;
    mutable std::mutex lock_;
    std::unordered_map<packet::ReplayTag, TimePoint, TagHash> seen_tags_;
    TimePoint last_cleanup_;
};

}
