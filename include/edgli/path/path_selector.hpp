#pragma once
#include "edgli/core/result.hpp"
#include "edgli/core/failures.hpp"
#include "edgli/interfaces/i_random_source.hpp"
#include "edgli/interfaces/i_relay_directory.hpp"
#include "edgli/path/path_descriptor.hpp"
#include <memory>
#include <unordered_set>

namespace edgli::path {

using PeerIdSet = std::unordered_set<identity::PeerId, identity::PeerId::Hash>;

/**
 * @brief Chooses routes over the relay directory
 *
 * Intermediates are drawn by weight, without replacement, from the
 * directory minus the exclude set minus the destination.
 */
class PathSelector {
public:
    PathSelector(
        std::shared_ptr<IRelayDirectory> directory,
        std::shared_ptr<IRandomSource> random);

    /**
     * @param destination Final hop
     * @param hop_count Total path length including the destination
     * @param exclude Relays that must not appear in the path
     * @param avoid Previous attempt's path; not returned again when any alternative exists
     */
    [[nodiscard]] Result<PathDescriptor, SessionFailure> SelectPath(
        const identity::RelayIdentity& destination,
        size_t hop_count,
        const PeerIdSet& exclude = {},
        const PathDescriptor* avoid = nullptr) const;

private:
    size_t PickWeighted(const std::vector<identity::RelayIdentity>& candidates) const;

    std::shared_ptr<IRelayDirectory> directory_;
    std::shared_ptr<IRandomSource> random_;
};

}
