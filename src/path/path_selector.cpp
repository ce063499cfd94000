#include "edgli/path/path_selector.hpp"
#include "edgli/core/format.hpp"
#include "edgli/debug/trace_logger.hpp"
#include <algorithm>
#include <utility>

namespace edgli::path {
    using identity::RelayIdentity;

    PathSelector::PathSelector(
        std::shared_ptr<IRelayDirectory> directory,
        std::shared_ptr<IRandomSource> random)
        : directory_(std::move(directory))
          , random_(std::move(random)) {
    }

    size_t PathSelector::PickWeighted(const std::vector<RelayIdentity>& candidates) const {
        double total = 0.0;
        for (const auto& candidate : candidates) {
            total += candidate.weight;
        }
        double point = random_->UniformReal() * total;
        for (size_t i = 0; i < candidates.size(); ++i) {
            if (point < candidates[i].weight) {
                return i;
            }
            point -= candidates[i].weight;
        }
        return candidates.size() - 1;
    }

    Result<PathDescriptor, SessionFailure> PathSelector::SelectPath(
        const RelayIdentity& destination,
        const size_t hop_count,
        const PeerIdSet& exclude,
        const PathDescriptor* avoid) const {
        if (hop_count == 0 || hop_count > kMaxPathLength) {
            return Result<PathDescriptor, SessionFailure>::Err(
                SessionFailure::InvalidInput(
                    compat::format("Hop count must be in [1, {}], got {}", kMaxPathLength, hop_count)));
        }
        if (exclude.count(destination.address) > 0) {
            return Result<PathDescriptor, SessionFailure>::Err(
                SessionFailure::NoRouteAvailable("Destination is excluded"));
        }

        std::vector<RelayIdentity> candidates;
        for (auto& relay : directory_->KnownRelays()) {
            if (relay.address == destination.address || exclude.count(relay.address) > 0) {
                continue;
            }
            const auto duplicate = std::any_of(candidates.begin(), candidates.end(),
                [&](const RelayIdentity& c) { return c.address == relay.address; });
            if (!duplicate && relay.weight > 0.0) {
                candidates.push_back(std::move(relay));
            }
        }

        const size_t intermediate_count = hop_count - 1;
        if (candidates.size() < intermediate_count) {
            return Result<PathDescriptor, SessionFailure>::Err(
                SessionFailure::NoRouteAvailable(
                    compat::format("Need {} intermediate relays, {} usable",
                        intermediate_count, candidates.size())));
        }
        debug::TracePathSelected(destination.address.AsSpan(), hop_count, candidates.size());

        std::vector<RelayIdentity> remaining = candidates;
        std::vector<RelayIdentity> hops;
        hops.reserve(hop_count);
        for (size_t i = 0; i < intermediate_count; ++i) {
            const size_t index = PickWeighted(remaining);
            hops.push_back(remaining[index]);
            remaining.erase(remaining.begin() + static_cast<std::ptrdiff_t>(index));
        }

        const auto same_as_avoid = [&]() {
            if (avoid == nullptr || avoid->Length() != hop_count) {
                return false;
            }
            for (size_t i = 0; i < intermediate_count; ++i) {
                if (!(avoid->Hops()[i].address == hops[i].address)) {
                    return false;
                }
            }
            return avoid->Destination().address == destination.address;
        };

        if (intermediate_count > 0 && same_as_avoid()) {
            if (!remaining.empty()) {
                const size_t position = random_->Uniform(static_cast<uint32_t>(intermediate_count));
                hops[position] = remaining[PickWeighted(remaining)];
            } else if (intermediate_count >= 2) {
                const size_t first = random_->Uniform(static_cast<uint32_t>(intermediate_count));
                const size_t offset = 1 + random_->Uniform(static_cast<uint32_t>(intermediate_count - 1));
                std::swap(hops[first], hops[(first + offset) % intermediate_count]);
            }
        }

        hops.push_back(destination);
        return PathDescriptor::Create(std::move(hops));
    }
}
