#include "edgli/path/path_descriptor.hpp"
#include "edgli/core/format.hpp"
#include <algorithm>

namespace edgli::path {
    using identity::PeerId;
    using identity::RelayIdentity;

    Result<PathDescriptor, SessionFailure> PathDescriptor::Create(std::vector<RelayIdentity> hops) {
        if (hops.empty() || hops.size() > kMaxPathLength) {
            return Result<PathDescriptor, SessionFailure>::Err(
                SessionFailure::InvalidInput(
                    compat::format("Path length must be in [1, {}], got {}", kMaxPathLength, hops.size())));
        }
        for (size_t i = 0; i < hops.size(); ++i) {
            for (size_t j = i + 1; j < hops.size(); ++j) {
                if (hops[i].address == hops[j].address) {
                    return Result<PathDescriptor, SessionFailure>::Err(
                        SessionFailure::InvalidInput(
                            compat::format("Relay {} appears twice in path", hops[i].address.ShortHex())));
                }
            }
        }
        return Result<PathDescriptor, SessionFailure>::Ok(PathDescriptor(std::move(hops)));
    }

    bool PathDescriptor::Contains(const PeerId& address) const noexcept {
        return std::any_of(hops_.begin(), hops_.end(),
            [&](const RelayIdentity& hop) { return hop.address == address; });
    }

    std::vector<PeerId> PathDescriptor::Intermediates() const {
        std::vector<PeerId> result;
        result.reserve(hops_.size() - 1);
        for (size_t i = 0; i + 1 < hops_.size(); ++i) {
            result.push_back(hops_[i].address);
        }
        return result;
    }

    std::string PathDescriptor::ToString() const {
        std::string out;
        for (const auto& hop : hops_) {
            if (!out.empty()) {
                out += " -> ";
            }
            out += hop.address.ShortHex();
        }
        return out;
    }
}
