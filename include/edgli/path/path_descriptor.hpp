#pragma once
#include "edgli/core/result.hpp"
#include "edgli/core/failures.hpp"
#include "edgli/identity/relay_identity.hpp"
#include <string>
#include <vector>

namespace edgli::path {

/**
 * @brief Immutable route from the local node to a destination
 *
 * Hops are ordered first hop to destination; the last hop is the
 * destination itself. Length is in [1, kMaxPathLength] and no address
 * appears twice.
 */
class PathDescriptor {
public:
    static Result<PathDescriptor, SessionFailure> Create(std::vector<identity::RelayIdentity> hops);

    [[nodiscard]] const std::vector<identity::RelayIdentity>& Hops() const noexcept { return hops_; }
    [[nodiscard]] size_t Length() const noexcept { return hops_.size(); }
    [[nodiscard]] const identity::RelayIdentity& FirstHop() const noexcept { return hops_.front(); }
    [[nodiscard]] const identity::RelayIdentity& Destination() const noexcept { return hops_.back(); }

    [[nodiscard]] bool Contains(const identity::PeerId& address) const noexcept;

    /// Relays other than the destination.
    [[nodiscard]] std::vector<identity::PeerId> Intermediates() const;

    [[nodiscard]] std::string ToString() const;

    bool operator==(const PathDescriptor& other) const noexcept { return hops_ == other.hops_; }

private:
    explicit PathDescriptor(std::vector<identity::RelayIdentity> hops) noexcept
        : hops_(std::move(hops)) {}

    std::vector<identity::RelayIdentity> hops_;
};

}
