#pragma once
#include "edgli/identity/relay_identity.hpp"
#include <vector>

namespace edgli {

class IRelayDirectory {
public:
    virtual ~IRelayDirectory() = default;
    virtual std::vector<identity::RelayIdentity> KnownRelays() const = 0;
};

}
