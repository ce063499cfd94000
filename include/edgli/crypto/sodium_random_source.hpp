#pragma once
#include "edgli/interfaces/i_random_source.hpp"

namespace edgli::crypto {

/// IRandomSource over libsodium's CSPRNG.
class SodiumRandomSource final : public IRandomSource {
public:
    uint32_t Uniform(uint32_t upper_bound) override;
    double UniformReal() override;
    void Fill(std::span<uint8_t> output) override;
};

}
