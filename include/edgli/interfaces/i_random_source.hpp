#pragma once
#include <cstdint>
#include <span>

namespace edgli {

/// Randomness used for path selection and identifiers. Tests inject a seeded source.
class IRandomSource {
public:
    virtual ~IRandomSource() = default;

    /// Uniform integer in [0, upper_bound); 0 when upper_bound < 2.
    virtual uint32_t Uniform(uint32_t upper_bound) = 0;

    /// Uniform real in [0, 1).
    virtual double UniformReal() = 0;

    virtual void Fill(std::span<uint8_t> output) = 0;
};

}
