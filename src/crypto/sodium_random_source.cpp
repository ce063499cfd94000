#include "edgli/crypto/sodium_random_source.hpp"
#include "edgli/crypto/sodium_interop.hpp"
#include <sodium.h>

namespace edgli::crypto {
    uint32_t SodiumRandomSource::Uniform(const uint32_t upper_bound) {
        return SodiumInterop::RandomUniform(upper_bound);
    }

    double SodiumRandomSource::UniformReal() {
        uint64_t raw = 0;
        randombytes_buf(&raw, sizeof(raw));
        return static_cast<double>(raw >> 11) * 0x1.0p-53;
    }

    void SodiumRandomSource::Fill(std::span<uint8_t> output) {
        SodiumInterop::FillRandom(output);
    }
}
