#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string_view>

#include "pwgen/pwgen_status.hpp"

namespace pwgen {

class IEntropySource {
public:
    virtual ~IEntropySource() = default;

    // Writes an unbiased value in [0, bound) to out_value. bound must be > 0.
    virtual PwgenStatus UniformInt(std::uint32_t bound, std::uint32_t& out_value) = 0;
    virtual PwgenStatus RandomBytes(std::uint8_t* out, std::size_t length) = 0;

    virtual std::string_view Name() const = 0;
};

class EntropyFactory {
public:
    // OS-seeded source. Each call yields an independent instance.
    static std::unique_ptr<IEntropySource> CreateSystem(PwgenStatus& out_status);
};

}  // namespace pwgen
