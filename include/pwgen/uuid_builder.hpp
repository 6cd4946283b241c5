#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

#include "pwgen/entropy_source.hpp"
#include "pwgen/pwgen_status.hpp"

namespace pwgen {

constexpr std::size_t kUuidByteCount = 16;
constexpr std::size_t kUuidTextLength = 36;

class UuidBuilder {
public:
    // RFC 4122 version 4, rendered as lowercase 8-4-4-4-12 hex.
    static PwgenStatus Generate(IEntropySource& rng, std::string& out_uuid);

    // Stamps version and variant bits onto raw bytes and renders them.
    static std::string Render(std::array<std::uint8_t, kUuidByteCount> bytes);
};

}  // namespace pwgen
