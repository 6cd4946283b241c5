#pragma once

#include <cstddef>
#include <string>

#include "pwgen/class_pool.hpp"
#include "pwgen/entropy_source.hpp"
#include "pwgen/pwgen_status.hpp"

namespace pwgen {

class SecretComposer {
public:
    // Draws each class minimum in pool order, then fills from the flattened pool.
    // The result is not shuffled.
    static PwgenStatus Compose(
        std::size_t length,
        const ClassPool& pool,
        IEntropySource& rng,
        std::string& out_sequence);

    // In-place Fisher-Yates.
    static PwgenStatus Shuffle(std::string& sequence, IEntropySource& rng);

    static PwgenStatus FormatSegments(
        const std::string& flat,
        int segments,
        int segment_length,
        std::string& out_key);
};

}  // namespace pwgen
