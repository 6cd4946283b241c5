#include "pwgen/secret_composer.hpp"

#include <cstdint>
#include <limits>
#include <string_view>
#include <utility>

#include "secure_wipe.hpp"

namespace pwgen {

namespace {

PwgenStatus AppendRandomChar(const std::string_view set, IEntropySource& rng, std::string& out) {
    if (set.empty() || set.size() > std::numeric_limits<std::uint32_t>::max()) {
        return PwgenStatus::InvalidLength;
    }
    std::uint32_t index = 0;
    const PwgenStatus status = rng.UniformInt(static_cast<std::uint32_t>(set.size()), index);
    if (status != PwgenStatus::Ok) {
        return status;
    }
    out.push_back(set[index]);
    return PwgenStatus::Ok;
}

}  // namespace

PwgenStatus SecretComposer::Compose(
    const std::size_t length,
    const ClassPool& pool,
    IEntropySource& rng,
    std::string& out_sequence) {
    out_sequence.clear();
    if (pool.Empty()) {
        return PwgenStatus::NoClassesEnabled;
    }
    if (pool.TotalMinimum() > length) {
        return PwgenStatus::MinimaExceedLength;
    }

    std::string sequence;
    sequence.reserve(length);
    auto fail = [&](const PwgenStatus error) -> PwgenStatus {
        detail::SecureWipeString(sequence);
        return error;
    };

    for (const ClassRequirement& requirement : pool.Requirements()) {
        for (int i = 0; i < requirement.minimum; ++i) {
            const PwgenStatus status = AppendRandomChar(requirement.chars, rng, sequence);
            if (status != PwgenStatus::Ok) {
                return fail(status);
            }
        }
    }

    const std::string all = pool.FlattenedCharacters();
    while (sequence.size() < length) {
        const PwgenStatus status = AppendRandomChar(all, rng, sequence);
        if (status != PwgenStatus::Ok) {
            return fail(status);
        }
    }

    out_sequence = std::move(sequence);
    return PwgenStatus::Ok;
}

PwgenStatus SecretComposer::Shuffle(std::string& sequence, IEntropySource& rng) {
    if (sequence.size() > std::numeric_limits<std::uint32_t>::max()) {
        return PwgenStatus::InvalidLength;
    }
    for (std::size_t i = sequence.size(); i-- > 1;) {
        std::uint32_t j = 0;
        const PwgenStatus status = rng.UniformInt(static_cast<std::uint32_t>(i + 1), j);
        if (status != PwgenStatus::Ok) {
            detail::SecureWipeString(sequence);
            return status;
        }
        if (i != j) {
            std::swap(sequence[i], sequence[j]);
        }
    }
    return PwgenStatus::Ok;
}

PwgenStatus SecretComposer::FormatSegments(
    const std::string& flat,
    const int segments,
    const int segment_length,
    std::string& out_key) {
    out_key.clear();
    if (segments <= 0) {
        return PwgenStatus::InvalidSegmentCount;
    }
    if (segment_length <= 0) {
        return PwgenStatus::InvalidSegmentLength;
    }
    const auto count = static_cast<std::size_t>(segments);
    const auto width = static_cast<std::size_t>(segment_length);
    if (flat.size() / width != count || flat.size() % width != 0) {
        return PwgenStatus::InvalidLength;
    }

    out_key.reserve(flat.size() + count - 1);
    for (std::size_t i = 0; i < flat.size(); ++i) {
        if (i > 0 && i % width == 0) {
            out_key.push_back('-');
        }
        out_key.push_back(flat[i]);
    }
    return PwgenStatus::Ok;
}

}  // namespace pwgen
