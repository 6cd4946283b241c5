#include "pwgen/generator.hpp"

#include <limits>
#include <memory>
#include <utility>

#include "pwgen/class_pool.hpp"
#include "pwgen/secret_composer.hpp"
#include "pwgen/uuid_builder.hpp"
#include "secure_wipe.hpp"

namespace pwgen {

PwgenStatus Generator::Generate(const GeneratorOptions& options, std::string& out_secret) {
    out_secret.clear();
    PwgenStatus status = PwgenStatus::Ok;
    const std::unique_ptr<IEntropySource> rng = EntropyFactory::CreateSystem(status);
    if (status != PwgenStatus::Ok) {
        return status;
    }
    return Generate(options, *rng, out_secret);
}

PwgenStatus Generator::Generate(const GeneratorOptions& options, IEntropySource& rng, std::string& out_secret) {
    out_secret.clear();
    switch (options.format) {
        case Format::Guid:
            return UuidBuilder::Generate(rng, out_secret);
        case Format::AppKey:
            return GenerateAppKey(options, rng, out_secret);
        case Format::Generic:
            return GenerateGeneric(options, options.length, rng, out_secret);
    }
    return PwgenStatus::UnknownFormat;
}

PwgenStatus Generator::GenerateGeneric(
    const GeneratorOptions& options,
    const int length,
    IEntropySource& rng,
    std::string& out_secret) {
    out_secret.clear();
    if (length <= 0) {
        return PwgenStatus::InvalidLength;
    }

    ClassPool pool;
    const PwgenStatus pool_status = ClassPool::Build(options, pool);
    if (pool_status != PwgenStatus::Ok) {
        return pool_status;
    }

    std::string sequence;
    const PwgenStatus compose_status =
        SecretComposer::Compose(static_cast<std::size_t>(length), pool, rng, sequence);
    if (compose_status != PwgenStatus::Ok) {
        return compose_status;
    }

    // Minima sit at the front until shuffled.
    const PwgenStatus shuffle_status = SecretComposer::Shuffle(sequence, rng);
    if (shuffle_status != PwgenStatus::Ok) {
        return shuffle_status;
    }

    out_secret = std::move(sequence);
    return PwgenStatus::Ok;
}

PwgenStatus Generator::GenerateAppKey(const GeneratorOptions& options, IEntropySource& rng, std::string& out_key) {
    out_key.clear();
    if (options.segments <= 0) {
        return PwgenStatus::InvalidSegmentCount;
    }
    if (options.segment_length <= 0) {
        return PwgenStatus::InvalidSegmentLength;
    }
    if (options.segments > std::numeric_limits<int>::max() / options.segment_length) {
        return PwgenStatus::InvalidLength;
    }

    const int total = options.segments * options.segment_length;
    std::string flat;
    const PwgenStatus status = GenerateGeneric(options, total, rng, flat);
    if (status != PwgenStatus::Ok) {
        return status;
    }

    const PwgenStatus format_status =
        SecretComposer::FormatSegments(flat, options.segments, options.segment_length, out_key);
    detail::SecureWipeString(flat);
    return format_status;
}

}  // namespace pwgen
