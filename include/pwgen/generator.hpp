#pragma once

#include <string>

#include "pwgen/entropy_source.hpp"
#include "pwgen/generator_options.hpp"
#include "pwgen/pwgen_status.hpp"

namespace pwgen {

class Generator {
public:
    // Opens a fresh system entropy source for this call only.
    static PwgenStatus Generate(const GeneratorOptions& options, std::string& out_secret);
    static PwgenStatus Generate(const GeneratorOptions& options, IEntropySource& rng, std::string& out_secret);

    static PwgenStatus GenerateGeneric(const GeneratorOptions& options, int length, IEntropySource& rng, std::string& out_secret);
    static PwgenStatus GenerateAppKey(const GeneratorOptions& options, IEntropySource& rng, std::string& out_key);
};

}  // namespace pwgen
