#pragma once

#include <string>
#include <string_view>

#include "pwgen/pwgen_status.hpp"

namespace pwgen {

constexpr int kDefaultLength = 16;
constexpr int kDefaultSegments = 4;
constexpr int kDefaultSegmentLength = 4;

enum class Format {
    Generic = 0,
    AppKey,
    Guid
};

struct GeneratorOptions {
    Format format = Format::Generic;
    // Generic only; appkey derives its total from the segment settings.
    int length = kDefaultLength;

    bool use_lower = true;
    bool use_upper = true;
    bool use_number = true;
    bool use_symbol = true;

    int min_lower = 0;
    int min_upper = 0;
    int min_number = 0;
    int min_symbol = 0;

    int segments = kDefaultSegments;
    int segment_length = kDefaultSegmentLength;
};

GeneratorOptions DefaultOptions();

PwgenStatus ParseFormat(std::string_view text, Format& out_format);
std::string_view ToString(Format format);

// Like Describe(status), but names the offending class or the counts involved.
std::string Describe(PwgenStatus status, const GeneratorOptions& options);

}  // namespace pwgen
