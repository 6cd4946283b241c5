#include "pwgen/generator_options.hpp"

#include <array>
#include <string>

namespace pwgen {

GeneratorOptions DefaultOptions() {
    return GeneratorOptions{};
}

PwgenStatus ParseFormat(const std::string_view text, Format& out_format) {
    // Names are case-sensitive: "GUID" is not a format.
    if (text == "generic") {
        out_format = Format::Generic;
        return PwgenStatus::Ok;
    }
    if (text == "appkey") {
        out_format = Format::AppKey;
        return PwgenStatus::Ok;
    }
    if (text == "guid") {
        out_format = Format::Guid;
        return PwgenStatus::Ok;
    }
    return PwgenStatus::UnknownFormat;
}

std::string_view ToString(const Format format) {
    switch (format) {
        case Format::Generic:
            return "generic";
        case Format::AppKey:
            return "appkey";
        case Format::Guid:
            return "guid";
    }
    return "unknown";
}

std::string Describe(const PwgenStatus status, const GeneratorOptions& options) {
    struct ClassSetting {
        const char* flag;
        const char* noun;
        bool enabled;
        int minimum;
    };
    const std::array<ClassSetting, 4> settings = {{
        {"min-lower", "lowercase", options.use_lower, options.min_lower},
        {"min-upper", "uppercase", options.use_upper, options.min_upper},
        {"min-number", "numbers", options.use_number, options.min_number},
        {"min-symbol", "symbols", options.use_symbol, options.min_symbol},
    }};

    if (status == PwgenStatus::DisabledClassMinimum) {
        for (const ClassSetting& setting : settings) {
            if (!setting.enabled && setting.minimum > 0) {
                return std::string(setting.flag) + " specified but " + setting.noun + " disabled";
            }
        }
    } else if (status == PwgenStatus::MinimaExceedLength) {
        long long total_min = 0;
        for (const ClassSetting& setting : settings) {
            if (setting.enabled) {
                total_min += setting.minimum;
            }
        }
        const long long length = options.format == Format::AppKey
            ? static_cast<long long>(options.segments) * options.segment_length
            : options.length;
        return "sum of minimum counts (" + std::to_string(total_min) + ") exceeds requested length " +
               std::to_string(length);
    }
    return std::string(Describe(status));
}

}  // namespace pwgen
