#pragma once

#include <string_view>

namespace pwgen {

enum class PwgenStatus {
    Ok = 0,
    InvalidLength,
    DisabledClassMinimum,
    NoClassesEnabled,
    NegativeMinimum,
    MinimaExceedLength,
    InvalidSegmentCount,
    InvalidSegmentLength,
    UnknownFormat,
    EntropySourceFailure
};

inline std::string_view ToString(const PwgenStatus status) {
    switch (status) {
        case PwgenStatus::Ok:
            return "Ok";
        case PwgenStatus::InvalidLength:
            return "InvalidLength";
        case PwgenStatus::DisabledClassMinimum:
            return "DisabledClassMinimum";
        case PwgenStatus::NoClassesEnabled:
            return "NoClassesEnabled";
        case PwgenStatus::NegativeMinimum:
            return "NegativeMinimum";
        case PwgenStatus::MinimaExceedLength:
            return "MinimaExceedLength";
        case PwgenStatus::InvalidSegmentCount:
            return "InvalidSegmentCount";
        case PwgenStatus::InvalidSegmentLength:
            return "InvalidSegmentLength";
        case PwgenStatus::UnknownFormat:
            return "UnknownFormat";
        case PwgenStatus::EntropySourceFailure:
            return "EntropySourceFailure";
    }
    return "UnknownStatus";
}

// Message shown to users at the command line.
inline std::string_view Describe(const PwgenStatus status) {
    switch (status) {
        case PwgenStatus::Ok:
            return "ok";
        case PwgenStatus::InvalidLength:
            return "length must be > 0";
        case PwgenStatus::DisabledClassMinimum:
            return "minimum count specified for a disabled character class";
        case PwgenStatus::NoClassesEnabled:
            return "no character classes enabled";
        case PwgenStatus::NegativeMinimum:
            return "minimum counts cannot be negative";
        case PwgenStatus::MinimaExceedLength:
            return "sum of minimum counts exceeds requested length";
        case PwgenStatus::InvalidSegmentCount:
            return "segments must be > 0";
        case PwgenStatus::InvalidSegmentLength:
            return "segment-length must be > 0";
        case PwgenStatus::UnknownFormat:
            return "unknown format (expected generic, appkey or guid)";
        case PwgenStatus::EntropySourceFailure:
            return "secure random source unavailable";
    }
    return "unknown error";
}

}  // namespace pwgen
