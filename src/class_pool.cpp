#include "pwgen/class_pool.hpp"

#include <array>
#include <initializer_list>
#include <utility>

namespace pwgen {

namespace {

constexpr std::string_view kLowerChars = "abcdefghijklmnopqrstuvwxyz";
constexpr std::string_view kUpperChars = "ABCDEFGHIJKLMNOPQRSTUVWXYZ";
constexpr std::string_view kNumberChars = "0123456789";
constexpr std::string_view kSymbolChars = "!@#$%^&*()-_=+[]{};:,.?/<>~";

struct ClassToggle {
    CharacterClass character_class;
    bool enabled;
    int minimum;
};

}  // namespace

PwgenStatus ClassPool::Build(const GeneratorOptions& options, ClassPool& out_pool) {
    const std::array<ClassToggle, 4> toggles = {{
        {CharacterClass::Lower, options.use_lower, options.min_lower},
        {CharacterClass::Upper, options.use_upper, options.min_upper},
        {CharacterClass::Number, options.use_number, options.min_number},
        {CharacterClass::Symbol, options.use_symbol, options.min_symbol},
    }};

    std::vector<ClassRequirement> requirements;
    requirements.reserve(toggles.size());
    for (const ClassToggle& toggle : toggles) {
        if (toggle.enabled) {
            requirements.push_back({toggle.character_class, Characters(toggle.character_class), toggle.minimum});
        } else if (toggle.minimum > 0) {
            return PwgenStatus::DisabledClassMinimum;
        }
    }

    if (requirements.empty()) {
        return PwgenStatus::NoClassesEnabled;
    }

    for (const ClassToggle& toggle : toggles) {
        if (toggle.minimum < 0) {
            return PwgenStatus::NegativeMinimum;
        }
    }

    out_pool.requirements_ = std::move(requirements);
    return PwgenStatus::Ok;
}

std::string_view ClassPool::Characters(const CharacterClass character_class) {
    switch (character_class) {
        case CharacterClass::Lower:
            return kLowerChars;
        case CharacterClass::Upper:
            return kUpperChars;
        case CharacterClass::Number:
            return kNumberChars;
        case CharacterClass::Symbol:
            return kSymbolChars;
    }
    return {};
}

std::string_view ClassPool::Name(const CharacterClass character_class) {
    switch (character_class) {
        case CharacterClass::Lower:
            return "lower";
        case CharacterClass::Upper:
            return "upper";
        case CharacterClass::Number:
            return "number";
        case CharacterClass::Symbol:
            return "symbol";
    }
    return "unknown";
}

std::optional<CharacterClass> ClassPool::ClassOf(const char ch) {
    for (const CharacterClass character_class :
         {CharacterClass::Lower, CharacterClass::Upper, CharacterClass::Number, CharacterClass::Symbol}) {
        if (Characters(character_class).find(ch) != std::string_view::npos) {
            return character_class;
        }
    }
    return std::nullopt;
}

std::size_t ClassPool::TotalMinimum() const {
    std::size_t total = 0;
    for (const ClassRequirement& requirement : requirements_) {
        total += static_cast<std::size_t>(requirement.minimum);
    }
    return total;
}

std::string ClassPool::FlattenedCharacters() const {
    std::size_t total = 0;
    for (const ClassRequirement& requirement : requirements_) {
        total += requirement.chars.size();
    }
    std::string out;
    out.reserve(total);
    for (const ClassRequirement& requirement : requirements_) {
        out.append(requirement.chars);
    }
    return out;
}

}  // namespace pwgen
