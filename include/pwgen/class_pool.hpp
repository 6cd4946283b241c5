#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "pwgen/generator_options.hpp"
#include "pwgen/pwgen_status.hpp"

namespace pwgen {

enum class CharacterClass {
    Lower = 0,
    Upper,
    Number,
    Symbol
};

struct ClassRequirement {
    CharacterClass character_class = CharacterClass::Lower;
    std::string_view chars;
    int minimum = 0;
};

class ClassPool {
public:
    // Active classes in lower, upper, number, symbol order.
    static PwgenStatus Build(const GeneratorOptions& options, ClassPool& out_pool);

    static std::string_view Characters(CharacterClass character_class);
    static std::string_view Name(CharacterClass character_class);
    static std::optional<CharacterClass> ClassOf(char ch);

    const std::vector<ClassRequirement>& Requirements() const {
        return requirements_;
    }
    bool Empty() const {
        return requirements_.empty();
    }

    std::size_t TotalMinimum() const;
    // Concatenation of every active set, so larger classes are proportionally more likely.
    std::string FlattenedCharacters() const;

private:
    std::vector<ClassRequirement> requirements_;
};

}  // namespace pwgen
