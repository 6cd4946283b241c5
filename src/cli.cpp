#include "pwgen/cli.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstddef>
#include <exception>
#include <initializer_list>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "pwgen/class_pool.hpp"
#include "pwgen/entropy_source.hpp"
#include "pwgen/generator.hpp"
#include "pwgen/pwgen_status.hpp"
#include "secure_wipe.hpp"

namespace pwgen {

namespace {

void CliLog(const CliOptions& opts, std::ostream& err, const std::string& message) {
    if (!opts.log) {
        return;
    }
    err << "[log] " << message << "\n";
}

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](const unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

bool ParseBool(const std::string& text, bool& out) {
    const std::string normalized = ToLower(text);
    if (normalized == "true" || normalized == "1" || normalized == "yes") {
        out = true;
        return true;
    }
    if (normalized == "false" || normalized == "0" || normalized == "no") {
        out = false;
        return true;
    }
    return false;
}

bool ParseInt(const std::string& text, int& out) {
    std::size_t idx = 0;
    try {
        const long long parsed = std::stoll(text, &idx);
        if (idx != text.size() ||
            parsed < static_cast<long long>(std::numeric_limits<int>::min()) ||
            parsed > static_cast<long long>(std::numeric_limits<int>::max())) {
            return false;
        }
        out = static_cast<int>(parsed);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

// Short flags that carry a value accept -l 8, -l=8 and -l8.
bool IsShortValueFlag(const std::string& arg) {
    return arg.size() > 2 && arg[0] == '-' && (arg[1] == 'l' || arg[1] == 'f');
}

std::string ClassCountSummary(const std::string& secret) {
    std::array<std::size_t, 4> counts{};
    for (const char ch : secret) {
        const auto character_class = ClassPool::ClassOf(ch);
        if (character_class.has_value()) {
            ++counts[static_cast<std::size_t>(*character_class)];
        }
    }
    std::string summary;
    for (const CharacterClass character_class :
         {CharacterClass::Lower, CharacterClass::Upper, CharacterClass::Number, CharacterClass::Symbol}) {
        if (!summary.empty()) {
            summary += " ";
        }
        summary += std::string(ClassPool::Name(character_class)) + "=" +
                   std::to_string(counts[static_cast<std::size_t>(character_class)]);
    }
    return summary;
}

int GenerateFlow(const CliOptions& opts, std::ostream& out, std::ostream& err) {
    const GeneratorOptions& gen = opts.generator;
    CliLog(opts, err, "format: " + std::string(ToString(gen.format)));
    if (gen.format == Format::AppKey) {
        CliLog(opts, err, "segments: " + std::to_string(gen.segments) + " x " + std::to_string(gen.segment_length));
    } else if (gen.format == Format::Generic) {
        CliLog(opts, err, "length: " + std::to_string(gen.length));
    }

    PwgenStatus status = PwgenStatus::Ok;
    const std::unique_ptr<IEntropySource> rng = EntropyFactory::CreateSystem(status);
    if (status != PwgenStatus::Ok) {
        CliLog(opts, err, "status: " + std::string(ToString(status)));
        err << Describe(status, gen) << "\n";
        return 1;
    }
    CliLog(opts, err, "entropy: " + std::string(rng->Name()));

    std::string secret;
    status = Generator::Generate(gen, *rng, secret);
    if (status != PwgenStatus::Ok) {
        CliLog(opts, err, "status: " + std::string(ToString(status)));
        err << Describe(status, gen) << "\n";
        return 1;
    }

    if (gen.format != Format::Guid) {
        CliLog(opts, err, "class counts: " + ClassCountSummary(secret));
    }
    out << secret << "\n";
    detail::SecureWipeString(secret);
    return 0;
}

}  // namespace

bool Cli::ParseArgs(const std::vector<std::string>& args, CliOptions& opts, std::string& error) {
    GeneratorOptions& gen = opts.generator;

    struct BoolFlag {
        std::string_view name;
        bool* target;
    };
    const std::array<BoolFlag, 4> bool_flags = {{
        {"lower", &gen.use_lower},
        {"upper", &gen.use_upper},
        {"number", &gen.use_number},
        {"symbol", &gen.use_symbol},
    }};

    struct IntFlag {
        std::string_view name;
        std::string_view short_name;
        int* target;
    };
    const std::array<IntFlag, 7> int_flags = {{
        {"--length", "-l", &gen.length},
        {"--min-lower", "", &gen.min_lower},
        {"--min-upper", "", &gen.min_upper},
        {"--min-number", "", &gen.min_number},
        {"--min-symbol", "", &gen.min_symbol},
        {"--segments", "", &gen.segments},
        {"--segment-length", "", &gen.segment_length},
    }};

    for (std::size_t i = 0; i < args.size(); ++i) {
        std::string arg = args[i];
        std::optional<std::string> inline_value;
        if (arg.rfind("--", 0) == 0) {
            const std::size_t eq = arg.find('=');
            if (eq != std::string::npos) {
                inline_value = arg.substr(eq + 1);
                arg.erase(eq);
            }
        } else if (IsShortValueFlag(arg)) {
            std::string value = arg.substr(2);
            if (value.front() == '=') {
                value.erase(0, 1);
            }
            inline_value = std::move(value);
            arg.erase(2);
        }

        auto require_value = [&](std::string& dst) -> bool {
            if (inline_value.has_value()) {
                dst = *inline_value;
                return true;
            }
            if (i + 1 >= args.size()) {
                error = "Missing value for " + arg;
                return false;
            }
            dst = args[++i];
            return true;
        };

        if (arg == "--help" || arg == "-h") {
            opts.help = true;
            continue;
        }
        if (arg == "--log") {
            opts.log = true;
            continue;
        }
        if (arg == "--format" || arg == "-f") {
            std::string value;
            if (!require_value(value)) {
                return false;
            }
            if (ParseFormat(value, gen.format) != PwgenStatus::Ok) {
                error = "unknown format: " + value;
                return false;
            }
            continue;
        }

        bool matched = false;
        for (const IntFlag& flag : int_flags) {
            if (arg != flag.name && (flag.short_name.empty() || arg != flag.short_name)) {
                continue;
            }
            std::string value;
            if (!require_value(value)) {
                return false;
            }
            if (!ParseInt(value, *flag.target)) {
                error = "Invalid value for " + arg;
                return false;
            }
            matched = true;
            break;
        }
        if (matched) {
            continue;
        }

        for (const BoolFlag& flag : bool_flags) {
            if (arg == "--no-" + std::string(flag.name)) {
                if (inline_value.has_value()) {
                    error = "Unexpected value for " + arg;
                    return false;
                }
                *flag.target = false;
                matched = true;
                break;
            }
            if (arg == "--" + std::string(flag.name)) {
                // Boolean flags take their value only in --flag=value form.
                if (inline_value.has_value() && !ParseBool(*inline_value, *flag.target)) {
                    error = "Invalid value for " + arg;
                    return false;
                }
                if (!inline_value.has_value()) {
                    *flag.target = true;
                }
                matched = true;
                break;
            }
        }
        if (matched) {
            continue;
        }

        error = "Unknown argument: " + args[i];
        return false;
    }
    return true;
}

void Cli::PrintHelp(std::ostream& out) {
    out << "pwgen - generate cryptographically secure passwords, app keys, or GUIDs\n\n";
    out << "Usage:\n";
    out << "  pwgen [options]\n";
    out << "  pwgen generate [options]\n";
    out << "  pwgen gen [options]\n";
    out << "  pwgen help\n\n";

    out << "Formats:\n";
    out << "  generic (default)    Random characters according to selected classes\n";
    out << "  appkey               Segmented key (e.g. XXXX-XXXX-XXXX)\n";
    out << "  guid                 RFC 4122 UUID v4\n\n";

    out << "Options:\n";
    out << "  --length, -l <N>     Total password length (generic format, default 16)\n";
    out << "  --format, -f <name>  Output format: generic|appkey|guid (default generic)\n";
    out << "  --lower[=bool]       Include lowercase letters (default true)\n";
    out << "  --upper[=bool]       Include uppercase letters (default true)\n";
    out << "  --number[=bool]      Include numbers (default true)\n";
    out << "  --symbol[=bool]      Include symbols (default true)\n";
    out << "  --no-<class>         Same as --<class>=false\n";
    out << "  --min-lower <N>      Minimum lowercase letters (default 0)\n";
    out << "  --min-upper <N>      Minimum uppercase letters (default 0)\n";
    out << "  --min-number <N>     Minimum numbers (default 0)\n";
    out << "  --min-symbol <N>     Minimum symbols (default 0)\n";
    out << "  --segments <N>       Number of segments (appkey format, default 4)\n";
    out << "  --segment-length <N> Length of each segment (appkey format, default 4)\n";
    out << "  --log                Show minimal runtime logs on stderr\n";
    out << "  --help, -h           Show this help\n\n";
    out << "Values may be given as --flag value or --flag=value; -l and -f also accept -l8 and -l=8.\n\n";

    out << "Examples:\n";
    out << "  pwgen\n";
    out << "  pwgen generate --length 32 --min-number 2 --min-symbol 2\n";
    out << "  pwgen generate --format appkey --segments 5 --segment-length 6\n";
    out << "  pwgen gen -fguid\n";
    out << "  pwgen --no-symbol -l20\n";
}

int Cli::Run(const std::vector<std::string>& args, std::ostream& out, std::ostream& err) {
    std::vector<std::string> flags = args;
    if (!flags.empty()) {
        if (flags.front() == "help") {
            PrintHelp(out);
            return 0;
        }
        if (flags.front() == "generate" || flags.front() == "gen") {
            flags.erase(flags.begin());
        }
    }

    CliOptions opts;
    std::string error;
    if (!ParseArgs(flags, opts, error)) {
        err << error << "\n";
        return 1;
    }
    if (opts.help) {
        PrintHelp(out);
        return 0;
    }
    return GenerateFlow(opts, out, err);
}

}  // namespace pwgen
