#pragma once

#include <ostream>
#include <string>
#include <vector>

#include "pwgen/generator_options.hpp"

namespace pwgen {

struct CliOptions {
    bool help = false;
    bool log = false;
    GeneratorOptions generator = DefaultOptions();
};

class Cli {
public:
    // args excludes the program name and any generate/gen/help subcommand.
    static bool ParseArgs(const std::vector<std::string>& args, CliOptions& opts, std::string& error);
    static void PrintHelp(std::ostream& out);

    // Returns the process exit code: 0 on success, 1 on any error.
    static int Run(const std::vector<std::string>& args, std::ostream& out, std::ostream& err);
};

}  // namespace pwgen
