#include <cstddef>
#include <iostream>
#include <string>
#include <vector>

#include "pwgen/cli.hpp"

int main(const int argc, char* argv[]) {
    std::vector<std::string> args;
    args.reserve(argc > 1 ? static_cast<std::size_t>(argc - 1) : 0U);
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return pwgen::Cli::Run(args, std::cout, std::cerr);
}
