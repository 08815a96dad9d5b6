#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "cli/cli.hpp"

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    return securand::cli::run(std::move(args), std::cout);
}
