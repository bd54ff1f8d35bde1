#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include "app/sampler.hpp"

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    return run_command(args,
                       std::getenv("SENSELOG_CONFIG"),
                       std::getenv("SENSELOG_OUTPUT"),
                       std::cout,
                       std::cerr);
}
