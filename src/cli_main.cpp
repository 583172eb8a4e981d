#include "stratum/Cli.hpp"

#include <iostream>

int main(int argc, char** argv) {
    return stratum::run_cli(argc, argv, std::cout, std::cerr);
}
