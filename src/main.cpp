#include "../include/commands.hpp"
#include <iostream>

int main(int argc, char* argv[]) {
    return cli::run_command(argc, argv, std::cout, std::cerr);
}
