#include <iostream>
#include <string>
#include <vector>

#include <usergen/cli/Run.hpp>

int main(int argc, char* argv[]) {
    return UserGen::cli::run(std::vector<std::string>(argv, argv + argc), std::cout, std::cerr);
}
