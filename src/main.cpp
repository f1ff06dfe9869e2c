#include <iostream>
#include <string>
#include <vector>

#include "SortCommand.hpp"

int main(int argc, char* argv[]) {
    const std::vector<std::string> args(argv + 1, argv + argc);
    return runSorter(args, std::cout, std::cerr);
}
