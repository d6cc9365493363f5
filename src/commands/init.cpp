#include "../include/init.h"
#include "../include/constants.h"
#include "../include/repository_utils.h"

#include <cstdlib>
#include <iostream>
#include <filesystem>

int handleInit(int argc, char* argv[]) {
    if (argc > 3) {
        std::cerr << "Usage: cogit init [<directory>]\n";
        return EXIT_FAILURE;
    }
    const std::filesystem::path workTree = (argc == 3) ? std::filesystem::path(argv[2]) : std::filesystem::current_path();

    const auto gitDir = initRepository(workTree, constants::DEFAULT_BRANCH_REF);
    std::cout << "Initialized empty Git repository in "
              << std::filesystem::absolute(gitDir).string() << "/\n";
    return EXIT_SUCCESS;
}
