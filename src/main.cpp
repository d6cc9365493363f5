#include <iostream>
#include <string>
#include <filesystem>
#include <cstdlib>

#include "include/errors.h"
#include "include/init.h"
#include "include/cat_file.h"
#include "include/hash_object.h"
#include "include/ls_tree.h"
#include "include/write_tree.h"
#include "include/commit_tree.h"
#include "include/clone.h"

static int dispatch(const std::string& command, int argc, char* argv[]) {
    if (command == "init") {
        return handleInit(argc, argv);
    }
    if (command == "cat-file") {
        return handleCatFile(argc, argv);
    }
    if (command == "hash-object") {
        return handleHashObject(argc, argv);
    }
    if (command == "ls-tree") {
        return handleLsTree(argc, argv);
    }
    if (command == "write-tree") {
        return handleWriteTree(argc, argv);
    }
    if (command == "commit-tree") {
        return handleCommitTree(argc, argv);
    }
    if (command == "clone") {
        return handleClone(argc, argv);
    }

    std::cerr << "Unknown command: " << command << "\n";
    return EXIT_FAILURE;
}

/**
 * @brief Main entry point for the cogit application.
 *
 * Parses the first argument to determine which command to execute and
 * forwards the arguments to the appropriate handler. Any error a handler
 * raises is reported once here and turned into a failing exit status.
 */
int main(int argc, char* argv[]) {
    // Ensure that cout/cerr flush immediately, for predictable output when
    // the program is used in scripts.
    std::cout << std::unitbuf;
    std::cerr << std::unitbuf;

    if (argc < 2) {
        std::cerr << "Usage: cogit <command> [<args>...]\n";
        return EXIT_FAILURE;
    }

    try {
        return dispatch(argv[1], argc, argv);
    } catch (const GitError& e) {
        std::cerr << "fatal: " << e.what() << "\n";
    } catch (const std::filesystem::filesystem_error& e) {
        std::cerr << "fatal: " << e.what() << "\n";
    } catch (const std::exception& e) {
        std::cerr << "fatal: " << e.what() << "\n";
    }
    return EXIT_FAILURE;
}
