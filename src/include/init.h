#pragma once

/**
 * @brief Handles the 'init' command.
 *
 * Implements `git init [<directory>]`, creating the required directory
 * structure (.git, .git/objects, .git/refs) and the HEAD file.
 */
int handleInit(int argc, char* argv[]);
