#pragma once
#include <filesystem>

#include "object_id.h"
#include "object_store.h"

/**
 * @brief Handles the 'write-tree' command.
 * Creates a tree object from the working tree of the enclosing repository.
 */
int handleWriteTree(int argc, char* argv[]);

/**
 * @brief Recursively creates a tree object from a directory's contents.
 *
 * For each entry, it either creates a blob (for files and symlinks) or
 * recursively calls itself (for subdirectories), then writes the tree object.
 * The `.git` directory and empty subdirectories are left out.
 *
 * @param store The object store to write to.
 * @param dirPath The directory to create a tree from.
 * @return The id of the created tree object.
 */
ObjectId writeTreeFromDirectory(const ObjectStore& store, const std::filesystem::path& dirPath);
