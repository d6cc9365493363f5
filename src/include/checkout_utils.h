#pragma once

#include <filesystem>

#include "object_id.h"
#include "object_store.h"

/**
 * @brief Restores the files from a specific commit to a working directory.
 *
 * Reads the commit, finds its root tree, and then recursively writes all
 * associated files and directories to the target path.
 *
 * @param store The object store holding the commit and everything it references.
 * @param commitId The commit to check out.
 * @param targetDir The root directory where files will be written.
 * @throws CorruptObjectError if any referenced object is missing or malformed.
 */
void checkoutCommit(const ObjectStore& store, const ObjectId& commitId, const std::filesystem::path& targetDir);

/**
 * @brief Writes the contents of one tree object into a directory, recursing into subtrees.
 *
 * Directories are created as needed, regular files get the permission bits
 * from the low 9 bits of their mode, symlinks are recreated and submodule
 * entries become empty directories.
 */
void checkoutTree(const ObjectStore& store, const ObjectId& treeId, const std::filesystem::path& currentPath);
