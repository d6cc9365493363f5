#pragma once

#include <ostream>

#include "object_id.h"
#include "object_store.h"

/**
 * @brief Handles the 'ls-tree' command.
 *
 * Implements `git ls-tree [--name-only] <tree-sha>`, listing the contents
 * of a tree object (filenames, modes, and SHAs).
 */
int handleLsTree(int argc, char* argv[]);

/**
 * @brief Writes the listing of a tree object, one entry per line.
 *
 * Each line is "<mode> <type> <id>\t<name>", or just the name with `nameOnly`.
 *
 * @throws CorruptObjectError if the object is missing, malformed or not a tree.
 */
void printTree(const ObjectStore& store, const ObjectId& treeId, bool nameOnly, std::ostream& out);
