#pragma once

#include <ostream>

#include "object_id.h"
#include "object_store.h"

/**
 * @brief Handles the 'cat-file' command.
 *
 * Implements `git cat-file (-p | -t | -s) <object-sha>`, reading a Git object
 * from the database and printing its content, type or size.
 */
int handleCatFile(int argc, char* argv[]);

/**
 * @brief Pretty-prints an object: raw content for blobs, commits and tags,
 * the `ls-tree` listing for trees. Nothing is appended to the content.
 */
void printObject(const ObjectStore& store, const ObjectId& id, std::ostream& out);
