#pragma once

#include <optional>
#include <string>

#include "object_id.h"
#include "object_store.h"

/**
 * @brief Handles the 'commit-tree' command.
 *
 * Implements `git commit-tree <tree-sha> [-p <parent>] [-m <message>]`,
 * creating a new commit object. Without -m the message is read from stdin.
 */
int handleCommitTree(int argc, char* argv[]);

/**
 * @brief Writes a commit of `treeId` using the author and committer from the environment.
 * @throws CorruptObjectError if `treeId` is not a tree in the store.
 */
ObjectId commitTree(const ObjectStore& store, const ObjectId& treeId,
                    const std::optional<ObjectId>& parentId, const std::string& message);
