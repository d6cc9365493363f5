#pragma once
#include <vector>
#include <cstddef>
#include <filesystem>

#include "object_id.h"
#include "object_store.h"

/**
 * @brief Handles the 'hash-object' command.
 *
 * Implements `git hash-object [-w] <file>`, printing the blob id of a file
 * and, with -w, writing the blob to the object database.
 */
int handleHashObject(int argc, char* argv[]);

/**
 * @brief Reads a whole file as raw bytes.
 * @throws GitError if the file cannot be read.
 */
std::vector<std::byte> readFileBytes(const std::filesystem::path& filePath);

/**
 * @brief Creates a Git blob object from a file and writes it to the object store.
 *
 * This is a core utility used by other commands like `write-tree`.
 *
 * @param store The object store to write to.
 * @param filePath Path to the file to be hashed.
 * @return The id of the created blob.
 */
ObjectId createBlobFromFile(const ObjectStore& store, const std::filesystem::path& filePath);
