#pragma once

#include <filesystem>
#include <string_view>

#include "object_id.h"

/**
 * @brief Creates an empty repository in `workTree`.
 *
 * Creates `.git`, `.git/objects`, `.git/refs/heads`, `.git/refs/tags` and a
 * HEAD pointing at `headRef`. The work tree directory itself is created if absent.
 *
 * @return The `.git` directory.
 * @throws StorageError if the layout cannot be created.
 */
std::filesystem::path initRepository(const std::filesystem::path& workTree,
                                     std::string_view headRef);

/**
 * @brief Checks that a ref name is safe to use as a path below `.git`.
 *
 * The name must start with "refs/" and contain no empty, "." or ".." components.
 */
bool isValidRefName(std::string_view refName);

/**
 * @brief Writes `<gitDir>/<refName>` containing the id followed by a newline.
 * @throws StorageError for a name rejected by isValidRefName, or if the file cannot be written.
 */
void writeRef(const std::filesystem::path& gitDir, std::string_view refName, const ObjectId& id);

/**
 * @brief Points HEAD at a branch: "ref: <refName>\n".
 */
void writeSymbolicHead(const std::filesystem::path& gitDir, std::string_view refName);

/**
 * @brief Detaches HEAD at a commit: "<40 hex>\n".
 */
void writeDetachedHead(const std::filesystem::path& gitDir, const ObjectId& id);
