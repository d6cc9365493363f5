#pragma once
#include <string>
#include <string_view>
#include <vector>
#include <span>
#include <cstddef>

#include "object_id.h"

/** @struct TreeEntry
 *  @brief Represents a single entry (file or directory) within a Git tree object.
 */
struct TreeEntry {
    std::string mode;     ///< File mode as an octal string (e.g., "100644" for blob, "40000" for tree).
    std::string filename; ///< The name of the file or subdirectory.
    ObjectId id;          ///< The blob or subtree this entry refers to.
};

/**
 * @brief Serializes entries into the binary body of a tree object.
 *
 * Entries are sorted by the raw bytes of their name, then written as
 * "<mode> <name>\0<20-byte id>". Identical directory contents therefore
 * always produce byte-identical bodies.
 *
 * @throws std::invalid_argument on an empty or duplicate name.
 */
std::vector<std::byte> encodeTree(std::vector<TreeEntry> entries);

/**
 * @brief Parses the binary content of a Git tree object into its entries.
 *
 * @param treeContent The tree object's data (payload only, after the header).
 * @throws CorruptObjectError if an entry is malformed or truncated.
 */
std::vector<TreeEntry> parseTreeObject(std::span<const std::byte> treeContent);

/**
 * @brief Converts an octal mode string to its numeric value.
 * @throws CorruptObjectError if the string is not a valid octal mode.
 */
unsigned int parseMode(std::string_view mode);

bool isTreeMode(std::string_view mode);
bool isSymlinkMode(std::string_view mode);
bool isGitlinkMode(std::string_view mode);

/**
 * @brief The object type an entry with this mode refers to, as `ls-tree` prints it.
 */
std::string_view entryTypeForMode(std::string_view mode);

/**
 * @brief Formats a file mode for display, matching `git ls-tree` output.
 * Ensures the mode is 6 digits (e.g., "40000" becomes "040000").
 */
std::string formatModeForDisplay(std::string_view mode);
