#pragma once

#include <string_view>
#include <filesystem>
#include <cstddef>

/**
 * @file
 * @brief Centralizes compile-time constants for the application.
 *
 * `string_view` is used for true compile-time constants that require no memory allocation.
 * Paths are always built relative to an explicit repository root, never the process cwd.
 */
namespace constants {
    // Core Git directory and file names
    constexpr std::string_view GIT_DIR_NAME = ".git";
    constexpr std::string_view OBJECTS_DIR_NAME = "objects";
    constexpr std::string_view REFS_DIR_NAME = "refs";
    constexpr std::string_view HEADS_DIR_NAME = "heads";
    constexpr std::string_view TAGS_DIR_NAME = "tags";
    constexpr std::string_view HEAD_FILE_NAME = "HEAD";
    constexpr std::string_view DEFAULT_BRANCH_REF = "refs/heads/main";

    // Git object modes
    // These are standard Unix-style permissions used in tree entries.
    constexpr std::string_view MODE_BLOB = "100644";       // Regular file
    constexpr std::string_view MODE_EXECUTABLE = "100755"; // Executable file
    constexpr std::string_view MODE_SYMLINK = "120000";    // Symbolic link
    constexpr std::string_view MODE_TREE = "40000";        // Directory

    // File type bits of a tree entry mode (octal).
    constexpr unsigned int MODE_TYPE_MASK = 0170000;
    constexpr unsigned int MODE_TYPE_TREE = 0040000;
    constexpr unsigned int MODE_TYPE_FILE = 0100000;
    constexpr unsigned int MODE_TYPE_SYMLINK = 0120000;
    constexpr unsigned int MODE_TYPE_GITLINK = 0160000;
    constexpr unsigned int MODE_PERMISSION_MASK = 0777;

    // Default author information for commits.
    // Overridden by GIT_AUTHOR_* / GIT_COMMITTER_* environment variables.
    constexpr std::string_view AUTHOR_NAME = "cogit";
    constexpr std::string_view AUTHOR_EMAIL = "cogit@localhost";

    // Smart HTTP protocol
    constexpr std::string_view UPLOAD_PACK_SERVICE = "git-upload-pack";
    constexpr std::string_view UPLOAD_PACK_REQUEST_TYPE = "application/x-git-upload-pack-request";
    constexpr std::string_view UPLOAD_PACK_RESULT_TYPE = "application/x-git-upload-pack-result";
    constexpr std::string_view USER_AGENT = "cogit/1.0";

    // Packfile format
    constexpr std::size_t PACK_HEADER_SIZE = 12;
    constexpr std::size_t PACK_CHECKSUM_SIZE = 20;
    constexpr unsigned int PACK_VERSION = 2;

    // A delta copy instruction with an encoded size of zero copies this many bytes.
    constexpr std::size_t DELTA_DEFAULT_COPY_SIZE = 4096;
}
