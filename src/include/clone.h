#pragma once

#include <filesystem>
#include <optional>
#include <ostream>
#include <string>

#include "http_transport.h"
#include "object_id.h"
#include "packfile_utils.h"

/**
 * @brief Handles the 'clone' command.
 *
 * Implements `git clone <url> [directory]`, fetching a repository
 * from a remote server using the smart HTTP protocol, creating the local
 * repository, and checking out the default branch.
 */
int handleClone(int argc, char* argv[]);

// What a clone produced, for reporting.
struct CloneResult {
    std::filesystem::path git_dir;
    std::optional<std::string> head_ref;   // Branch HEAD points at, unless detached.
    std::optional<ObjectId> head_commit;   // Commit checked out; empty for an empty remote.
    size_t ref_count;
    UnpackStats stats;
};

/**
 * @brief Infers the directory name from a URL, e.g. https://host/user/repo.git -> repo.
 * @throws GitError if the URL has no usable last path segment.
 */
std::filesystem::path inferCloneDirectory(const std::string& url);

/**
 * @brief Clones `url` into `targetDir`.
 *
 * Discovery and the pack fetch both complete before anything is written, so a
 * protocol failure leaves no repository behind. Afterwards every object is
 * stored, refs and HEAD are written, and HEAD's tree is checked out.
 *
 * @throws GitError (ProtocolError, CorruptPackError, MissingBaseError, ...) on failure.
 */
CloneResult cloneRepository(const std::string& url, const std::filesystem::path& targetDir,
                            HttpTransport& transport);

/**
 * @brief Prints the outcome of a clone: object and ref counts and the checked-out
 * commit, or a warning when nothing was checked out.
 */
void reportClone(const CloneResult& result, std::ostream& out);
