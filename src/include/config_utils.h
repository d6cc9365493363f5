#pragma once

#include <filesystem>
#include <optional>
#include <string_view>

#include "commit_codec.h"

/**
 * @brief Builds an identity from Git's environment variables.
 *
 * Unset variables fall back to the defaults in constants.h and the current
 * local time. The date variable, when set, must be "<seconds> <+|-HHMM>".
 *
 * @throws GitError if the date variable is set but malformed.
 */
Identity identityFromEnvironment(const char* nameVar, const char* emailVar, const char* dateVar);

// GIT_AUTHOR_NAME / GIT_AUTHOR_EMAIL / GIT_AUTHOR_DATE.
Identity authorIdentity();

// GIT_COMMITTER_NAME / GIT_COMMITTER_EMAIL / GIT_COMMITTER_DATE.
Identity committerIdentity();

/**
 * @brief Finds the `.git` directory for a working tree by walking up from `start`.
 * @return The `.git` directory, or std::nullopt if no enclosing repository exists.
 */
std::optional<std::filesystem::path> findGitDir(const std::filesystem::path& start);

/**
 * @brief The `.git` directory enclosing the current directory.
 * @throws GitError if the current directory is not inside a repository.
 */
std::filesystem::path requireGitDir();
