#pragma once

#include <cstdint>
#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "object_id.h"

/** @struct Identity
 *  @brief Who made a commit and when, as written on the author/committer lines.
 */
struct Identity {
    std::string name;
    std::string email;
    std::int64_t timestamp; ///< Seconds since the Unix epoch.
    std::string timezone;   ///< Offset from UTC as "+HHMM" or "-HHMM".
};

/** @struct CommitData
 *  @brief The fields of a commit object this tool writes.
 */
struct CommitData {
    ObjectId tree;
    std::optional<ObjectId> parent;
    Identity author;
    Identity committer;
    std::string message;
};

/**
 * @brief Formats an identity as "<name> <<email>> <timestamp> <timezone>".
 */
std::string formatIdentity(const Identity& identity);

/**
 * @brief Serializes a commit into the body of a commit object.
 */
std::vector<std::byte> encodeCommit(const CommitData& commit);

/**
 * @brief Locates the root tree id inside a raw commit body.
 * @throws CorruptObjectError if no "tree <40 hex>" line is present.
 */
ObjectId findTreeId(std::span<const std::byte> commitContent);
