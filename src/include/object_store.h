#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <cstddef>
#include <span>
#include <filesystem>

#include "object_id.h"

// The kinds of objects the store holds.
enum class ObjectType {
    BLOB,
    TREE,
    COMMIT,
    TAG
};

// Returns the on-disk type name ("blob", "tree", "commit", "tag").
std::string_view objectTypeName(ObjectType type);

// Parses an on-disk type name, or std::nullopt if it is not one of the known types.
std::optional<ObjectType> parseObjectType(std::string_view name);

/** @struct GitObject
 *  @brief A decoded object: its type and the content after the "<type> <len>\0" header.
 */
struct GitObject {
    ObjectType type;
    std::vector<std::byte> content;
};

/**
 * @class ObjectStore
 * @brief The loose-object database under `<git-dir>/objects`.
 *
 * Objects are stored zlib-compressed as "<type> <len>\0<content>" at
 * `objects/<first 2 hex>/<remaining 38 hex>` and are never modified once written.
 */
class ObjectStore {
public:
    /**
     * @param gitDir The repository's `.git` directory.
     */
    explicit ObjectStore(std::filesystem::path gitDir);

    /**
     * @brief Builds the framed buffer "<type> <len>\0<content>" that is hashed and stored.
     */
    static std::vector<std::byte> frameObject(ObjectType type, std::span<const std::byte> content);

    /**
     * @brief Computes an object's id without writing it.
     */
    static ObjectId hash(ObjectType type, std::span<const std::byte> content);

    /**
     * @brief Writes an object to the database.
     *
     * Hashes the framed content, compresses it fully in memory, then writes it
     * to its path. Writing an object that already exists is a no-op.
     *
     * @return The id of the object.
     * @throws StorageError if the object file cannot be written.
     */
    ObjectId put(ObjectType type, std::span<const std::byte> content) const;

    /**
     * @brief Reads and decodes an object.
     * @throws CorruptObjectError if the object is missing, does not decompress,
     *         or its header does not match its content.
     */
    GitObject get(const ObjectId& id) const;

    bool contains(const ObjectId& id) const;

    std::filesystem::path objectPath(const ObjectId& id) const;

    const std::filesystem::path& gitDir() const { return m_gitDir; }

private:
    std::filesystem::path m_gitDir;
    std::filesystem::path m_objectsDir;
};
