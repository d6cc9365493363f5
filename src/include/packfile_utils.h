#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>
#include <span>

#include "delta_utils.h"
#include "object_store.h"

// Represents the different types of objects found within a packfile.
enum class PackObjectType {
    NONE = 0,
    COMMIT = 1,
    TREE = 2,
    BLOB = 3,
    TAG = 4,
    OFS_DELTA = 6,  // Delta referencing a base object by its offset in the same packfile.
    REF_DELTA = 7   // Delta referencing a base object by its SHA-1 hash.
};

// The variable-length header in front of every packed object.
struct PackObjectHeader {
    PackObjectType type;
    uint64_t uncompressed_size; // Size of the object (or delta stream) after inflating.
};

// What the first pass over a packfile produced.
struct PackParseResult {
    uint32_t object_count;                    // Declared in the pack header.
    std::vector<ObjectId> literal_ids;        // Commits, trees, blobs and tags, already stored.
    std::vector<PendingDelta> pending_deltas; // Ref-deltas waiting for the resolver.
};

// Totals reported after a packfile has been fully unpacked.
struct UnpackStats {
    size_t object_count;
    size_t literal_count;
    size_t delta_count;
};

/**
 * @class PackfileParser
 * @brief A stateful parser for Git packfiles.
 *
 * Reads the 12-byte header and then exactly the declared number of records.
 * Literal objects are written to the object store as they are read, keyed by
 * their recomputed content hash; ref-deltas are returned for resolution.
 */
class PackfileParser {
public:
    /**
     * @brief Constructs a parser for the given packfile data.
     * @param packfile_data The packfile without its trailing 20-byte checksum.
     */
    PackfileParser(std::span<const std::byte> packfile_data);

    /**
     * @brief First pass: stores every literal object and queues every delta.
     * @throws CorruptPackError if the header is invalid, a record is malformed,
     *         or the records do not exactly fill the declared object count.
     */
    PackParseResult parse(const ObjectStore& store);

private:
    std::span<const std::byte> m_packfile; // A non-owning view of the packfile data.
    size_t m_cursor;                       // Current read position within the packfile.

    // Reads a 32-bit big-endian integer and advances the cursor.
    uint32_t read_big_endian_32();

    // Verifies the "PACK" magic header and version number.
    void verify_header();

    // Reads the type and size header of the record at the cursor.
    PackObjectHeader read_object_header();

    /**
     * @brief Inflates the zlib stream at the cursor and advances past exactly its compressed bytes.
     * @param uncompressed_size The size declared in the record header; the stream must match it.
     */
    std::vector<std::byte> decompress_data(uint64_t uncompressed_size);
};

/**
 * @brief Stores every object of a packfile, resolving ref-deltas against the store.
 * @throws CorruptPackError, MissingBaseError, DeltaSizeMismatchError, DeltaRangeError.
 */
UnpackStats unpackPackfile(std::span<const std::byte> packfile, const ObjectStore& store);
