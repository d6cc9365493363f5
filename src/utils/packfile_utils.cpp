#include "../include/packfile_utils.h"
#include "../include/constants.h"
#include "../include/zlib_utils.h"
#include "../include/errors.h"

#include <optional>
#include <string>

// Maps the literal pack types onto the object store's types.
static std::optional<ObjectType> toObjectType(PackObjectType type) {
    switch (type) {
        case PackObjectType::COMMIT: return ObjectType::COMMIT;
        case PackObjectType::TREE: return ObjectType::TREE;
        case PackObjectType::BLOB: return ObjectType::BLOB;
        case PackObjectType::TAG: return ObjectType::TAG;
        default: return std::nullopt;
    }
}

PackfileParser::PackfileParser(std::span<const std::byte> packfile_data) : m_packfile(packfile_data), m_cursor(0) {}

PackParseResult PackfileParser::parse(const ObjectStore& store) {
    m_cursor = 0;
    verify_header();

    PackParseResult result;
    result.object_count = read_big_endian_32();

    // Parse every record. Base objects are stored directly; delta objects are
    // queued to be resolved once all bases are available.
    for (uint32_t i = 0; i < result.object_count; ++i) {
        if (m_cursor >= m_packfile.size()) {
            throw CorruptPackError("packfile ends after " + std::to_string(i) + " of " +
                                   std::to_string(result.object_count) + " objects");
        }
        const size_t record_offset = m_cursor;

        // 1. Decode the object header (type and size).
        const PackObjectHeader header = read_object_header();

        if (header.type == PackObjectType::REF_DELTA) {
            // 2. For ref-deltas, the base object's id follows the header.
            if (m_packfile.size() - m_cursor < OBJECT_ID_SIZE) {
                throw CorruptPackError("truncated delta base id at offset " + std::to_string(record_offset));
            }
            const ObjectId base_id = ObjectId::fromBytes(m_packfile.subspan(m_cursor, OBJECT_ID_SIZE));
            m_cursor += OBJECT_ID_SIZE;

            // 3. Decompress the delta instructions and queue them.
            result.pending_deltas.push_back({base_id, decompress_data(header.uncompressed_size), record_offset});
            continue;
        }

        auto object_type = toObjectType(header.type);
        if (!object_type) {
            throw CorruptPackError("unsupported object type " + std::to_string(static_cast<int>(header.type)) +
                                   " at offset " + std::to_string(record_offset));
        }

        // 3. Decompress the object and store it under its real content hash.
        const std::vector<std::byte> data = decompress_data(header.uncompressed_size);
        result.literal_ids.push_back(store.put(*object_type, data));
    }

    if (m_cursor != m_packfile.size()) {
        throw CorruptPackError(std::to_string(m_packfile.size() - m_cursor) +
                               " unexpected bytes after the last of " +
                               std::to_string(result.object_count) + " objects");
    }
    return result;
}

/**
 * @brief Reads a standard 32-bit big-endian (network byte order) integer.
 * Advances the internal member cursor `m_cursor` by 4 bytes.
 */
uint32_t PackfileParser::read_big_endian_32() {
    uint32_t value = 0;
    value |= std::to_integer<uint32_t>(m_packfile[m_cursor++]) << 24;
    value |= std::to_integer<uint32_t>(m_packfile[m_cursor++]) << 16;
    value |= std::to_integer<uint32_t>(m_packfile[m_cursor++]) << 8;
    value |= std::to_integer<uint32_t>(m_packfile[m_cursor++]);
    return value;
}

/**
 * @brief Verifies the 12-byte packfile header.
 * The header must consist of the magic signature "PACK" followed by a 32-bit
 * version number (which must be 2). The object count is read by the caller.
 */
void PackfileParser::verify_header() {
    if (m_packfile.size() < constants::PACK_HEADER_SIZE) {
        throw CorruptPackError("packfile is shorter than its 12-byte header");
    }

    // Check for "PACK" signature.
    if (m_packfile[0] != std::byte{'P'} || m_packfile[1] != std::byte{'A'} ||
        m_packfile[2] != std::byte{'C'} || m_packfile[3] != std::byte{'K'}) {
        throw CorruptPackError("missing PACK signature");
    }
    m_cursor += 4;

    uint32_t version = read_big_endian_32();
    if (version != constants::PACK_VERSION) {
        throw CorruptPackError("unsupported packfile version " + std::to_string(version));
    }
}

/**
 * @brief Decodes a record header.
 *
 * Bits 4-6 of the first byte are the type and bits 0-3 the low bits of the
 * size. While the MSB is set, each following byte adds 7 more size bits,
 * least-significant group first.
 */
PackObjectHeader PackfileParser::read_object_header() {
    const size_t header_offset = m_cursor;
    uint8_t current_byte = std::to_integer<uint8_t>(m_packfile[m_cursor++]);

    PackObjectHeader header;
    header.type = static_cast<PackObjectType>((current_byte >> 4) & 0x07);
    header.uncompressed_size = current_byte & 0x0F;

    int shift = 4;
    while ((current_byte & 0x80) != 0) {
        if (m_cursor >= m_packfile.size()) {
            throw CorruptPackError("truncated object header at offset " + std::to_string(header_offset));
        }
        if (shift > 57) {
            throw CorruptPackError("object size overflows at offset " + std::to_string(header_offset));
        }
        current_byte = std::to_integer<uint8_t>(m_packfile[m_cursor++]);
        header.uncompressed_size |= static_cast<uint64_t>(current_byte & 0x7F) << shift;
        shift += 7;
    }
    return header;
}

std::vector<std::byte> PackfileParser::decompress_data(uint64_t uncompressed_size) {
    const size_t data_offset = m_cursor;
    auto inflated = inflateStream(m_packfile.subspan(m_cursor), uncompressed_size);
    if (!inflated) {
        throw CorruptPackError("corrupt or truncated zlib stream at offset " + std::to_string(data_offset));
    }
    if (inflated->data.size() != uncompressed_size) {
        throw CorruptPackError("object at offset " + std::to_string(data_offset) + " inflates to " +
                               std::to_string(inflated->data.size()) + " bytes, header declares " +
                               std::to_string(uncompressed_size));
    }
    // Records are back to back: the next one starts right after this stream.
    m_cursor += inflated->bytes_consumed;
    return std::move(inflated->data);
}

UnpackStats unpackPackfile(std::span<const std::byte> packfile, const ObjectStore& store) {
    PackfileParser parser(packfile);
    PackParseResult parsed = parser.parse(store);

    const size_t delta_count = parsed.pending_deltas.size();
    DeltaResolver resolver(store);
    resolver.resolveAll(std::move(parsed.pending_deltas));

    return {parsed.object_count, parsed.literal_ids.size(), delta_count};
}
