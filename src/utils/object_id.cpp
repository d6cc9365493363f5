#include "../include/object_id.h"
#include "../include/sha1_utils.h"

#include <algorithm>
#include <cctype>
#include <stdexcept>

ObjectId ObjectId::fromBytes(std::span<const std::byte> bytes) {
    if (bytes.size() != OBJECT_ID_SIZE) {
        throw std::invalid_argument("Object id must be " + std::to_string(OBJECT_ID_SIZE) +
                                    " bytes, got " + std::to_string(bytes.size()));
    }
    ObjectId id;
    std::copy(bytes.begin(), bytes.end(), id.m_bytes.begin());
    return id;
}

ObjectId ObjectId::fromHex(std::string_view hex) {
    if (!isValidHex(hex)) {
        throw std::invalid_argument("Not a valid object name " + std::string(hex));
    }
    return fromBytes(hexToBytes(hex));
}

bool ObjectId::isValidHex(std::string_view hex) {
    return hex.size() == OBJECT_ID_HEX_SIZE &&
           std::all_of(hex.begin(), hex.end(), [](char c) {
               return std::isxdigit(static_cast<unsigned char>(c)) != 0;
           });
}

std::string ObjectId::hex() const {
    return bytesToHex(m_bytes);
}
