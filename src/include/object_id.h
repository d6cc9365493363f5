#pragma once

#include <array>
#include <cstddef>
#include <span>
#include <string>
#include <string_view>

constexpr std::size_t OBJECT_ID_SIZE = 20;
constexpr std::size_t OBJECT_ID_HEX_SIZE = 40;

/**
 * @class ObjectId
 * @brief The 20-byte SHA-1 name of a Git object.
 *
 * Displayed as 40 lowercase hex characters; the first two characters name the
 * object's directory under `objects/`, the remaining 38 its file.
 */
class ObjectId {
public:
    ObjectId() = default;

    /**
     * @brief Builds an id from exactly 20 raw bytes.
     * @throws std::invalid_argument if the span is not 20 bytes long.
     */
    static ObjectId fromBytes(std::span<const std::byte> bytes);

    /**
     * @brief Parses a 40-character hex string (either case).
     * @throws std::invalid_argument if the string is not a valid object name.
     */
    static ObjectId fromHex(std::string_view hex);

    static bool isValidHex(std::string_view hex);

    std::string hex() const;

    std::span<const std::byte> bytes() const { return m_bytes; }

    bool operator==(const ObjectId& other) const = default;
    bool operator<(const ObjectId& other) const { return m_bytes < other.m_bytes; }

private:
    std::array<std::byte, OBJECT_ID_SIZE> m_bytes{};
};
