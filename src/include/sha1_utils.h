#pragma once
#include <string>
#include <string_view>
#include <vector>
#include <span>

#include "object_id.h"

/**
 * @brief Calculates the SHA-1 hash of a data span.
 * This is a low-level function that uses OpenSSL.
 */
ObjectId calculateSha1(std::span<const std::byte> data);

/**
 * @brief Converts a span of raw bytes to its lowercase hexadecimal representation.
 */
std::string bytesToHex(std::span<const std::byte> bytes);

/**
 * @brief Converts a hexadecimal string back into a vector of raw bytes.
 * @throws std::invalid_argument on an odd length or a non-hex character.
 */
std::vector<std::byte> hexToBytes(std::string_view hex);
