#pragma once
#include <cstddef>
#include <optional>
#include <vector>
#include <span>

/**
 * @brief Decompresses a zlib-compressed data span.
 * This function handles dynamically resizing the output buffer to fit the decompressed data.
 * @param input The compressed data.
 * @param output A vector that will be cleared and filled with the decompressed data.
 * @return True on success, false if a zlib error occurs or the stream is incomplete.
 */
bool decompressZlib(std::span<const std::byte> input, std::vector<std::byte>& output);

/**
 * @brief Compresses a data span using zlib.
 * @param input The raw data to compress.
 * @param output A vector that will be cleared and filled with the compressed data.
 * @return True on success, false if a zlib error occurs.
 */
bool compressZlib(std::span<const std::byte> input, std::vector<std::byte>& output);

// Result of inflating one zlib stream embedded at the front of a larger buffer.
struct InflateResult {
    std::vector<std::byte> data; // The inflated bytes.
    size_t bytes_consumed;       // How many input bytes the compressed stream occupied.
};

/**
 * @brief Inflates the zlib stream that starts at the beginning of `input`.
 *
 * Packfile records are stored back to back without a length prefix for their
 * compressed span, so the caller needs to know exactly where this stream ends
 * in order to resume parsing at the next record.
 *
 * @param input Buffer whose prefix is a complete zlib stream; trailing bytes are left untouched.
 * @param size_hint Expected inflated size, used to size the output buffer.
 * @return The inflated data and consumed byte count, or std::nullopt if the stream
 *         is corrupt or truncated.
 */
std::optional<InflateResult> inflateStream(std::span<const std::byte> input, size_t size_hint);
