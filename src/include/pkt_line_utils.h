#pragma once
#include <cstddef>
#include <optional>
#include <span>
#include <string>

// Largest pkt-line allowed by the protocol, including its 4-byte length prefix.
constexpr size_t PKT_LINE_MAX_LENGTH = 65520;

/** @struct PktLine
 *  @brief One decoded packet: either a flush-pkt ("0000") or a data line.
 */
struct PktLine {
    bool is_flush;
    std::string payload; ///< Empty for a flush-pkt.
};

/**
 * @class PktLineReader
 * @brief A stateful reader for Git's pkt-line formatted data.
 *
 * This class reads one "packet" at a time from a buffer. A packet consists
 * of a 4-byte hex length prefix (which counts itself) followed by the payload.
 */
class PktLineReader {
private:
    std::span<const std::byte> m_data;
    size_t m_cursor;

public:
    PktLineReader(std::span<const std::byte> data);

    /**
     * @brief Reads the next packet.
     * @return The packet, or std::nullopt once the buffer is exhausted.
     * @throws ProtocolError on a non-hex or out-of-range length prefix, or a
     *         packet that runs past the end of the buffer.
     */
    std::optional<PktLine> readNextPacket();

    // Offset of the first byte not yet consumed.
    size_t position() const { return m_cursor; }

    // The bytes after the last packet read, e.g. a packfile following the NAK line.
    std::span<const std::byte> remaining() const { return m_data.subspan(m_cursor); }
};

/**
 * @brief Encodes a string into the pkt-line format.
 * Prepends the payload length as a 4-character hex string.
 * @param line The payload to encode. An empty string creates a flush-pkt ("0000").
 * @return The pkt-line formatted string.
 */
std::string createPktLine(const std::string& line);

/**
 * @brief Drops one trailing '\n' from a pkt-line payload.
 */
std::string chompLine(std::string line);
