#include "../include/pkt_line_utils.h"
#include "../include/errors.h"

#include <sstream>
#include <iomanip>

static int hexValue(std::byte b) {
    const char c = static_cast<char>(b);
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

PktLineReader::PktLineReader(std::span<const std::byte> data) : m_data(data), m_cursor(0) {}

std::optional<PktLine> PktLineReader::readNextPacket() {
    if (m_cursor == m_data.size()) {
        return std::nullopt;
    }
    if (m_data.size() - m_cursor < 4) {
        throw ProtocolError("truncated pkt-line length at offset " + std::to_string(m_cursor));
    }

    // Convert the 4 hex digit size.
    size_t length = 0;
    for (size_t i = 0; i < 4; ++i) {
        int digit = hexValue(m_data[m_cursor + i]);
        if (digit < 0) {
            throw ProtocolError("invalid pkt-line length prefix at offset " + std::to_string(m_cursor));
        }
        length = (length << 4) | static_cast<size_t>(digit);
    }

    if (length == 0) {
        m_cursor += 4;
        return PktLine{true, {}};
    }
    if (length < 4 || length > PKT_LINE_MAX_LENGTH) {
        throw ProtocolError("invalid pkt-line length " + std::to_string(length) +
                            " at offset " + std::to_string(m_cursor));
    }
    if (length > m_data.size() - m_cursor) {
        throw ProtocolError("pkt-line at offset " + std::to_string(m_cursor) + " runs past the end of the response");
    }

    auto payload = m_data.subspan(m_cursor + 4, length - 4);
    m_cursor += length;
    return PktLine{false, std::string(reinterpret_cast<const char*>(payload.data()), payload.size())};
}

std::string createPktLine(const std::string& line) {
    if (line.empty()) {
        return "0000"; // special case flush-pkt
    }

    size_t len = line.length() + 4;
    std::stringstream ss;
    ss << std::setw(4) << std::setfill('0') << std::hex << len << line;
    return ss.str();
}

std::string chompLine(std::string line) {
    if (!line.empty() && line.back() == '\n') {
        line.pop_back();
    }
    return line;
}
