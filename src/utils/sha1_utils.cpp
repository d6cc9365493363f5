#include "../include/sha1_utils.h"
#include <openssl/sha.h>
#include <sstream>
#include <iomanip>
#include <stdexcept>
#include <span>

ObjectId calculateSha1(std::span<const std::byte> data) {
    std::array<std::byte, SHA_DIGEST_LENGTH> hash;
    SHA1(reinterpret_cast<const unsigned char*>(data.data()), data.size(),
         reinterpret_cast<unsigned char*>(hash.data()));
    return ObjectId::fromBytes(hash);
}

std::string bytesToHex(std::span<const std::byte> bytes) {
    std::ostringstream result;
    result << std::hex << std::setfill('0');
    for (const auto& byte : bytes) {
        result << std::setw(2) << static_cast<unsigned int>(byte);
    }
    return result.str();
}

static int hexDigitValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::vector<std::byte> hexToBytes(std::string_view hex) {
    if (hex.length() % 2 != 0) {
        throw std::invalid_argument("Hex string must have an even number of characters");
    }
    std::vector<std::byte> bytes;
    bytes.reserve(hex.length() / 2);
    for (size_t i = 0; i < hex.length(); i += 2) {
        int high = hexDigitValue(hex[i]);
        int low = hexDigitValue(hex[i + 1]);
        if (high < 0 || low < 0) {
            throw std::invalid_argument("Invalid hex character in '" + std::string(hex) + "'");
        }
        bytes.push_back(static_cast<std::byte>((high << 4) | low));
    }
    return bytes;
}
