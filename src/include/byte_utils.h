#pragma once

#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <vector>

// Conversions between text and the raw byte buffers used throughout the object model.

inline std::vector<std::byte> toBytes(std::string_view text) {
    auto bytes = std::as_bytes(std::span{text.data(), text.size()});
    return {bytes.begin(), bytes.end()};
}

inline void appendBytes(std::vector<std::byte>& out, std::string_view text) {
    auto bytes = std::as_bytes(std::span{text.data(), text.size()});
    out.insert(out.end(), bytes.begin(), bytes.end());
}

inline void appendBytes(std::vector<std::byte>& out, std::span<const std::byte> bytes) {
    out.insert(out.end(), bytes.begin(), bytes.end());
}

inline std::string toString(std::span<const std::byte> bytes) {
    return std::string(reinterpret_cast<const char*>(bytes.data()), bytes.size());
}
