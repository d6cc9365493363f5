#include "../include/tree_codec.h"
#include "../include/constants.h"
#include "../include/byte_utils.h"
#include "../include/errors.h"

#include <algorithm>
#include <charconv>
#include <stdexcept>

std::vector<std::byte> encodeTree(std::vector<TreeEntry> entries) {
    // std::string compares as unsigned bytes, which is the order the body needs.
    std::sort(entries.begin(), entries.end(), [](const TreeEntry& a, const TreeEntry& b) {
        return a.filename < b.filename;
    });

    std::vector<std::byte> treeContent;
    for (size_t i = 0; i < entries.size(); ++i) {
        const auto& entry = entries[i];
        if (entry.filename.empty()) {
            throw std::invalid_argument("tree entry with an empty name");
        }
        if (i > 0 && entries[i - 1].filename == entry.filename) {
            throw std::invalid_argument("duplicate tree entry '" + entry.filename + "'");
        }
        appendBytes(treeContent, entry.mode + " " + entry.filename + '\0');
        appendBytes(treeContent, entry.id.bytes());
    }
    return treeContent;
}

std::vector<TreeEntry> parseTreeObject(std::span<const std::byte> treeContent) {
    std::vector<TreeEntry> entries;
    auto current = treeContent.begin();

    while (current != treeContent.end()) {
        auto nullPos = std::find(current, treeContent.end(), std::byte{0});
        if (nullPos == treeContent.end()) {
            throw CorruptObjectError("tree has " + std::to_string(std::distance(current, treeContent.end())) +
                                     " trailing bytes that are not an entry");
        }

        // "<mode> <name>" split on the first space.
        const std::string header = toString(std::span{current, nullPos});
        const size_t spacePos = header.find(' ');
        if (spacePos == std::string::npos || spacePos == 0 || spacePos + 1 == header.size()) {
            throw CorruptObjectError("malformed tree entry header '" + header + "'");
        }

        // The id is the next 20 raw bytes.
        auto idStart = nullPos + 1;
        if (std::distance(idStart, treeContent.end()) < static_cast<std::ptrdiff_t>(OBJECT_ID_SIZE)) {
            throw CorruptObjectError("tree entry '" + header.substr(spacePos + 1) + "' has a truncated object id");
        }
        auto idEnd = idStart + OBJECT_ID_SIZE;

        entries.push_back({header.substr(0, spacePos), header.substr(spacePos + 1),
                           ObjectId::fromBytes(std::span{idStart, idEnd})});
        current = idEnd;
    }

    return entries;
}

unsigned int parseMode(std::string_view mode) {
    unsigned int value = 0;
    auto [ptr, ec] = std::from_chars(mode.data(), mode.data() + mode.size(), value, 8);
    if (mode.empty() || ec != std::errc{} || ptr != mode.data() + mode.size()) {
        throw CorruptObjectError("invalid file mode '" + std::string(mode) + "'");
    }
    return value;
}

bool isTreeMode(std::string_view mode) {
    return (parseMode(mode) & constants::MODE_TYPE_MASK) == constants::MODE_TYPE_TREE;
}

bool isSymlinkMode(std::string_view mode) {
    return (parseMode(mode) & constants::MODE_TYPE_MASK) == constants::MODE_TYPE_SYMLINK;
}

bool isGitlinkMode(std::string_view mode) {
    return (parseMode(mode) & constants::MODE_TYPE_MASK) == constants::MODE_TYPE_GITLINK;
}

std::string_view entryTypeForMode(std::string_view mode) {
    if (isTreeMode(mode)) return "tree";
    if (isGitlinkMode(mode)) return "commit";
    return "blob";
}

// Pads the mode to 6 digits for display, e.g., "40000" -> "040000".
std::string formatModeForDisplay(std::string_view mode) {
    if (mode.length() < 6) {
        return std::string(6 - mode.length(), '0') + std::string(mode);
    }
    return std::string(mode);
}
