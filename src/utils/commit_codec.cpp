#include "../include/commit_codec.h"
#include "../include/byte_utils.h"
#include "../include/errors.h"

#include <sstream>

std::string formatIdentity(const Identity& identity) {
    std::ostringstream out;
    out << identity.name << " <" << identity.email << "> " << identity.timestamp << " " << identity.timezone;
    return out.str();
}

std::vector<std::byte> encodeCommit(const CommitData& commit) {
    std::ostringstream commitDataStream;
    commitDataStream << "tree " << commit.tree.hex() << "\n";
    if (commit.parent) {
        commitDataStream << "parent " << commit.parent->hex() << "\n";
    }
    commitDataStream << "author " << formatIdentity(commit.author) << "\n";
    commitDataStream << "committer " << formatIdentity(commit.committer) << "\n";
    commitDataStream << "\n" << commit.message;
    if (commit.message.empty() || commit.message.back() != '\n') {
        commitDataStream << "\n";
    }
    return toBytes(commitDataStream.str());
}

ObjectId findTreeId(std::span<const std::byte> commitContent) {
    const std::string content = toString(commitContent);
    constexpr std::string_view marker = "tree ";

    // The tree line is the first header line, but scan in case of a leading oddity.
    size_t pos = 0;
    while ((pos = content.find(marker, pos)) != std::string::npos) {
        if (pos == 0 || content[pos - 1] == '\n') {
            std::string_view candidate = std::string_view(content).substr(pos + marker.size(), OBJECT_ID_HEX_SIZE);
            if (ObjectId::isValidHex(candidate)) {
                return ObjectId::fromHex(candidate);
            }
            break;
        }
        pos += marker.size();
    }
    throw CorruptObjectError("commit has no valid tree line");
}
