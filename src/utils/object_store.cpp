#include "../include/object_store.h"
#include "../include/constants.h"
#include "../include/sha1_utils.h"
#include "../include/zlib_utils.h"
#include "../include/byte_utils.h"
#include "../include/errors.h"

#include <algorithm>
#include <charconv>
#include <fstream>
#include <iterator>

std::string_view objectTypeName(ObjectType type) {
    switch (type) {
        case ObjectType::BLOB: return "blob";
        case ObjectType::TREE: return "tree";
        case ObjectType::COMMIT: return "commit";
        case ObjectType::TAG: return "tag";
    }
    return "unknown";
}

std::optional<ObjectType> parseObjectType(std::string_view name) {
    if (name == "blob") return ObjectType::BLOB;
    if (name == "tree") return ObjectType::TREE;
    if (name == "commit") return ObjectType::COMMIT;
    if (name == "tag") return ObjectType::TAG;
    return std::nullopt;
}

ObjectStore::ObjectStore(std::filesystem::path gitDir)
    : m_gitDir(std::move(gitDir)), m_objectsDir(m_gitDir / constants::OBJECTS_DIR_NAME) {}

std::vector<std::byte> ObjectStore::frameObject(ObjectType type, std::span<const std::byte> content) {
    std::string header = std::string(objectTypeName(type)) + " " + std::to_string(content.size()) + '\0';
    std::vector<std::byte> framed;
    framed.reserve(header.size() + content.size());
    appendBytes(framed, header);
    appendBytes(framed, content);
    return framed;
}

ObjectId ObjectStore::hash(ObjectType type, std::span<const std::byte> content) {
    return calculateSha1(frameObject(type, content));
}

std::filesystem::path ObjectStore::objectPath(const ObjectId& id) const {
    const std::string hex = id.hex();
    return m_objectsDir / hex.substr(0, 2) / hex.substr(2);
}

bool ObjectStore::contains(const ObjectId& id) const {
    std::error_code ec;
    return std::filesystem::is_regular_file(objectPath(id), ec);
}

ObjectId ObjectStore::put(ObjectType type, std::span<const std::byte> content) const {
    // 1. Frame and hash the object.
    const std::vector<std::byte> framed = frameObject(type, content);
    const ObjectId id = calculateSha1(framed);
    const auto filePath = objectPath(id);

    // Content addressing makes an existing file identical to what we would write.
    if (contains(id)) {
        return id;
    }

    // 2. Compress the whole object before touching the disk.
    std::vector<std::byte> compressedData;
    if (!compressZlib(framed, compressedData)) {
        throw StorageError("zlib compression failed for object " + id.hex());
    }

    // 3. Write the compressed data, creating the fan-out directory if needed.
    std::error_code ec;
    std::filesystem::create_directories(filePath.parent_path(), ec);
    if (ec) {
        throw StorageError("cannot create directory " + filePath.parent_path().string() + ": " + ec.message());
    }
    std::ofstream outFile(filePath, std::ios::binary | std::ios::trunc);
    if (!outFile) {
        throw StorageError("cannot open " + filePath.string() + " for writing");
    }
    outFile.write(reinterpret_cast<const char*>(compressedData.data()), compressedData.size());
    if (!outFile) {
        throw StorageError("failed writing object file " + filePath.string());
    }
    return id;
}

GitObject ObjectStore::get(const ObjectId& id) const {
    const auto objectPath = this->objectPath(id);
    std::ifstream objectFile(objectPath, std::ios::binary);
    if (!objectFile) {
        throw CorruptObjectError("object " + id.hex() + " not found");
    }

    const std::vector<char> compressed((std::istreambuf_iterator<char>(objectFile)),
                                       std::istreambuf_iterator<char>());

    std::vector<std::byte> raw;
    if (!decompressZlib(std::as_bytes(std::span{compressed}), raw)) {
        throw CorruptObjectError("object " + id.hex() + " is not a valid zlib stream");
    }

    // Parse the "<type> <len>\0" header.
    auto nullPos = std::find(raw.begin(), raw.end(), std::byte{0});
    if (nullPos == raw.end()) {
        throw CorruptObjectError("object " + id.hex() + " has no header terminator");
    }
    const std::string header = toString(std::span{raw.begin(), nullPos});
    const size_t spacePos = header.find(' ');
    if (spacePos == std::string::npos) {
        throw CorruptObjectError("object " + id.hex() + " has a malformed header");
    }

    auto type = parseObjectType(std::string_view(header).substr(0, spacePos));
    if (!type) {
        throw CorruptObjectError("object " + id.hex() + " has unknown type '" + header.substr(0, spacePos) + "'");
    }

    const std::string_view lengthText = std::string_view(header).substr(spacePos + 1);
    size_t declaredLength = 0;
    auto [ptr, ec] = std::from_chars(lengthText.data(), lengthText.data() + lengthText.size(), declaredLength);
    if (ec != std::errc{} || ptr != lengthText.data() + lengthText.size() || lengthText.empty()) {
        throw CorruptObjectError("object " + id.hex() + " has an invalid length '" + std::string(lengthText) + "'");
    }

    GitObject object{*type, std::vector<std::byte>(nullPos + 1, raw.end())};
    if (object.content.size() != declaredLength) {
        throw CorruptObjectError("object " + id.hex() + " declares " + std::to_string(declaredLength) +
                                 " bytes but contains " + std::to_string(object.content.size()));
    }
    return object;
}
