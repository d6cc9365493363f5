#include "../include/repository_utils.h"
#include "../include/constants.h"
#include "../include/errors.h"

#include <fstream>
#include <string>

static void writeTextFile(const std::filesystem::path& path, const std::string& text) {
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
        throw StorageError("cannot create directory " + path.parent_path().string() + ": " + ec.message());
    }
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        throw StorageError("cannot open " + path.string() + " for writing");
    }
    file << text;
    if (!file) {
        throw StorageError("failed writing " + path.string());
    }
}

std::filesystem::path initRepository(const std::filesystem::path& workTree, std::string_view headRef) {
    const auto gitDir = workTree / constants::GIT_DIR_NAME;
    const auto refsDir = gitDir / constants::REFS_DIR_NAME;

    std::error_code ec;
    for (const auto& dir : {gitDir / constants::OBJECTS_DIR_NAME,
                            refsDir / constants::HEADS_DIR_NAME,
                            refsDir / constants::TAGS_DIR_NAME}) {
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            throw StorageError("cannot create " + dir.string() + ": " + ec.message());
        }
    }
    writeSymbolicHead(gitDir, headRef);
    return gitDir;
}

bool isValidRefName(std::string_view refName) {
    constexpr std::string_view prefix = "refs/";
    if (!refName.starts_with(prefix) || refName.ends_with("/")) {
        return false;
    }
    size_t start = 0;
    while (start <= refName.size()) {
        size_t end = refName.find('/', start);
        if (end == std::string_view::npos) end = refName.size();
        std::string_view component = refName.substr(start, end - start);
        if (component.empty() || component == "." || component == ".." ||
            component.find('\\') != std::string_view::npos || component.find('\0') != std::string_view::npos) {
            return false;
        }
        start = end + 1;
    }
    return true;
}

void writeRef(const std::filesystem::path& gitDir, std::string_view refName, const ObjectId& id) {
    if (!isValidRefName(refName)) {
        throw StorageError("refusing to write invalid ref name '" + std::string(refName) + "'");
    }
    writeTextFile(gitDir / refName, id.hex() + "\n");
}

void writeSymbolicHead(const std::filesystem::path& gitDir, std::string_view refName) {
    writeTextFile(gitDir / constants::HEAD_FILE_NAME, "ref: " + std::string(refName) + "\n");
}

void writeDetachedHead(const std::filesystem::path& gitDir, const ObjectId& id) {
    writeTextFile(gitDir / constants::HEAD_FILE_NAME, id.hex() + "\n");
}
