#include "../include/write_tree.h"
#include "../include/hash_object.h"
#include "../include/tree_codec.h"
#include "../include/config_utils.h"
#include "../include/constants.h"
#include "../include/byte_utils.h"

#include <cstdlib>
#include <iostream>
#include <vector>
#include <string>
#include <optional>

// Builds the entries of one directory; std::nullopt when it holds nothing trackable.
static std::optional<ObjectId> writeSubtree(const ObjectStore& store, const std::filesystem::path& dirPath,
                                            bool isRoot) {
    std::vector<TreeEntry> entries;

    for (const auto& file : std::filesystem::directory_iterator(dirPath)) {
        auto filename = file.path().filename().string();
        if (filename == constants::GIT_DIR_NAME) {
            continue; // The .git directory is never included in its own tree.
        }

        if (file.is_symlink()) {
            const auto target = std::filesystem::read_symlink(file.path()).string();
            entries.push_back({std::string(constants::MODE_SYMLINK), filename,
                               store.put(ObjectType::BLOB, toBytes(target))});
        } else if (file.is_directory()) {
            // Recurse to create the subtree object.
            if (auto subtreeId = writeSubtree(store, file.path(), false)) {
                entries.push_back({std::string(constants::MODE_TREE), filename, *subtreeId});
            }
        } else if (file.is_regular_file()) {
            const auto perms = file.status().permissions();
            const bool executable = (perms & std::filesystem::perms::owner_exec) != std::filesystem::perms::none;
            entries.push_back({std::string(executable ? constants::MODE_EXECUTABLE : constants::MODE_BLOB),
                               filename, createBlobFromFile(store, file.path())});
        }
        // Sockets, fifos and devices cannot be represented in a tree.
    }

    if (entries.empty() && !isRoot) {
        return std::nullopt;
    }
    // encodeTree sorts by raw name bytes, so the id is independent of directory order.
    return store.put(ObjectType::TREE, encodeTree(std::move(entries)));
}

ObjectId writeTreeFromDirectory(const ObjectStore& store, const std::filesystem::path& dirPath) {
    return *writeSubtree(store, dirPath, true);
}

// Command handler for `cogit write-tree`.
int handleWriteTree(int argc, char* argv[]) {
    if (argc != 2) {
        std::cerr << "Usage: cogit write-tree\n";
        return EXIT_FAILURE;
    }
    const auto gitDir = requireGitDir();
    const ObjectStore store(gitDir);
    std::cout << writeTreeFromDirectory(store, gitDir.parent_path()).hex() << "\n";
    return EXIT_SUCCESS;
}
