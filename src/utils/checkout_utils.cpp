#include "../include/checkout_utils.h"
#include "../include/tree_codec.h"
#include "../include/commit_codec.h"
#include "../include/constants.h"
#include "../include/byte_utils.h"
#include "../include/errors.h"

#include <fstream>
#include <string>

// Reads an object and insists on its type.
static GitObject readTyped(const ObjectStore& store, const ObjectId& id, ObjectType expected) {
    GitObject object = store.get(id);
    if (object.type != expected) {
        throw CorruptObjectError("object " + id.hex() + " is a " + std::string(objectTypeName(object.type)) +
                                 ", expected a " + std::string(objectTypeName(expected)));
    }
    return object;
}

static void createDirectory(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::create_directories(path, ec);
    if (ec) {
        throw StorageError("cannot create directory " + path.string() + ": " + ec.message());
    }
}

void checkoutCommit(const ObjectStore& store, const ObjectId& commitId, const std::filesystem::path& targetDir) {
    const GitObject commit = readTyped(store, commitId, ObjectType::COMMIT);
    createDirectory(targetDir);
    checkoutTree(store, findTreeId(commit.content), targetDir);
}

void checkoutTree(const ObjectStore& store, const ObjectId& treeId, const std::filesystem::path& currentPath) {
    const GitObject tree = readTyped(store, treeId, ObjectType::TREE);

    for (const auto& entry : parseTreeObject(tree.content)) {
        if (entry.filename == "." || entry.filename == ".." || entry.filename == constants::GIT_DIR_NAME ||
            entry.filename.find('/') != std::string::npos) {
            throw CorruptObjectError("tree " + treeId.hex() + " has an unsafe entry name '" + entry.filename + "'");
        }
        const std::filesystem::path entryPath = currentPath / entry.filename;
        const unsigned int mode = parseMode(entry.mode);

        switch (mode & constants::MODE_TYPE_MASK) {
            case constants::MODE_TYPE_TREE:
                createDirectory(entryPath);
                checkoutTree(store, entry.id, entryPath);
                break;

            case constants::MODE_TYPE_GITLINK:
                // Submodule contents live in another repository.
                createDirectory(entryPath);
                break;

            case constants::MODE_TYPE_SYMLINK: {
                const GitObject blob = readTyped(store, entry.id, ObjectType::BLOB);
                std::error_code ec;
                std::filesystem::create_symlink(toString(blob.content), entryPath, ec);
                if (ec) {
                    throw StorageError("cannot create symlink " + entryPath.string() + ": " + ec.message());
                }
                break;
            }

            default: {
                const GitObject blob = readTyped(store, entry.id, ObjectType::BLOB);
                {
                    std::ofstream outFile(entryPath, std::ios::binary | std::ios::trunc);
                    if (!outFile) {
                        throw StorageError("cannot open " + entryPath.string() + " for writing");
                    }
                    outFile.write(reinterpret_cast<const char*>(blob.content.data()), blob.content.size());
                    if (!outFile) {
                        throw StorageError("failed writing " + entryPath.string());
                    }
                }
                std::error_code ec;
                std::filesystem::permissions(entryPath,
                                             static_cast<std::filesystem::perms>(mode & constants::MODE_PERMISSION_MASK),
                                             std::filesystem::perm_options::replace, ec);
                if (ec) {
                    throw StorageError("cannot set permissions on " + entryPath.string() + ": " + ec.message());
                }
                break;
            }
        }
    }
}
