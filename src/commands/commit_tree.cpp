#include "../include/commit_tree.h"
#include "../include/commit_codec.h"
#include "../include/config_utils.h"
#include "../include/errors.h"

#include <cstdlib>
#include <iostream>
#include <iterator>
#include <vector>

ObjectId commitTree(const ObjectStore& store, const ObjectId& treeId,
                    const std::optional<ObjectId>& parentId, const std::string& message) {
    if (store.get(treeId).type != ObjectType::TREE) {
        throw CorruptObjectError(treeId.hex() + " is not a valid 'tree' object");
    }

    CommitData commit;
    commit.tree = treeId;
    commit.parent = parentId;
    commit.author = authorIdentity();
    commit.committer = committerIdentity();
    commit.message = message;

    return store.put(ObjectType::COMMIT, encodeCommit(commit));
}

int handleCommitTree(int argc, char* argv[]) {
    // This command takes a tree SHA, an optional parent commit, and an optional message.
    if (argc < 3) {
        std::cerr << "Usage: cogit commit-tree <tree_sha> [-p <commit_sha>] [-m <message>]\n";
        return EXIT_FAILURE;
    }

    const std::string treeSha = argv[2];
    std::optional<std::string> parentCommitSha;
    std::optional<std::string> commitMessage;

    for (int i = 3; i < argc; i += 2) {
        const std::string flag = argv[i];
        if (i + 1 >= argc || (flag != "-p" && flag != "-m")) {
            std::cerr << "Usage: cogit commit-tree <tree_sha> [-p <commit_sha>] [-m <message>]\n";
            return EXIT_FAILURE;
        }
        if (flag == "-p") {
            if (parentCommitSha) {
                std::cerr << "fatal: only a single parent is supported\n";
                return EXIT_FAILURE;
            }
            parentCommitSha = argv[i + 1];
        } else {
            commitMessage = argv[i + 1];
        }
    }

    if (!commitMessage) {
        commitMessage = std::string((std::istreambuf_iterator<char>(std::cin)), std::istreambuf_iterator<char>());
    }

    const ObjectStore store(requireGitDir());
    std::optional<ObjectId> parentId;
    if (parentCommitSha) {
        parentId = ObjectId::fromHex(*parentCommitSha);
    }

    std::cout << commitTree(store, ObjectId::fromHex(treeSha), parentId, *commitMessage).hex() << "\n";
    return EXIT_SUCCESS;
}
