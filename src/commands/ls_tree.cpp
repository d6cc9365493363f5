#include "../include/ls_tree.h"
#include "../include/tree_codec.h"
#include "../include/config_utils.h"
#include "../include/errors.h"

#include <cstdlib>
#include <iostream>
#include <string>

void printTree(const ObjectStore& store, const ObjectId& treeId, bool nameOnly, std::ostream& out) {
    const GitObject tree = store.get(treeId);
    if (tree.type != ObjectType::TREE) {
        throw CorruptObjectError("not a tree object: " + treeId.hex());
    }

    for (const auto& entry : parseTreeObject(tree.content)) {
        if (nameOnly) {
            out << entry.filename << "\n";
        } else {
            out << formatModeForDisplay(entry.mode) << " " << entryTypeForMode(entry.mode) << " "
                << entry.id.hex() << "\t" << entry.filename << "\n";
        }
    }
}

int handleLsTree(int argc, char* argv[]) {
    bool nameOnly = false;
    std::string treeSha;

    if (argc == 4 && std::string(argv[2]) == "--name-only") {
        nameOnly = true;
        treeSha = argv[3];
    } else if (argc == 3) {
        treeSha = argv[2];
    } else {
        std::cerr << "Usage: cogit ls-tree [--name-only] <tree-sha>\n";
        return EXIT_FAILURE;
    }

    const ObjectStore store(requireGitDir());
    printTree(store, ObjectId::fromHex(treeSha), nameOnly, std::cout);
    return EXIT_SUCCESS;
}
