#include "../include/cat_file.h"
#include "../include/ls_tree.h"
#include "../include/config_utils.h"

#include <cstdlib>
#include <iostream>
#include <string>

void printObject(const ObjectStore& store, const ObjectId& id, std::ostream& out) {
    const GitObject object = store.get(id);
    if (object.type == ObjectType::TREE) {
        printTree(store, id, false, out);
        return;
    }
    out.write(reinterpret_cast<const char*>(object.content.data()), object.content.size());
}

int handleCatFile(int argc, char* argv[]) {
    const std::string option = (argc == 4) ? argv[2] : "";
    if (option != "-p" && option != "-t" && option != "-s") {
        std::cerr << "Usage: cogit cat-file (-p | -t | -s) <object-sha>\n";
        return EXIT_FAILURE;
    }

    const ObjectStore store(requireGitDir());
    const ObjectId id = ObjectId::fromHex(argv[3]);

    if (option == "-p") {
        printObject(store, id, std::cout);
    } else {
        const GitObject object = store.get(id);
        if (option == "-t") {
            std::cout << objectTypeName(object.type) << "\n";
        } else {
            std::cout << object.content.size() << "\n";
        }
    }
    return EXIT_SUCCESS;
}
