#include "../include/hash_object.h"
#include "../include/config_utils.h"
#include "../include/errors.h"

#include <cstdlib>
#include <iostream>
#include <fstream>
#include <iterator>
#include <string>

std::vector<std::byte> readFileBytes(const std::filesystem::path& filePath) {
    std::ifstream inFile(filePath, std::ios::binary);
    if (!inFile) {
        throw GitError("could not open '" + filePath.string() + "' for reading");
    }
    const std::vector<char> fileContent(
        (std::istreambuf_iterator<char>(inFile)),
        std::istreambuf_iterator<char>()
    );
    if (inFile.bad()) {
        throw GitError("failed reading '" + filePath.string() + "'");
    }
    auto bytes = std::as_bytes(std::span{fileContent});
    return {bytes.begin(), bytes.end()};
}

ObjectId createBlobFromFile(const ObjectStore& store, const std::filesystem::path& filePath) {
    return store.put(ObjectType::BLOB, readFileBytes(filePath));
}

// Command handler for `cogit hash-object [-w] <file>`.
int handleHashObject(int argc, char* argv[]) {
    bool write = false;
    std::filesystem::path filePath;

    if (argc == 4 && std::string(argv[2]) == "-w") {
        write = true;
        filePath = argv[3];
    } else if (argc == 3) {
        filePath = argv[2];
    } else {
        std::cerr << "Usage: cogit hash-object [-w] <file-path>\n";
        return EXIT_FAILURE;
    }

    if (write) {
        const ObjectStore store(requireGitDir());
        std::cout << createBlobFromFile(store, filePath).hex() << "\n";
    } else {
        std::cout << ObjectStore::hash(ObjectType::BLOB, readFileBytes(filePath)).hex() << "\n";
    }
    return EXIT_SUCCESS;
}
