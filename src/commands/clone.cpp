#include "../include/clone.h"
#include "../include/smart_http_client.h"
#include "../include/repository_utils.h"
#include "../include/checkout_utils.h"
#include "../include/object_store.h"
#include "../include/constants.h"
#include "../include/errors.h"

#include <cstdlib>
#include <iostream>
#include <ostream>
#include <string>
#include <vector>

std::filesystem::path inferCloneDirectory(const std::string& url) {
    const std::string normalized = normalizeRemoteUrl(url);
    std::string repoName = normalized.substr(normalized.find_last_of('/') + 1);
    if (repoName.ends_with(".git")) {
        repoName.resize(repoName.size() - 4);
    }
    if (repoName.empty() || repoName == "." || repoName == "..") {
        throw GitError("cannot infer a directory name from '" + url + "'");
    }
    return repoName;
}

CloneResult cloneRepository(const std::string& url, const std::filesystem::path& targetDir,
                            HttpTransport& transport) {
    // --- 1. Destination must be absent or an empty directory ---
    if (std::filesystem::exists(targetDir) &&
        (!std::filesystem::is_directory(targetDir) || !std::filesystem::is_empty(targetDir))) {
        throw GitError("destination path '" + targetDir.string() + "' already exists and is not an empty directory");
    }

    // --- 2. Ref discovery and pack fetch, before anything touches the disk ---
    SmartHttpClient client(url, transport);
    const RefAdvertisement advertisement = client.discoverRefs();
    const std::vector<ObjectId> wants = collectWants(advertisement);

    std::vector<std::byte> packfile;
    if (!wants.empty()) {
        packfile = client.fetchPack(wants);
    }

    // --- 3. Local repository and objects ---
    CloneResult result{};
    result.head_ref = resolveHeadRef(advertisement);
    result.git_dir = initRepository(targetDir, result.head_ref.value_or(std::string(constants::DEFAULT_BRANCH_REF)));

    const ObjectStore store(result.git_dir);
    if (!packfile.empty()) {
        result.stats = unpackPackfile(packfile, store);
    }

    // --- 4. Refs and HEAD ---
    for (const auto& ref : advertisement.refs) {
        writeRef(result.git_dir, ref.name, ref.id);
        if (result.head_ref && ref.name == *result.head_ref) {
            result.head_commit = ref.id;
        }
    }
    result.ref_count = advertisement.refs.size();

    if (!result.head_ref && advertisement.head_id) {
        writeDetachedHead(result.git_dir, *advertisement.head_id);
        result.head_commit = advertisement.head_id;
    }

    // --- 5. Populate the working directory ---
    if (result.head_commit) {
        checkoutCommit(store, *result.head_commit, targetDir);
    }
    return result;
}

void reportClone(const CloneResult& result, std::ostream& out) {
    if (!result.head_commit) {
        if (result.ref_count == 0) {
            out << "warning: You appear to have cloned an empty repository.\n";
        } else {
            // HEAD names a branch the remote did not advertise.
            out << "warning: remote HEAD refers to nonexistent ref, unable to checkout\n";
        }
        return;
    }
    out << "Received " << result.stats.object_count << " objects ("
        << result.stats.literal_count << " literal, " << result.stats.delta_count << " deltas), "
        << result.ref_count << " refs.\n";
    out << "HEAD is now at " << result.head_commit->hex().substr(0, 7);
    if (result.head_ref) {
        out << " (" << *result.head_ref << ")";
    }
    out << "\n";
}

int handleClone(int argc, char* argv[]) {
    std::string baseUrl;
    std::filesystem::path targetDir;

    if (argc == 3) { // cogit clone <url>
        baseUrl = argv[2];
        targetDir = inferCloneDirectory(baseUrl);
    } else if (argc == 4) { // cogit clone <url> <dir>
        baseUrl = argv[2];
        targetDir = argv[3];
    } else {
        std::cerr << "Usage: cogit clone <url> [<directory>]\n";
        return EXIT_FAILURE;
    }

    std::cerr << "Cloning into '" << targetDir.string() << "'...\n";

    CprTransport transport;
    const CloneResult result = cloneRepository(baseUrl, targetDir, transport);

    reportClone(result, std::cerr);
    return EXIT_SUCCESS;
}
