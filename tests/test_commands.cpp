#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <sstream>
#include <string>
#include <vector>

#include "test_helpers.h"
#include "cat_file.h"
#include "commit_tree.h"
#include "config_utils.h"
#include "hash_object.h"
#include "init.h"
#include "ls_tree.h"
#include "repository_utils.h"
#include "tree_codec.h"
#include "write_tree.h"
#include "errors.h"

namespace fs = std::filesystem;

// Runs a command handler as `cogit <args...>`.
static int runCommand(int (*handler)(int, char*[]), std::vector<std::string> args) {
    args.insert(args.begin(), "cogit");
    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);
    return handler(static_cast<int>(args.size()), argv.data());
}

TEST(InitTest, CreatesRepositoryLayout) {
    TempDir dir;
    const fs::path gitDir = initRepository(dir.path(), "refs/heads/main");

    EXPECT_EQ(gitDir, dir.path() / ".git");
    EXPECT_TRUE(fs::is_directory(gitDir / "objects"));
    EXPECT_TRUE(fs::is_directory(gitDir / "refs" / "heads"));
    EXPECT_TRUE(fs::is_directory(gitDir / "refs" / "tags"));
    EXPECT_EQ(readFile(gitDir / "HEAD"), "ref: refs/heads/main\n");
}

TEST(InitTest, ReinitializingKeepsObjects) {
    TempDir dir;
    const fs::path gitDir = initRepository(dir.path(), "refs/heads/main");
    const ObjectId id = ObjectStore(gitDir).put(ObjectType::BLOB, toBytes("kept"));

    initRepository(dir.path(), "refs/heads/main");
    EXPECT_TRUE(ObjectStore(gitDir).contains(id));
}

TEST(RefsTest, WriteRefAndHead) {
    TempDir dir;
    const fs::path gitDir = initRepository(dir.path(), "refs/heads/main");
    const ObjectId id = ObjectId::fromHex("b6fc4c620b67d95f953a5c1c1230aaab5db5a1b0");

    writeRef(gitDir, "refs/tags/v1.0", id);
    EXPECT_EQ(readFile(gitDir / "refs" / "tags" / "v1.0"), id.hex() + "\n");

    writeDetachedHead(gitDir, id);
    EXPECT_EQ(readFile(gitDir / "HEAD"), id.hex() + "\n");

    EXPECT_THROW(writeRef(gitDir, "refs/../HEAD", id), StorageError);
    EXPECT_THROW(writeRef(gitDir, "HEAD", id), StorageError);
    EXPECT_FALSE(fs::exists(dir.path() / "HEAD"));
}

TEST(FindGitDirTest, WalksUpFromNestedDirectories) {
    TempDir dir;
    const fs::path gitDir = initRepository(dir.path(), "refs/heads/main");
    const fs::path nested = dir.path() / "a" / "b";
    fs::create_directories(nested);

    const auto found = findGitDir(nested);
    ASSERT_TRUE(found.has_value());
    EXPECT_TRUE(fs::equivalent(*found, gitDir));
}

TEST(HashObjectTest, BlobFromFile) {
    TempDir dir;
    ObjectStore store(dir.path() / ".git");
    writeFile(dir.path() / "hello.txt", "hello");

    const ObjectId id = createBlobFromFile(store, dir.path() / "hello.txt");
    EXPECT_EQ(id.hex(), "b6fc4c620b67d95f953a5c1c1230aaab5db5a1b0");

    std::ostringstream out;
    printObject(store, id, out);
    EXPECT_EQ(out.str(), "hello");
}

TEST(HashObjectTest, MissingFileIsAnError) {
    TempDir dir;
    EXPECT_THROW(readFileBytes(dir.path() / "nope"), GitError);
}

TEST(WriteTreeTest, SingleFileMatchesGit) {
    TempDir dir;
    ObjectStore store(dir.path() / ".git");
    fs::create_directories(dir.path() / ".git");
    writeFile(dir.path() / "f.txt", "1");

    const ObjectId treeId = writeTreeFromDirectory(store, dir.path());
    EXPECT_EQ(treeId.hex(), "39339b1397e857d983b3c9463c63cbdbbf2be720");

    const auto entries = parseTreeObject(store.get(treeId).content);
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].mode, "100644");
    EXPECT_EQ(entries[0].filename, "f.txt");
    EXPECT_EQ(entries[0].id.hex(), "56a6051ca2b02b04ef92d5150c9ef600403cb1de");
}

TEST(WriteTreeTest, SkipsGitDirAndEmptyDirectoriesAndSortsEntries) {
    TempDir dir;
    ObjectStore store(dir.path() / ".git");
    writeFile(dir.path() / "zeta.txt", "z");
    writeFile(dir.path() / "alpha.txt", "a");
    writeFile(dir.path() / "lib" / "mod.c", "int x;\n");
    fs::create_directories(dir.path() / "empty");
    writeFile(dir.path() / ".git" / "HEAD", "ref: refs/heads/main\n");

    const ObjectId treeId = writeTreeFromDirectory(store, dir.path());
    const auto entries = parseTreeObject(store.get(treeId).content);

    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[0].filename, "alpha.txt");
    EXPECT_EQ(entries[1].filename, "lib");
    EXPECT_EQ(entries[1].mode, "40000");
    EXPECT_EQ(entries[2].filename, "zeta.txt");

    const auto sub = parseTreeObject(store.get(entries[1].id).content);
    ASSERT_EQ(sub.size(), 1u);
    EXPECT_EQ(sub[0].filename, "mod.c");
}

TEST(WriteTreeTest, ExecutableBitAndSymlinks) {
    TempDir dir;
    ObjectStore store(dir.path() / ".git");
    writeFile(dir.path() / "run.sh", "#!/bin/sh\n");
    fs::permissions(dir.path() / "run.sh", fs::perms::owner_exec, fs::perm_options::add);
    fs::create_symlink("run.sh", dir.path() / "alias");

    const auto entries = parseTreeObject(store.get(writeTreeFromDirectory(store, dir.path())).content);
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].filename, "alias");
    EXPECT_EQ(entries[0].mode, "120000");
    EXPECT_EQ(toString(store.get(entries[0].id).content), "run.sh");
    EXPECT_EQ(entries[1].filename, "run.sh");
    EXPECT_EQ(entries[1].mode, "100755");
}

TEST(LsTreeTest, ListsModesTypesAndNames) {
    TempDir dir;
    ObjectStore store(dir.path() / ".git");
    const ObjectId blobId = store.put(ObjectType::BLOB, toBytes("1"));
    const ObjectId subId = store.put(ObjectType::TREE, encodeTree({{"100644", "f.txt", blobId}}));
    const ObjectId rootId = store.put(ObjectType::TREE, encodeTree({{"40000", "dir", subId}, {"100644", "f.txt", blobId}}));

    std::ostringstream listing;
    printTree(store, rootId, false, listing);
    EXPECT_EQ(listing.str(),
              "040000 tree " + subId.hex() + "\tdir\n"
              "100644 blob " + blobId.hex() + "\tf.txt\n");

    std::ostringstream names;
    printTree(store, rootId, true, names);
    EXPECT_EQ(names.str(), "dir\nf.txt\n");

    std::ostringstream catFile;
    printObject(store, rootId, catFile);
    EXPECT_EQ(catFile.str(), listing.str());

    std::ostringstream ignored;
    EXPECT_THROW(printTree(store, blobId, false, ignored), CorruptObjectError);
}

class CommitTreeTest : public ::testing::Test {
protected:
    void SetUp() override {
        setenv("GIT_AUTHOR_NAME", "Author", 1);
        setenv("GIT_AUTHOR_EMAIL", "author@example.com", 1);
        setenv("GIT_AUTHOR_DATE", "1700000000 +0000", 1);
        setenv("GIT_COMMITTER_NAME", "Committer", 1);
        setenv("GIT_COMMITTER_EMAIL", "committer@example.com", 1);
        setenv("GIT_COMMITTER_DATE", "1700000100 -0700", 1);
    }
    void TearDown() override {
        for (const char* var : {"GIT_AUTHOR_NAME", "GIT_AUTHOR_EMAIL", "GIT_AUTHOR_DATE",
                                "GIT_COMMITTER_NAME", "GIT_COMMITTER_EMAIL", "GIT_COMMITTER_DATE"}) {
            unsetenv(var);
        }
    }

    TempDir dir;
    ObjectStore store{dir.path() / ".git"};
};

TEST_F(CommitTreeTest, WritesCommitWithParent) {
    const ObjectId treeId = store.put(ObjectType::TREE, {});
    const ObjectId parent = ObjectId::fromHex("b6fc4c620b67d95f953a5c1c1230aaab5db5a1b0");

    const ObjectId commitId = commitTree(store, treeId, parent, "second");
    const GitObject commit = store.get(commitId);

    EXPECT_EQ(commit.type, ObjectType::COMMIT);
    EXPECT_EQ(toString(commit.content),
              "tree 4b825dc642cb6eb9a060e54bf8d69288fbee4904\n"
              "parent b6fc4c620b67d95f953a5c1c1230aaab5db5a1b0\n"
              "author Author <author@example.com> 1700000000 +0000\n"
              "committer Committer <committer@example.com> 1700000100 -0700\n"
              "\n"
              "second\n");
}

TEST_F(CommitTreeTest, SameInputsGiveSameCommitId) {
    const ObjectId treeId = store.put(ObjectType::TREE, {});
    EXPECT_EQ(commitTree(store, treeId, std::nullopt, "root"), commitTree(store, treeId, std::nullopt, "root"));
}

TEST_F(CommitTreeTest, RefusesNonTreeObjects) {
    const ObjectId blobId = store.put(ObjectType::BLOB, toBytes("1"));
    EXPECT_THROW(commitTree(store, blobId, std::nullopt, "bad"), CorruptObjectError);

    const ObjectId absent = ObjectStore::hash(ObjectType::TREE, toBytes("nothing"));
    EXPECT_THROW(commitTree(store, absent, std::nullopt, "bad"), CorruptObjectError);
}

TEST(CommandHandlerTest, InitHashObjectAndCatFileFromTheWorkTree) {
    TempDir dir;
    ScopedCurrentPath cwd(dir.path());

    ::testing::internal::CaptureStdout();
    ASSERT_EQ(runCommand(handleInit, {"init"}), EXIT_SUCCESS);
    ::testing::internal::GetCapturedStdout();

    writeFile(dir.path() / "hello.txt", "hello");
    ::testing::internal::CaptureStdout();
    ASSERT_EQ(runCommand(handleHashObject, {"hash-object", "-w", "hello.txt"}), EXIT_SUCCESS);
    EXPECT_EQ(::testing::internal::GetCapturedStdout(), "b6fc4c620b67d95f953a5c1c1230aaab5db5a1b0\n");

    ::testing::internal::CaptureStdout();
    ASSERT_EQ(runCommand(handleCatFile, {"cat-file", "-t", "b6fc4c620b67d95f953a5c1c1230aaab5db5a1b0"}), EXIT_SUCCESS);
    EXPECT_EQ(::testing::internal::GetCapturedStdout(), "blob\n");

    ::testing::internal::CaptureStdout();
    ASSERT_EQ(runCommand(handleCatFile, {"cat-file", "-s", "b6fc4c620b67d95f953a5c1c1230aaab5db5a1b0"}), EXIT_SUCCESS);
    EXPECT_EQ(::testing::internal::GetCapturedStdout(), "5\n");
}

TEST(CommandHandlerTest, BadUsageFails) {
    ::testing::internal::CaptureStderr();
    EXPECT_EQ(runCommand(handleCatFile, {"cat-file", "-x", "abc"}), EXIT_FAILURE);
    EXPECT_EQ(runCommand(handleLsTree, {"ls-tree"}), EXIT_FAILURE);
    ::testing::internal::GetCapturedStderr();
}
