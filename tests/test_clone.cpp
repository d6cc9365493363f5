#include <gtest/gtest.h>

#include <filesystem>
#include <sstream>
#include <string>
#include <vector>

#include "test_helpers.h"
#include "clone.h"
#include "smart_http_client.h"
#include "commit_codec.h"
#include "tree_codec.h"
#include "object_store.h"
#include "errors.h"

namespace fs = std::filesystem;

static constexpr std::string_view BASE_CONTENT = "hello world\n";
static constexpr std::string_view DELTA_CONTENT = "hello there\n";

// A remote holding one commit whose tree has a literal blob and a blob sent as a ref-delta.
class CloneTest : public ::testing::Test {
protected:
    void SetUp() override {
        baseId = ObjectStore::hash(ObjectType::BLOB, toBytes(BASE_CONTENT));
        deltaId = ObjectStore::hash(ObjectType::BLOB, toBytes(DELTA_CONTENT));

        const std::vector<std::byte> treeBody = encodeTree({{"100644", "a.txt", baseId},
                                                            {"100644", "b.txt", deltaId}});
        treeId = ObjectStore::hash(ObjectType::TREE, treeBody);

        CommitData commit;
        commit.tree = treeId;
        commit.author = {"Remote", "remote@example.com", 1700000000, "+0000"};
        commit.committer = commit.author;
        commit.message = "initial";
        const std::vector<std::byte> commitBody = encodeCommit(commit);
        commitId = ObjectStore::hash(ObjectType::COMMIT, commitBody);

        delta = deltaHeader(BASE_CONTENT.size(), DELTA_CONTENT.size());
        appendCopy(delta, 0, 6);
        appendInsert(delta, "there\n");

        pack.addObject(PackObjectType::COMMIT, commitBody)
            .addObject(PackObjectType::TREE, treeBody)
            .addObject(PackObjectType::BLOB, BASE_CONTENT)
            .addRefDelta(baseId, delta);

        transport.get_response.body = advertisement({{commitId, "HEAD"}, {commitId, "refs/heads/main"}},
                                                    "symref=HEAD:refs/heads/main agent=git/2.43.0");
        transport.post_response.body = uploadPackResponse(pack.buildWithChecksum());
    }

    TempDir parent;
    fs::path target() const { return parent.path() / "repo"; }

    ObjectId baseId, deltaId, treeId, commitId;
    std::vector<std::byte> delta;
    PackBuilder pack;
    FakeTransport transport;
};

TEST_F(CloneTest, ClonesObjectsRefsAndWorkingTree) {
    const CloneResult result = cloneRepository("https://example.com/repo.git", target(), transport);

    EXPECT_EQ(result.git_dir, target() / ".git");
    EXPECT_EQ(result.head_ref, std::optional<std::string>("refs/heads/main"));
    ASSERT_TRUE(result.head_commit.has_value());
    EXPECT_EQ(*result.head_commit, commitId);
    EXPECT_EQ(result.ref_count, 1u);
    EXPECT_EQ(result.stats.object_count, 4u);
    EXPECT_EQ(result.stats.literal_count, 3u);
    EXPECT_EQ(result.stats.delta_count, 1u);

    // The delta result is stored under its own content hash, not its base's.
    const ObjectStore store(result.git_dir);
    EXPECT_NE(deltaId, baseId);
    ASSERT_TRUE(store.contains(deltaId));
    EXPECT_EQ(toString(store.get(deltaId).content), DELTA_CONTENT);

    EXPECT_EQ(readFile(target() / "a.txt"), BASE_CONTENT);
    EXPECT_EQ(readFile(target() / "b.txt"), DELTA_CONTENT);
    EXPECT_EQ(readFile(target() / ".git" / "refs" / "heads" / "main"), commitId.hex() + "\n");
    EXPECT_EQ(readFile(target() / ".git" / "HEAD"), "ref: refs/heads/main\n");

    ASSERT_EQ(transport.post_urls.size(), 1u);
    EXPECT_EQ(transport.post_body, buildUploadPackRequest({commitId}));
}

TEST_F(CloneTest, HeadWithoutBranchIsDetached) {
    transport.get_response.body = advertisement({{commitId, "HEAD"}, {commitId, "refs/tags/v1"}}, "");

    const CloneResult result = cloneRepository("https://example.com/repo", target(), transport);

    EXPECT_FALSE(result.head_ref.has_value());
    EXPECT_EQ(readFile(target() / ".git" / "HEAD"), commitId.hex() + "\n");
    EXPECT_EQ(readFile(target() / ".git" / "refs" / "tags" / "v1"), commitId.hex() + "\n");
    EXPECT_EQ(readFile(target() / "b.txt"), DELTA_CONTENT);
}

TEST_F(CloneTest, ChecksumMismatchLeavesNoRepository) {
    std::vector<std::byte> corrupted = pack.buildWithChecksum();
    corrupted.back() ^= std::byte{0xFF};
    transport.post_response.body = uploadPackResponse(corrupted);

    EXPECT_THROW(cloneRepository("https://example.com/repo.git", target(), transport), ProtocolError);
    EXPECT_FALSE(fs::exists(target() / ".git"));
}

TEST_F(CloneTest, HttpFailureLeavesNoRepository) {
    transport.get_response = {404, "Repository not found", {}};

    EXPECT_THROW(cloneRepository("https://example.com/missing.git", target(), transport), ProtocolError);
    EXPECT_TRUE(transport.post_urls.empty());
    EXPECT_FALSE(fs::exists(target() / ".git"));
}

TEST_F(CloneTest, MissingDeltaBaseFailsTheClone) {
    PackBuilder incomplete;
    incomplete.addRefDelta(baseId, delta);
    transport.post_response.body = uploadPackResponse(incomplete.buildWithChecksum());

    EXPECT_THROW(cloneRepository("https://example.com/repo.git", target(), transport), MissingBaseError);
}

TEST_F(CloneTest, EmptyRemoteGivesAnEmptyRepository) {
    transport.get_response.body = advertisement({{ObjectId{}, "capabilities^{}"}}, "agent=git/2.43.0");

    const CloneResult result = cloneRepository("https://example.com/empty.git", target(), transport);

    EXPECT_FALSE(result.head_commit.has_value());
    EXPECT_TRUE(transport.post_urls.empty());
    EXPECT_EQ(readFile(target() / ".git" / "HEAD"), "ref: refs/heads/main\n");
    EXPECT_TRUE(fs::is_directory(target() / ".git" / "objects"));
}

TEST_F(CloneTest, NonEmptyDestinationIsRefused) {
    writeFile(target() / "existing.txt", "keep me");

    EXPECT_THROW(cloneRepository("https://example.com/repo.git", target(), transport), GitError);
    EXPECT_TRUE(transport.get_urls.empty());
    EXPECT_EQ(readFile(target() / "existing.txt"), "keep me");
}

TEST_F(CloneTest, EmptyExistingDestinationIsAccepted) {
    fs::create_directories(target());
    const CloneResult result = cloneRepository("https://example.com/repo.git", target(), transport);
    EXPECT_TRUE(result.head_commit.has_value());
    EXPECT_EQ(readFile(target() / "a.txt"), BASE_CONTENT);
}

TEST_F(CloneTest, HeadNamingAnUnadvertisedBranchIsNotAnEmptyClone) {
    transport.get_response.body = advertisement({{commitId, "HEAD"}, {commitId, "refs/heads/main"}},
                                                "symref=HEAD:refs/heads/gone");

    const CloneResult result = cloneRepository("https://example.com/repo.git", target(), transport);

    EXPECT_FALSE(result.head_commit.has_value());
    EXPECT_EQ(result.ref_count, 1u);
    EXPECT_EQ(readFile(target() / ".git" / "HEAD"), "ref: refs/heads/gone\n");
    EXPECT_FALSE(fs::exists(target() / "a.txt"));

    std::ostringstream report;
    reportClone(result, report);
    EXPECT_EQ(report.str(), "warning: remote HEAD refers to nonexistent ref, unable to checkout\n");
}

TEST_F(CloneTest, ReportsEmptyAndCheckedOutClones) {
    transport.get_response.body = advertisement({{ObjectId{}, "capabilities^{}"}}, "");
    const CloneResult empty = cloneRepository("https://example.com/empty.git", parent.path() / "empty", transport);
    std::ostringstream emptyReport;
    reportClone(empty, emptyReport);
    EXPECT_EQ(emptyReport.str(), "warning: You appear to have cloned an empty repository.\n");

    transport.get_response.body = advertisement({{commitId, "HEAD"}, {commitId, "refs/heads/main"}},
                                                "symref=HEAD:refs/heads/main");
    const CloneResult full = cloneRepository("https://example.com/repo.git", target(), transport);
    std::ostringstream fullReport;
    reportClone(full, fullReport);
    EXPECT_EQ(fullReport.str(), "Received 4 objects (3 literal, 1 deltas), 1 refs.\n"
                                "HEAD is now at " + commitId.hex().substr(0, 7) + " (refs/heads/main)\n");
}

TEST(InferCloneDirectoryTest, UsesTheLastPathSegment) {
    EXPECT_EQ(inferCloneDirectory("https://github.com/user/project.git"), fs::path("project"));
    EXPECT_EQ(inferCloneDirectory("https://github.com/user/project/"), fs::path("project"));
    EXPECT_EQ(inferCloneDirectory("http://localhost:8080/tools"), fs::path("tools"));
    EXPECT_THROW(inferCloneDirectory("https://example.com/.git"), GitError);
}
