#include <gtest/gtest.h>

#include <filesystem>
#include <set>
#include <thread>

#include "test_utils.hpp"
#include "core/DiffEngine.hpp"
#include "core/RepoChecker.hpp"
#include "sync/SyncContext.hpp"

namespace fs = std::filesystem;

namespace monosync::test {

using namespace monosync::test::utils;

/**
 * @brief Integration tests for small/large repository workflows
 *
 * Tests complete workflows that combine commands and reopen the on-disk
 * state between steps, the way separate monosync processes would.
 */
class SyncWorkflowTest : public ::testing::Test {
protected:
    void SetUp() override {
        tempDir = createTempDir();
        originalCwd = getCwd();
        setCwd(tempDir);

        auto result = runCommand("init", {});
        ASSERT_TRUE(result) << result.error().describe();
    }

    void TearDown() override {
        setCwd(originalCwd);
        removeDir(tempDir);
    }

    std::unique_ptr<SyncContext> open() {
        auto pair = SyncContext::openOnDisk(tempDir);
        if (!pair) throw std::runtime_error(pair.error().describe());
        return std::move(pair.value());
    }

    void commit(const std::vector<std::string>& args) {
        auto result = runCommand("commit", args);
        ASSERT_TRUE(result) << result.error().describe();
    }

    fs::path tempDir;
    fs::path originalCwd;
};

/**
 * @brief Test: Small pushes interleaved with direct large commits
 *
 * The second small push is based on a stale head; it is rebased onto the
 * large commit and the small repository receives the rebased commit.
 */
TEST_F(SyncWorkflowTest, InterleavedPushes) {
    createFile(tempDir, "one.txt", "one");
    createFile(tempDir, "two.txt", "two");

    // 1. Small push
    commit({"--write", "one", "one.txt", "-m", "small one"});

    // 2. Someone commits to the small directory straight in the large repository
    commit({"-r", "large", "--write", "small/server", "two.txt", "--write", "infra/ci", "two.txt", "-m", "server"});

    // 3. Backsync it
    std::string output;
    ASSERT_TRUE(runCommand("sync", {"--to-small", "master"}, &output));
    EXPECT_NE(output.find("1 synced, 0 skipped"), std::string::npos) << output;

    // 4. Another small push, still based on the first commit
    commit({"--write", "two", "two.txt", "-m", "small two"});

    auto pair = open();
    auto smallHead = *pair->small().bookmark("master").value();
    auto largeHead = *pair->large().bookmark("master").value();
    EXPECT_EQ(pair->mapping().getLarge(1, 0, 1, smallHead), largeHead);
    EXPECT_EQ(pair->large().changesets().generation(largeHead).value(), 3u);
    EXPECT_EQ(pair->small().changesets().generation(smallHead).value(), 3u);
    EXPECT_EQ(pair->large().globalrevs().last(), 3u);

    auto smallTree = pair->small().manifests().manifestFor(smallHead);
    ASSERT_TRUE(smallTree);
    EXPECT_EQ(smallTree.value().size(), 3u);
    EXPECT_EQ(smallTree.value().count("server"), 1u);
    EXPECT_EQ(smallTree.value().count("infra/ci"), 0u);

    // 5. Both histories are consistent, and the small log shows all three commits
    for (Repository* repo : {&pair->small(), &pair->large()}) {
        auto failures = RepoChecker(*repo).check(repo == &pair->large() ? largeHead : smallHead, {});
        ASSERT_TRUE(failures);
        EXPECT_TRUE(failures.value().empty()) << repo->name();
    }
    pair.reset();

    ASSERT_TRUE(runCommand("log", {}, &output));
    EXPECT_NE(output.find("small two"), std::string::npos);
    EXPECT_NE(output.find("server"), std::string::npos);
    EXPECT_NE(output.find("small one"), std::string::npos);
}

/**
 * @brief Test: Renames pushed to the small repository read as renames in the large one
 */
TEST_F(SyncWorkflowTest, RenameAndCopyPreserved) {
    createFile(tempDir, "a.txt", "alpha");
    createFile(tempDir, "b.txt", "beta");
    commit({"--write", "a", "a.txt", "--write", "b", "b.txt", "-m", "base"});
    commit({"--move", "a", "moved_a", "--copy", "b", "copied_b", "-m", "rename and copy"});

    std::string output;
    ASSERT_TRUE(runCommand("diff", {"-r", "large", "master"}, &output));
    EXPECT_NE(output.find("rename from small/a to small/moved_a"), std::string::npos) << output;
    EXPECT_NE(output.find("copy from small/b to small/copied_b"), std::string::npos) << output;
}

/**
 * @brief Test: Non-common bookmarks live under the bookmark prefix in the large repository
 */
TEST_F(SyncWorkflowTest, FeatureBookmarkLifecycle) {
    createFile(tempDir, "x.txt", "x");
    commit({"-b", "X", "--write", "x", "x.txt", "-m", "feature"});

    std::string output;
    ASSERT_TRUE(runCommand("bookmarks", {"-r", "large"}, &output));
    EXPECT_NE(output.find("  small/X\t"), std::string::npos);

    ASSERT_TRUE(runCommand("bookmarks", {"--delete", "X"}, &output));
    ASSERT_TRUE(runCommand("bookmarks", {"-r", "large"}, &output));
    EXPECT_EQ(output.find("small/X"), std::string::npos);
    ASSERT_TRUE(runCommand("bookmarks", {}, &output));
    EXPECT_EQ(output, "");
}

/**
 * @brief Test: Concurrent pushes through one context all land with distinct globalrevs
 */
TEST_F(SyncWorkflowTest, ConcurrentPushers) {
    constexpr int kPushers = 4;
    auto pair = open();
    auto base = pair->redirector().push("master", {buildFiles(pair->small(), {}, {{"base", "b"}}, "base")});
    ASSERT_TRUE(base) << base.error().describe();
    ChangesetId smallBase = base.value().smallHead;

    std::vector<Changeset> pushes;
    for (int i = 0; i < kPushers; ++i) {
        pushes.push_back(buildFiles(pair->small(), {smallBase}, {{"file" + std::to_string(i), "v"}},
                                    "push " + std::to_string(i)));
    }

    std::vector<Expected<PushResult>> results(kPushers, Error{ErrorCode::None, "not run"});
    std::vector<std::thread> threads;
    for (int i = 0; i < kPushers; ++i) {
        threads.emplace_back([&, i]() { results[i] = pair->redirector().push("master", {pushes[i]}); });
    }
    for (auto& t : threads) t.join();

    std::set<uint64_t> globalrevs;
    for (int i = 0; i < kPushers; ++i) {
        ASSERT_TRUE(results[i]) << results[i].error().describe();
        ASSERT_EQ(results[i].value().commits.size(), 1u);
        ASSERT_TRUE(results[i].value().commits[0].globalrev);
        globalrevs.insert(*results[i].value().commits[0].globalrev);
    }
    EXPECT_EQ(globalrevs, (std::set<uint64_t>{2, 3, 4, 5}));

    ChangesetId largeHead = *pair->large().bookmark("master").value();
    ChangesetId smallHead = *pair->small().bookmark("master").value();
    EXPECT_EQ(pair->mapping().getLarge(1, 0, 1, smallHead), largeHead);
    EXPECT_EQ(pair->large().changesets().generation(largeHead).value(), 1u + kPushers);

    auto manifest = pair->small().manifests().manifestFor(smallHead);
    ASSERT_TRUE(manifest);
    for (int i = 0; i < kPushers; ++i) {
        EXPECT_EQ(manifest.value().count("file" + std::to_string(i)), 1u);
    }
}

}
