#include <gtest/gtest.h>
#include <atomic>
#include <functional>
#include <thread>
#include "test_utils.hpp"
#include "sync/Pushrebase.hpp"

using namespace monosync;
using namespace monosync::test::utils;

namespace {

/**
 * @brief Bookmark store that runs a hook before every compare-and-swap
 *
 * Lets a test move a bookmark between the engine's read and its swap.
 */
class RacingBookmarkStore : public BookmarkStore {
public:
    Expected<std::optional<ChangesetId>> read(RepositoryId repo, const std::string& name) const override {
        return inner.read(repo, name);
    }

    Expected<bool> compareAndSwap(RepositoryId repo, const std::string& name,
                                  const std::optional<ChangesetId>& expected,
                                  const ChangesetId& newValue) override {
        if (beforeSwap) beforeSwap();
        return inner.compareAndSwap(repo, name, expected, newValue);
    }

    Expected<bool> remove(RepositoryId repo, const std::string& name, const ChangesetId& expected) override {
        return inner.remove(repo, name, expected);
    }

    Expected<BookmarkList> list(RepositoryId repo, const std::string& prefix) const override {
        return inner.list(repo, prefix);
    }

    InMemoryBookmarkStore inner;
    std::function<void()> beforeSwap;
};

}

class PushrebaseTest : public ::testing::Test {
protected:
    void SetUp() override {
        bookmarks = std::make_shared<RacingBookmarkStore>();
        repo = Repository::inMemory(0, "large", bookmarks);
        base = commitFiles(*repo, {}, {{"shared.txt", "base"}, {"dir/file", "d"}}, "base");
        ASSERT_TRUE(bookmarks->inner.compareAndSwap(0, "master", std::nullopt, base).value());
    }

    /// Commit on top of master directly, as another pusher would
    ChangesetId landServerCommit(const std::string& path, const std::string& content) {
        ChangesetId head = *repo->bookmark("master").value();
        ChangesetId next = commitFiles(*repo, {head}, {{path, content}}, "server " + path);
        EXPECT_TRUE(bookmarks->inner.compareAndSwap(0, "master", head, next).value());
        return next;
    }

    ChangesetId master() { return *repo->bookmark("master").value(); }

    std::shared_ptr<RacingBookmarkStore> bookmarks;
    std::unique_ptr<Repository> repo;
    ChangesetId base;
};

// Test: Bookmark at the base is fast-forwarded without new commits
TEST_F(PushrebaseTest, FastForward) {
    ChangesetId c1 = commitFiles(*repo, {base}, {{"a", "1"}}, "c1");
    ChangesetId c2 = commitFiles(*repo, {c1}, {{"b", "2"}}, "c2");

    PushrebaseEngine engine(*repo, PushrebaseParams{});
    auto outcome = engine.rebase("master", {c2, c1});
    ASSERT_TRUE(outcome) << outcome.error().describe();
    EXPECT_TRUE(outcome.value().published);
    EXPECT_EQ(outcome.value().oldHead, base);
    EXPECT_EQ(outcome.value().newHead, c2);
    ASSERT_EQ(outcome.value().rebased.size(), 2u);
    EXPECT_EQ(outcome.value().rebased[0], std::make_pair(c1, c1));
    EXPECT_EQ(master(), c2);
}

// Test: Absent bookmarks are created at the pushed tip
TEST_F(PushrebaseTest, CreatesAbsentBookmark) {
    ChangesetId c1 = commitFiles(*repo, {base}, {{"a", "1"}}, "c1");
    PushrebaseEngine engine(*repo, PushrebaseParams{});
    auto outcome = engine.rebase("release", {c1});
    ASSERT_TRUE(outcome);
    EXPECT_FALSE(outcome.value().oldHead);
    EXPECT_EQ(repo->bookmark("release").value(), c1);
}

// Test: Non-conflicting pushes are re-parented on the moved head
TEST_F(PushrebaseTest, RebasesOntoMovedHead) {
    ChangesetId c1 = commitFiles(*repo, {base}, {{"client.txt", "c"}}, "client");
    ChangesetId server = landServerCommit("server.txt", "s");

    PushrebaseEngine engine(*repo, PushrebaseParams{});
    auto outcome = engine.rebase("master", {c1});
    ASSERT_TRUE(outcome) << outcome.error().describe();
    ASSERT_EQ(outcome.value().rebased.size(), 1u);
    ChangesetId landed = outcome.value().rebased[0].second;
    EXPECT_NE(landed, c1);
    EXPECT_EQ(master(), landed);
    EXPECT_EQ(repo->changesets().parents(landed).value(), std::vector<ChangesetId>{server});

    auto manifest = repo->manifests().manifestFor(landed);
    ASSERT_TRUE(manifest);
    EXPECT_EQ(manifest.value().count("client.txt"), 1u);
    EXPECT_EQ(manifest.value().count("server.txt"), 1u);

    auto cs = repo->changesets().get(landed);
    ASSERT_TRUE(cs);
    EXPECT_EQ(cs.value().message, "client");
}

// Test: Overlapping paths abort the push and leave the bookmark alone
TEST_F(PushrebaseTest, ConflictAborts) {
    ChangesetId c1 = commitFiles(*repo, {base}, {{"shared.txt", "client"}, {"new.txt", "n"}}, "client");
    ChangesetId server = landServerCommit("shared.txt", "server");

    PushrebaseEngine engine(*repo, PushrebaseParams{});
    auto outcome = engine.rebase("master", {c1});
    ASSERT_FALSE(outcome);
    EXPECT_EQ(outcome.error().code, ErrorCode::RebaseConflict);
    EXPECT_EQ(outcome.error().details, std::vector<std::string>{"shared.txt"});
    EXPECT_EQ(master(), server);
}

// Test: A file replacing a directory conflicts with changes inside it
TEST_F(PushrebaseTest, DirectoryConflict) {
    auto replace = repo->createCommit({base}, {{"dir/file", FileWrite::remove()}, {"dir", FileWrite::write("now a file")}},
                                      "replace dir", "tester");
    ASSERT_TRUE(replace);
    landServerCommit("dir/other", "o");

    PushrebaseEngine engine(*repo, PushrebaseParams{});
    auto outcome = engine.rebase("master", {replace.value()});
    ASSERT_FALSE(outcome);
    EXPECT_EQ(outcome.error().code, ErrorCode::RebaseConflict);
    EXPECT_EQ(outcome.error().details.front(), "dir");
}

// Test: Pushed commits already in the bookmark's history publish nothing
TEST_F(PushrebaseTest, AlreadyLanded) {
    ChangesetId server = landServerCommit("x", "x");
    PushrebaseEngine engine(*repo, PushrebaseParams{});
    auto outcome = engine.rebase("master", {base});
    ASSERT_TRUE(outcome);
    EXPECT_FALSE(outcome.value().published);
    EXPECT_EQ(outcome.value().newHead, server);
}

// Test: A root batch is checked against the whole tree of the head
TEST_F(PushrebaseTest, RootBatch) {
    ChangesetId clash = commitFiles(*repo, {}, {{"dir/file", "mine"}}, "clash");
    ChangesetId fresh = commitFiles(*repo, {}, {{"fresh.txt", "f"}}, "fresh");

    PushrebaseEngine engine(*repo, PushrebaseParams{});
    auto conflict = engine.rebase("master", {clash});
    ASSERT_FALSE(conflict);
    EXPECT_EQ(conflict.error().code, ErrorCode::RebaseConflict);

    auto outcome = engine.rebase("master", {fresh});
    ASSERT_TRUE(outcome) << outcome.error().describe();
    EXPECT_EQ(repo->changesets().parents(master()).value(), std::vector<ChangesetId>{base});
}

// Test: Malformed batches are rejected
TEST_F(PushrebaseTest, InvalidBatches) {
    ChangesetId a = commitFiles(*repo, {base}, {{"a", "1"}}, "a");
    ChangesetId b = commitFiles(*repo, {base}, {{"b", "2"}}, "b");
    PushrebaseEngine engine(*repo, PushrebaseParams{});

    EXPECT_EQ(engine.rebase("master", {}).error().code, ErrorCode::InvalidArgs);
    EXPECT_EQ(engine.rebase("master", {a, b}).error().code, ErrorCode::InvalidArgs);
    EXPECT_EQ(engine.rebase("bad..name/", {a}).error().code, ErrorCode::InvalidArgs);
    EXPECT_EQ(master(), base);
}

// Test: A lost race is retried against the new head
TEST_F(PushrebaseTest, RetriesAfterLostRace) {
    ChangesetId c1 = commitFiles(*repo, {base}, {{"client.txt", "c"}}, "client");
    bool raced = false;
    bookmarks->beforeSwap = [&]() {
        if (raced) return;
        raced = true;
        landServerCommit("racer.txt", "r");
    };

    PushrebaseEngine engine(*repo, PushrebaseParams{});
    auto outcome = engine.rebase("master", {c1});
    ASSERT_TRUE(outcome) << outcome.error().describe();
    EXPECT_EQ(outcome.value().retries, 1);
    auto manifest = repo->manifests().manifestFor(master());
    ASSERT_TRUE(manifest);
    EXPECT_EQ(manifest.value().count("racer.txt"), 1u);
    EXPECT_EQ(manifest.value().count("client.txt"), 1u);
}

// Test: A bookmark that moves on every attempt exhausts the retries
TEST_F(PushrebaseTest, TooManyRetries) {
    ChangesetId c1 = commitFiles(*repo, {base}, {{"client.txt", "c"}}, "client");
    int races = 0;
    bookmarks->beforeSwap = [&]() {
        landServerCommit("racer" + std::to_string(races++), "r");
    };

    PushrebaseEngine engine(*repo, PushrebaseParams{2});
    auto outcome = engine.rebase("master", {c1});
    ASSERT_FALSE(outcome);
    EXPECT_EQ(outcome.error().code, ErrorCode::TooManyRetries);
    EXPECT_EQ(races, 3);
}

// Test: Concurrent pushes of disjoint files all land, one after another
TEST_F(PushrebaseTest, ConcurrentDisjointPushes) {
    constexpr int kPushers = 8;
    std::vector<ChangesetId> pushed;
    for (int i = 0; i < kPushers; ++i) {
        pushed.push_back(commitFiles(*repo, {base}, {{"pusher" + std::to_string(i), "p"}}, "push " + std::to_string(i)));
    }

    std::atomic<int> failures{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < kPushers; ++i) {
        threads.emplace_back([&, i]() {
            PushrebaseEngine engine(*repo, PushrebaseParams{100});
            auto outcome = engine.rebase("master", {pushed[i]});
            if (!outcome || !outcome.value().published) ++failures;
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(failures.load(), 0);
    auto manifest = repo->manifests().manifestFor(master());
    ASSERT_TRUE(manifest);
    for (int i = 0; i < kPushers; ++i) {
        EXPECT_EQ(manifest.value().count("pusher" + std::to_string(i)), 1u);
    }
    EXPECT_EQ(repo->changesets().generation(master()).value(), 1u + kPushers);
}

// Test: Paths collide when equal or when one is a directory of the other
TEST(ConflictingPathsTest, PrefixRules) {
    std::set<std::string> server{"a/b", "c", "docs/readme"};
    EXPECT_EQ(conflictingPaths({"a/b"}, server), std::vector<std::string>{"a/b"});
    EXPECT_EQ(conflictingPaths({"a"}, server), std::vector<std::string>{"a"});
    EXPECT_EQ(conflictingPaths({"c/d"}, server), std::vector<std::string>{"c/d"});
    EXPECT_TRUE(conflictingPaths({"a/bc", "ab", "doc", "cc"}, server).empty());
}

// Test: Bookmark helpers keep to creation and fast-forward moves
TEST_F(PushrebaseTest, BookmarkHelpers) {
    ChangesetId next = commitFiles(*repo, {base}, {{"n", "n"}}, "next");
    PushrebaseEngine engine(*repo, PushrebaseParams{});

    EXPECT_TRUE(engine.createBookmark("feature", base).value());
    EXPECT_FALSE(engine.createBookmark("feature", base).value());
    EXPECT_EQ(engine.createBookmark("ghost", ChangesetId(std::string(64, 'f'))).error().code, ErrorCode::NotFound);

    EXPECT_TRUE(engine.moveBookmark("feature", base, next).value());
    EXPECT_EQ(engine.moveBookmark("feature", next, base).error().code, ErrorCode::InvalidArgs);

    EXPECT_FALSE(engine.deleteBookmark("feature", base).value());
    EXPECT_TRUE(engine.deleteBookmark("feature", next).value());
    EXPECT_FALSE(repo->bookmark("feature").value());
}
