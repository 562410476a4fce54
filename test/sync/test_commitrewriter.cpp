#include <gtest/gtest.h>
#include "test_utils.hpp"
#include "core/Constants.hpp"
#include "sync/CommitRewriter.hpp"

using namespace monosync;
using namespace monosync::test::utils;

class CommitRewriterTest : public ::testing::Test {
protected:
    void SetUp() override {
        pair = makeMemoryPair();
        config = pair->configs().current();
    }

    const CommitRewriter& rewriter() { return pair->syncer().rewriter(); }

    void map(const ChangesetId& smallId, const ChangesetId& largeId) {
        ASSERT_TRUE(pair->mapping().insert({1, smallId, 0, largeId, config.version}));
    }

    std::unique_ptr<SyncContext> pair;
    SyncVersionConfig config;
};

// Test: A root commit moves under the prefix and names its source
TEST_F(CommitRewriterTest, RootSmallToLarge) {
    Changeset cs = buildFiles(pair->small(), {}, {{"a", "1"}, {"dir/b", "2"}}, "root");
    cs.extras["reviewer"] = "someone";
    cs.extras["sync.source-id"] = "stale";
    ChangesetId id = cs.computeId();

    auto result = rewriter().rewrite(id, cs, Direction::SmallToLarge, config);
    ASSERT_TRUE(result) << result.error().describe();
    ASSERT_FALSE(result.value().skipped());
    const Changeset& out = *result.value().changeset;
    EXPECT_TRUE(out.parents.empty());
    EXPECT_EQ(out.fileChanges.size(), 2u);
    EXPECT_EQ(out.fileChanges.count("small/a"), 1u);
    EXPECT_EQ(out.fileChanges.count("small/dir/b"), 1u);
    EXPECT_EQ(out.author, cs.author);
    EXPECT_EQ(out.authorTimestamp, cs.authorTimestamp);
    EXPECT_EQ(out.message, "root");
    EXPECT_EQ(out.extra("reviewer"), std::optional<std::string>("someone"));
    EXPECT_EQ(out.extra(Constants::EXTRA_SYNC_SOURCE_REPO), std::optional<std::string>("1"));
    EXPECT_EQ(out.extra(Constants::EXTRA_SYNC_SOURCE_ID), std::optional<std::string>(id.hex()));

    auto source = syncSourceOf(out);
    ASSERT_TRUE(source);
    EXPECT_EQ(source->first, 1);
    EXPECT_EQ(source->second, id);
    EXPECT_FALSE(syncSourceOf(cs));

    auto again = rewriter().rewrite(id, cs, Direction::SmallToLarge, config);
    ASSERT_TRUE(again);
    EXPECT_EQ(again.value().changeset->computeId(), out.computeId());
}

// Test: Parents must be mapped (or overridden) first
TEST_F(CommitRewriterTest, UnsyncedAncestor) {
    ChangesetId root = commitFiles(pair->small(), {}, {{"a", "1"}}, "root");
    Changeset child = buildFiles(pair->small(), {root}, {{"b", "2"}}, "child");

    auto result = rewriter().rewrite(child.computeId(), child, Direction::SmallToLarge, config);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::UnsyncedAncestor);

    ChangesetId largeRoot(std::string(64, 'b'));
    map(root, largeRoot);
    auto mapped = rewriter().rewrite(child.computeId(), child, Direction::SmallToLarge, config);
    ASSERT_TRUE(mapped) << mapped.error().describe();
    EXPECT_EQ(mapped.value().changeset->parents, std::vector<ChangesetId>{largeRoot});
}

// Test: Overrides replace parents, and duplicate substitutes collapse
TEST_F(CommitRewriterTest, ParentOverrides) {
    ChangesetId p1 = commitFiles(pair->small(), {}, {{"a", "1"}}, "p1");
    ChangesetId p2 = commitFiles(pair->small(), {}, {{"b", "2"}}, "p2");
    Changeset merge = buildFiles(pair->small(), {p1, p2}, {{"c", "3"}}, "merge");

    ChangesetId shared(std::string(64, 'd'));
    ParentOverrides overrides{{p1, {shared}}, {p2, {shared}}};
    auto result = rewriter().rewrite(merge.computeId(), merge, Direction::SmallToLarge, config, overrides);
    ASSERT_TRUE(result);
    EXPECT_EQ(result.value().changeset->parents, std::vector<ChangesetId>{shared});

    ParentOverrides none{{p1, {}}, {p2, {}}};
    auto orphan = rewriter().rewrite(merge.computeId(), merge, Direction::SmallToLarge, config, none);
    ASSERT_TRUE(orphan);
    EXPECT_TRUE(orphan.value().changeset->parents.empty());
}

// Test: Large commits touching nothing in scope are skipped or emitted by policy
TEST_F(CommitRewriterTest, OutOfScopeCommits) {
    Changeset outside = buildFiles(pair->large(), {}, {{"tools/build.sh", "x"}}, "tools");
    ChangesetId id = outside.computeId();

    auto skipped = rewriter().rewrite(id, outside, Direction::LargeToSmall, config);
    ASSERT_TRUE(skipped);
    EXPECT_TRUE(skipped.value().skipped());

    SyncVersionConfig emit = config;
    emit.emptyCommits = EmptyCommitPolicy::Emit;
    auto emitted = rewriter().rewrite(id, outside, Direction::LargeToSmall, emit);
    ASSERT_TRUE(emitted);
    ASSERT_FALSE(emitted.value().skipped());
    EXPECT_TRUE(emitted.value().changeset->fileChanges.empty());

    // A commit that never had file changes is kept even when skipping
    Changeset empty = buildFiles(pair->large(), {}, {}, "empty");
    auto kept = rewriter().rewrite(empty.computeId(), empty, Direction::LargeToSmall, config);
    ASSERT_TRUE(kept);
    EXPECT_FALSE(kept.value().skipped());
}

// Test: Copy sources follow the mapped parent or are dropped when out of scope
TEST_F(CommitRewriterTest, CopySources) {
    ChangesetId largeParent = commitFiles(pair->large(), {}, {{"small/a", "1"}, {"tools/t", "2"}}, "base");
    ChangesetId smallParent(std::string(64, 'e'));
    map(smallParent, largeParent);

    auto copy = pair->large().buildCommit({largeParent},
                                          {{"small/b", FileWrite::copy("1", "small/a", largeParent)},
                                           {"small/c", FileWrite::copy("2", "tools/t", largeParent)}},
                                          "copies", "tester");
    ASSERT_TRUE(copy);
    auto result = rewriter().rewrite(copy.value().computeId(), copy.value(), Direction::LargeToSmall, config);
    ASSERT_TRUE(result) << result.error().describe();
    const Changeset& out = *result.value().changeset;
    ASSERT_TRUE(out.fileChanges.at("b").copyFrom);
    EXPECT_EQ(out.fileChanges.at("b").copyFrom->path, "a");
    EXPECT_EQ(out.fileChanges.at("b").copyFrom->changeset, smallParent);
    EXPECT_FALSE(out.fileChanges.at("c").copyFrom);
    EXPECT_TRUE(out.verify());
}
