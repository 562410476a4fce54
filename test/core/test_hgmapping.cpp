#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include "test_utils.hpp"
#include "core/HgMapping.hpp"
#include "core/IdentifierResolver.hpp"

namespace fs = std::filesystem;

using namespace monosync;
using namespace monosync::test::utils;

class HgMappingTest : public ::testing::Test {
protected:
    void SetUp() override {
        tempDir = createTempDir();
        bookmarks = std::make_shared<InMemoryBookmarkStore>();
        repo = Repository::inMemory(0, "large", bookmarks);
    }

    void TearDown() override {
        removeDir(tempDir);
    }

    fs::path tempDir;
    std::shared_ptr<InMemoryBookmarkStore> bookmarks;
    std::unique_ptr<Repository> repo;
};

// Test: Hg ids are 40 hex, derived for ancestors too, and resolvable both ways
TEST_F(HgMappingTest, DeriveWithAncestors) {
    ChangesetId a = commitFiles(*repo, {}, {{"a", "1"}}, "a");
    ChangesetId b = commitFiles(*repo, {a}, {{"b", "2"}}, "b");

    auto hg = repo->hgIdOf(b);
    ASSERT_TRUE(hg) << hg.error().describe();
    EXPECT_EQ(hg.value().hex().size(), 40u);
    EXPECT_TRUE(repo->hgIds().get(a).has_value());
    EXPECT_EQ(repo->hgIds().getChangeset(hg.value()), b);
    EXPECT_EQ(repo->hgIdOf(b).value(), hg.value());
}

// Test: Same tree, author, date and message give the same hg id in another repository
TEST_F(HgMappingTest, DeterministicAcrossRepositories) {
    auto other = Repository::inMemory(1, "other", bookmarks);
    ChangesetId here = commitFiles(*repo, {}, {{"x", "same"}}, "msg");
    ChangesetId there = commitFiles(*other, {}, {{"x", "same"}}, "msg");
    EXPECT_EQ(repo->hgIdOf(here).value(), other->hgIdOf(there).value());

    ChangesetId different = commitFiles(*other, {}, {{"x", "other"}}, "msg");
    EXPECT_NE(repo->hgIdOf(here).value(), other->hgIdOf(different).value());
}

// Test: Recorded ids survive reopening
TEST_F(HgMappingTest, Persists) {
    ChangesetId a = commitFiles(*repo, {}, {{"a", "1"}}, "a");
    HgChangesetId hg;
    {
        auto mapping = HgMapping::open(tempDir / "hg_mapping");
        ASSERT_TRUE(mapping);
        auto derived = mapping.value()->derive(repo->changesets(), repo->manifests(), a);
        ASSERT_TRUE(derived);
        hg = derived.value();
    }
    auto reopened = HgMapping::open(tempDir / "hg_mapping");
    ASSERT_TRUE(reopened);
    EXPECT_EQ(reopened.value()->get(a), hg);
    EXPECT_EQ(HgMapping::nullId().hex(), std::string(40, '0'));
}

// Test: Commits with the same tree that differ in copy metadata or extras get distinct hg ids
TEST_F(HgMappingTest, CopyMetadataAndExtrasDistinguishIds) {
    ChangesetId base = commitFiles(*repo, {}, {{"a", "content"}}, "base");

    auto moved = repo->createCommit({base},
                                    {{"a", FileWrite::remove()}, {"b", FileWrite::copy("content", "a", base)}},
                                    "move", "test");
    auto plain = repo->createCommit({base},
                                    {{"a", FileWrite::remove()}, {"b", FileWrite::write("content")}},
                                    "move", "test");
    ASSERT_TRUE(moved && plain);
    ASSERT_NE(moved.value(), plain.value());
    EXPECT_EQ(repo->manifests().manifestFor(moved.value()).value(),
              repo->manifests().manifestFor(plain.value()).value());

    auto built = repo->buildCommit({base}, {{"c", FileWrite::write("x")}}, "extras", "test");
    ASSERT_TRUE(built);
    Changeset tagged = built.value();
    tagged.extras["label"] = "one";
    auto untagged = repo->changesets().put(built.value());
    auto withExtra = repo->changesets().put(tagged);
    ASSERT_TRUE(untagged && withExtra);

    auto hgMoved = repo->hgIdOf(moved.value());
    auto hgPlain = repo->hgIdOf(plain.value());
    auto hgUntagged = repo->hgIdOf(untagged.value());
    auto hgTagged = repo->hgIdOf(withExtra.value());
    ASSERT_TRUE(hgMoved && hgPlain && hgUntagged && hgTagged);
    EXPECT_NE(hgMoved.value(), hgPlain.value());
    EXPECT_NE(hgUntagged.value(), hgTagged.value());

    IdentifierResolver resolver(*repo);
    EXPECT_EQ(resolver.resolve(HgSpec{hgPlain.value()}).value(), plain.value());
    EXPECT_EQ(resolver.resolve(HgSpec{hgMoved.value()}).value(), moved.value());
    EXPECT_EQ(resolver.resolve(HgSpec{hgTagged.value()}).value(), withExtra.value());
}

// Test: A table recording one hg id for two changesets does not open
TEST_F(HgMappingTest, DuplicateHgIdIsCorrupt) {
    {
        std::ofstream out(tempDir / "hg_mapping");
        out << std::string(64, 'a') << "\t" << std::string(40, 'c') << "\n";
        out << std::string(64, 'b') << "\t" << std::string(40, 'c') << "\n";
    }
    auto mapping = HgMapping::open(tempDir / "hg_mapping");
    ASSERT_FALSE(mapping);
    EXPECT_EQ(mapping.error().code, ErrorCode::CorruptObject);
}
