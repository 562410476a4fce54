#include <gtest/gtest.h>
#include <algorithm>
#include <filesystem>
#include <memory>
#include "test_utils.hpp"
#include "core/Blobstore.hpp"
#include "core/ChangesetStore.hpp"
#include "core/Constants.hpp"

namespace fs = std::filesystem;

using namespace monosync;
using namespace monosync::test::utils;

class ChangesetStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        blobs = std::make_shared<MemoryBlobstore>();
        store = std::make_unique<ChangesetStore>(blobs);
    }

    ChangesetId put(const std::vector<ChangesetId>& parents, const std::string& path, const std::string& content) {
        Changeset cs;
        cs.parents = parents;
        auto contentId = store->putContent(content);
        EXPECT_TRUE(contentId);
        cs.fileChanges[path] = FileChange::modified(contentId.value(), content.size());
        cs.author = "tester";
        cs.message = path + "=" + content;
        auto id = store->put(cs);
        EXPECT_TRUE(id) << id.error().describe();
        return id.value();
    }

    std::shared_ptr<MemoryBlobstore> blobs;
    std::unique_ptr<ChangesetStore> store;
};

// Test: put/get and idempotent re-put
TEST_F(ChangesetStoreTest, PutGet) {
    ChangesetId root = put({}, "a", "1");
    auto cs = store->get(root);
    ASSERT_TRUE(cs);
    EXPECT_EQ(cs.value().computeId(), root);

    size_t before = blobs->size();
    ChangesetId again = put({}, "a", "1");
    EXPECT_EQ(again, root);
    EXPECT_EQ(blobs->size(), before);
}

// Test: Parents must already be stored
TEST_F(ChangesetStoreTest, RejectsMissingParent) {
    Changeset cs;
    cs.parents = {ChangesetId(std::string(64, 'f'))};
    cs.message = "orphan";
    auto id = store->put(cs);
    ASSERT_FALSE(id);
    EXPECT_EQ(id.error().code, ErrorCode::InvalidArgs);
}

// Test: Unknown id is NotFound
TEST_F(ChangesetStoreTest, GetMissing) {
    auto cs = store->get(ChangesetId(std::string(64, '0')));
    ASSERT_FALSE(cs);
    EXPECT_EQ(cs.error().code, ErrorCode::NotFound);
}

// Test: Stored bytes that do not hash to the id are CorruptObject
TEST_F(ChangesetStoreTest, DetectsCorruption) {
    ChangesetId root = put({}, "a", "1");
    Changeset other;
    other.message = "tampered";
    auto tamperedBlobs = std::make_shared<MemoryBlobstore>();
    tamperedBlobs->put(std::string(Constants::KEY_CHANGESET) + "." + root.hex(), other.serialize());
    tamperedBlobs->put(std::string(Constants::KEY_GENERATION) + "." + root.hex(), "1");
    ChangesetStore corrupt(tamperedBlobs);

    auto cs = corrupt.get(root);
    ASSERT_FALSE(cs);
    EXPECT_EQ(cs.error().code, ErrorCode::CorruptObject);
}

// Test: Generation numbers and ancestry
TEST_F(ChangesetStoreTest, GenerationAndAncestry) {
    ChangesetId a = put({}, "a", "1");
    ChangesetId b = put({a}, "b", "2");
    ChangesetId c = put({a}, "c", "3");
    ChangesetId merge = put({b, c}, "m", "4");

    EXPECT_EQ(store->generation(a).value(), 1u);
    EXPECT_EQ(store->generation(b).value(), 2u);
    EXPECT_EQ(store->generation(merge).value(), 3u);

    EXPECT_TRUE(store->isAncestor(a, merge).value());
    EXPECT_TRUE(store->isAncestor(c, merge).value());
    EXPECT_TRUE(store->isAncestor(b, b).value());
    EXPECT_FALSE(store->isAncestor(b, c).value());
    EXPECT_FALSE(store->isAncestor(merge, a).value());
}

// Test: difference returns children before parents
TEST_F(ChangesetStoreTest, Difference) {
    ChangesetId a = put({}, "a", "1");
    ChangesetId b = put({a}, "b", "2");
    ChangesetId c = put({b}, "c", "3");
    ChangesetId side = put({a}, "s", "4");
    ChangesetId merge = put({c, side}, "m", "5");

    auto diff = store->difference({merge}, {b});
    ASSERT_TRUE(diff);
    ASSERT_EQ(diff.value().size(), 3u);
    EXPECT_EQ(diff.value().front(), merge);
    EXPECT_NE(std::find(diff.value().begin(), diff.value().end(), c), diff.value().end());
    EXPECT_NE(std::find(diff.value().begin(), diff.value().end(), side), diff.value().end());

    auto none = store->difference({b}, {c});
    ASSERT_TRUE(none);
    EXPECT_TRUE(none.value().empty());
}

// Test: Contents are content addressed and copied between stores on demand
TEST_F(ChangesetStoreTest, ContentsAndImport) {
    auto id = store->putContent("hello");
    ASSERT_TRUE(id);
    EXPECT_EQ(id.value(), ChangesetStore::contentIdOf("hello"));
    EXPECT_EQ(store->getContent(id.value()).value(), "hello");

    ChangesetId a = put({}, "a", "payload");
    ChangesetStore other(std::make_shared<MemoryBlobstore>());
    auto cs = store->get(a);
    ASSERT_TRUE(cs);

    auto copied = other.importContents(*store, cs.value());
    ASSERT_TRUE(copied) << copied.error().describe();
    EXPECT_EQ(copied.value(), 1u);
    EXPECT_EQ(other.getContent(cs.value().fileChanges.at("a").contentId).value(), "payload");
    EXPECT_EQ(other.importContents(*store, cs.value()).value(), 0u);
}

// Test: A store over a FileBlobstore survives reopening
TEST(ChangesetStoreFileTest, PersistsAcrossInstances) {
    fs::path dir = createTempDir();
    ChangesetId id;
    {
        ChangesetStore store(std::make_shared<FileBlobstore>(dir));
        Changeset cs;
        cs.message = "root";
        auto put = store.put(cs);
        ASSERT_TRUE(put) << put.error().describe();
        id = put.value();
    }
    ChangesetStore reopened(std::make_shared<FileBlobstore>(dir));
    auto cs = reopened.get(id);
    ASSERT_TRUE(cs) << cs.error().describe();
    EXPECT_EQ(cs.value().message, "root");
    EXPECT_EQ(reopened.generation(id).value(), 1u);
    removeDir(dir);
}
