#include "test_helpers.h"

#include <chatport/attachment/attachment_store.h>
#include <chatport/crypto/hasher.h>

#include <gtest/gtest.h>

#include <atomic>
#include <thread>

using namespace chatport;
using namespace chatport::attachment;
using namespace chatport::test;
using nlohmann::json;

class AttachmentStoreTest : public ChatportTest {
protected:
    std::filesystem::path storeDir;

    void SetUp() override {
        ChatportTest::SetUp();
        storeDir = testDir / "attachments";
        std::filesystem::create_directories(storeDir);
    }

    std::shared_ptr<AttachmentStore> makeStore(bool overwrite = false) {
        return std::make_shared<AttachmentStore>(AttachmentStoreConfig{storeDir, overwrite});
    }

    static void writeAndClose(AtomicFileWriter& w, std::string_view body) {
        ASSERT_TRUE(w.write(body));
        ASSERT_TRUE(w.close());
    }
};

TEST_F(AttachmentStoreTest, DestinationIsFingerprintPlusExtension) {
    auto store = makeStore();
    const auto hash = crypto::fingerprintForKey("k1");
    EXPECT_EQ(store->destinationFor("k1", "image/png"), storeDir / (hash + ".png"));
    EXPECT_EQ(store->destinationFor("k1", "image/jpeg"), storeDir / (hash + ".jpg"));
    EXPECT_EQ(store->destinationFor("k1", "application/octet-stream"), storeDir / hash);
}

TEST_F(AttachmentStoreTest, WriteThenGetPathReturnsCompleteFile) {
    auto store = makeStore();
    auto writer = store->reserveWrite("k1", "image/png");
    ASSERT_TRUE(writer) << writer.error().message;
    EXPECT_TRUE(store->hasMapping("k1"));

    writeAndClose(*writer.value(), "PNGDATA");

    auto path = store->getPath("k1");
    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(*path, storeDir / (crypto::fingerprintForKey("k1") + ".png"));
    EXPECT_EQ(readFile(*path), "PNGDATA");
}

TEST_F(AttachmentStoreTest, SecondReserveForSameKeyFails) {
    auto store = makeStore();
    auto first = store->reserveWrite("k1", "image/png");
    ASSERT_TRUE(first);

    auto second = store->reserveWrite("k1", "image/png");
    EXPECT_THAT(second, HasErrorCode(ErrorCode::AlreadyExists));

    // A different media type does not give the key a second path either
    EXPECT_THAT(store->reserveWrite("k1", "image/gif"), HasErrorCode(ErrorCode::AlreadyExists));
}

TEST_F(AttachmentStoreTest, ConcurrentReservesGrantExactlyOneClaim) {
    auto store = makeStore();
    std::atomic<int> granted{0};
    std::atomic<int> refused{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&] {
            auto w = store->reserveWrite("contended", "image/png");
            if (w) {
                ++granted;
            } else if (w.error() == ErrorCode::AlreadyExists) {
                ++refused;
            }
        });
    }
    for (auto& t : threads)
        t.join();

    EXPECT_EQ(granted.load(), 1);
    EXPECT_EQ(refused.load(), 7);
}

TEST_F(AttachmentStoreTest, ExistingDestinationIsAdoptedUnlessOverwrite) {
    const auto dest = storeDir / (crypto::fingerprintForKey("k1") + ".png");
    createTestFileWithContent("previous run", std::filesystem::relative(dest, testDir).string());

    auto store = makeStore();
    EXPECT_THAT(store->reserveWrite("k1", "image/png"), HasErrorCode(ErrorCode::AlreadyExists));
    ASSERT_TRUE(store->getPath("k1").has_value());
    EXPECT_EQ(*store->getPath("k1"), dest);

    auto overwriting = makeStore(/*overwrite=*/true);
    auto w = overwriting->reserveWrite("k1", "image/png");
    ASSERT_TRUE(w) << w.error().message;
    writeAndClose(*w.value(), "fresh");
    EXPECT_EQ(readFile(dest), "fresh");
}

TEST_F(AttachmentStoreTest, AbandonedWriteLeavesNoDestination) {
    auto store = makeStore();
    {
        auto w = store->reserveWrite("k1", "image/png");
        ASSERT_TRUE(w);
        ASSERT_TRUE(w.value()->write(std::string_view{"partial"}));
        // Dropped without close(), as after a crash mid-transfer
    }
    EXPECT_FALSE(std::filesystem::exists(store->destinationFor("k1", "image/png")));
    EXPECT_TRUE(listFiles(storeDir).empty());

    // The claim stays until released; releasing it lets a later attempt write the file
    EXPECT_THAT(store->reserveWrite("k1", "image/png"), HasErrorCode(ErrorCode::AlreadyExists));
    store->releaseClaim("k1");
    EXPECT_FALSE(store->hasMapping("k1"));
    auto retry = store->reserveWrite("k1", "image/png");
    ASSERT_TRUE(retry);
    writeAndClose(*retry.value(), "complete");
    EXPECT_EQ(readFile(*store->getPath("k1")), "complete");
}

TEST_F(AttachmentStoreTest, ReleaseClaimKeepsPublishedFiles) {
    auto store = makeStore();
    auto w = store->reserveWrite("k1", "");
    ASSERT_TRUE(w);
    writeAndClose(*w.value(), "data");

    store->releaseClaim("k1");
    EXPECT_TRUE(store->hasMapping("k1"));
}

TEST_F(AttachmentStoreTest, ScanRediscoversFilesFromEarlierRun) {
    {
        auto store = makeStore();
        auto w = store->reserveWrite("k1", "image/gif");
        ASSERT_TRUE(w);
        writeAndClose(*w.value(), "GIF89a");
    }

    auto fresh = makeStore();
    EXPECT_FALSE(fresh->hasMapping("k1"));
    auto found = fresh->scanForKey("k1");
    ASSERT_TRUE(found) << found.error().message;
    EXPECT_EQ(found.value(), storeDir / (crypto::fingerprintForKey("k1") + ".gif"));
    EXPECT_TRUE(fresh->hasMapping("k1"));

    EXPECT_THAT(fresh->scanForKey("unknown"), HasErrorCode(ErrorCode::NotFound));
}

TEST_F(AttachmentStoreTest, ScanIgnoresTemporaryFilesAndPrefixCollisions) {
    const auto hash = crypto::fingerprintForKey("k1");
    createTestFileWithContent("x", "attachments/tmp-" + hash + ".png-abc123");
    createTestFileWithContent("x", "attachments/" + hash + "extra");

    auto store = makeStore();
    EXPECT_THAT(store->scanForKey("k1"), HasErrorCode(ErrorCode::NotFound));
}

TEST_F(AttachmentStoreTest, ScanWithoutDirectoryIsNotFound) {
    auto store = std::make_shared<AttachmentStore>(
        AttachmentStoreConfig{testDir / "missing", false});
    EXPECT_THAT(store->scanForKey("k1"), HasErrorCode(ErrorCode::NotFound));
}

TEST_F(AttachmentStoreTest, ReserveWithoutBasePathIsInvalidState) {
    AttachmentStore store(AttachmentStoreConfig{});
    EXPECT_THAT(store.reserveWrite("k1", "image/png"), HasErrorCode(ErrorCode::InvalidState));
}

TEST_F(AttachmentStoreTest, SnapshotRoundTripDropsDeletedFiles) {
    const auto snapshot = testDir / "state" / "attachments.json";
    std::filesystem::path p1;
    std::filesystem::path p2;
    {
        auto store = makeStore();
        for (const char* key : {"k1", "k2"}) {
            auto w = store->reserveWrite(key, "image/png");
            ASSERT_TRUE(w);
            writeAndClose(*w.value(), key);
        }
        p1 = *store->getPath("k1");
        p2 = *store->getPath("k2");
        ASSERT_TRUE(store->saveSnapshotFile(snapshot));
    }

    auto doc = json::parse(readFile(snapshot));
    ASSERT_TRUE(doc.contains("Entries"));
    EXPECT_EQ(doc["Entries"]["k1"], p1.string());
    EXPECT_EQ(doc["Entries"]["k2"], p2.string());

    std::filesystem::remove(p2);

    auto restored = makeStore();
    ASSERT_TRUE(restored->loadSnapshotFile(snapshot));
    EXPECT_EQ(restored->size(), 1u);
    ASSERT_TRUE(restored->getPath("k1").has_value());
    EXPECT_EQ(*restored->getPath("k1"), p1);
    EXPECT_FALSE(restored->getPath("k2").has_value());
}

TEST_F(AttachmentStoreTest, SnapshotWithInvalidUtf8KeyIsStillWritten) {
    auto store = makeStore();
    auto w = store->reserveWrite("photo-\xff", "image/png");
    ASSERT_TRUE(w);
    writeAndClose(*w.value(), "PNG");

    const auto snapshot = testDir / "snapshot.json";
    auto r = store->saveSnapshotFile(snapshot);
    ASSERT_TRUE(r) << r.error().message;

    auto doc = json::parse(readFile(snapshot));
    EXPECT_TRUE(doc["Entries"].contains("photo-\xEF\xBF\xBD"));
}

TEST_F(AttachmentStoreTest, LoadSnapshotAcceptsLowercaseField) {
    const auto file = createTestFileWithContent("x", "attachments/existing.png");
    auto store = makeStore();
    ASSERT_TRUE(store->loadSnapshot(json{{"entries", {{"k1", file.string()}}}}));
    EXPECT_EQ(*store->getPath("k1"), file);
}

TEST_F(AttachmentStoreTest, LoadSnapshotKeepsExistingMappings) {
    const auto a = createTestFileWithContent("a", "attachments/a.png");
    const auto b = createTestFileWithContent("b", "attachments/b.png");
    auto store = makeStore();
    ASSERT_TRUE(store->loadSnapshot(json{{"Entries", {{"k1", a.string()}}}}));
    ASSERT_TRUE(store->loadSnapshot(json{{"Entries", {{"k1", b.string()}}}}));
    EXPECT_EQ(*store->getPath("k1"), a);
}

TEST_F(AttachmentStoreTest, MalformedSnapshotIsInvalidData) {
    auto store = makeStore();
    EXPECT_THAT(store->loadSnapshot(json::array()), HasErrorCode(ErrorCode::InvalidData));
    EXPECT_THAT(store->loadSnapshot(json{{"Entries", json::array()}}),
                HasErrorCode(ErrorCode::InvalidData));

    const auto bad = createTestFileWithContent("{not json", "bad.json");
    EXPECT_THAT(store->loadSnapshotFile(bad), HasErrorCode(ErrorCode::InvalidData));
}

TEST_F(AttachmentStoreTest, MissingSnapshotFileIsEmptyState) {
    auto store = makeStore();
    EXPECT_TRUE(store->loadSnapshotFile(testDir / "nope.json"));
    EXPECT_EQ(store->size(), 0u);
}

TEST_F(AttachmentStoreTest, RemoveStaleTempFiles) {
    createTestFileWithContent("x", "attachments/tmp-abc.png-123456");
    createTestFileWithContent("x", "attachments/tmp-def-654321");
    const auto keep = createTestFileWithContent("x", "attachments/keep.png");

    auto store = makeStore();
    EXPECT_EQ(store->removeStaleTempFiles(), 2u);
    auto files = listFiles(storeDir);
    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(files.front(), keep);
}
