#include "fake_http_adapter.h"
#include "test_helpers.h"

#include <chatport/attachment/attachment_store.h>
#include <chatport/crypto/hasher.h>
#include <chatport/downloader/downloader.hpp>

#include <gtest/gtest.h>

#include <thread>

using namespace chatport;
using namespace chatport::downloader;
using namespace chatport::test;
using namespace std::chrono_literals;

class AttachmentDownloaderTest : public ChatportTest {
protected:
    std::filesystem::path storeDir;
    std::shared_ptr<attachment::AttachmentStore> store;
    std::shared_ptr<FakeHttpAdapter::State> http;
    DownloaderConfig config;

    void SetUp() override {
        ChatportTest::SetUp();
        storeDir = testDir / "attachments";
        std::filesystem::create_directories(storeDir);
        store = std::make_shared<attachment::AttachmentStore>(
            attachment::AttachmentStoreConfig{storeDir, false});
        http = std::make_shared<FakeHttpAdapter::State>();

        config.retry.minWait = 1ms;
        config.retry.maxWait = 5ms;
    }

    void script(const std::string& url, std::vector<ScriptedResponse> responses) {
        std::lock_guard<std::mutex> lk(http->mutex);
        http->scripts[url] = std::deque<ScriptedResponse>(responses.begin(), responses.end());
    }

    int calls(const std::string& url) {
        std::lock_guard<std::mutex> lk(http->mutex);
        return http->calls[url];
    }

    std::unique_ptr<AttachmentDownloader> makeDownloader() {
        return std::make_unique<AttachmentDownloader>(store, config,
                                                      std::make_unique<FakeHttpAdapter>(http));
    }

    std::filesystem::path expectedPath(const std::string& key, const std::string& ext) {
        return storeDir / (crypto::fingerprintForKey(key) + (ext.empty() ? "" : "." + ext));
    }
};

TEST_F(AttachmentDownloaderTest, EndToEndWithRetryAndPermanentFailure) {
    script("https://h/1", {{200, "image/png", "PNG-ONE"}});
    script("https://h/2", {{429, "text/plain", ""}, {200, "image/jpeg", "JPEG-TWO"}});
    script("https://h/3", {{404, "text/plain", "not here"}});

    auto downloader = makeDownloader();
    EXPECT_TRUE(downloader->submit("k1", {"https://h/1"}));
    EXPECT_TRUE(downloader->submit("k2", {"https://h/2"}));
    EXPECT_TRUE(downloader->submit("k3", {"https://h/3"}));
    downloader->awaitIdle();

    EXPECT_EQ(readFile(expectedPath("k1", "png")), "PNG-ONE");
    EXPECT_EQ(readFile(expectedPath("k2", "jpg")), "JPEG-TWO");
    EXPECT_FALSE(store->hasMapping("k3"));
    EXPECT_EQ(listFiles(storeDir).size(), 2u);

    EXPECT_EQ(calls("https://h/2"), 2);
    EXPECT_EQ(calls("https://h/3"), 1);

    auto stats = downloader->stats();
    EXPECT_EQ(stats.submitted, 3u);
    EXPECT_EQ(stats.stored, 2u);
    EXPECT_EQ(stats.failed, 1u);

    auto failures = downloader->failures();
    ASSERT_EQ(failures.size(), 1u);
    EXPECT_EQ(failures[0].key, "k3");
    EXPECT_EQ(failures[0].error.code, ErrorCode::HttpError);
}

TEST_F(AttachmentDownloaderTest, ConcurrencyNeverExceedsSlots) {
    config.concurrency = 5;
    {
        std::lock_guard<std::mutex> lk(http->mutex);
        http->latency = 20ms;
    }
    for (int i = 0; i < 20; ++i) {
        script("https://h/" + std::to_string(i), {{200, "image/png", "body-" + std::to_string(i)}});
    }

    auto downloader = makeDownloader();
    for (int i = 0; i < 20; ++i) {
        EXPECT_TRUE(downloader->submit("k" + std::to_string(i), {"https://h/" + std::to_string(i)}));
    }
    downloader->awaitIdle();

    std::lock_guard<std::mutex> lk(http->mutex);
    EXPECT_LE(http->peakInFlight, 5);
    EXPECT_GE(http->peakInFlight, 1);
    EXPECT_EQ(downloader->stats().stored, 20u);
    EXPECT_EQ(listFiles(storeDir).size(), 20u);
}

TEST_F(AttachmentDownloaderTest, KnownKeyIsSkippedWithoutRequest) {
    auto w = store->reserveWrite("k1", "image/png");
    ASSERT_TRUE(w);
    ASSERT_TRUE(w.value()->write(std::string_view{"stored earlier"}));
    ASSERT_TRUE(w.value()->close());

    script("https://h/1", {{200, "image/png", "new"}});
    auto downloader = makeDownloader();
    EXPECT_FALSE(downloader->submit("k1", {"https://h/1"}));
    downloader->awaitIdle();

    EXPECT_EQ(calls("https://h/1"), 0);
    EXPECT_EQ(downloader->stats().skipped, 1u);
    EXPECT_EQ(readFile(expectedPath("k1", "png")), "stored earlier");
}

TEST_F(AttachmentDownloaderTest, FileFromEarlierRunIsFoundByScan) {
    createTestFileWithContent("old", "attachments/" + crypto::fingerprintForKey("k1") + ".gif");

    auto downloader = makeDownloader();
    EXPECT_FALSE(downloader->submit("k1", {"https://h/1"}));
    EXPECT_EQ(calls("https://h/1"), 0);
    EXPECT_EQ(*store->getPath("k1"), expectedPath("k1", "gif"));
}

TEST_F(AttachmentDownloaderTest, NoCandidatesIsNotScheduled) {
    auto downloader = makeDownloader();
    EXPECT_FALSE(downloader->submit("k1", {}));
    EXPECT_EQ(downloader->stats().submitted, 0u);
}

TEST_F(AttachmentDownloaderTest, FallsBackToNextCandidate) {
    script("https://a/1", {{404, "text/plain", ""}});
    script("https://b/1", {{200, "video/mp4", "MP4"}});

    auto downloader = makeDownloader();
    ASSERT_TRUE(downloader->submit("k1", {"https://a/1", "https://b/1"}));
    downloader->awaitIdle();

    EXPECT_EQ(readFile(expectedPath("k1", "mp4")), "MP4");
    EXPECT_EQ(downloader->stats().stored, 1u);
    EXPECT_TRUE(downloader->failures().empty());
}

TEST_F(AttachmentDownloaderTest, HtmlResponseIsRejected) {
    script("https://h/1", {{200, "text/html; charset=utf-8", "<html>login</html>"}});

    auto downloader = makeDownloader();
    ASSERT_TRUE(downloader->submit("k1", {"https://h/1"}));
    downloader->awaitIdle();

    EXPECT_TRUE(listFiles(storeDir).empty());
    EXPECT_FALSE(store->hasMapping("k1"));
    auto failures = downloader->failures();
    ASSERT_EQ(failures.size(), 1u);
    EXPECT_EQ(failures[0].error.code, ErrorCode::UnexpectedMediaType);
}

TEST_F(AttachmentDownloaderTest, NotImplementedIsNotRetried) {
    script("https://h/1", {{501, "text/plain", ""}});

    auto downloader = makeDownloader();
    ASSERT_TRUE(downloader->submit("k1", {"https://h/1"}));
    downloader->awaitIdle();

    EXPECT_EQ(calls("https://h/1"), 1);
    EXPECT_EQ(downloader->stats().failed, 1u);
}

TEST_F(AttachmentDownloaderTest, RetriesStopAtMaxRetries) {
    config.retry.maxRetries = 2;
    script("https://h/1", {{503, "text/plain", ""}});

    auto downloader = makeDownloader();
    ASSERT_TRUE(downloader->submit("k1", {"https://h/1"}));
    downloader->awaitIdle();

    EXPECT_EQ(calls("https://h/1"), 3);
    ASSERT_EQ(downloader->failures().size(), 1u);
    EXPECT_EQ(downloader->failures()[0].error.code, ErrorCode::HttpError);
}

TEST_F(AttachmentDownloaderTest, ItemDeadlineBoundsRetries) {
    config.retry.minWait = 200ms;
    config.retry.maxWait = 200ms;
    config.retry.itemDeadline = 50ms;
    script("https://h/1", {{503, "text/plain", ""}});

    auto downloader = makeDownloader();
    ASSERT_TRUE(downloader->submit("k1", {"https://h/1"}));
    downloader->awaitIdle();

    EXPECT_EQ(calls("https://h/1"), 1);
    ASSERT_EQ(downloader->failures().size(), 1u);
    EXPECT_EQ(downloader->failures()[0].error.code, ErrorCode::Timeout);
}

TEST_F(AttachmentDownloaderTest, TransportErrorIsRetried) {
    ScriptedResponse reset;
    reset.transportError = Error{ErrorCode::NetworkError, "connection reset"};
    script("https://h/1", {reset, {200, "image/png", "after reset"}});

    auto downloader = makeDownloader();
    ASSERT_TRUE(downloader->submit("k1", {"https://h/1"}));
    downloader->awaitIdle();

    EXPECT_EQ(calls("https://h/1"), 2);
    EXPECT_EQ(readFile(expectedPath("k1", "png")), "after reset");
}

TEST_F(AttachmentDownloaderTest, BodyCutOffMidwayIsDiscardedAndRetried) {
    config.copyBufferBytes = 2; // partial bytes reach the temporary file
    ScriptedResponse cut{200, "image/png", "PARTIAL-BODY"};
    cut.failAfterBytes = 6;
    script("https://h/1", {cut, {200, "image/png", "FULLBODY"}});

    auto downloader = makeDownloader();
    ASSERT_TRUE(downloader->submit("k1", {"https://h/1"}));
    downloader->awaitIdle();

    EXPECT_EQ(calls("https://h/1"), 2);
    EXPECT_TRUE(store->hasMapping("k1"));
    auto files = listFiles(storeDir);
    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(files[0], expectedPath("k1", "png"));
    EXPECT_EQ(readFile(files[0]), "FULLBODY");

    auto stats = downloader->stats();
    EXPECT_EQ(stats.stored, 1u);
    EXPECT_EQ(stats.failed, 0u);
}

TEST_F(AttachmentDownloaderTest, BodyCutOffReleasesClaimForNextCandidate) {
    config.copyBufferBytes = 2;
    config.retry.maxRetries = 0;
    ScriptedResponse cut{200, "image/jpeg", "JPEG-PARTIAL"};
    cut.failAfterBytes = 3;
    script("https://a/1", {cut});
    script("https://b/1", {{200, "image/jpeg", "JPEG-WHOLE"}});

    auto downloader = makeDownloader();
    ASSERT_TRUE(downloader->submit("k1", {"https://a/1", "https://b/1"}));
    downloader->awaitIdle();

    auto files = listFiles(storeDir);
    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(readFile(expectedPath("k1", "jpg")), "JPEG-WHOLE");
    EXPECT_TRUE(store->hasMapping("k1"));
    EXPECT_TRUE(downloader->failures().empty());
}

TEST_F(AttachmentDownloaderTest, WriteFailureOnFlushLeavesNothingBehind) {
    config.copyBufferBytes = 1 << 20; // whole body stays buffered until the final flush
    script("https://h/1", {{200, "image/png", std::string(64 * 1024, 'p')}});

    auto downloader = makeDownloader();
    {
        ScopedFileSizeLimit limit(1024);
        ASSERT_TRUE(downloader->submit("k1", {"https://h/1"}));
        downloader->awaitIdle();
    }

    EXPECT_EQ(calls("https://h/1"), 1);
    EXPECT_TRUE(listFiles(storeDir).empty());
    EXPECT_FALSE(store->hasMapping("k1"));
    ASSERT_EQ(downloader->failures().size(), 1u);
    EXPECT_EQ(downloader->failures()[0].error.code, ErrorCode::IoError);

    // The claim was released, so a later fetch can still store the key
    script("https://h/2", {{200, "image/png", "small"}});
    ASSERT_TRUE(downloader->submit("k1", {"https://h/2"}));
    downloader->awaitIdle();
    EXPECT_EQ(readFile(expectedPath("k1", "png")), "small");
}

TEST_F(AttachmentDownloaderTest, TlsFailureIsNotRetried) {
    ScriptedResponse tls;
    tls.transportError = Error{ErrorCode::TlsVerificationFailed, "bad certificate"};
    script("https://h/1", {tls});

    auto downloader = makeDownloader();
    ASSERT_TRUE(downloader->submit("k1", {"https://h/1"}));
    downloader->awaitIdle();

    EXPECT_EQ(calls("https://h/1"), 1);
    ASSERT_EQ(downloader->failures().size(), 1u);
    EXPECT_EQ(downloader->failures()[0].error.code, ErrorCode::TlsVerificationFailed);
}

TEST_F(AttachmentDownloaderTest, ConcurrentWriterMakesFetchANoOp) {
    script("https://h/1", {{200, "image/png", "late copy"}});
    {
        std::lock_guard<std::mutex> lk(http->mutex);
        http->beforeResponse = [this](const std::string&) {
            auto w = store->reserveWrite("k1", "image/png");
            if (w && w.value()->write(std::string_view{"first copy"})) {
                (void)w.value()->close();
            }
        };
    }

    auto downloader = makeDownloader();
    ASSERT_TRUE(downloader->submit("k1", {"https://h/1"}));
    downloader->awaitIdle();

    EXPECT_EQ(readFile(expectedPath("k1", "png")), "first copy");
    auto stats = downloader->stats();
    EXPECT_EQ(stats.alreadyPresent, 1u);
    EXPECT_EQ(stats.failed, 0u);
}

TEST_F(AttachmentDownloaderTest, SmallCopyBufferStillWritesWholeBody) {
    config.copyBufferBytes = 4;
    const std::string body(1000, 'z');
    script("https://h/1", {{200, "image/gif", body}});

    auto downloader = makeDownloader();
    ASSERT_TRUE(downloader->submit("k1", {"https://h/1"}));
    downloader->awaitIdle();

    EXPECT_EQ(readFile(expectedPath("k1", "gif")), body);
}

TEST_F(AttachmentDownloaderTest, CookiesAndHeadersAreSent) {
    config.cookies = {{"SID", "abc"}, {"HSID", "def"}};
    config.headers = {{"User-Agent", "chatport-test"}};
    script("https://h/1", {{200, "image/png", "x"}});

    auto downloader = makeDownloader();
    ASSERT_TRUE(downloader->submit("k1", {"https://h/1"}));
    downloader->awaitIdle();

    std::lock_guard<std::mutex> lk(http->mutex);
    ASSERT_EQ(http->requests.size(), 1u);
    const auto& req = http->requests.front();
    ASSERT_EQ(req.cookies.size(), 2u);
    EXPECT_EQ(req.cookies[0].name, "SID");
    EXPECT_EQ(req.cookies[1].value, "def");
    ASSERT_EQ(req.headers.size(), 1u);
    EXPECT_EQ(req.headers[0].value, "chatport-test");
}

TEST_F(AttachmentDownloaderTest, CancelInterruptsBackoff) {
    config.retry.minWait = 10s;
    config.retry.maxWait = 10s;
    script("https://h/1", {{503, "text/plain", ""}});

    auto downloader = makeDownloader();
    ASSERT_TRUE(downloader->submit("k1", {"https://h/1"}));
    while (calls("https://h/1") == 0) {
        std::this_thread::sleep_for(1ms);
    }

    const auto started = std::chrono::steady_clock::now();
    downloader->cancel();
    downloader->awaitIdle();
    EXPECT_LT(std::chrono::steady_clock::now() - started, 5s);

    ASSERT_EQ(downloader->failures().size(), 1u);
    EXPECT_EQ(downloader->failures()[0].error.code, ErrorCode::OperationCancelled);
    EXPECT_FALSE(downloader->submit("k2", {"https://h/2"}));
}
