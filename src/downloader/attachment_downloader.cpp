/*
 * chatport/src/downloader/attachment_downloader.cpp
 *
 * AttachmentDownloader:
 * - N-slot semaphore acquired by the submitting thread (backpressure), N-thread worker pool
 * - Per item: candidate URLs in order; per URL: GET attempts under the retry predicate with
 *   exponential backoff, bounded by RetryPolicy::maxRetries and RetryPolicy::itemDeadline
 * - Body streamed through a fixed-size copy buffer into the store's atomic writer
 * - AlreadyExists from the store is a successful no-op
 */

#include <chatport/attachment/attachment_store.h>
#include <chatport/attachment/media_type.h>
#include <chatport/downloader/downloader.hpp>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <spdlog/fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <exception>
#include <mutex>
#include <semaphore>
#include <utility>

namespace chatport::downloader {

namespace {

using clock_type = std::chrono::steady_clock;

enum class FetchOutcome { Stored, AlreadyPresent };

// Accumulates body bytes and hands them to the writer in fixed-size blocks
class CopyBuffer {
public:
    CopyBuffer(attachment::AtomicFileWriter& writer, std::size_t capacity)
        : writer_(writer), capacity_(std::max<std::size_t>(capacity, 1)) {
        buffer_.reserve(capacity_);
    }

    Result<void> append(std::span<const std::byte> data) {
        while (!data.empty()) {
            const auto n = std::min(capacity_ - buffer_.size(), data.size());
            buffer_.insert(buffer_.end(), data.begin(), data.begin() + static_cast<long>(n));
            data = data.subspan(n);
            if (buffer_.size() == capacity_) {
                if (auto r = flush(); !r) {
                    return r;
                }
            }
        }
        return {};
    }

    Result<void> flush() {
        if (buffer_.empty()) {
            return {};
        }
        auto r = writer_.write(std::span<const std::byte>(buffer_.data(), buffer_.size()));
        buffer_.clear();
        return r;
    }

private:
    attachment::AtomicFileWriter& writer_;
    std::size_t capacity_;
    std::vector<std::byte> buffer_;
};

// State of one GET attempt
struct AttemptState {
    std::string mediaType;
    std::unique_ptr<attachment::AtomicFileWriter> writer;
    std::unique_ptr<CopyBuffer> buffer;
    std::optional<Error> storeError;
    bool alreadyPresent{false};
};

} // namespace

struct AttachmentDownloader::Impl {
    Impl(std::shared_ptr<attachment::AttachmentStore> s, DownloaderConfig cfg,
         std::unique_ptr<IHttpAdapter> h, RetryPredicate r)
        : store(std::move(s)), config(std::move(cfg)), http(std::move(h)),
          shouldRetry(std::move(r)),
          slots(static_cast<std::ptrdiff_t>(std::max<std::size_t>(config.concurrency, 1))),
          pool(std::max<std::size_t>(config.concurrency, 1)) {
        if (!http)
            http = makeCurlHttpAdapter();
        if (!shouldRetry)
            shouldRetry = makeRetryPredicate(config.retry);
    }

    void downloadItem(const std::string& key, const std::vector<std::string>& urls);
    Result<FetchOutcome> tryDownloadUrl(const std::string& key, const std::string& url);
    bool sleepFor(std::chrono::milliseconds wait);
    void finishTask();
    void recordFailure(const std::string& key, const std::vector<std::string>& urls, Error error);

    std::shared_ptr<attachment::AttachmentStore> store;
    DownloaderConfig config;
    std::unique_ptr<IHttpAdapter> http;
    RetryPredicate shouldRetry;

    std::counting_semaphore<> slots;
    boost::asio::thread_pool pool;

    mutable std::mutex mutex;
    std::condition_variable idleCv;
    std::size_t outstanding{0};
    DownloadStats stats;
    std::vector<DownloadFailure> failures;

    std::atomic<bool> cancelled{false};
    std::mutex cancelMutex;
    std::condition_variable cancelCv;
};

void AttachmentDownloader::Impl::downloadItem(const std::string& key,
                                              const std::vector<std::string>& urls) {
    Error lastError{ErrorCode::NotFound, "no candidate URL"};
    for (std::size_t i = 0; i < urls.size(); ++i) {
        auto r = tryDownloadUrl(key, urls[i]);
        if (r) {
            std::lock_guard<std::mutex> lk(mutex);
            if (r.value() == FetchOutcome::Stored)
                ++stats.stored;
            else
                ++stats.alreadyPresent;
            return;
        }
        lastError = r.error();
        spdlog::warn("Failed to download key #{} {} at {}: {}", i, key, urls[i],
                     lastError.message);
        if (cancelled.load()) {
            break;
        }
    }

    spdlog::error("Unable to download meaningful content for key {}, tried: [{}]", key,
                  fmt::join(urls, ", "));
    recordFailure(key, urls, std::move(lastError));
}

Result<FetchOutcome> AttachmentDownloader::Impl::tryDownloadUrl(const std::string& key,
                                                                const std::string& url) {
    HttpRequest request;
    request.url = url;
    request.headers = config.headers;
    request.cookies = config.cookies;
    request.timeout = config.requestTimeout;
    request.bufferSizeHint = config.copyBufferBytes;

    const auto& policy = config.retry;
    const auto started = clock_type::now();

    for (int attempt = 0;; ++attempt) {
        AttemptState st;

        ResponseHandler onResponse = [&](const HttpResponse& head) -> Result<BodySink> {
            if (shouldRetry(Result<HttpResponse>(head)) || head.status != 200) {
                return BodySink{};
            }
            st.mediaType = head.contentType ? attachment::parseMediaType(*head.contentType) : "";
            if (st.mediaType == "text/html") {
                // No attachment is HTML; this is almost certainly an error or login page
                return BodySink{};
            }

            auto writer = store->reserveWrite(key, st.mediaType);
            if (!writer) {
                if (writer.error().code == ErrorCode::AlreadyExists) {
                    st.alreadyPresent = true;
                    return Error{ErrorCode::OperationCancelled, "attachment already stored"};
                }
                st.storeError = writer.error();
                return writer.error();
            }
            st.writer = std::move(writer).value();
            st.buffer = std::make_unique<CopyBuffer>(*st.writer, config.copyBufferBytes);
            return BodySink{[&st](std::span<const std::byte> data) -> Result<void> {
                return st.buffer->append(data);
            }};
        };

        auto outcome = http->get(request, onResponse);

        if (st.alreadyPresent) {
            spdlog::info("An attachment already exists for {}, skipping.", key);
            return FetchOutcome::AlreadyPresent;
        }
        if (st.storeError) {
            spdlog::error("Failed to create attachment writer for {}: {}", key,
                          st.storeError->message);
            return *st.storeError;
        }

        if (outcome && st.writer) {
            auto flushed = st.buffer->flush();
            auto closed = flushed ? st.writer->close() : Result<void>(flushed.error());
            if (!closed) {
                st.writer.reset();
                store->releaseClaim(key);
                spdlog::error("Could not write file for {}: {}", key, closed.error().message);
                return closed.error();
            }
            spdlog::info("Successfully downloaded {} ({}) ({} byte(s)) from: {} to: {}", key,
                         st.mediaType, st.writer->bytesWritten(), url,
                         st.writer->path().string());
            return FetchOutcome::Stored;
        }

        if (st.writer) {
            // Transfer failed after the claim: drop the partial file and the claim
            st.writer.reset();
            store->releaseClaim(key);
        }

        if (!shouldRetry(outcome)) {
            if (!outcome) {
                return outcome.error();
            }
            const auto& resp = outcome.value();
            if (resp.status != 200) {
                return Error{ErrorCode::HttpError, "download failed, non-OK status code " +
                                                       std::to_string(resp.status)};
            }
            return Error{ErrorCode::UnexpectedMediaType,
                         "got media type \"" + st.mediaType + "\", probably error page"};
        }

        const std::string reason = outcome ? "HTTP " + std::to_string(outcome.value().status)
                                           : outcome.error().message;
        if (cancelled.load()) {
            return Error{ErrorCode::OperationCancelled, "download cancelled (" + reason + ")"};
        }
        if (attempt >= policy.maxRetries) {
            return Error{outcome ? ErrorCode::HttpError : outcome.error().code,
                         "giving up after " + std::to_string(attempt + 1) +
                             " attempt(s): " + reason};
        }

        auto wait = computeBackoff(policy, attempt, outcome ? &outcome.value() : nullptr);
        if (policy.itemDeadline.count() > 0 &&
            clock_type::now() + wait - started > policy.itemDeadline) {
            return Error{ErrorCode::Timeout, "retry deadline exceeded after " +
                                                 std::to_string(attempt + 1) +
                                                 " attempt(s): " + reason};
        }

        spdlog::debug("Retrying {} for {} in {} ms (attempt {}): {}", url, key, wait.count(),
                      attempt + 1, reason);
        if (!sleepFor(wait)) {
            return Error{ErrorCode::OperationCancelled, "download cancelled (" + reason + ")"};
        }
    }
}

bool AttachmentDownloader::Impl::sleepFor(std::chrono::milliseconds wait) {
    std::unique_lock<std::mutex> lk(cancelMutex);
    return !cancelCv.wait_for(lk, wait, [this] { return cancelled.load(); });
}

void AttachmentDownloader::Impl::finishTask() {
    slots.release();
    {
        std::lock_guard<std::mutex> lk(mutex);
        --outstanding;
    }
    idleCv.notify_all();
}

void AttachmentDownloader::Impl::recordFailure(const std::string& key,
                                               const std::vector<std::string>& urls,
                                               Error error) {
    std::lock_guard<std::mutex> lk(mutex);
    ++stats.failed;
    failures.push_back(DownloadFailure{key, urls, std::move(error)});
}

// ---- AttachmentDownloader ----

AttachmentDownloader::AttachmentDownloader(std::shared_ptr<attachment::AttachmentStore> store,
                                           DownloaderConfig config,
                                           std::unique_ptr<IHttpAdapter> http,
                                           RetryPredicate shouldRetry)
    : pImpl(std::make_unique<Impl>(std::move(store), std::move(config), std::move(http),
                                   std::move(shouldRetry))) {}

AttachmentDownloader::~AttachmentDownloader() {
    awaitIdle();
    pImpl->pool.join();
}

bool AttachmentDownloader::submit(std::string key, std::vector<std::string> candidateUrls) {
    auto* impl = pImpl.get();
    if (impl->cancelled.load()) {
        return false;
    }

    auto scan = impl->store->scanForKey(key);
    if (scan) {
        spdlog::info("File for {} already exists, skipping: {}", key, scan.value().string());
        std::lock_guard<std::mutex> lk(impl->mutex);
        ++impl->stats.skipped;
        return false;
    }
    if (scan.error().code != ErrorCode::NotFound) {
        spdlog::error("Could not scan for key {}, downloading anyway: {}", key,
                      scan.error().message);
    }

    if (candidateUrls.empty()) {
        spdlog::warn("Don't know how to get a URL for {}", key);
        return false;
    }

    // Blocks while all slots are in use
    impl->slots.acquire();
    if (impl->cancelled.load()) {
        impl->slots.release();
        return false;
    }
    {
        std::lock_guard<std::mutex> lk(impl->mutex);
        ++impl->outstanding;
        ++impl->stats.submitted;
    }

    boost::asio::post(impl->pool, [impl, key = std::move(key),
                                   urls = std::move(candidateUrls)]() {
        try {
            impl->downloadItem(key, urls);
        } catch (const std::exception& e) {
            spdlog::error("Download of {} failed with exception: {}", key, e.what());
            impl->recordFailure(key, urls, Error{ErrorCode::InternalError, e.what()});
        }
        impl->finishTask();
    });
    return true;
}

void AttachmentDownloader::awaitIdle() {
    std::unique_lock<std::mutex> lk(pImpl->mutex);
    pImpl->idleCv.wait(lk, [this] { return pImpl->outstanding == 0; });
}

void AttachmentDownloader::cancel() noexcept {
    {
        std::lock_guard<std::mutex> lk(pImpl->cancelMutex);
        pImpl->cancelled.store(true);
    }
    pImpl->cancelCv.notify_all();
}

DownloadStats AttachmentDownloader::stats() const {
    std::lock_guard<std::mutex> lk(pImpl->mutex);
    return pImpl->stats;
}

std::vector<DownloadFailure> AttachmentDownloader::failures() const {
    std::lock_guard<std::mutex> lk(pImpl->mutex);
    return pImpl->failures;
}

const DownloaderConfig& AttachmentDownloader::config() const noexcept {
    return pImpl->config;
}

} // namespace chatport::downloader
