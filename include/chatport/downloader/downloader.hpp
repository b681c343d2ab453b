#pragma once

/*
 * chatport attachment downloader - public types and interfaces
 *
 * The downloader consumes (logical key, candidate URLs) requests, runs a bounded number of
 * fetches in parallel, retries transient failures with exponential backoff and publishes each
 * successful body through the AttachmentStore's atomic writer.
 *
 * Separation of concerns:
 * - IHttpAdapter: one GET attempt (libcurl implementation in http_adapter_curl.cpp)
 * - RetryPredicate / computeBackoff: which outcomes are transient and how long to wait
 * - AttachmentDownloader: slots, worker pool, candidate loop, store interaction
 */

#include <chatport/core/types.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace chatport::attachment {
class AttachmentStore;
}

namespace chatport::downloader {

// ===================
// Small data objects
// ===================

/**
 * HTTP header key/value pair.
 */
struct Header {
    std::string name;
    std::string value;
};

/**
 * Session cookie sent with every request.
 */
struct Cookie {
    std::string name;
    std::string value;
};

/**
 * Retry/backoff policy.
 * The wait before retry n (0-based) is minWait * 2^n, capped at maxWait.
 */
struct RetryPolicy {
    std::chrono::milliseconds minWait{5000};
    std::chrono::milliseconds maxWait{60000};
    int maxRetries{std::numeric_limits<int>::max()};
    std::chrono::milliseconds itemDeadline{0}; // 0 = no deadline per candidate URL
    std::vector<long> retryStatuses;           // extra transient statuses
};

/**
 * Downloader configuration.
 */
struct DownloaderConfig {
    std::size_t concurrency{5};
    std::size_t copyBufferBytes{4ull * 1024ull * 1024ull}; // 4 MiB
    std::chrono::milliseconds requestTimeout{0};           // 0 = no transfer timeout
    RetryPolicy retry{};
    std::vector<Cookie> cookies;
    std::vector<Header> headers;
};

/**
 * A single GET request.
 */
struct HttpRequest {
    std::string url;
    std::vector<Header> headers;
    std::vector<Cookie> cookies;
    std::chrono::milliseconds timeout{0};
    std::size_t bufferSizeHint{0};
};

/**
 * Final response head (after redirects).
 */
struct HttpResponse {
    long status{0};
    std::optional<std::string> contentType;
    std::optional<std::string> retryAfter;
    std::uint64_t bodyBytes{0};
};

// ===================
// Callback signatures
// ===================

using BodySink = std::function<Result<void>(std::span<const std::byte>)>;

/**
 * Called once per attempt when the response head is final, before any body byte.
 * Return a sink to receive the body, an empty sink to discard it, or an error to abort the
 * transfer (the adapter then returns that error).
 */
using ResponseHandler = std::function<Result<BodySink>(const HttpResponse&)>;

/**
 * Decides whether the outcome of one attempt is transient and should be retried.
 */
using RetryPredicate = std::function<bool(const Result<HttpResponse>&)>;

// ==========================
// Service interface classes
// ==========================

/**
 * HTTP adapter abstraction (libcurl-based implementation satisfies this).
 */
class IHttpAdapter {
public:
    virtual ~IHttpAdapter() = default;

    /**
     * Perform one GET. Transport failures are returned as errors (NetworkError, Timeout,
     * TlsVerificationFailed, ...); any HTTP status is a successful result.
     */
    virtual Result<HttpResponse> get(const HttpRequest& request,
                                     const ResponseHandler& onResponse) = 0;
};

std::unique_ptr<IHttpAdapter> makeCurlHttpAdapter();

// =====================
// Retry policy helpers
// =====================

/**
 * Default transient-failure policy: transport errors other than TLS verification, invalid
 * requests, local I/O and cancellation; status 0, 429 and 5xx except 501.
 */
bool defaultShouldRetry(const Result<HttpResponse>& outcome);

/**
 * Default policy extended with policy.retryStatuses.
 */
RetryPredicate makeRetryPredicate(const RetryPolicy& policy);

/**
 * Wait before retry number attempt (0-based). A Retry-After value in seconds on a 429 or 503
 * response takes precedence; every wait is capped at policy.maxWait.
 */
std::chrono::milliseconds computeBackoff(const RetryPolicy& policy, int attempt,
                                         const HttpResponse* response = nullptr);

// =========================
// Attachment downloader
// =========================

struct DownloadStats {
    std::uint64_t submitted{0};
    std::uint64_t skipped{0};
    std::uint64_t stored{0};
    std::uint64_t alreadyPresent{0};
    std::uint64_t failed{0};
};

struct DownloadFailure {
    std::string key;
    std::vector<std::string> urls;
    Error error;
};

/**
 * Bounded-concurrency attachment fetcher.
 *
 * submit() blocks while all slots are busy, which bounds in-flight transfers without an
 * unbounded queue. Items whose key the store can already resolve are skipped. An item whose
 * candidates all fail is logged and recorded in failures(); it is not retried later.
 */
class AttachmentDownloader {
public:
    AttachmentDownloader(std::shared_ptr<attachment::AttachmentStore> store,
                         DownloaderConfig config, std::unique_ptr<IHttpAdapter> http = nullptr,
                         RetryPredicate shouldRetry = {});
    ~AttachmentDownloader();

    AttachmentDownloader(const AttachmentDownloader&) = delete;
    AttachmentDownloader& operator=(const AttachmentDownloader&) = delete;

    /**
     * Schedule key for download from the first working candidate URL.
     * Returns false without scheduling anything when the key is already stored, no candidate
     * is given, or the downloader was cancelled.
     */
    bool submit(std::string key, std::vector<std::string> candidateUrls);

    // Block until every scheduled fetch has completed and released its slot.
    void awaitIdle();

    // Refuse new work and stop retrying; transfers already on the wire run to completion.
    void cancel() noexcept;

    [[nodiscard]] DownloadStats stats() const;
    [[nodiscard]] std::vector<DownloadFailure> failures() const;
    [[nodiscard]] const DownloaderConfig& config() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace chatport::downloader
