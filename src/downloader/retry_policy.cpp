/*
 * Retry predicate and exponential backoff for attachment fetches.
 *
 * Transient: transport failures (other than TLS verification, malformed requests, local I/O and
 * cancellation), a missing status, 429 and server errors except 501 Not Implemented.
 */

#include <chatport/downloader/downloader.hpp>

#include <algorithm>
#include <charconv>
#include <cctype>
#include <system_error>

namespace chatport::downloader {

namespace {

std::optional<long> parseRetryAfterSeconds(std::string_view value) {
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.front())))
        value.remove_prefix(1);
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back())))
        value.remove_suffix(1);
    if (value.empty())
        return std::nullopt;

    long seconds = 0;
    auto res = std::from_chars(value.data(), value.data() + value.size(), seconds);
    if (res.ec != std::errc() || res.ptr != value.data() + value.size() || seconds < 0) {
        return std::nullopt; // HTTP-date form is not honoured
    }
    return seconds;
}

} // namespace

bool defaultShouldRetry(const Result<HttpResponse>& outcome) {
    if (!outcome) {
        switch (outcome.error().code) {
            case ErrorCode::TlsVerificationFailed:
            case ErrorCode::InvalidArgument:
            case ErrorCode::IoError:
            case ErrorCode::AlreadyExists:
            case ErrorCode::OperationCancelled:
            case ErrorCode::InvalidState:
                return false;
            default:
                return true;
        }
    }

    const long status = outcome.value().status;
    if (status == 0 || status == 429) {
        return true;
    }
    return status >= 500 && status != 501;
}

RetryPredicate makeRetryPredicate(const RetryPolicy& policy) {
    return [extra = policy.retryStatuses](const Result<HttpResponse>& outcome) {
        if (defaultShouldRetry(outcome)) {
            return true;
        }
        if (!outcome) {
            return false;
        }
        return std::find(extra.begin(), extra.end(), outcome.value().status) != extra.end();
    };
}

std::chrono::milliseconds computeBackoff(const RetryPolicy& policy, int attempt,
                                         const HttpResponse* response) {
    const auto cap = std::max(policy.maxWait, policy.minWait);

    if (response != nullptr && (response->status == 429 || response->status == 503) &&
        response->retryAfter) {
        if (auto seconds = parseRetryAfterSeconds(*response->retryAfter)) {
            // Clamp before converting to avoid overflowing the millisecond count
            const long capSeconds =
                static_cast<long>(std::chrono::duration_cast<std::chrono::seconds>(cap).count()) + 1;
            auto wait = std::chrono::milliseconds(std::min(*seconds, capSeconds) * 1000);
            return std::min(wait, cap);
        }
    }

    auto wait = policy.minWait;
    for (int i = 0; i < attempt && wait.count() > 0 && wait < cap; ++i) {
        wait *= 2;
    }
    return std::min(wait, cap);
}

} // namespace chatport::downloader
