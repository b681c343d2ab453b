/*
 * http_adapter_curl.cpp
 *
 * Notes
 * - One GET per call using the libcurl easy API; redirects followed, TLS verified.
 * - Response headers are parsed per hop; only the final hop is reported to the handler.
 * - The handler is consulted before the first body byte (or after the transfer for an empty
 *   body); a sink error aborts the transfer and is returned verbatim.
 *
 * Build
 * - Linked via CURL::libcurl; logging via spdlog.
 */

#include <chatport/downloader/downloader.hpp>

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <mutex>
#include <string_view>

namespace chatport::downloader {

// Local helper: lowercase copy
static std::string to_lower(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s)
        out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}

// Local helper: trim whitespace
static std::string trim(std::string_view s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b])))
        ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
        --e;
    return std::string{s.substr(b, e - b)};
}

// Map CURLcode to Error
static Error makeCurlError(CURLcode code, std::string_view where) {
    Error err;
    err.message = std::string(where) + ": " + curl_easy_strerror(code);
    switch (code) {
        case CURLE_OK:
            err.code = ErrorCode::Success;
            break;
        case CURLE_OPERATION_TIMEDOUT:
            err.code = ErrorCode::Timeout;
            break;
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
        /* CURLE_SSL_CACERT is an alias of CURLE_PEER_FAILED_VERIFICATION in newer libcurl */
        case CURLE_SSL_CACERT_BADFILE:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CIPHER:
        case CURLE_SSL_ISSUER_ERROR:
            err.code = ErrorCode::TlsVerificationFailed;
            break;
        case CURLE_UNSUPPORTED_PROTOCOL:
        case CURLE_URL_MALFORMAT:
        case CURLE_TOO_MANY_REDIRECTS:
            err.code = ErrorCode::InvalidArgument;
            break;
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_COULDNT_CONNECT:
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_PARTIAL_FILE:
        case CURLE_HTTP2:
        case CURLE_HTTP2_STREAM:
            err.code = ErrorCode::NetworkError;
            break;
        default:
            err.code = ErrorCode::Unknown;
            break;
    }
    return err;
}

// Header parser context (reset on every status line, so it describes the last hop)
struct HeaderParseContext {
    std::optional<std::string> contentType;
    std::optional<std::string> retryAfter;
};

// CURL header callback
static size_t header_cb(char* buffer, size_t size, size_t nitems, void* userdata) {
    const size_t total = size * nitems;
    if (total == 0 || userdata == nullptr)
        return 0;

    auto* ctx = static_cast<HeaderParseContext*>(userdata);
    std::string_view line(buffer, total);

    // Strip CRLF
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.remove_suffix(1);
    }

    if (line.size() >= 5 && to_lower(line.substr(0, 5)) == "http/") {
        *ctx = HeaderParseContext{};
        return total;
    }

    // We expect "Key: Value"
    auto colon = line.find(':');
    if (colon == std::string_view::npos)
        return total;

    auto key = to_lower(trim(line.substr(0, colon)));
    auto val = trim(line.substr(colon + 1));

    if (key == "content-type") {
        ctx->contentType = std::move(val);
    } else if (key == "retry-after") {
        ctx->retryAfter = std::move(val);
    }

    return total;
}

// Per-transfer state shared by the callbacks
struct TransferContext {
    CURL* curl{nullptr};
    const ResponseHandler* onResponse{nullptr};
    HeaderParseContext headers;
    HttpResponse response;
    BodySink sink;
    bool dispatched{false};
    std::optional<Error> abortError;
};

static HttpResponse snapshotResponse(TransferContext& ctx) {
    HttpResponse resp;
    long status = 0;
    curl_easy_getinfo(ctx.curl, CURLINFO_RESPONSE_CODE, &status);
    resp.status = status;
    resp.contentType = ctx.headers.contentType;
    resp.retryAfter = ctx.headers.retryAfter;
    return resp;
}

static bool dispatchResponse(TransferContext& ctx) {
    ctx.dispatched = true;
    ctx.response = snapshotResponse(ctx);
    if (ctx.onResponse == nullptr || !*ctx.onResponse) {
        return true;
    }
    auto r = (*ctx.onResponse)(ctx.response);
    if (!r) {
        ctx.abortError = r.error();
        return false;
    }
    ctx.sink = std::move(r).value();
    return true;
}

// CURL write callback
static size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const size_t total = size * nmemb;
    if (userdata == nullptr)
        return 0;

    auto* ctx = static_cast<TransferContext*>(userdata);
    if (!ctx->dispatched && !dispatchResponse(*ctx)) {
        return 0; // signal error to curl => CURLE_WRITE_ERROR
    }
    if (total == 0)
        return 0;

    ctx->response.bodyBytes += static_cast<std::uint64_t>(total);
    if (!ctx->sink) {
        return total; // discard
    }

    std::span<const std::byte> bytes{reinterpret_cast<const std::byte*>(ptr), total};
    auto r = ctx->sink(bytes);
    if (!r) {
        ctx->abortError = r.error();
        return 0;
    }
    return total;
}

// Helper to build curl_slist from headers
static curl_slist* build_header_list(const std::vector<Header>& headers) {
    curl_slist* list = nullptr;
    for (const auto& h : headers) {
        std::string line = h.name;
        line.append(": ");
        line.append(h.value);
        list = curl_slist_append(list, line.c_str());
    }
    return list;
}

static std::string build_cookie_string(const std::vector<Cookie>& cookies) {
    std::string out;
    for (const auto& c : cookies) {
        if (!out.empty())
            out.append("; ");
        out.append(c.name);
        out.push_back('=');
        out.append(c.value);
    }
    return out;
}

// Common CURL easy handle configuration
static void configure_common(CURL* curl, std::chrono::milliseconds timeout) {
    // Timeouts (0 = none for the transfer; connect phase is always bounded)
    if (timeout.count() > 0) {
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
    }
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, 30000L);

    // Redirects
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 10L);

    // TLS
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);

    // Robustness
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPIDLE, 30L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPINTVL, 15L);
    curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "");
}

class CurlHttpAdapter final : public IHttpAdapter {
public:
    CurlHttpAdapter() {
        static std::once_flag globalInit;
        std::call_once(globalInit, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
    }
    ~CurlHttpAdapter() override = default;

    Result<HttpResponse> get(const HttpRequest& request,
                             const ResponseHandler& onResponse) override {
        if (request.url.empty()) {
            return Error{ErrorCode::InvalidArgument, "Empty URL"};
        }

        CURL* curl = curl_easy_init();
        if (!curl) {
            return Error{ErrorCode::InternalError, "curl_easy_init failed"};
        }

        curl_slist* list = build_header_list(request.headers);
        const std::string cookies = build_cookie_string(request.cookies);

        TransferContext ctx;
        ctx.curl = curl;
        ctx.onResponse = &onResponse;

        curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
        curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
        if (list)
            curl_easy_setopt(curl, CURLOPT_HTTPHEADER, list);
        if (!cookies.empty())
            curl_easy_setopt(curl, CURLOPT_COOKIE, cookies.c_str());
        if (request.bufferSizeHint > 0) {
            // libcurl clamps this to its own maximum
            curl_easy_setopt(curl, CURLOPT_BUFFERSIZE, static_cast<long>(request.bufferSizeHint));
        }

        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_cb);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &ctx);
        curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_cb);
        curl_easy_setopt(curl, CURLOPT_HEADERDATA, &ctx.headers);

        configure_common(curl, request.timeout);

        CURLcode rc = curl_easy_perform(curl);

        // Empty body: the write callback never ran
        if (rc == CURLE_OK && !ctx.dispatched) {
            (void)dispatchResponse(ctx);
        }

        if (list)
            curl_slist_free_all(list);
        curl_easy_cleanup(curl);

        if (ctx.abortError) {
            return *ctx.abortError;
        }
        if (rc != CURLE_OK) {
            return makeCurlError(rc, "GET " + request.url);
        }

        spdlog::debug("GET {} -> {} ({} byte(s), content-type '{}')", request.url,
                      ctx.response.status, ctx.response.bodyBytes,
                      ctx.response.contentType.value_or(""));
        return ctx.response;
    }
};

/// Factory: the default HTTP adapter used by AttachmentDownloader.
std::unique_ptr<IHttpAdapter> makeCurlHttpAdapter() {
    return std::make_unique<CurlHttpAdapter>();
}

} // namespace chatport::downloader
