#pragma once

#include <chatport/downloader/downloader.hpp>

#include <algorithm>
#include <chrono>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace chatport::test {

// One scripted outcome for a GET
struct ScriptedResponse {
    long status{200};
    std::string contentType{"image/png"};
    std::string body;
    std::optional<std::string> retryAfter;
    std::optional<Error> transportError; // set = the request fails before any response
    std::optional<std::size_t> failAfterBytes; // set = the body breaks off after this many bytes
};

/**
 * In-memory IHttpAdapter. Each URL replays its script in order; the last entry repeats once the
 * script is exhausted. Unscripted URLs answer 404.
 */
class FakeHttpAdapter final : public downloader::IHttpAdapter {
public:
    struct State {
        std::mutex mutex;
        std::map<std::string, std::deque<ScriptedResponse>> scripts;
        std::map<std::string, int> calls;
        std::vector<downloader::HttpRequest> requests;
        std::chrono::milliseconds latency{0};
        std::function<void(const std::string& url)> beforeResponse;
        int inFlight{0};
        int peakInFlight{0};
    };

    explicit FakeHttpAdapter(std::shared_ptr<State> state) : state_(std::move(state)) {}

    Result<downloader::HttpResponse> get(const downloader::HttpRequest& request,
                                         const downloader::ResponseHandler& onResponse) override {
        ScriptedResponse scripted;
        std::chrono::milliseconds latency{0};
        std::function<void(const std::string&)> hook;
        {
            std::lock_guard<std::mutex> lk(state_->mutex);
            ++state_->calls[request.url];
            state_->requests.push_back(request);
            ++state_->inFlight;
            state_->peakInFlight = std::max(state_->peakInFlight, state_->inFlight);
            latency = state_->latency;
            hook = state_->beforeResponse;

            auto it = state_->scripts.find(request.url);
            if (it == state_->scripts.end() || it->second.empty()) {
                scripted.status = 404;
                scripted.contentType = "text/plain";
            } else {
                scripted = it->second.front();
                if (it->second.size() > 1)
                    it->second.pop_front();
            }
        }

        auto result = serve(request, scripted, latency, hook, onResponse);

        std::lock_guard<std::mutex> lk(state_->mutex);
        --state_->inFlight;
        return result;
    }

private:
    static Result<downloader::HttpResponse>
    serve(const downloader::HttpRequest& request, const ScriptedResponse& scripted,
          std::chrono::milliseconds latency,
          const std::function<void(const std::string&)>& hook,
          const downloader::ResponseHandler& onResponse) {
        if (latency.count() > 0)
            std::this_thread::sleep_for(latency);
        if (scripted.transportError)
            return *scripted.transportError;
        if (hook)
            hook(request.url);

        downloader::HttpResponse resp;
        resp.status = scripted.status;
        if (!scripted.contentType.empty())
            resp.contentType = scripted.contentType;
        resp.retryAfter = scripted.retryAfter;

        auto sink = onResponse(resp);
        if (!sink)
            return sink.error();

        // Deliver the body in small pieces, like a network read loop
        const auto* bytes = reinterpret_cast<const std::byte*>(scripted.body.data());
        std::size_t offset = 0;
        while (offset < scripted.body.size()) {
            if (scripted.failAfterBytes && offset >= *scripted.failAfterBytes)
                return Error{ErrorCode::NetworkError, "connection reset during body"};
            const std::size_t n = std::min<std::size_t>(3, scripted.body.size() - offset);
            resp.bodyBytes += n;
            if (sink.value()) {
                if (auto r = sink.value()(std::span<const std::byte>(bytes + offset, n)); !r)
                    return r.error();
            }
            offset += n;
        }
        return resp;
    }

    std::shared_ptr<State> state_;
};

} // namespace chatport::test
