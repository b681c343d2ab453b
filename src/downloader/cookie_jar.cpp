#include <chatport/downloader/cookie_jar.h>

#include <spdlog/spdlog.h>

#include <cctype>
#include <fstream>
#include <sstream>

namespace chatport::downloader {

namespace {

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front())))
        s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())))
        s.remove_suffix(1);
    return s;
}

} // namespace

Result<std::vector<Cookie>> loadCookiesFromText(std::string_view text) {
    std::vector<Cookie> cookies;
    while (!text.empty()) {
        auto semi = text.find(';');
        auto segment = trim(text.substr(0, semi));
        text = semi == std::string_view::npos ? std::string_view{} : text.substr(semi + 1);
        if (segment.empty()) {
            continue;
        }

        auto eq = segment.find('=');
        if (eq == std::string_view::npos || eq == 0) {
            return Error{ErrorCode::InvalidData, "invalid cookie: \"" + std::string(segment) + "\""};
        }
        cookies.push_back(Cookie{std::string(trim(segment.substr(0, eq))),
                                 std::string(segment.substr(eq + 1))});
    }
    return cookies;
}

Result<std::vector<Cookie>> loadCookiesFromJson(const nlohmann::json& doc) {
    if (!doc.is_array()) {
        return Error{ErrorCode::InvalidData, "cookie jar must be a JSON array"};
    }

    std::vector<Cookie> cookies;
    cookies.reserve(doc.size());
    for (const auto& item : doc) {
        if (!item.is_object() || !item.contains("name") || !item["name"].is_string()) {
            return Error{ErrorCode::InvalidData, "cookie entry without a name: " + item.dump()};
        }
        Cookie c;
        c.name = item["name"].get<std::string>();
        c.value = item.value("value", std::string{});
        cookies.push_back(std::move(c));
    }
    return cookies;
}

Result<std::vector<Cookie>> loadCookieJar(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Error{ErrorCode::FileNotFound, "could not open cookie jar " + path.string()};
    }

    Result<std::vector<Cookie>> cookies = std::vector<Cookie>{};
    if (path.extension() == ".json") {
        auto doc = nlohmann::json::parse(in, nullptr, /*allow_exceptions=*/false);
        if (doc.is_discarded()) {
            return Error{ErrorCode::InvalidData, "malformed cookie jar: " + path.string()};
        }
        cookies = loadCookiesFromJson(doc);
    } else {
        std::ostringstream ss;
        ss << in.rdbuf();
        cookies = loadCookiesFromText(ss.str());
    }

    if (cookies) {
        spdlog::info("Loaded {} cookie(s) from {}", cookies.value().size(), path.string());
    }
    return cookies;
}

} // namespace chatport::downloader
