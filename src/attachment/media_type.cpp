#include <chatport/attachment/media_type.h>

#include <algorithm>
#include <array>
#include <cctype>

namespace chatport::attachment {

namespace {

std::string to_lower(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s)
        out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}

std::string_view trim(std::string_view s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b])))
        ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
        --e;
    return s.substr(b, e - b);
}

// RFC 2045 token characters
bool isTokenChar(unsigned char c) {
    if (c <= 0x20 || c >= 0x7f)
        return false;
    constexpr std::string_view tspecials = "()<>@,;:\\\"/[]?=";
    return tspecials.find(static_cast<char>(c)) == std::string_view::npos;
}

bool isToken(std::string_view s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](char c) {
        return isTokenChar(static_cast<unsigned char>(c));
    });
}

constexpr std::array<std::string_view, 2> kAutoPrefixes{"image/", "video/"};

} // namespace

std::string parseMediaType(std::string_view contentType) {
    auto base = contentType;
    if (auto semi = base.find(';'); semi != std::string_view::npos) {
        base = base.substr(0, semi);
    }
    base = trim(base);

    auto slash = base.find('/');
    if (slash == std::string_view::npos || !isToken(base.substr(0, slash)) ||
        !isToken(base.substr(slash + 1))) {
        return std::string(contentType);
    }
    return to_lower(base);
}

std::string extensionForMediaType(std::string_view mediaType) {
    if (mediaType == "image/jpeg")
        return "jpg";
    if (mediaType == "image/png")
        return "png";
    if (mediaType == "image/gif")
        return "gif";

    for (auto prefix : kAutoPrefixes) {
        if (mediaType.size() > prefix.size() && mediaType.substr(0, prefix.size()) == prefix) {
            return std::string(mediaType.substr(prefix.size()));
        }
    }
    return {};
}

} // namespace chatport::attachment
