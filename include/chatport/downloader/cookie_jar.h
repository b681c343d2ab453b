#pragma once

#include <chatport/core/types.h>
#include <chatport/downloader/downloader.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <string_view>
#include <vector>

namespace chatport::downloader {

/**
 * Parse a browser-style cookie header: "name=value; name2=value2".
 * Empty segments are ignored; a segment without '=' is an InvalidData error.
 */
Result<std::vector<Cookie>> loadCookiesFromText(std::string_view text);

/**
 * Parse a JSON array of {"name": ..., "value": ...} objects.
 */
Result<std::vector<Cookie>> loadCookiesFromJson(const nlohmann::json& doc);

// Load a cookie jar file; ".json" files use the JSON form, anything else the text form.
Result<std::vector<Cookie>> loadCookieJar(const std::filesystem::path& path);

} // namespace chatport::downloader
