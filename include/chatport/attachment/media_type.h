#pragma once

#include <string>
#include <string_view>

namespace chatport::attachment {

/**
 * Normalize a Content-Type header value to its bare media type.
 * Parameters are stripped and the type is lower-cased ("Image/PNG; q=1" -> "image/png").
 * A value that is not of the form "type/subtype" is returned unchanged.
 */
std::string parseMediaType(std::string_view contentType);

/**
 * File extension (without the dot) used when storing an artifact of the given media type.
 * image/jpeg -> jpg, image/png -> png, image/gif -> gif; other image/* and video/* types use
 * their subtype; everything else has no extension.
 */
std::string extensionForMediaType(std::string_view mediaType);

} // namespace chatport::attachment
