#pragma once

#include <chatport/core/types.h>

#include <cstddef>
#include <memory>
#include <span>
#include <string>
#include <string_view>

namespace chatport::crypto {

// Streaming SHA-256 over OpenSSL EVP
class SHA256Hasher {
public:
    SHA256Hasher();
    ~SHA256Hasher();

    // Disable copy, enable move
    SHA256Hasher(const SHA256Hasher&) = delete;
    SHA256Hasher& operator=(const SHA256Hasher&) = delete;
    SHA256Hasher(SHA256Hasher&&) noexcept;
    SHA256Hasher& operator=(SHA256Hasher&&) noexcept;

    void init();
    void update(std::span<const std::byte> data);
    std::string finalize();

    // Static utility for one-shot hashing
    static std::string hash(std::span<const std::byte> data);

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

/**
 * Content address for a logical attachment key: lowercase hex SHA-256 of the key bytes.
 * Identical keys always produce identical addresses, across calls and across runs.
 */
[[nodiscard]] std::string fingerprintForKey(std::string_view key);

} // namespace chatport::crypto
