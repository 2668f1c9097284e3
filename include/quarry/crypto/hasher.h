#pragma once

#include <quarry/core/types.h>

#include <memory>
#include <span>
#include <string>
#include <string_view>

namespace quarry::crypto {

// Incremental SHA-256 used for content and configuration fingerprints
class SHA256Hasher {
public:
    SHA256Hasher();
    ~SHA256Hasher();

    SHA256Hasher(const SHA256Hasher&) = delete;
    SHA256Hasher& operator=(const SHA256Hasher&) = delete;
    SHA256Hasher(SHA256Hasher&&) noexcept;
    SHA256Hasher& operator=(SHA256Hasher&&) noexcept;

    void init();
    void update(std::span<const std::byte> data);
    void update(std::string_view text);
    // Hex digest; the hasher is re-initialized afterwards
    std::string finalize();

    static std::string hash(std::span<const std::byte> data);
    static std::string hash(std::string_view text);

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace quarry::crypto
