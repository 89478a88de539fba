#pragma once

#include <memory>
#include <string>
#include <string_view>

namespace beacon::crypto {

// SHA-256 digest with hex output
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
    void update(std::string_view data);
    std::string finalize();

    // Static utility for one-shot hashing
    static std::string hash(std::string_view data);

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace beacon::crypto
