#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace drift {

// Streaming SHA-256 (FIPS 180-4). Used only to compare inputs across runs,
// so the digest is always handled as lowercase hex.
class Sha256 {
public:
    using Digest = std::array<uint8_t, 32>;

    Sha256();

    void update(const uint8_t* data, size_t len);
    void update(std::string_view s);

    // Pads and returns the digest. The object must not be fed afterwards.
    Digest finish();
    std::string finish_hex();

    static std::string hex(std::string_view input);
    static std::string to_hex(const Digest& digest);

private:
    void compress(const uint8_t* block);

    std::array<uint32_t, 8> h_;
    std::array<uint8_t, 64> pending_;
    size_t pending_len_ = 0;
    uint64_t length_ = 0;
};

} // namespace drift
