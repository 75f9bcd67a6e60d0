#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>
#include <openssl/evp.h>

inline std::vector<std::uint8_t> sha256(const std::uint8_t* data, std::size_t size) {
    std::vector<std::uint8_t> out(32);
    unsigned int outLen = 0;
    if (EVP_Digest(data, size, out.data(), &outLen, EVP_sha256(), nullptr) != 1 || outLen != out.size()) {
        throw std::runtime_error("EVP_Digest(sha256) failed");
    }
    return out;
}

inline std::vector<std::uint8_t> sha256(const std::vector<std::uint8_t>& data) {
    return sha256(data.data(), data.size());
}

// Lowercase hex digest; used as a content address for stored blocks.
inline std::string sha256Hex(const std::vector<std::uint8_t>& data) {
    static const char* kHex = "0123456789abcdef";
    auto digest = sha256(data);
    std::string out;
    out.reserve(digest.size() * 2);
    for (std::uint8_t b : digest) {
        out.push_back(kHex[b >> 4]);
        out.push_back(kHex[b & 0x0F]);
    }
    return out;
}
