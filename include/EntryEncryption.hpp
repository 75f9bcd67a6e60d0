#pragma once
#include <cstdint>
#include <vector>

// Pluggable encryption slot of the entry log. One object per role
// (data payloads, or whole replicated blocks).
class EntryEncryption {
public:
    virtual ~EntryEncryption() = default;

    virtual std::vector<std::uint8_t> encrypt(const std::vector<std::uint8_t>& plaintext) = 0;

    // Throws DecryptionError when the input was not produced under this password.
    virtual std::vector<std::uint8_t> decrypt(const std::vector<std::uint8_t>& ciphertext) const = 0;

    virtual std::uint64_t ivInterval() const = 0;
};
