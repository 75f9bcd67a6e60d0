#pragma once
#include "AesGcmEngine.hpp"
#include "EntryEncryption.hpp"

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <variant>
#include <vector>

using Password = std::variant<std::string, std::vector<std::uint8_t>>;

struct EncryptionConfig {
    std::optional<Password> password;
    KdfAlgorithm  kdf        = KdfAlgorithm::Pbkdf2Sha256;
    std::uint32_t kdfCost    = 0;   // 0 = engine default
    std::uint64_t ivInterval = 0;   // 0 = engine default
};

// Password-based encryption object for one log role.
//
// Owns the password and a call counter that starts at 0 and advances once
// per successful encrypt. Two objects built from the same password keep
// independent counters; nonce uniqueness across them rests on each engine
// drawing its own salt.
class SimpleEncryption : public EntryEncryption {
public:
    // Throws std::invalid_argument when no password is given.
    explicit SimpleEncryption(const EncryptionConfig& config);
    ~SimpleEncryption() override;

    SimpleEncryption(const SimpleEncryption&) = delete;
    SimpleEncryption& operator=(const SimpleEncryption&) = delete;

    std::vector<std::uint8_t> encrypt(const std::vector<std::uint8_t>& plaintext) override;
    std::vector<std::uint8_t> decrypt(const std::vector<std::uint8_t>& ciphertext) const override;
    std::uint64_t ivInterval() const override { return m_engine.ivInterval(); }

    // Counter value the next encrypt will use.
    std::uint64_t counter() const;

private:
    AesGcmEngine m_engine;
    std::vector<std::uint8_t> m_password;

    mutable std::mutex m_counterMutex;
    std::uint64_t m_counter = 0;
};
