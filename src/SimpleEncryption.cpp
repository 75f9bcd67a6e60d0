#include "SimpleEncryption.hpp"

#include <openssl/crypto.h>
#include <stdexcept>

namespace {
    std::vector<std::uint8_t> password_bytes(const EncryptionConfig& config) {
        if (!config.password) {
            throw std::invalid_argument("password must be a string or a byte sequence");
        }
        if (const auto* s = std::get_if<std::string>(&*config.password)) {
            return std::vector<std::uint8_t>(s->begin(), s->end());
        }
        return std::get<std::vector<std::uint8_t>>(*config.password);
    }

    EngineParams engine_params(const EncryptionConfig& config) {
        EngineParams p;
        p.kdf        = config.kdf;
        p.kdfCost    = config.kdfCost;
        p.ivInterval = config.ivInterval;
        return p;
    }
}

SimpleEncryption::SimpleEncryption(const EncryptionConfig& config)
: m_engine(engine_params(config)),
  m_password(password_bytes(config))
{
}

SimpleEncryption::~SimpleEncryption() {
    OPENSSL_cleanse(m_password.data(), m_password.size());
}

std::vector<std::uint8_t> SimpleEncryption::encrypt(const std::vector<std::uint8_t>& plaintext) {
    // Held across the engine call: the counter only advances once the
    // envelope exists, and no two callers can share a counter value.
    std::lock_guard<std::mutex> lock(m_counterMutex);
    auto out = m_engine.encrypt(plaintext, m_password, m_counter);
    ++m_counter;
    return out;
}

std::vector<std::uint8_t> SimpleEncryption::decrypt(const std::vector<std::uint8_t>& ciphertext) const {
    return m_engine.decrypt(ciphertext, m_password);
}

std::uint64_t SimpleEncryption::counter() const {
    std::lock_guard<std::mutex> lock(m_counterMutex);
    return m_counter;
}
