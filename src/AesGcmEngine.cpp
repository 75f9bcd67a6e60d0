#include "AesGcmEngine.hpp"
#include "sha256.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <argon2.h>
#include <algorithm>
#include <cstring>
#include <limits>
#include <memory>

namespace {
    using CipherCtx = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;

    void put_be32(std::uint8_t* out, std::uint32_t v) {
        out[0] = static_cast<std::uint8_t>(v >> 24);
        out[1] = static_cast<std::uint8_t>(v >> 16);
        out[2] = static_cast<std::uint8_t>(v >> 8);
        out[3] = static_cast<std::uint8_t>(v);
    }

    std::uint32_t get_be32(const std::uint8_t* in) {
        return (static_cast<std::uint32_t>(in[0]) << 24) |
               (static_cast<std::uint32_t>(in[1]) << 16) |
               (static_cast<std::uint32_t>(in[2]) << 8)  |
                static_cast<std::uint32_t>(in[3]);
    }

    std::uint32_t default_cost(KdfAlgorithm kdf) {
        return kdf == KdfAlgorithm::Argon2id ? AesGcmEngine::ARGON2_DEFAULT_T_COST
                                             : AesGcmEngine::PBKDF2_DEFAULT_ITERATIONS;
    }

    void random_bytes(std::vector<std::uint8_t>& out, const char* what) {
        if (RAND_bytes(out.data(), static_cast<int>(out.size())) != 1) {
            throw std::runtime_error(std::string("RAND_bytes failed for ") + what);
        }
    }

    void cleanse(std::vector<std::uint8_t>& bytes) {
        if (!bytes.empty()) OPENSSL_cleanse(bytes.data(), bytes.size());
    }
}

bool AesGcmEngine::costInRange(KdfAlgorithm kdf, std::uint32_t cost) {
    switch (kdf) {
    case KdfAlgorithm::Pbkdf2Sha256:
        return cost >= PBKDF2_MIN_ITERATIONS && cost <= PBKDF2_MAX_ITERATIONS;
    case KdfAlgorithm::Argon2id:
        return cost >= 1 && cost <= ARGON2_MAX_T_COST;
    }
    return false;
}

AesGcmEngine::AesGcmEngine(const EngineParams& params)
: m_kdf(params.kdf),
  m_kdfCost(params.kdfCost == 0 ? default_cost(params.kdf) : params.kdfCost),
  m_ivInterval(params.ivInterval == 0 ? DEFAULT_IV_INTERVAL : params.ivInterval)
{
    if (m_kdf != KdfAlgorithm::Pbkdf2Sha256 && m_kdf != KdfAlgorithm::Argon2id) {
        throw std::invalid_argument("AesGcmEngine: unknown KDF");
    }
    if (!costInRange(m_kdf, m_kdfCost)) {
        throw std::invalid_argument("AesGcmEngine: KDF cost out of range");
    }
    if (m_ivInterval > std::numeric_limits<std::uint32_t>::max()) {
        throw std::invalid_argument("AesGcmEngine: ivInterval must fit in 32 bits");
    }
}

AesGcmEngine::~AesGcmEngine() {
    for (auto& entry : m_keys) {
        cleanse(entry.key);
        cleanse(entry.passwordDigest);
    }
}

std::uint64_t AesGcmEngine::keyDerivations() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_derivations;
}

std::vector<std::uint8_t> AesGcmEngine::deriveKey(
    const std::vector<std::uint8_t>& password,
    const std::vector<std::uint8_t>& salt,
    KdfAlgorithm kdf,
    std::uint32_t cost
) {
    if (salt.size() != SALT_LEN) {
        throw std::invalid_argument("deriveKey: salt must be 16 bytes");
    }
    if (!costInRange(kdf, cost)) {
        throw std::invalid_argument("deriveKey: KDF cost out of range");
    }
    std::vector<std::uint8_t> key(KEY_LEN);

    if (kdf == KdfAlgorithm::Argon2id) {
        int rc = argon2id_hash_raw(
            cost,
            ARGON2_M_COST_KiB,
            ARGON2_PARALLELISM,
            password.data(), password.size(),
            salt.data(), salt.size(),
            key.data(), key.size()
        );
        if (rc != ARGON2_OK) {
            throw std::runtime_error(std::string("argon2id_hash_raw failed: ")
                                     + argon2_error_message(rc));
        }
        return key;
    }

    if (PKCS5_PBKDF2_HMAC(reinterpret_cast<const char*>(password.data()),
                          static_cast<int>(password.size()),
                          salt.data(), static_cast<int>(salt.size()),
                          static_cast<int>(cost), EVP_sha256(),
                          static_cast<int>(key.size()), key.data()) != 1) {
        throw std::runtime_error("PKCS5_PBKDF2_HMAC failed");
    }
    return key;
}

std::vector<std::uint8_t> AesGcmEngine::keyFor(
    const std::vector<std::uint8_t>& password,
    const std::vector<std::uint8_t>& salt,
    KdfAlgorithm kdf,
    std::uint32_t cost
) const {
    auto digest = sha256(password);
    const auto kdfId = static_cast<std::uint8_t>(kdf);
    auto matches = [&](const CachedKey& c) {
        return c.kdf == kdfId && c.cost == cost && c.salt == salt &&
               c.passwordDigest == digest;
    };
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = std::find_if(m_keys.begin(), m_keys.end(), matches);
        if (it != m_keys.end()) {
            it->lastUse = ++m_useTick;
            cleanse(digest);
            return it->key;
        }
    }

    // Derive outside the lock; PBKDF2/Argon2 are slow on purpose.
    std::vector<std::uint8_t> key;
    try {
        key = deriveKey(password, salt, kdf, cost);
    } catch (const std::exception&) {
        cleanse(digest);
        throw;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    ++m_derivations;
    // Another thread may have derived the same key meanwhile.
    auto it = std::find_if(m_keys.begin(), m_keys.end(), matches);
    if (it != m_keys.end()) {
        it->lastUse = ++m_useTick;
        cleanse(digest);
        return key;
    }
    if (m_keys.size() >= MAX_CACHED_KEYS) {
        auto victim = std::min_element(m_keys.begin(), m_keys.end(),
            [](const CachedKey& a, const CachedKey& b) { return a.lastUse < b.lastUse; });
        cleanse(victim->key);
        cleanse(victim->passwordDigest);
        m_keys.erase(victim);
    }
    m_keys.push_back(CachedKey{ std::move(digest), salt, kdfId, cost, key, ++m_useTick });
    return key;
}

std::vector<std::uint8_t> AesGcmEngine::nonceFor(std::uint64_t counter) {
    std::lock_guard<std::mutex> lock(m_mutex);
    return nonceForLocked(counter);
}

std::vector<std::uint8_t> AesGcmEngine::nonceForLocked(std::uint64_t counter) {
    const std::uint64_t index  = counter / m_ivInterval;
    const std::uint64_t offset = counter % m_ivInterval;
    if (index > std::numeric_limits<std::uint32_t>::max()) {
        throw std::overflow_error("nonce space exhausted for this key");
    }

    if (!m_intervalIndex || *m_intervalIndex != index) {
        std::vector<std::uint8_t> r(4);
        random_bytes(r, "IV interval");
        m_intervalRandom = std::move(r);
        m_intervalIndex = index;
    }

    std::vector<std::uint8_t> iv(IV_LEN);
    std::memcpy(iv.data(), m_intervalRandom.data(), 4);
    put_be32(iv.data() + 4, static_cast<std::uint32_t>(index));
    put_be32(iv.data() + 8, static_cast<std::uint32_t>(offset));
    return iv;
}

std::vector<std::uint8_t> AesGcmEngine::encrypt(
    const std::vector<std::uint8_t>& plaintext,
    const std::vector<std::uint8_t>& password,
    std::uint64_t counter
) {
    std::vector<std::uint8_t> salt;
    std::vector<std::uint8_t> iv;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_salt.empty()) {
            std::vector<std::uint8_t> s(SALT_LEN);
            random_bytes(s, "salt");
            m_salt = std::move(s);
        }
        salt = m_salt;
        iv = nonceForLocked(counter);
    }

    const auto key = keyFor(password, salt, m_kdf, m_kdfCost);

    // header | ciphertext | tag, written in place
    std::vector<std::uint8_t> out(HEADER_LEN + plaintext.size() + TAG_LEN);
    out[0] = FORMAT_VERSION;
    out[1] = static_cast<std::uint8_t>(m_kdf);
    put_be32(out.data() + 2, m_kdfCost);
    std::memcpy(out.data() + 6, salt.data(), SALT_LEN);
    std::memcpy(out.data() + 6 + SALT_LEN, iv.data(), IV_LEN);

    EVP_CIPHER_CTX* raw = EVP_CIPHER_CTX_new();
    if (!raw) throw std::runtime_error("EVP_CIPHER_CTX_new failed");
    CipherCtx ctx(raw, &EVP_CIPHER_CTX_free);

    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1)
        throw std::runtime_error("EncryptInit cipher failed");
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, IV_LEN, nullptr) != 1)
        throw std::runtime_error("SET_IVLEN failed");
    if (EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), iv.data()) != 1)
        throw std::runtime_error("EncryptInit key/iv failed");

    int len = 0;
    if (EVP_EncryptUpdate(ctx.get(), nullptr, &len, out.data(), static_cast<int>(HEADER_LEN)) != 1)
        throw std::runtime_error("EncryptUpdate AAD failed");

    int outLen1 = 0;
    if (!plaintext.empty()) {
        if (EVP_EncryptUpdate(ctx.get(), out.data() + HEADER_LEN, &outLen1,
                              plaintext.data(), static_cast<int>(plaintext.size())) != 1) {
            throw std::runtime_error("EncryptUpdate data failed");
        }
    }

    int outLen2 = 0;
    if (EVP_EncryptFinal_ex(ctx.get(), out.data() + HEADER_LEN + outLen1, &outLen2) != 1)
        throw std::runtime_error("EncryptFinal failed");

    const std::size_t cLen = static_cast<std::size_t>(outLen1 + outLen2);
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, TAG_LEN,
                            out.data() + HEADER_LEN + cLen) != 1)
        throw std::runtime_error("GET_TAG failed");

    out.resize(HEADER_LEN + cLen + TAG_LEN);
    return out;
}

std::vector<std::uint8_t> AesGcmEngine::decrypt(
    const std::vector<std::uint8_t>& envelope,
    const std::vector<std::uint8_t>& password
) const {
    if (envelope.size() < HEADER_LEN + TAG_LEN) throw DecryptionError();
    if (envelope[0] != FORMAT_VERSION) throw DecryptionError();

    const std::uint8_t kdfId = envelope[1];
    if (kdfId != static_cast<std::uint8_t>(KdfAlgorithm::Pbkdf2Sha256) &&
        kdfId != static_cast<std::uint8_t>(KdfAlgorithm::Argon2id)) {
        throw DecryptionError();
    }
    const auto kdf = static_cast<KdfAlgorithm>(kdfId);
    const std::uint32_t cost = get_be32(envelope.data() + 2);
    if (!costInRange(kdf, cost)) throw DecryptionError();

    const std::vector<std::uint8_t> salt(envelope.begin() + 6, envelope.begin() + 6 + SALT_LEN);
    const std::uint8_t* iv         = envelope.data() + 6 + SALT_LEN;
    const std::size_t   cLen       = envelope.size() - HEADER_LEN - TAG_LEN;
    const std::uint8_t* ciphertext = envelope.data() + HEADER_LEN;
    const std::uint8_t* tag        = ciphertext + cLen;

    std::vector<std::uint8_t> key;
    try {
        key = keyFor(password, salt, kdf, cost);
    } catch (const std::runtime_error&) {
        throw DecryptionError();
    }

    std::vector<std::uint8_t> plaintext(cLen);

    EVP_CIPHER_CTX* raw = EVP_CIPHER_CTX_new();
    if (!raw) throw DecryptionError();
    CipherCtx ctx(raw, &EVP_CIPHER_CTX_free);

    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1)
        throw DecryptionError();
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, IV_LEN, nullptr) != 1)
        throw DecryptionError();
    if (EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), iv) != 1)
        throw DecryptionError();

    int len = 0;
    if (EVP_DecryptUpdate(ctx.get(), nullptr, &len, envelope.data(), static_cast<int>(HEADER_LEN)) != 1)
        throw DecryptionError();

    int pLen1 = 0;
    if (cLen > 0) {
        if (EVP_DecryptUpdate(ctx.get(), plaintext.data(), &pLen1, ciphertext, static_cast<int>(cLen)) != 1)
            throw DecryptionError();
    }

    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, TAG_LEN, const_cast<std::uint8_t*>(tag)) != 1)
        throw DecryptionError();

    int pLen2 = 0;
    if (EVP_DecryptFinal_ex(ctx.get(), plaintext.data() + pLen1, &pLen2) != 1) {
        // Never hand back unauthenticated bytes.
        OPENSSL_cleanse(plaintext.data(), plaintext.size());
        throw DecryptionError();
    }

    plaintext.resize(static_cast<std::size_t>(pLen1 + pLen2));
    return plaintext;
}
