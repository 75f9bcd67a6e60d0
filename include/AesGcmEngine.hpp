#pragma once
#include <cstdint>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

// Raised by decrypt for every kind of failure (bad tag, wrong password,
// malformed envelope). The message never carries key or plaintext bytes.
class DecryptionError : public std::runtime_error {
public:
    DecryptionError() : std::runtime_error("could not decrypt entry") {}
};

enum class KdfAlgorithm : std::uint8_t {
    Pbkdf2Sha256 = 1,
    Argon2id     = 2,
};

struct EngineParams {
    KdfAlgorithm  kdf        = KdfAlgorithm::Pbkdf2Sha256;
    std::uint32_t kdfCost    = 0;   // 0 = default for the algorithm
    std::uint64_t ivInterval = 0;   // 0 = DEFAULT_IV_INTERVAL
};

// Password-keyed AES-256-GCM.
//
// Envelope: version(1) | kdf(1) | cost(4, BE) | salt(16) | iv(12) | ct | tag(16)
// The 34-byte header is bound as AAD.
//
// IV = R(4) || BE32(counter / ivInterval) || BE32(counter % ivInterval)
// R is redrawn each time the counter moves into a new interval.
class AesGcmEngine {
public:
    explicit AesGcmEngine(const EngineParams& params = {});
    ~AesGcmEngine();

    AesGcmEngine(const AesGcmEngine&) = delete;
    AesGcmEngine& operator=(const AesGcmEngine&) = delete;

    std::vector<std::uint8_t> encrypt(const std::vector<std::uint8_t>& plaintext,
                                      const std::vector<std::uint8_t>& password,
                                      std::uint64_t counter);

    // Throws DecryptionError on any failure.
    std::vector<std::uint8_t> decrypt(const std::vector<std::uint8_t>& envelope,
                                      const std::vector<std::uint8_t>& password) const;

    // IV the nonce policy assigns to `counter`. Draws a new random
    // component when the counter enters a new interval.
    std::vector<std::uint8_t> nonceFor(std::uint64_t counter);

    std::uint64_t ivInterval() const { return m_ivInterval; }
    KdfAlgorithm  kdf() const { return m_kdf; }
    std::uint32_t kdfCost() const { return m_kdfCost; }

    // Number of keys this engine has derived, i.e. key cache misses.
    std::uint64_t keyDerivations() const;

    // Derive a 32-byte key. Exposed for tests; callers normally never see keys.
    static std::vector<std::uint8_t> deriveKey(const std::vector<std::uint8_t>& password,
                                               const std::vector<std::uint8_t>& salt,
                                               KdfAlgorithm kdf,
                                               std::uint32_t cost);

    static constexpr std::size_t KEY_LEN    = 32;
    static constexpr std::size_t IV_LEN     = 12;
    static constexpr std::size_t TAG_LEN    = 16;
    static constexpr std::size_t SALT_LEN   = 16;
    static constexpr std::size_t HEADER_LEN = 1 + 1 + 4 + SALT_LEN + IV_LEN;

    static constexpr std::uint8_t  FORMAT_VERSION      = 0x01;
    static constexpr std::uint64_t DEFAULT_IV_INTERVAL = 65536;

    static constexpr std::uint32_t PBKDF2_DEFAULT_ITERATIONS = 600000;
    static constexpr std::uint32_t PBKDF2_MIN_ITERATIONS     = 10000;
    static constexpr std::uint32_t PBKDF2_MAX_ITERATIONS     = 2000000;

    static constexpr std::uint32_t ARGON2_DEFAULT_T_COST = 3;
    static constexpr std::uint32_t ARGON2_MAX_T_COST     = 10;
    static constexpr std::uint32_t ARGON2_M_COST_KiB     = 64 * 1024; // ~64 MiB
    static constexpr std::uint32_t ARGON2_PARALLELISM    = 1;

    static bool costInRange(KdfAlgorithm kdf, std::uint32_t cost);

private:
    // A derived key and what it was derived from. The password enters as a
    // SHA-256 digest so a cached key is never handed out for a different
    // password. Digest and key are cleansed when the entry goes away.
    struct CachedKey {
        std::vector<std::uint8_t> passwordDigest;
        std::vector<std::uint8_t> salt;
        std::uint8_t  kdf;
        std::uint32_t cost;
        std::vector<std::uint8_t> key;
        std::uint64_t lastUse;
    };

    // Returns the cached key for (password, salt, kdf, cost) or derives and
    // caches it, evicting the least recently used entry when full.
    // Cache entries are only added after a successful derivation.
    std::vector<std::uint8_t> keyFor(const std::vector<std::uint8_t>& password,
                                     const std::vector<std::uint8_t>& salt,
                                     KdfAlgorithm kdf,
                                     std::uint32_t cost) const;

    std::vector<std::uint8_t> nonceForLocked(std::uint64_t counter);

    const KdfAlgorithm  m_kdf;
    const std::uint32_t m_kdfCost;
    const std::uint64_t m_ivInterval;

    mutable std::mutex m_mutex;
    std::vector<std::uint8_t> m_salt;                  // drawn on first encrypt
    std::optional<std::uint64_t> m_intervalIndex;      // interval of last IV
    std::vector<std::uint8_t> m_intervalRandom;        // R for that interval
    mutable std::vector<CachedKey> m_keys;
    mutable std::uint64_t m_useTick = 0;
    mutable std::uint64_t m_derivations = 0;

    static constexpr std::size_t MAX_CACHED_KEYS = 32;
};
