#include <catch2/catch_all.hpp>
#include "AesGcmEngine.hpp"

#include <algorithm>
#include <cstring>
#include <string>
#include <vector>

static std::vector<std::uint8_t> toBytes(const char* s) {
    return std::vector<std::uint8_t>(reinterpret_cast<const std::uint8_t*>(s),
                                     reinterpret_cast<const std::uint8_t*>(s) + std::strlen(s));
}

// Minimum PBKDF2 cost keeps the per-bit tamper loop fast.
static EngineParams fastParams() {
    EngineParams p;
    p.kdfCost = AesGcmEngine::PBKDF2_MIN_ITERATIONS;
    return p;
}

TEST_CASE("AES-GCM: round-trip succeeds; tamper fails", "[engine]") {
    AesGcmEngine engine(fastParams());
    const auto password = toBytes("correct horse battery staple");
    const auto pt = toBytes("secret-payload-123!");

    auto env = engine.encrypt(pt, password, 0);
    REQUIRE(env.size() == AesGcmEngine::HEADER_LEN + pt.size() + AesGcmEngine::TAG_LEN);
    REQUIRE(env[0] == AesGcmEngine::FORMAT_VERSION);
    REQUIRE(env[1] == static_cast<std::uint8_t>(KdfAlgorithm::Pbkdf2Sha256));

    REQUIRE(engine.decrypt(env, password) == pt);

    SECTION("every single-bit flip is rejected") {
        for (std::size_t i = 0; i < env.size() * 8; ++i) {
            auto bad = env;
            bad[i / 8] ^= static_cast<std::uint8_t>(1u << (i % 8));
            REQUIRE_THROWS_AS(engine.decrypt(bad, password), DecryptionError);
        }
    }
    SECTION("wrong password is rejected") {
        REQUIRE_THROWS_AS(engine.decrypt(env, toBytes("Tr0ub4dor&3")), DecryptionError);
        // and the right one still works after a failed attempt
        REQUIRE(engine.decrypt(env, password) == pt);
    }
    SECTION("a second engine with the same password can decrypt") {
        AesGcmEngine other(fastParams());
        REQUIRE(other.decrypt(env, password) == pt);
    }
}

TEST_CASE("AES-GCM: payload sizes round-trip", "[engine]") {
    AesGcmEngine engine(fastParams());
    const auto password = toBytes("pw");

    std::uint64_t counter = 0;
    for (std::size_t n : {0u, 1u, 15u, 16u, 17u, 4096u}) {
        std::vector<std::uint8_t> pt(n);
        for (std::size_t i = 0; i < n; ++i) pt[i] = static_cast<std::uint8_t>(i * 31 + 7);
        auto env = engine.encrypt(pt, password, counter++);
        REQUIRE(engine.decrypt(env, password) == pt);
    }
}

TEST_CASE("AES-GCM: malformed envelopes fail with the same error", "[engine]") {
    AesGcmEngine engine(fastParams());
    const auto password = toBytes("pw");
    auto env = engine.encrypt(toBytes("record"), password, 0);

    SECTION("empty") {
        REQUIRE_THROWS_AS(engine.decrypt({}, password), DecryptionError);
    }
    SECTION("truncated below header + tag") {
        std::vector<std::uint8_t> shortEnv(env.begin(),
                                           env.begin() + AesGcmEngine::HEADER_LEN + AesGcmEngine::TAG_LEN - 1);
        REQUIRE_THROWS_AS(engine.decrypt(shortEnv, password), DecryptionError);
    }
    SECTION("truncated tag") {
        env.pop_back();
        REQUIRE_THROWS_AS(engine.decrypt(env, password), DecryptionError);
    }
    SECTION("unknown version") {
        env[0] = 0x7F;
        REQUIRE_THROWS_WITH(engine.decrypt(env, password), "could not decrypt entry");
    }
    SECTION("cost outside the accepted range") {
        env[2] = 0xFF;
        REQUIRE_THROWS_AS(engine.decrypt(env, password), DecryptionError);
    }
}

TEST_CASE("AES-GCM: each engine uses its own salt", "[engine]") {
    AesGcmEngine a(fastParams());
    AesGcmEngine b(fastParams());
    const auto password = toBytes("same password");

    auto envA = a.encrypt(toBytes("x"), password, 0);
    auto envB = b.encrypt(toBytes("x"), password, 0);

    std::vector<std::uint8_t> saltA(envA.begin() + 6, envA.begin() + 6 + AesGcmEngine::SALT_LEN);
    std::vector<std::uint8_t> saltB(envB.begin() + 6, envB.begin() + 6 + AesGcmEngine::SALT_LEN);
    REQUIRE(saltA != saltB);

    // the salt is fixed for the lifetime of one engine
    auto envA2 = a.encrypt(toBytes("y"), password, 1);
    REQUIRE(std::equal(saltA.begin(), saltA.end(), envA2.begin() + 6));
}

TEST_CASE("KDF: deterministic per (password, salt, cost)", "[engine][kdf]") {
    std::vector<std::uint8_t> salt(AesGcmEngine::SALT_LEN, 0x11);
    const auto pw = toBytes("pw-for-test");
    const auto cost = AesGcmEngine::PBKDF2_MIN_ITERATIONS;

    auto k1 = AesGcmEngine::deriveKey(pw, salt, KdfAlgorithm::Pbkdf2Sha256, cost);
    auto k2 = AesGcmEngine::deriveKey(pw, salt, KdfAlgorithm::Pbkdf2Sha256, cost);
    REQUIRE(k1.size() == AesGcmEngine::KEY_LEN);
    REQUIRE(k1 == k2);

    auto other = AesGcmEngine::deriveKey(toBytes("pw-for-tesT"), salt, KdfAlgorithm::Pbkdf2Sha256, cost);
    REQUIRE(other != k1);

    REQUIRE_THROWS_AS(AesGcmEngine::deriveKey(pw, std::vector<std::uint8_t>(8, 0), KdfAlgorithm::Pbkdf2Sha256, cost),
                      std::invalid_argument);
    REQUIRE_THROWS_AS(AesGcmEngine::deriveKey(pw, salt, KdfAlgorithm::Pbkdf2Sha256, 1),
                      std::invalid_argument);
}

TEST_CASE("KDF: Argon2id envelopes round-trip", "[engine][kdf][argon2]") {
    EngineParams p;
    p.kdf = KdfAlgorithm::Argon2id;
    p.kdfCost = 1;
    AesGcmEngine engine(p);
    const auto password = toBytes("argon password");

    auto env = engine.encrypt(toBytes("record"), password, 0);
    REQUIRE(env[1] == static_cast<std::uint8_t>(KdfAlgorithm::Argon2id));
    REQUIRE(engine.decrypt(env, password) == toBytes("record"));
    REQUIRE_THROWS_AS(engine.decrypt(env, toBytes("argon passworD")), DecryptionError);
}

TEST_CASE("Engine parameters are validated at construction", "[engine]") {
    EngineParams p;

    SECTION("PBKDF2 iterations too low") {
        p.kdfCost = AesGcmEngine::PBKDF2_MIN_ITERATIONS - 1;
        REQUIRE_THROWS_AS(AesGcmEngine(p), std::invalid_argument);
    }
    SECTION("Argon2 t_cost too high") {
        p.kdf = KdfAlgorithm::Argon2id;
        p.kdfCost = AesGcmEngine::ARGON2_MAX_T_COST + 1;
        REQUIRE_THROWS_AS(AesGcmEngine(p), std::invalid_argument);
    }
    SECTION("defaults") {
        AesGcmEngine engine(p);
        REQUIRE(engine.kdfCost() == AesGcmEngine::PBKDF2_DEFAULT_ITERATIONS);
        REQUIRE(engine.ivInterval() == AesGcmEngine::DEFAULT_IV_INTERVAL);
    }
}

TEST_CASE("Key cache evicts the least recently used key", "[engine][cache]") {
    const auto password = toBytes("pw");
    const auto pt = toBytes("cached");

    // One envelope per salt: 33 distinct keys, one more than the cache holds.
    std::vector<std::vector<std::uint8_t>> envs;
    for (int i = 0; i < 33; ++i) {
        AesGcmEngine writer(fastParams());
        envs.push_back(writer.encrypt(pt, password, 0));
    }

    AesGcmEngine reader(fastParams());
    for (int i = 0; i < 32; ++i) REQUIRE(reader.decrypt(envs[i], password) == pt);
    REQUIRE(reader.keyDerivations() == 32);

    // Touch the oldest entry, then overflow the cache.
    REQUIRE(reader.decrypt(envs[0], password) == pt);
    REQUIRE(reader.keyDerivations() == 32);
    REQUIRE(reader.decrypt(envs[32], password) == pt);
    REQUIRE(reader.keyDerivations() == 33);

    // envs[0] was used recently and stays; envs[1] was the LRU entry.
    REQUIRE(reader.decrypt(envs[0], password) == pt);
    REQUIRE(reader.keyDerivations() == 33);
    REQUIRE(reader.decrypt(envs[1], password) == pt);
    REQUIRE(reader.keyDerivations() == 34);

    SECTION("a wrong password never hits another password's entry") {
        REQUIRE_THROWS_AS(reader.decrypt(envs[1], toBytes("other")), DecryptionError);
        REQUIRE(reader.keyDerivations() == 35);
        REQUIRE(reader.decrypt(envs[1], password) == pt);
        REQUIRE(reader.keyDerivations() == 35);
    }
}
