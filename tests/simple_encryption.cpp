#include <catch2/catch_all.hpp>
#include "SimpleEncryption.hpp"

#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

static std::vector<std::uint8_t> toBytes(const std::string& s) {
    return std::vector<std::uint8_t>(s.begin(), s.end());
}

static EncryptionConfig fastConfig(Password password) {
    EncryptionConfig config;
    config.password = std::move(password);
    config.kdfCost  = AesGcmEngine::PBKDF2_MIN_ITERATIONS;
    return config;
}

TEST_CASE("SimpleEncryption: password is required", "[factory]") {
    REQUIRE_THROWS_AS(SimpleEncryption(EncryptionConfig{}), std::invalid_argument);
    REQUIRE_THROWS_WITH(SimpleEncryption(EncryptionConfig{}),
                        "password must be a string or a byte sequence");
}

TEST_CASE("SimpleEncryption: string and byte passwords", "[factory]") {
    SimpleEncryption fromString(fastConfig(std::string("hello")));
    SimpleEncryption fromBytes(fastConfig(toBytes("hello")));

    // same secret, either representation
    auto env = fromString.encrypt(toBytes("record"));
    REQUIRE(fromBytes.decrypt(env) == toBytes("record"));

    SECTION("an empty password is still a password") {
        SimpleEncryption empty(fastConfig(std::string()));
        auto e = empty.encrypt(toBytes("x"));
        REQUIRE(empty.decrypt(e) == toBytes("x"));
        REQUIRE_THROWS_AS(fromString.decrypt(e), DecryptionError);
    }
}

TEST_CASE("SimpleEncryption: only byte sequences are accepted", "[factory]") {
    using Encrypt = decltype(&SimpleEncryption::encrypt);
    using Decrypt = decltype(&SimpleEncryption::decrypt);

    STATIC_REQUIRE(std::is_invocable_v<Encrypt, SimpleEncryption&, std::vector<std::uint8_t>>);
    STATIC_REQUIRE(!std::is_invocable_v<Encrypt, SimpleEncryption&, std::string>);
    STATIC_REQUIRE(!std::is_invocable_v<Encrypt, SimpleEncryption&, const char*>);
    STATIC_REQUIRE(!std::is_invocable_v<Encrypt, SimpleEncryption&, int>);
    STATIC_REQUIRE(!std::is_invocable_v<Decrypt, const SimpleEncryption&, std::string>);
    STATIC_REQUIRE(!std::is_invocable_v<Decrypt, const SimpleEncryption&, double>);
}

TEST_CASE("SimpleEncryption: counter advances once per encrypt", "[factory]") {
    SimpleEncryption a(fastConfig(std::string("hello")));
    SimpleEncryption b(fastConfig(std::string("hello")));

    REQUIRE(a.counter() == 0);
    a.encrypt(toBytes("1"));
    a.encrypt(toBytes("2"));
    REQUIRE(a.counter() == 2);

    // decrypt never touches the counter
    auto env = b.encrypt(toBytes("3"));
    REQUIRE(b.decrypt(env) == toBytes("3"));
    REQUIRE(b.counter() == 1);
    REQUIRE(a.counter() == 2);
}

TEST_CASE("SimpleEncryption: decryption errors propagate unchanged", "[factory]") {
    SimpleEncryption hello(fastConfig(std::string("hello")));
    SimpleEncryption world(fastConfig(std::string("world")));

    auto env = hello.encrypt(toBytes("record"));
    REQUIRE_THROWS_AS(world.decrypt(env), DecryptionError);
    REQUIRE_THROWS_AS(hello.decrypt(toBytes("not an envelope")), DecryptionError);
}

TEST_CASE("SimpleEncryption: concurrent encrypts never share a nonce", "[factory][threads]") {
    SimpleEncryption enc(fastConfig(std::string("hello")));
    enc.encrypt(toBytes("warm-up"));   // derive the key once

    std::mutex mu;
    std::set<std::vector<std::uint8_t>> ivs;
    std::vector<std::thread> workers;
    for (int t = 0; t < 4; ++t) {
        workers.emplace_back([&] {
            for (int i = 0; i < 200; ++i) {
                auto env = enc.encrypt(toBytes("payload"));
                std::vector<std::uint8_t> iv(env.begin() + 6 + AesGcmEngine::SALT_LEN,
                                             env.begin() + AesGcmEngine::HEADER_LEN);
                std::lock_guard<std::mutex> lock(mu);
                ivs.insert(std::move(iv));
            }
        });
    }
    for (auto& w : workers) w.join();

    REQUIRE(ivs.size() == 800);
    REQUIRE(enc.counter() == 801);
}
