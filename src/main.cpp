// src/main.cpp
#include "EncryptionDetector.hpp"
#include "EntryLog.hpp"
#include "SimpleEncryption.hpp"
#include "console_io.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include <cstdint>
#include <stdexcept>

// ----- Small helpers -----

static std::shared_ptr<EntryEncryption> encryption_for(const std::string& role) {
    std::string pw = prompt_hidden(role + " password (blank = none): ");
    if (pw.empty()) return nullptr;

    EncryptionConfig config;
    config.password = pw;
    auto enc = std::make_shared<SimpleEncryption>(config);

    // scrub both copies; the encryption object keeps its own
    auto& copy = std::get<std::string>(*config.password);
    std::fill(copy.begin(), copy.end(), '\0');
    std::fill(pw.begin(), pw.end(), '\0');
    return enc;
}

static std::string printable(const std::vector<std::uint8_t>& bytes) {
    const bool text = std::all_of(bytes.begin(), bytes.end(), [](std::uint8_t c) {
        return std::isprint(c) || std::isspace(c);
    });
    if (text) return "\"" + std::string(bytes.begin(), bytes.end()) + "\"";

    static const char* kHex = "0123456789abcdef";
    std::string out = "0x";
    for (std::uint8_t b : bytes) {
        out.push_back(kHex[b >> 4]);
        out.push_back(kHex[b & 0x0F]);
    }
    return out;
}

static void print_entry(const LogEntry& e) {
    std::cout << "  " << e.hash.value_or("<no hash>")
              << "  clock=" << e.clock
              << "  value=" << (e.value ? printable(*e.value) : std::string("<undefined>"))
              << "\n";
}

// ----- Menu actions -----

static void action_add(EntryLog& log) {
    std::string value = prompt_line("Record: ");
    std::string hash = log.add(value);
    std::cout << "Added " << hash << "\n";
}

static void action_list_all(EntryLog& log) {
    try {
        auto entries = log.all();
        if (entries.empty()) {
            std::cout << "Log is empty.\n";
            return;
        }
        for (const auto& e : entries) print_entry(e);
    } catch (const UndecodedEntryAccess& ex) {
        std::cout << "Cannot decode log: " << ex.what()
                  << " (replication password required)\n";
    }
}

static void action_get(EntryLog& log) {
    std::string hash = prompt_line("Hash: ");
    try {
        auto value = log.get(hash);
        if (!value) { std::cout << "Not found or not readable.\n"; return; }
        std::cout << "Value: " << printable(*value) << "\n";
    } catch (const UndecodedEntryAccess& ex) {
        std::cout << "Cannot decode entry: " << ex.what() << "\n";
    }
}

static void action_block(const EntryLog& log) {
    std::string hash = prompt_line("Hash: ");
    auto bytes = log.getBlock(hash);
    if (!bytes) { std::cout << "Not found.\n"; return; }
    std::cout << "Block (" << bytes->size() << " bytes): " << printable(*bytes) << "\n";
}

static void action_replicate(EntryLog& log) {
    std::string path = prompt_line("Replicate from log file: ");
    if (!std::filesystem::exists(path)) {
        std::cout << "No such file.\n";
        return;
    }
    EntryLog source(path);
    source.init();
    std::size_t copied = log.replicateFrom(source);
    std::cout << "Copied " << copied << " new block(s).\n";
}

static void action_detect(const std::string& dbPath) {
    // A second handle without any encryption, as an app without keys would open it.
    EntryLog keyless(dbPath);
    keyless.init();
    if (isDatabaseEncrypted(keyless)) {
        std::cout << "Log appears to be encrypted.\n";
    } else {
        std::cout << "Log does not appear to be encrypted (or is empty).\n";
    }
}

// ----- Main -----

int main(int argc, char** argv) {
    try {
        const std::string dbPath = argc > 1 ? argv[1] : "data/sealedlog.sqlite";
        const auto parent = std::filesystem::path(dbPath).parent_path();
        if (!parent.empty()) std::filesystem::create_directories(parent);

        std::cout << "sealedlog: " << dbPath << "\n";

        LogEncryption encryption;
        encryption.data        = encryption_for("Data");
        encryption.replication = encryption_for("Replication");

        EntryLog log(dbPath, encryption);
        log.init();
        log.onError([](const std::string& hash, const std::exception& ex) {
            std::cerr << "[error] entry " << hash << ": " << ex.what() << "\n";
        });

        for (;;) {
            std::cout << "\n=== Menu ===\n"
                         "1) Add record\n"
                         "2) List all\n"
                         "3) Get by hash\n"
                         "4) Show raw block\n"
                         "5) Replicate from another log\n"
                         "6) Detect encryption\n"
                         "q) Quit\n";
            std::string choice = prompt_line("> ");
            if (!std::cin) break;

            try {
                if (choice == "1") action_add(log);
                else if (choice == "2") action_list_all(log);
                else if (choice == "3") action_get(log);
                else if (choice == "4") action_block(log);
                else if (choice == "5") action_replicate(log);
                else if (choice == "6") action_detect(dbPath);
                else if (choice == "q" || choice == "Q") break;
                else std::cout << "Unknown option.\n";
            } catch (const std::exception& ex) {
                std::cerr << "[error] " << ex.what() << "\n";
            }
        }

        return 0;
    } catch (const std::exception& ex) {
        std::cerr << "[Fatal] " << ex.what() << "\n";
        return 99;
    }
}
