#pragma once
#include "EntryEncryption.hpp"
#include "LogReader.hpp"

#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

// Forward-declare sqlite3 so consumers of this header don't need sqlite3.h
struct sqlite3;

// Encryption slots, per role. Either may be empty.
struct LogEncryption {
    std::shared_ptr<EntryEncryption> data;         // entry payloads
    std::shared_ptr<EntryEncryption> replication;  // whole stored blocks
};

// Append-only, hash-linked entry log persisted in SQLite.
// Blocks are content-addressed by the hex SHA-256 of their stored bytes.
class EntryLog : public LogReader {
public:
    using ErrorHandler = std::function<void(const std::string& hash, const std::exception& error)>;

    explicit EntryLog(const std::string& dbPath, LogEncryption encryption = {});
    ~EntryLog() override;

    EntryLog(const EntryLog&) = delete;
    EntryLog& operator=(const EntryLog&) = delete;

    // Create tables if not present
    void init();

    // ---- Writing
    std::string add(const std::vector<std::uint8_t>& value);
    std::string add(const std::string& value);

    // Store a block received from elsewhere. Throws std::invalid_argument if
    // `hash` is not the block's content address. Returns false for duplicates.
    bool putBlock(const std::string& hash, const std::vector<std::uint8_t>& bytes);

    // Copy every block this log lacks from `other`; returns how many were new.
    std::size_t replicateFrom(const EntryLog& other);

    // Remove every block.
    void drop();

    // ---- Reading
    // Entries whose sealed block fails to decrypt are reported to the error
    // handler and skipped; payloads that fail to decrypt come back without
    // a value. A sealed block with no replication slot throws
    // UndecodedEntryAccess.
    std::vector<LogEntry> all() override;
    std::optional<std::vector<std::uint8_t>> getBlock(const std::string& hash) const override;

    std::optional<std::vector<std::uint8_t>> get(const std::string& hash);
    std::vector<std::string> hashes() const;
    std::size_t size() const;

    // Per-entry decryption failures go here instead of aborting a read.
    void onError(ErrorHandler handler);

    // ---- Transactions
    void beginTransaction();
    void commit();
    void rollback();

private:
    struct StoredBlock {
        std::string hash;
        std::vector<std::uint8_t> bytes;
    };

    std::vector<StoredBlock> loadBlocks() const;
    std::optional<StoredBlock> headBlock() const;

    // Clock for the next appended entry: head clock + 1, or 1 for an empty
    // log. Falls back to size() + 1 when the head cannot be decoded here.
    std::uint64_t nextClock(const std::optional<StoredBlock>& head) const;

    // nullopt when the entry had to be skipped.
    std::optional<LogEntry> decodeBlock(const StoredBlock& block);

    void reportError(const std::string& hash, const std::exception& error) const;

    std::string   m_dbPath;
    sqlite3*      m_db = nullptr; // persistent DB connection
    LogEncryption m_encryption;
    ErrorHandler  m_onError;

    // helper to run raw SQL without parameters on m_db
    void exec(const std::string& sql) const;
};
