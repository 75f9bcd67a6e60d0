// src/EntryLog.cpp
#include "EntryLog.hpp"
#include "AesGcmEngine.hpp"
#include "EntryCodec.hpp"
#include "sha256.hpp"

#include <sqlite3.h>
#include <stdexcept>
#include <string>
#include <vector>
#include <memory>     // std::unique_ptr
#include <optional>   // std::optional
#include <cstdint>

// Helper: RAII closer for sqlite3_stmt* + small helpers
namespace {
    struct StmtCloser {
        void operator()(sqlite3_stmt* stmt) const {
            if (stmt) sqlite3_finalize(stmt);
        }
    };
    using Stmt = std::unique_ptr<sqlite3_stmt, StmtCloser>;

    Stmt prepare(sqlite3* db, const char* sql, const char* what) {
        sqlite3_stmt* stmtRaw = nullptr;
        int rc = sqlite3_prepare_v2(db, sql, -1, &stmtRaw, nullptr);
        if (rc != SQLITE_OK) {
            throw std::runtime_error(std::string("sqlite3_prepare_v2(") + what + "): "
                                     + sqlite3_errmsg(db));
        }
        return Stmt(stmtRaw);
    }

    // Null-safe read of BLOB columns
    std::vector<std::uint8_t> read_blob(sqlite3_stmt* st, int col) {
        const void* ptr = sqlite3_column_blob(st, col);
        int nbytes = sqlite3_column_bytes(st, col);
        std::vector<std::uint8_t> out;
        if (ptr && nbytes > 0) {
            const auto* b = static_cast<const std::uint8_t*>(ptr);
            out.assign(b, b + nbytes);
        }
        return out;
    }

    // Null-safe read of TEXT columns
    inline std::string read_text_nullable(sqlite3_stmt* st, int col) {
        const unsigned char* p = sqlite3_column_text(st, col);
        return p ? reinterpret_cast<const char*>(p) : std::string{};
    }
}

// ---- Persistent-connection ctor/dtor ----
EntryLog::EntryLog(const std::string& dbPath, LogEncryption encryption)
    : m_dbPath(dbPath), m_db(nullptr), m_encryption(std::move(encryption))
{
    int rc = sqlite3_open_v2(
        m_dbPath.c_str(),
        &m_db,
        SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE,
        nullptr
    );
    if (rc != SQLITE_OK || !m_db) {
        std::string msg = m_db ? sqlite3_errmsg(m_db) : "unknown";
        if (m_db) sqlite3_close(m_db);
        m_db = nullptr;
        throw std::runtime_error("sqlite3_open_v2 failed: " + msg);
    }
}

EntryLog::~EntryLog() {
    if (m_db) {
        sqlite3_close(m_db);
        m_db = nullptr;
    }
}

// Run raw SQL (no parameters) on the same connection
void EntryLog::exec(const std::string& sql) const {
    char* errMsg = nullptr;
    int rc = sqlite3_exec(m_db, sql.c_str(), nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        std::string msg = errMsg ? errMsg : "unknown";
        sqlite3_free(errMsg);
        throw std::runtime_error("sqlite3_exec failed: " + msg);
    }
}

void EntryLog::init() {
    static const char* kSchema = R"SQL(
CREATE TABLE IF NOT EXISTS blocks (
  seq   INTEGER PRIMARY KEY AUTOINCREMENT,
  hash  TEXT NOT NULL UNIQUE,
  bytes BLOB NOT NULL
);
)SQL";

    exec(kSchema);
}

void EntryLog::onError(ErrorHandler handler) {
    m_onError = std::move(handler);
}

void EntryLog::reportError(const std::string& hash, const std::exception& error) const {
    if (m_onError) m_onError(hash, error);
}

// ---- Writing ----

std::string EntryLog::add(const std::string& value) {
    return add(std::vector<std::uint8_t>(value.begin(), value.end()));
}

std::string EntryLog::add(const std::vector<std::uint8_t>& value) {
    const auto head = headBlock();

    EntryRecord entry;
    entry.clock = nextClock(head);
    if (head) entry.next = head->hash;

    if (m_encryption.data) {
        entry.payload = m_encryption.data->encrypt(value);
        entry.dataEncrypted = true;
    } else {
        entry.payload = value;
    }

    std::vector<std::uint8_t> block = EntryCodec::encode(entry);
    if (m_encryption.replication) {
        block = EntryCodec::seal(m_encryption.replication->encrypt(block));
    }

    const std::string hash = sha256Hex(block);
    putBlock(hash, block);
    return hash;
}

bool EntryLog::putBlock(const std::string& hash, const std::vector<std::uint8_t>& bytes) {
    if (sha256Hex(bytes) != hash) {
        throw std::invalid_argument("putBlock: hash does not match block content");
    }

    auto stmt = prepare(m_db, "INSERT OR IGNORE INTO blocks(hash, bytes) VALUES(?, ?);", "putBlock");

    auto bind_ok = [&](int code, const char* what) {
        if (code != SQLITE_OK) {
            throw std::runtime_error(std::string(what) + ": " + sqlite3_errmsg(m_db));
        }
    };
    bind_ok(sqlite3_bind_text(stmt.get(), 1, hash.c_str(), -1, SQLITE_TRANSIENT), "bind hash");
    bind_ok(sqlite3_bind_blob(stmt.get(), 2, bytes.data(),
                              static_cast<int>(bytes.size()), SQLITE_TRANSIENT), "bind bytes");

    int rc = sqlite3_step(stmt.get());
    if (rc != SQLITE_DONE) {
        throw std::runtime_error(std::string("step putBlock: ") + sqlite3_errmsg(m_db));
    }
    return sqlite3_changes(m_db) > 0;
}

std::size_t EntryLog::replicateFrom(const EntryLog& other) {
    std::size_t copied = 0;
    auto blocks = other.loadBlocks();

    beginTransaction();
    try {
        for (const auto& b : blocks) {
            if (putBlock(b.hash, b.bytes)) ++copied;
        }
        commit();
    } catch (const std::exception&) {
        // report the original failure, not a rollback one
        try { rollback(); } catch (const std::runtime_error&) {}
        throw;
    }
    return copied;
}

void EntryLog::drop() {
    exec("DELETE FROM blocks;");
}

// ---- Reading ----

std::vector<EntryLog::StoredBlock> EntryLog::loadBlocks() const {
    auto stmt = prepare(m_db, "SELECT hash, bytes FROM blocks ORDER BY seq ASC;", "loadBlocks");

    std::vector<StoredBlock> out;
    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        out.push_back(StoredBlock{ read_text_nullable(stmt.get(), 0), read_blob(stmt.get(), 1) });
    }
    if (rc != SQLITE_DONE) {
        throw std::runtime_error(std::string("step loadBlocks failed: ") + sqlite3_errmsg(m_db));
    }
    return out;
}

std::optional<EntryLog::StoredBlock> EntryLog::headBlock() const {
    auto stmt = prepare(m_db, "SELECT hash, bytes FROM blocks ORDER BY seq DESC LIMIT 1;", "headBlock");

    int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_ROW) {
        return StoredBlock{ read_text_nullable(stmt.get(), 0), read_blob(stmt.get(), 1) };
    } else if (rc == SQLITE_DONE) {
        return std::nullopt;
    } else {
        throw std::runtime_error(std::string("step headBlock failed: ") + sqlite3_errmsg(m_db));
    }
}

std::uint64_t EntryLog::nextClock(const std::optional<StoredBlock>& head) const {
    if (!head) return 1;

    try {
        std::vector<std::uint8_t> plain = head->bytes;
        if (EntryCodec::isSealed(plain)) {
            if (!m_encryption.replication) {
                return static_cast<std::uint64_t>(size()) + 1;
            }
            plain = m_encryption.replication->decrypt(EntryCodec::unseal(plain));
        }
        return EntryCodec::decode(plain).clock + 1;
    } catch (const DecryptionError&) {
        return static_cast<std::uint64_t>(size()) + 1;
    } catch (const MalformedBlock&) {
        return static_cast<std::uint64_t>(size()) + 1;
    }
}

std::optional<LogEntry> EntryLog::decodeBlock(const StoredBlock& block) {
    std::vector<std::uint8_t> plain = block.bytes;

    if (EntryCodec::isSealed(plain)) {
        if (!m_encryption.replication) {
            throw UndecodedEntryAccess(block.hash);
        }
        try {
            plain = m_encryption.replication->decrypt(EntryCodec::unseal(plain));
        } catch (const DecryptionError& ex) {
            reportError(block.hash, ex);
            return std::nullopt;
        } catch (const MalformedBlock& ex) {
            reportError(block.hash, ex);
            return std::nullopt;
        }
    }

    EntryRecord record;
    try {
        record = EntryCodec::decode(plain);
    } catch (const MalformedBlock& ex) {
        reportError(block.hash, ex);
        return std::nullopt;
    }

    LogEntry entry;
    entry.hash  = block.hash;
    entry.next  = std::move(record.next);
    entry.clock = record.clock;

    if (!record.dataEncrypted) {
        entry.value = std::move(record.payload);
    } else if (m_encryption.data) {
        try {
            entry.value = m_encryption.data->decrypt(record.payload);
        } catch (const DecryptionError& ex) {
            reportError(block.hash, ex);
        }
    }
    return entry;
}

std::vector<LogEntry> EntryLog::all() {
    std::vector<LogEntry> out;
    for (const auto& block : loadBlocks()) {
        if (auto entry = decodeBlock(block)) {
            out.push_back(std::move(*entry));
        }
    }
    return out;
}

std::optional<std::vector<std::uint8_t>> EntryLog::get(const std::string& hash) {
    auto bytes = getBlock(hash);
    if (!bytes) return std::nullopt;

    auto entry = decodeBlock(StoredBlock{ hash, std::move(*bytes) });
    if (!entry) return std::nullopt;
    return entry->value;
}

std::optional<std::vector<std::uint8_t>> EntryLog::getBlock(const std::string& hash) const {
    auto stmt = prepare(m_db, "SELECT bytes FROM blocks WHERE hash = ?;", "getBlock");

    int rc = sqlite3_bind_text(stmt.get(), 1, hash.c_str(), -1, SQLITE_TRANSIENT);
    if (rc != SQLITE_OK) {
        throw std::runtime_error(std::string("bind hash failed: ") + sqlite3_errmsg(m_db));
    }

    rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_ROW) {
        return read_blob(stmt.get(), 0);
    } else if (rc == SQLITE_DONE) {
        return std::nullopt;
    } else {
        throw std::runtime_error(std::string("step getBlock failed: ") + sqlite3_errmsg(m_db));
    }
}

std::vector<std::string> EntryLog::hashes() const {
    auto stmt = prepare(m_db, "SELECT hash FROM blocks ORDER BY seq ASC;", "hashes");

    std::vector<std::string> out;
    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        out.push_back(read_text_nullable(stmt.get(), 0));
    }
    if (rc != SQLITE_DONE) {
        throw std::runtime_error(std::string("step hashes failed: ") + sqlite3_errmsg(m_db));
    }
    return out;
}

std::size_t EntryLog::size() const {
    auto stmt = prepare(m_db, "SELECT COUNT(*) FROM blocks;", "size");

    int rc = sqlite3_step(stmt.get());
    if (rc != SQLITE_ROW) {
        throw std::runtime_error(std::string("step size failed: ") + sqlite3_errmsg(m_db));
    }
    return static_cast<std::size_t>(sqlite3_column_int64(stmt.get(), 0));
}

// ---- Transactions ----

void EntryLog::beginTransaction() { exec("BEGIN IMMEDIATE;"); }
void EntryLog::commit()           { exec("COMMIT;"); }
void EntryLog::rollback()         { exec("ROLLBACK;"); }
