#pragma once
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

// Decoded view of one log entry. `value` is empty when the payload could
// not be decrypted (or no data encryption was configured to decrypt it).
struct LogEntry {
    std::optional<std::string>               hash;
    std::optional<std::vector<std::uint8_t>> value;
    std::string   next;
    std::uint64_t clock = 0;
};

// Thrown while enumerating when the log tries to read the value of an entry
// whose block it could not decode at all (sealed by replication encryption
// and no key configured to open it).
class UndecodedEntryAccess : public std::runtime_error {
public:
    explicit UndecodedEntryAccess(const std::string& hash)
    : std::runtime_error("cannot read 'value' of undecoded entry " + hash) {}
};

// The two capabilities the encryption detector needs from a log.
class LogReader {
public:
    virtual ~LogReader() = default;

    // All decoded entries in append order.
    virtual std::vector<LogEntry> all() = 0;

    // Raw stored bytes at a content address.
    virtual std::optional<std::vector<std::uint8_t>> getBlock(const std::string& hash) const = 0;
};
