#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

class MalformedBlock : public std::runtime_error {
public:
    MalformedBlock() : std::runtime_error("malformed entry block") {}
};

// Wire form of a log entry before any replication sealing.
struct EntryRecord {
    std::uint64_t clock = 0;
    std::string   next;                    // hash of the previous head, "" for the first entry
    bool          dataEncrypted = false;   // payload holds a data-slot envelope
    std::vector<std::uint8_t> payload;
};

// Block layout: 'S' 'L' kind | body
//   kind 0 (plain):  BE64 clock | BE16 len | next | u8 flags | BE32 len | payload
//   kind 1 (sealed): replication-slot envelope of a plain block
namespace EntryCodec {
    constexpr std::uint8_t KIND_PLAIN  = 0;
    constexpr std::uint8_t KIND_SEALED = 1;

    std::vector<std::uint8_t> encode(const EntryRecord& entry);

    // Throws MalformedBlock on bad framing.
    EntryRecord decode(const std::vector<std::uint8_t>& block);

    std::vector<std::uint8_t> seal(const std::vector<std::uint8_t>& envelope);

    // Returns the envelope carried by a sealed block. Throws MalformedBlock.
    std::vector<std::uint8_t> unseal(const std::vector<std::uint8_t>& block);

    bool isSealed(const std::vector<std::uint8_t>& block);
}
