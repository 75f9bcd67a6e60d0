#include "EntryCodec.hpp"

#include <limits>
#include <stdexcept>

namespace {
    constexpr std::uint8_t MAGIC0 = 'S';
    constexpr std::uint8_t MAGIC1 = 'L';
    constexpr std::uint8_t FLAG_DATA_ENCRYPTED = 0x01;

    [[noreturn]] void malformed() {
        throw MalformedBlock();
    }

    void put_be(std::vector<std::uint8_t>& out, std::uint64_t v, int bytes) {
        for (int i = bytes - 1; i >= 0; --i) {
            out.push_back(static_cast<std::uint8_t>(v >> (8 * i)));
        }
    }

    // Bounds-checked reader over a block.
    struct Reader {
        const std::vector<std::uint8_t>& buf;
        std::size_t pos;

        std::uint64_t be(int bytes) {
            if (buf.size() - pos < static_cast<std::size_t>(bytes)) malformed();
            std::uint64_t v = 0;
            for (int i = 0; i < bytes; ++i) v = (v << 8) | buf[pos++];
            return v;
        }

        std::vector<std::uint8_t> take(std::size_t n) {
            if (buf.size() - pos < n) malformed();
            std::vector<std::uint8_t> out(buf.begin() + pos, buf.begin() + pos + n);
            pos += n;
            return out;
        }
    };

    bool has_magic(const std::vector<std::uint8_t>& block) {
        return block.size() >= 3 && block[0] == MAGIC0 && block[1] == MAGIC1;
    }
}

namespace EntryCodec {

std::vector<std::uint8_t> encode(const EntryRecord& entry) {
    if (entry.next.size() > std::numeric_limits<std::uint16_t>::max()) {
        throw std::invalid_argument("encode: next hash too long");
    }
    if (entry.payload.size() > std::numeric_limits<std::uint32_t>::max()) {
        throw std::invalid_argument("encode: payload too large");
    }

    std::vector<std::uint8_t> out;
    out.reserve(3 + 8 + 2 + entry.next.size() + 1 + 4 + entry.payload.size());
    out.push_back(MAGIC0);
    out.push_back(MAGIC1);
    out.push_back(KIND_PLAIN);
    put_be(out, entry.clock, 8);
    put_be(out, entry.next.size(), 2);
    out.insert(out.end(), entry.next.begin(), entry.next.end());
    out.push_back(entry.dataEncrypted ? FLAG_DATA_ENCRYPTED : 0);
    put_be(out, entry.payload.size(), 4);
    out.insert(out.end(), entry.payload.begin(), entry.payload.end());
    return out;
}

EntryRecord decode(const std::vector<std::uint8_t>& block) {
    if (!has_magic(block) || block[2] != KIND_PLAIN) malformed();

    Reader r{ block, 3 };
    EntryRecord entry;
    entry.clock = r.be(8);
    auto next = r.take(static_cast<std::size_t>(r.be(2)));
    entry.next.assign(next.begin(), next.end());

    const std::uint64_t flags = r.be(1);
    if (flags & ~static_cast<std::uint64_t>(FLAG_DATA_ENCRYPTED)) malformed();
    entry.dataEncrypted = (flags & FLAG_DATA_ENCRYPTED) != 0;

    entry.payload = r.take(static_cast<std::size_t>(r.be(4)));
    if (r.pos != block.size()) malformed();
    return entry;
}

std::vector<std::uint8_t> seal(const std::vector<std::uint8_t>& envelope) {
    std::vector<std::uint8_t> out;
    out.reserve(3 + envelope.size());
    out.push_back(MAGIC0);
    out.push_back(MAGIC1);
    out.push_back(KIND_SEALED);
    out.insert(out.end(), envelope.begin(), envelope.end());
    return out;
}

std::vector<std::uint8_t> unseal(const std::vector<std::uint8_t>& block) {
    if (!isSealed(block)) malformed();
    return std::vector<std::uint8_t>(block.begin() + 3, block.end());
}

bool isSealed(const std::vector<std::uint8_t>& block) {
    return has_magic(block) && block[2] == KIND_SEALED;
}

}
