#include "id.hpp"
#include "wire_format.hpp"
#include <cstdio>
#include <random>

namespace {

std::mt19937_64 &id_engine() {
    thread_local std::mt19937_64 engine{[] {
        std::random_device rd;
        std::seed_seq seq{rd(), rd(), rd(), rd()};
        return std::mt19937_64(seq);
    }()};
    return engine;
}

int hex_value(char c) {
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

} // namespace

Id Id::generate() {
    Id id;
    // Never hand out the nil id
    do {
        id.hi = id_engine()();
        id.lo = id_engine()();
    } while (id.is_nil());
    return id;
}

Id Id::from_name(std::string_view name) {
    Id id;
    id.hi = fnv1a64(name);
    id.lo = fnv1a64(name, 0x84222325cbf29ce4ULL);
    return id;
}

std::optional<Id> Id::parse(std::string_view text) {
    // 8-4-4-4-12 hex groups
    if (text.size() != 36)
        return std::nullopt;

    Id id;
    int nibbles = 0;
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            if (text[i] != '-')
                return std::nullopt;
            continue;
        }
        int v = hex_value(text[i]);
        if (v < 0)
            return std::nullopt;
        if (nibbles < 16)
            id.hi = (id.hi << 4) | static_cast<std::uint64_t>(v);
        else
            id.lo = (id.lo << 4) | static_cast<std::uint64_t>(v);
        ++nibbles;
    }
    return id;
}

std::string Id::to_string() const {
    char buffer[37];
    std::snprintf(buffer, sizeof(buffer), "%08x-%04x-%04x-%04x-%04x%08x",
                  static_cast<unsigned>(hi >> 32),
                  static_cast<unsigned>((hi >> 16) & 0xFFFF),
                  static_cast<unsigned>(hi & 0xFFFF),
                  static_cast<unsigned>(lo >> 48),
                  static_cast<unsigned>((lo >> 32) & 0xFFFF),
                  static_cast<unsigned>(lo & 0xFFFFFFFF));
    return std::string(buffer);
}

void Id::encode(WireWriter &writer) const {
    writer.write_u64(lo);
    writer.write_u64(hi);
}

Id Id::decode(WireReader &reader) {
    Id id;
    id.lo = reader.read_u64();
    id.hi = reader.read_u64();
    return id;
}
