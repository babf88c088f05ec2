#include "wire_format.hpp"
#include <cstring>
#include <string>

bool is_valid_utf8(const char *data, std::size_t size) {
    const auto *bytes = reinterpret_cast<const unsigned char *>(data);
    std::size_t i = 0;
    while (i < size) {
        unsigned char lead = bytes[i];
        std::size_t extra = 0;
        std::uint32_t code_point = 0;

        if (lead < 0x80) {
            ++i;
            continue;
        } else if ((lead & 0xE0) == 0xC0) {
            extra = 1;
            code_point = lead & 0x1F;
        } else if ((lead & 0xF0) == 0xE0) {
            extra = 2;
            code_point = lead & 0x0F;
        } else if ((lead & 0xF8) == 0xF0) {
            extra = 3;
            code_point = lead & 0x07;
        } else {
            return false;
        }

        if (size - i <= extra)
            return false;

        for (std::size_t k = 1; k <= extra; ++k) {
            unsigned char next = bytes[i + k];
            if ((next & 0xC0) != 0x80)
                return false;
            code_point = (code_point << 6) | (next & 0x3F);
        }

        // Reject overlong forms, surrogates and values past U+10FFFF
        if ((extra == 1 && code_point < 0x80) ||
            (extra == 2 && code_point < 0x800) ||
            (extra == 3 && code_point < 0x10000) || code_point > 0x10FFFF ||
            (code_point >= 0xD800 && code_point <= 0xDFFF))
            return false;

        i += extra + 1;
    }
    return true;
}

void WireWriter::write_f32(float value) {
    std::uint32_t bits;
    std::memcpy(&bits, &value, sizeof(bits));
    write_u32(bits);
}

void WireWriter::write_f64(double value) {
    std::uint64_t bits;
    std::memcpy(&bits, &value, sizeof(bits));
    write_u64(bits);
}

void WireWriter::write_raw(const std::uint8_t *data, std::size_t size) {
    m_buffer.insert(m_buffer.end(), data, data + size);
}

void WireWriter::write_string(std::string_view text) {
    write_length(text.size());
    write_raw(reinterpret_cast<const std::uint8_t *>(text.data()), text.size());
}

void WireReader::require(std::size_t count) const {
    if (count > remaining()) {
        throw DecodeError("truncated input: need " + std::to_string(count) +
                          " bytes, have " + std::to_string(remaining()));
    }
}

std::uint8_t WireReader::read_u8() {
    require(1);
    return m_data[m_offset++];
}

bool WireReader::read_bool() {
    std::uint8_t value = read_u8();
    if (value > 1)
        throw DecodeError("invalid bool value " + std::to_string(value));
    return value == 1;
}

float WireReader::read_f32() {
    std::uint32_t bits = read_u32();
    float value;
    std::memcpy(&value, &bits, sizeof(value));
    return value;
}

double WireReader::read_f64() {
    std::uint64_t bits = read_u64();
    double value;
    std::memcpy(&value, &bits, sizeof(value));
    return value;
}

std::size_t WireReader::read_length(std::size_t min_element_size) {
    std::uint64_t length = read_u64();
    // A count that cannot fit in what is left is a truncated buffer, and
    // must not drive a huge allocation
    if (min_element_size > 0 && length > remaining() / min_element_size) {
        throw DecodeError("length prefix " + std::to_string(length) +
                          " exceeds remaining input");
    }
    return static_cast<std::size_t>(length);
}

void WireReader::read_raw(std::uint8_t *out, std::size_t size) {
    require(size);
    if (size > 0) {
        std::memcpy(out, m_data + m_offset, size);
    }
    m_offset += size;
}

std::string WireReader::read_string() {
    std::size_t length = read_length();
    std::string text(reinterpret_cast<const char *>(m_data + m_offset), length);
    m_offset += length;
    if (!is_valid_utf8(text.data(), text.size())) {
        throw DecodeError("string is not valid UTF-8");
    }
    return text;
}

void WireReader::expect_end() const {
    if (!at_end()) {
        throw DecodeError(std::to_string(remaining()) +
                          " trailing bytes after value");
    }
}
