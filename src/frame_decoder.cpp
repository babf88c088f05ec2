#include "frame_decoder.hpp"
#include "net_types.hpp"
#include "wire_format.hpp"
#include <cstddef>
#include <string>

FrameDecoder::FrameDecoder(std::size_t max_frame_size)
    : m_max_frame_size(max_frame_size) {}

void FrameDecoder::feed(const std::uint8_t *data, std::size_t size) {
    m_buffer.insert(m_buffer.end(), data, data + size);
}

std::optional<std::vector<std::uint8_t>> FrameDecoder::next() {
    if (buffered() < FRAME_HEADER_SIZE)
        return std::nullopt;

    const std::uint8_t *header = m_buffer.data() + m_offset;
    std::uint32_t length = static_cast<std::uint32_t>(header[0]) |
                           (static_cast<std::uint32_t>(header[1]) << 8) |
                           (static_cast<std::uint32_t>(header[2]) << 16) |
                           (static_cast<std::uint32_t>(header[3]) << 24);
    if (length > m_max_frame_size) {
        throw DecodeError("frame of " + std::to_string(length) +
                          " bytes exceeds limit of " +
                          std::to_string(m_max_frame_size));
    }
    if (buffered() < FRAME_HEADER_SIZE + length)
        return std::nullopt;

    auto begin = m_buffer.begin() + static_cast<std::ptrdiff_t>(m_offset + FRAME_HEADER_SIZE);
    std::vector<std::uint8_t> frame(begin, begin + length);
    m_offset += FRAME_HEADER_SIZE + length;
    compact();
    return frame;
}

void FrameDecoder::compact() {
    // Drop consumed bytes once they dominate the buffer
    if (m_offset == m_buffer.size()) {
        m_buffer.clear();
        m_offset = 0;
    } else if (m_offset > 4096 && m_offset * 2 > m_buffer.size()) {
        m_buffer.erase(m_buffer.begin(), m_buffer.begin() + static_cast<std::ptrdiff_t>(m_offset));
        m_offset = 0;
    }
}

std::vector<std::uint8_t> encode_frame(const std::vector<std::uint8_t> &payload) {
    std::vector<std::uint8_t> frame;
    frame.reserve(FRAME_HEADER_SIZE + payload.size());
    auto length = static_cast<std::uint32_t>(payload.size());
    frame.push_back(static_cast<std::uint8_t>(length));
    frame.push_back(static_cast<std::uint8_t>(length >> 8));
    frame.push_back(static_cast<std::uint8_t>(length >> 16));
    frame.push_back(static_cast<std::uint8_t>(length >> 24));
    frame.insert(frame.end(), payload.begin(), payload.end());
    return frame;
}
