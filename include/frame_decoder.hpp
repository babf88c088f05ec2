#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

// Reassembles length-prefixed frames from a reliable byte stream.
// Each frame is a 4-byte little-endian length followed by that many bytes;
// the stream may hand them over in chunks of any size.
class FrameDecoder {
public:
  explicit FrameDecoder(std::size_t max_frame_size);

  void feed(const std::uint8_t *data, std::size_t size);
  // Next complete frame, or nullopt until more bytes arrive.
  // Throws DecodeError when a header announces an oversized frame.
  std::optional<std::vector<std::uint8_t>> next();

  std::size_t buffered() const { return m_buffer.size() - m_offset; }

private:
  void compact();

  std::size_t m_max_frame_size;
  std::vector<std::uint8_t> m_buffer;
  std::size_t m_offset = 0;
};

// Length prefix + payload, ready to write to the stream
std::vector<std::uint8_t> encode_frame(const std::vector<std::uint8_t> &payload);
