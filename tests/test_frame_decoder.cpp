#include "frame_decoder.hpp"
#include "net_types.hpp"
#include "packets.hpp"
#include <doctest/doctest.h>
#include <string>
#include <vector>

TEST_SUITE("framing") {

TEST_CASE("frame header is a 4-byte little-endian length") {
  std::vector<std::uint8_t> payload(300, 7);
  auto frame = encode_frame(payload);
  REQUIRE(frame.size() == 304);
  CHECK(frame[0] == 0x2C);
  CHECK(frame[1] == 0x01);
  CHECK(frame[2] == 0);
  CHECK(frame[3] == 0);
}

TEST_CASE("frames fed one byte at a time come out whole and in order") {
  client_id client = Id::generate();
  std::vector<ClientPacket> sent;
  std::vector<std::uint8_t> stream;
  for (int i = 0; i < 5; ++i) {
    sent.push_back(make_client_packet(client, client_msg::Ping{"message " + std::to_string(i)}));
    auto frame = encode_frame(encode(sent.back()));
    stream.insert(stream.end(), frame.begin(), frame.end());
  }

  FrameDecoder decoder(MAX_FRAME_SIZE);
  std::vector<ClientPacket> received;
  for (auto byte : stream) {
    decoder.feed(&byte, 1);
    while (auto frame = decoder.next()) {
      received.push_back(decode<ClientPacket>(*frame));
    }
  }

  REQUIRE(received.size() == sent.size());
  for (std::size_t i = 0; i < sent.size(); ++i) {
    CHECK(received[i] == sent[i]);
  }
  CHECK(decoder.buffered() == 0);
}

TEST_CASE("several frames in one chunk") {
  std::vector<std::uint8_t> stream;
  for (std::uint8_t i = 0; i < 3; ++i) {
    auto frame = encode_frame(std::vector<std::uint8_t>(i, i));
    stream.insert(stream.end(), frame.begin(), frame.end());
  }

  FrameDecoder decoder(MAX_FRAME_SIZE);
  decoder.feed(stream.data(), stream.size());
  for (std::uint8_t i = 0; i < 3; ++i) {
    auto frame = decoder.next();
    REQUIRE(frame.has_value());
    CHECK(frame->size() == i);
  }
  CHECK_FALSE(decoder.next().has_value());
}

TEST_CASE("partial header waits for more bytes") {
  FrameDecoder decoder(MAX_FRAME_SIZE);
  std::uint8_t header[] = {5, 0};
  decoder.feed(header, sizeof(header));
  CHECK_FALSE(decoder.next().has_value());
  CHECK(decoder.buffered() == 2);
}

TEST_CASE("oversized frame is a stream error") {
  FrameDecoder decoder(1024);
  std::uint8_t header[] = {0x01, 0x04, 0, 0}; // 1025
  decoder.feed(header, sizeof(header));
  CHECK_THROWS_AS(decoder.next(), DecodeError);
}

} // TEST_SUITE
