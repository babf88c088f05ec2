#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <map>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

/*
 * Binary wire format used for every packet body and RPC payload.
 *
 * - integers are fixed width, little-endian
 * - bool is one byte (0 or 1)
 * - strings, sequences and maps carry a u64 count prefix
 * - fixed-size arrays carry no prefix
 * - variants carry a u8 discriminant (the alternative index)
 */

class DecodeError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

bool is_valid_utf8(const char *data, std::size_t size);

class WireWriter {
public:
  void write_u8(std::uint8_t value) { m_buffer.push_back(value); }
  void write_u16(std::uint16_t value) { write_le(value); }
  void write_u32(std::uint32_t value) { write_le(value); }
  void write_u64(std::uint64_t value) { write_le(value); }
  void write_bool(bool value) { write_u8(value ? 1 : 0); }
  void write_f32(float value);
  void write_f64(double value);
  void write_length(std::size_t length) {
    write_u64(static_cast<std::uint64_t>(length));
  }
  void write_raw(const std::uint8_t *data, std::size_t size);
  void write_string(std::string_view text);

  const std::vector<std::uint8_t> &data() const { return m_buffer; }
  std::vector<std::uint8_t> take() { return std::move(m_buffer); }
  std::size_t size() const { return m_buffer.size(); }

private:
  template <typename T> void write_le(T value) {
    for (std::size_t i = 0; i < sizeof(T); ++i) {
      m_buffer.push_back(static_cast<std::uint8_t>(value >> (8 * i)));
    }
  }

  std::vector<std::uint8_t> m_buffer;
};

class WireReader {
public:
  WireReader(const std::uint8_t *data, std::size_t size)
      : m_data(data), m_size(size) {}
  explicit WireReader(const std::vector<std::uint8_t> &bytes)
      : m_data(bytes.data()), m_size(bytes.size()) {}

  std::uint8_t read_u8();
  std::uint16_t read_u16() { return read_le<std::uint16_t>(); }
  std::uint32_t read_u32() { return read_le<std::uint32_t>(); }
  std::uint64_t read_u64() { return read_le<std::uint64_t>(); }
  bool read_bool();
  float read_f32();
  double read_f64();
  // Element count for a sequence; never larger than the remaining bytes
  // when each element takes at least min_element_size bytes
  std::size_t read_length(std::size_t min_element_size = 1);
  void read_raw(std::uint8_t *out, std::size_t size);
  std::string read_string();

  std::size_t remaining() const { return m_size - m_offset; }
  bool at_end() const { return m_offset == m_size; }
  // Throws when bytes are left over after a complete value
  void expect_end() const;

private:
  void require(std::size_t count) const;

  template <typename T> T read_le() {
    require(sizeof(T));
    T value = 0;
    for (std::size_t i = 0; i < sizeof(T); ++i) {
      value |= static_cast<T>(static_cast<T>(m_data[m_offset + i]) << (8 * i));
    }
    m_offset += sizeof(T);
    return value;
  }

  const std::uint8_t *m_data;
  std::size_t m_size;
  std::size_t m_offset = 0;
};

// Encoding rules per type. Aggregates without a specialization provide
// `void encode(WireWriter &) const` and `static T decode(WireReader &)`.
template <typename T, typename Enable = void> struct WireTraits {
  static void encode(WireWriter &writer, const T &value) {
    value.encode(writer);
  }
  static T decode(WireReader &reader) { return T::decode(reader); }
};

template <typename T> void write(WireWriter &writer, const T &value) {
  WireTraits<T>::encode(writer, value);
}

template <typename T> T read(WireReader &reader) {
  return WireTraits<T>::decode(reader);
}

template <typename T> std::vector<std::uint8_t> encode(const T &value) {
  WireWriter writer;
  write(writer, value);
  return writer.take();
}

template <typename T> T decode(const std::uint8_t *data, std::size_t size) {
  WireReader reader(data, size);
  T value = read<T>(reader);
  reader.expect_end();
  return value;
}

template <typename T> T decode(const std::vector<std::uint8_t> &bytes) {
  return decode<T>(bytes.data(), bytes.size());
}

template <typename T>
struct WireTraits<T, std::enable_if_t<std::is_integral_v<T> &&
                                      !std::is_same_v<T, bool>>> {
  using unsigned_type = std::make_unsigned_t<T>;

  static void encode(WireWriter &writer, T value) {
    auto bits = static_cast<unsigned_type>(value);
    for (std::size_t i = 0; i < sizeof(T); ++i) {
      writer.write_u8(static_cast<std::uint8_t>(bits >> (8 * i)));
    }
  }
  static T decode(WireReader &reader) {
    unsigned_type bits = 0;
    for (std::size_t i = 0; i < sizeof(T); ++i) {
      bits |= static_cast<unsigned_type>(
          static_cast<unsigned_type>(reader.read_u8()) << (8 * i));
    }
    return static_cast<T>(bits);
  }
};

template <typename T> struct WireTraits<T, std::enable_if_t<std::is_enum_v<T>>> {
  using underlying = std::underlying_type_t<T>;

  static void encode(WireWriter &writer, T value) {
    write(writer, static_cast<underlying>(value));
  }
  static T decode(WireReader &reader) {
    return static_cast<T>(read<underlying>(reader));
  }
};

template <> struct WireTraits<bool> {
  static void encode(WireWriter &writer, bool value) {
    writer.write_bool(value);
  }
  static bool decode(WireReader &reader) { return reader.read_bool(); }
};

template <> struct WireTraits<float> {
  static void encode(WireWriter &writer, float value) {
    writer.write_f32(value);
  }
  static float decode(WireReader &reader) { return reader.read_f32(); }
};

template <> struct WireTraits<double> {
  static void encode(WireWriter &writer, double value) {
    writer.write_f64(value);
  }
  static double decode(WireReader &reader) { return reader.read_f64(); }
};

template <> struct WireTraits<std::string> {
  static void encode(WireWriter &writer, const std::string &value) {
    writer.write_string(value);
  }
  static std::string decode(WireReader &reader) { return reader.read_string(); }
};

template <> struct WireTraits<std::vector<std::uint8_t>> {
  static void encode(WireWriter &writer,
                     const std::vector<std::uint8_t> &value) {
    writer.write_length(value.size());
    writer.write_raw(value.data(), value.size());
  }
  static std::vector<std::uint8_t> decode(WireReader &reader) {
    std::vector<std::uint8_t> bytes(reader.read_length());
    reader.read_raw(bytes.data(), bytes.size());
    return bytes;
  }
};

template <typename T> struct WireTraits<std::vector<T>> {
  static void encode(WireWriter &writer, const std::vector<T> &value) {
    writer.write_length(value.size());
    for (const auto &element : value) {
      write(writer, element);
    }
  }
  static std::vector<T> decode(WireReader &reader) {
    std::size_t count = reader.read_length();
    std::vector<T> result;
    result.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
      result.push_back(read<T>(reader));
    }
    return result;
  }
};

template <typename T, std::size_t N> struct WireTraits<std::array<T, N>> {
  static void encode(WireWriter &writer, const std::array<T, N> &value) {
    for (const auto &element : value) {
      write(writer, element);
    }
  }
  static std::array<T, N> decode(WireReader &reader) {
    std::array<T, N> result{};
    for (auto &element : result) {
      element = read<T>(reader);
    }
    return result;
  }
};

template <typename K, typename V, typename C>
struct WireTraits<std::map<K, V, C>> {
  static void encode(WireWriter &writer, const std::map<K, V, C> &value) {
    writer.write_length(value.size());
    for (const auto &[key, mapped] : value) {
      write(writer, key);
      write(writer, mapped);
    }
  }
  static std::map<K, V, C> decode(WireReader &reader) {
    std::size_t count = reader.read_length();
    std::map<K, V, C> result;
    for (std::size_t i = 0; i < count; ++i) {
      K key = read<K>(reader);
      result.insert_or_assign(std::move(key), read<V>(reader));
    }
    return result;
  }
};

template <typename K, typename V, typename H, typename E>
struct WireTraits<std::unordered_map<K, V, H, E>> {
  static void encode(WireWriter &writer,
                     const std::unordered_map<K, V, H, E> &value) {
    writer.write_length(value.size());
    for (const auto &[key, mapped] : value) {
      write(writer, key);
      write(writer, mapped);
    }
  }
  static std::unordered_map<K, V, H, E> decode(WireReader &reader) {
    std::size_t count = reader.read_length();
    std::unordered_map<K, V, H, E> result;
    for (std::size_t i = 0; i < count; ++i) {
      K key = read<K>(reader);
      result.insert_or_assign(std::move(key), read<V>(reader));
    }
    return result;
  }
};

template <typename T, typename C> struct WireTraits<std::set<T, C>> {
  static void encode(WireWriter &writer, const std::set<T, C> &value) {
    writer.write_length(value.size());
    for (const auto &element : value) {
      write(writer, element);
    }
  }
  static std::set<T, C> decode(WireReader &reader) {
    std::size_t count = reader.read_length();
    std::set<T, C> result;
    for (std::size_t i = 0; i < count; ++i) {
      result.insert(read<T>(reader));
    }
    return result;
  }
};

template <typename T> struct WireTraits<std::optional<T>> {
  static void encode(WireWriter &writer, const std::optional<T> &value) {
    writer.write_u8(value ? 1 : 0);
    if (value) {
      write(writer, *value);
    }
  }
  static std::optional<T> decode(WireReader &reader) {
    std::uint8_t tag = reader.read_u8();
    if (tag == 0)
      return std::nullopt;
    if (tag != 1)
      throw DecodeError("invalid optional tag " + std::to_string(tag));
    return read<T>(reader);
  }
};

template <typename A, typename B> struct WireTraits<std::pair<A, B>> {
  static void encode(WireWriter &writer, const std::pair<A, B> &value) {
    write(writer, value.first);
    write(writer, value.second);
  }
  static std::pair<A, B> decode(WireReader &reader) {
    A first = read<A>(reader);
    B second = read<B>(reader);
    return {std::move(first), std::move(second)};
  }
};

template <typename... Ts> struct WireTraits<std::tuple<Ts...>> {
  static void encode(WireWriter &writer, const std::tuple<Ts...> &value) {
    std::apply([&writer](const auto &...fields) { (write(writer, fields), ...); },
               value);
  }
  static std::tuple<Ts...> decode(WireReader &reader) {
    // Braced initialisation evaluates the reads left to right
    return std::tuple<Ts...>{read<Ts>(reader)...};
  }
};

template <typename... Ts> struct WireTraits<std::variant<Ts...>> {
  using variant_type = std::variant<Ts...>;
  static_assert(sizeof...(Ts) <= 256, "discriminant is a single byte");

  static void encode(WireWriter &writer, const variant_type &value) {
    writer.write_u8(static_cast<std::uint8_t>(value.index()));
    std::visit(
        [&writer](const auto &alternative) { write(writer, alternative); },
        value);
  }

  static variant_type decode(WireReader &reader) {
    std::uint8_t tag = reader.read_u8();
    if (tag >= sizeof...(Ts)) {
      throw DecodeError("invalid variant discriminant " + std::to_string(tag));
    }
    return decode_tagged(reader, tag, std::index_sequence_for<Ts...>{});
  }

private:
  template <std::size_t I> static variant_type decode_at(WireReader &reader) {
    using alternative = std::variant_alternative_t<I, variant_type>;
    return variant_type(std::in_place_index<I>, read<alternative>(reader));
  }

  template <std::size_t... Is>
  static variant_type decode_tagged(WireReader &reader, std::uint8_t tag,
                                    std::index_sequence<Is...>) {
    using decoder = variant_type (*)(WireReader &);
    static constexpr decoder table[] = {&decode_at<Is>...};
    return table[tag](reader);
  }
};
