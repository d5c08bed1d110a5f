#pragma once
#include <sentinel/schema/primitives.hpp>
#include <boost/endian/conversion.hpp>
#include <algorithm>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <type_traits>

namespace sentinel::schema::key {

// Raw byte key assembly. Integers are written big-endian so RocksDB's
// bytewise ordering matches numeric ordering under a prefix.
struct builder final {
  sentinel::schema::bytes_t data;

  builder& write(const std::string_view& str);
  builder& write(const std::span<const uint8_t>& bytes);
  builder& write(const account_id_t& account);

  template <typename T, typename = std::enable_if_t<std::is_integral_v<T>>>
  builder& write(T value) {
    auto big = boost::endian::native_to_big(value);
    const auto* raw = reinterpret_cast<const uint8_t*>(&big);
    data.insert(std::end(data), raw, raw + sizeof(T));
    return *this;
  }
};

/// Inverse of builder::write for an integer at `offset`.
template <typename T, typename = std::enable_if_t<std::is_integral_v<T>>>
std::optional<T> read_integral(const bytes_view_t& key, const size_t offset) {
  if (key.size() < offset + sizeof(T)) {
    return std::nullopt;
  }
  auto big = T{};
  std::copy_n(key.data() + offset, sizeof(T),
              reinterpret_cast<uint8_t*>(&big));
  return boost::endian::big_to_native(big);
}

}  // namespace sentinel::schema::key
