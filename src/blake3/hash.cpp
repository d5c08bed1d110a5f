#include <blake3.h>
#include <sentinel/blake3/hash.hpp>

namespace sentinel::blake3 {

namespace {

sentinel::schema::hash32_t digest(const void* data, const std::size_t size) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, data, size);
  auto output = sentinel::schema::hash32_t{};
  static_assert(BLAKE3_OUT_LEN == std::tuple_size_v<sentinel::schema::hash32_t>);
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

}  // namespace

sentinel::schema::hash32_t hash(const std::string_view& str) {
  return digest(str.data(), str.size());
}

sentinel::schema::hash32_t hash(const std::span<const uint8_t>& bytes) {
  return digest(bytes.data(), bytes.size());
}

}  // namespace sentinel::blake3
