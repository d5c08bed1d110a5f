#pragma once
#include <sentinel/common/critical.hpp>
#include <sentinel/schema/encoding/encoder.hpp>
#include <sentinel/schema/encoding/scale/primitives.hpp>
#include <sentinel/schema/encoding/scale/records.hpp>
#include <sentinel/schema/encoding/scale/transaction.hpp>
#include <spdlog/spdlog.h>
#include <exception>
#include <iterator>
#include <scale/scale.hpp>
#include <utility>

namespace sentinel::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  sentinel::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, sentinel::schema::bytes_t& out);

  /// Decode trusted bytes (our own storage). Failure is fatal.
  template <typename T>
  T decode(const sentinel::schema::bytes_view_t& bytes);

  /// Decode untrusted bytes (transactions, query data).
  template <typename T>
  std::optional<T> try_decode(const sentinel::schema::bytes_view_t& bytes);
};

template <typename T>
sentinel::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    sentinel::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        sentinel::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
T encoder<scale_encoder_tag>::decode(
    const sentinel::schema::bytes_view_t& bytes) {
  auto decoded = try_decode<T>(bytes);
  if (!decoded) {
    sentinel::common::critical("failed to decode SCALE bytes");
  }
  return std::move(*decoded);
}

// Custom decoders report malformed input by throwing; the library reports
// truncation through its result type. Both map to nullopt.
template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const sentinel::schema::bytes_view_t& bytes) {
  try {
    auto decoded = ::scale::impl::memory::decode<T>(bytes);
    if (!decoded) {
      return std::nullopt;
    }
    return std::move(decoded.value());
  } catch (const std::exception& e) {
    spdlog::debug("SCALE decode rejected input: {}", e.what());
    return std::nullopt;
  }
}

}  // namespace sentinel::schema::encoding
