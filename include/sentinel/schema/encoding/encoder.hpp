#pragma once
#include <sentinel/schema/primitives.hpp>
#include <optional>
#include <span>

namespace sentinel::schema::encoding {

// Codec selected at build time by tag. Every persisted record, wire
// transaction and query answer goes through one of these.
template <typename Library>
struct encoder {
  template <typename T>
  sentinel::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, sentinel::schema::bytes_t& out);

  template <typename T>
  T decode(const sentinel::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const sentinel::schema::bytes_view_t& bytes);
};

}  // namespace sentinel::schema::encoding
