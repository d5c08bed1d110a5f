#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <sentinel/common/critical.hpp>
#include <sentinel/schema/encoding/scale/encoder.hpp>
#include <sentinel/storage/storage.hpp>
#include <memory>
#include <string_view>

namespace sentinel::storage {

namespace detail {

inline ROCKSDB_NAMESPACE::Slice make_slice(
    const sentinel::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

inline sentinel::schema::bytes_t to_bytes(
    const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  std::optional<sentinel::schema::bytes_t> read(
      const sentinel::schema::bytes_view_t& key) const;

  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const sentinel::schema::bytes_view_t& key) const;

  std::vector<key_value_entry_t> list_by_prefix(
      const sentinel::schema::bytes_view_t& prefix) const;
  std::optional<committed_state> load_committed_state() const;
  void commit_batch(const std::vector<write_entry_t>& writes,
                    const committed_state& state) const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

template <typename T, typename Encoder>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const sentinel::schema::bytes_view_t& key) const {
  auto value = read(key);
  if (!value) {
    return std::nullopt;
  }
  return encoder.template decode<T>(
      sentinel::schema::bytes_view_t{value->data(), value->size()});
}

}  // namespace sentinel::storage
