#pragma once
#include <sentinel/schema/primitives.hpp>
#include <optional>
#include <utility>
#include <vector>

namespace sentinel::storage {

using key_value_entry_t =
    std::pair<sentinel::schema::bytes_t, sentinel::schema::bytes_t>;

/// Pending mutation: a value to write, or std::nullopt for a delete.
using write_entry_t = std::pair<sentinel::schema::bytes_t,
                                std::optional<sentinel::schema::bytes_t>>;

/// Last committed consensus checkpoint persisted by the storage backend.
struct committed_state final {
  int64_t height{};
  sentinel::schema::hash32_t state_root;
};

template <typename Library>
struct storage {
  /// Raw bytes at key, or std::nullopt when missing.
  std::optional<sentinel::schema::bytes_t> read(
      const sentinel::schema::bytes_view_t& key) const;

  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const sentinel::schema::bytes_view_t& key) const;

  /// Return all key-value pairs that share the provided key prefix, in
  /// ascending key order.
  std::vector<key_value_entry_t> list_by_prefix(
      const sentinel::schema::bytes_view_t& prefix) const;

  /// Load the most recent committed checkpoint (height + state_root).
  std::optional<committed_state> load_committed_state() const;

  /// Apply a block's writes and its checkpoint in one atomic batch.
  void commit_batch(const std::vector<write_entry_t>& writes,
                    const committed_state& state) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace sentinel::storage
