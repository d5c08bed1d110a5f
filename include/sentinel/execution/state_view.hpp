#pragma once

#include <sentinel/schema/encoding/scale/encoder.hpp>
#include <sentinel/schema/primitives.hpp>
#include <sentinel/storage/rocksdb/storage.hpp>
#include <map>
#include <optional>
#include <vector>

namespace sentinel::execution {

/// Layered write overlay over committed storage.
///
/// The engine stacks one view per block and one per transaction on top of it.
/// Reads fall through to the parent (or storage) for keys the layer has not
/// touched; writes stay local until merge_into_parent() or take_writes().
/// Discarding a view discards its writes, which is how failed operations
/// leave no trace.
class state_view final {
 public:
  using storage_t =
      sentinel::storage::storage<sentinel::storage::rocksdb_storage_tag>;
  using encoder_t = sentinel::schema::encoding::encoder<
      sentinel::schema::encoding::scale_encoder_tag>;

  explicit state_view(const storage_t& storage);
  /// Overlay on `parent`, which must outlive this view.
  explicit state_view(state_view* parent);
  state_view(const state_view&) = delete;
  state_view& operator=(const state_view&) = delete;

  std::optional<sentinel::schema::bytes_t> read(
      const sentinel::schema::bytes_view_t& key) const;
  void write(const sentinel::schema::bytes_view_t& key,
             sentinel::schema::bytes_t value);
  void erase(const sentinel::schema::bytes_view_t& key);

  template <typename T>
  std::optional<T> get(const sentinel::schema::bytes_t& key) const {
    auto raw = read(sentinel::schema::bytes_view_t{key.data(), key.size()});
    if (!raw) {
      return std::nullopt;
    }
    auto encoder = encoder_t{};
    return encoder.decode<T>(
        sentinel::schema::bytes_view_t{raw->data(), raw->size()});
  }

  template <typename T>
  void put(const sentinel::schema::bytes_t& key, const T& value) {
    auto encoder = encoder_t{};
    write(sentinel::schema::bytes_view_t{key.data(), key.size()},
          encoder.encode(value));
  }

  /// Merged view of every layer, ascending by key, deletes applied.
  std::vector<sentinel::storage::key_value_entry_t> list_by_prefix(
      const sentinel::schema::bytes_view_t& prefix) const;

  /// Push this layer's writes down one level and clear them.
  void merge_into_parent();

  /// Hand this layer's writes to the caller (for the storage batch).
  std::vector<sentinel::storage::write_entry_t> take_writes();

  /// Pending writes in key order.
  const std::map<sentinel::schema::bytes_t,
                 std::optional<sentinel::schema::bytes_t>>&
  writes() const;

 private:
  const storage_t* storage_{};
  state_view* parent_{};
  std::map<sentinel::schema::bytes_t, std::optional<sentinel::schema::bytes_t>>
      writes_;
};

}  // namespace sentinel::execution
