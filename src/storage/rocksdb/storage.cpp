#include <sentinel/common/critical.hpp>
#include <sentinel/schema/key/engine_keys.hpp>
#include <sentinel/storage/rocksdb/storage.hpp>
#include <tuple>

namespace sentinel::storage {

namespace {

using encoder_t = sentinel::schema::encoding::encoder<
    sentinel::schema::encoding::scale_encoder_tag>;

void require_open(const std::unique_ptr<ROCKSDB_NAMESPACE::DB>& database) {
  if (!database) {
    sentinel::common::critical("RocksDB database is not initialized");
  }
}

}  // namespace

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto store = storage<rocksdb_storage_tag>();

  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.IncreaseParallelism();
  options.OptimizeLevelStyleCompaction();

  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status =
      ROCKSDB_NAMESPACE::DB::Open(options, std::string{path}, &database);
  if (!status.ok()) {
    spdlog::error("Failed to open RocksDB at {}: {}", path, status.ToString());
    sentinel::common::critical("Failed to open RocksDB");
  }
  spdlog::info("Opened RocksDB at {}", path);
  store.database.reset(database);

  return store;
}

std::optional<sentinel::schema::bytes_t> storage<rocksdb_storage_tag>::read(
    const sentinel::schema::bytes_view_t& key) const {
  require_open(database);
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::make_slice(key), &value);
  if (status.IsNotFound()) {
    return std::nullopt;
  }
  if (!status.ok()) {
    spdlog::error("Failed to get value from RocksDB: {}", status.ToString());
    sentinel::common::critical("Failed to get value from RocksDB");
  }
  return sentinel::schema::make_bytes(value);
}

std::vector<key_value_entry_t> storage<rocksdb_storage_tag>::list_by_prefix(
    const sentinel::schema::bytes_view_t& prefix) const {
  require_open(database);

  auto entries = std::vector<key_value_entry_t>{};
  auto prefix_slice = detail::make_slice(prefix);
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(ROCKSDB_NAMESPACE::ReadOptions{})};
  for (iterator->Seek(prefix_slice);
       iterator->Valid() && iterator->key().starts_with(prefix_slice);
       iterator->Next()) {
    entries.emplace_back(detail::to_bytes(iterator->key()),
                         detail::to_bytes(iterator->value()));
  }
  if (!iterator->status().ok()) {
    spdlog::error("RocksDB iteration failed: {}",
                  iterator->status().ToString());
    sentinel::common::critical("RocksDB iteration failed");
  }
  return entries;
}

std::optional<committed_state>
storage<rocksdb_storage_tag>::load_committed_state() const {
  auto key = sentinel::schema::key::make_committed_state_key();
  auto raw = read(sentinel::schema::bytes_view_t{key.data(), key.size()});
  if (!raw) {
    return std::nullopt;
  }
  auto encoder = encoder_t{};
  auto decoded =
      encoder.try_decode<std::tuple<int64_t, sentinel::schema::hash32_t>>(
          sentinel::schema::bytes_view_t{raw->data(), raw->size()});
  if (!decoded) {
    sentinel::common::critical("failed to decode committed state");
  }
  return committed_state{.height = std::get<0>(*decoded),
                         .state_root = std::get<1>(*decoded)};
}

void storage<rocksdb_storage_tag>::commit_batch(
    const std::vector<write_entry_t>& writes,
    const committed_state& state) const {
  require_open(database);

  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& [key, value] : writes) {
    auto key_slice =
        detail::make_slice(sentinel::schema::bytes_view_t{key.data(),
                                                          key.size()});
    auto status =
        value ? batch.Put(key_slice, detail::make_slice(
                                         sentinel::schema::bytes_view_t{
                                             value->data(), value->size()}))
              : batch.Delete(key_slice);
    if (!status.ok()) {
      sentinel::common::critical("failed staging write batch entry");
    }
  }

  auto encoder = encoder_t{};
  auto encoded = encoder.encode(std::tuple{state.height, state.state_root});
  auto state_key = sentinel::schema::key::make_committed_state_key();
  auto state_status = batch.Put(
      detail::make_slice(
          sentinel::schema::bytes_view_t{state_key.data(), state_key.size()}),
      detail::make_slice(
          sentinel::schema::bytes_view_t{encoded.data(), encoded.size()}));
  if (!state_status.ok()) {
    sentinel::common::critical("failed staging committed state");
  }

  auto write_options = ROCKSDB_NAMESPACE::WriteOptions{};
  write_options.sync = true;
  auto status = database->Write(write_options, &batch);
  if (!status.ok()) {
    spdlog::error("RocksDB batch write failed: {}", status.ToString());
    sentinel::common::critical("failed to commit write batch");
  }
  spdlog::debug("Committed {} write(s) at height {}", writes.size(),
                state.height);
}

}  // namespace sentinel::storage
