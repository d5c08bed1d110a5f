#include <gtest/gtest.h>
#include <sentinel/schema/encoding/scale/encoder.hpp>
#include <sentinel/storage/rocksdb/storage.hpp>
#include <sentinel/storage/storage.hpp>
#include <sentinel/testing/common.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace {

using encoder_t = sentinel::schema::encoding::encoder<
    sentinel::schema::encoding::scale_encoder_tag>;

sentinel::schema::bytes_t key_of(const std::string_view text) {
  return sentinel::schema::make_bytes(text);
}

sentinel::schema::bytes_view_t view_of(const sentinel::schema::bytes_t& bytes) {
  return sentinel::schema::bytes_view_t{bytes.data(), bytes.size()};
}

}  // namespace

TEST(storage, defaults_are_stable) {
  auto committed = sentinel::storage::committed_state{};
  EXPECT_EQ(committed.height, 0);
  EXPECT_EQ(committed.state_root, sentinel::schema::make_zero_hash());

  auto entry = sentinel::storage::key_value_entry_t{};
  EXPECT_TRUE(entry.first.empty());
  EXPECT_TRUE(entry.second.empty());
}

TEST(storage, fresh_database_has_no_checkpoint) {
  auto db = sentinel::testing::make_db_path("sentinel_storage_fresh");
  {
    auto storage = sentinel::storage::make_storage<
        sentinel::storage::rocksdb_storage_tag>(db);
    EXPECT_FALSE(storage.load_committed_state().has_value());
    auto missing = key_of("SYS|STATE|NONE");
    EXPECT_FALSE(storage.read(view_of(missing)).has_value());
  }
  sentinel::testing::remove_path(db);
}

TEST(storage, commit_batch_applies_writes_deletes_and_checkpoint) {
  auto db = sentinel::testing::make_db_path("sentinel_storage_batch");
  {
    auto storage = sentinel::storage::make_storage<
        sentinel::storage::rocksdb_storage_tag>(db);
    auto encoder = encoder_t{};
    auto kept = key_of("A|kept");
    auto removed = key_of("A|removed");
    storage.commit_batch({{removed, encoder.encode(uint64_t{7})}},
                         sentinel::storage::committed_state{.height = 8});
    ASSERT_TRUE(storage.read(view_of(removed)).has_value());

    auto writes = std::vector<sentinel::storage::write_entry_t>{
        {kept, encoder.encode(uint64_t{42})}, {removed, std::nullopt}};
    storage.commit_batch(writes,
                         sentinel::storage::committed_state{
                             .height = 9,
                             .state_root = sentinel::testing::make_hash(3)});

    EXPECT_EQ(storage.get<uint64_t>(encoder, view_of(kept)), uint64_t{42});
    EXPECT_FALSE(storage.read(view_of(removed)).has_value());

    auto checkpoint = storage.load_committed_state();
    ASSERT_TRUE(checkpoint.has_value());
    EXPECT_EQ(checkpoint->height, 9);
    EXPECT_EQ(checkpoint->state_root, sentinel::testing::make_hash(3));
  }
  {
    // Reopened database sees the same checkpoint.
    auto storage = sentinel::storage::make_storage<
        sentinel::storage::rocksdb_storage_tag>(db);
    auto checkpoint = storage.load_committed_state();
    ASSERT_TRUE(checkpoint.has_value());
    EXPECT_EQ(checkpoint->height, 9);
  }
  sentinel::testing::remove_path(db);
}

TEST(storage, list_by_prefix_returns_only_matching_keys_in_order) {
  auto db = sentinel::testing::make_db_path("sentinel_storage_prefix");
  {
    auto storage = sentinel::storage::make_storage<
        sentinel::storage::rocksdb_storage_tag>(db);
    auto encoder = encoder_t{};
    auto a2 = key_of("A|two");
    auto a1 = key_of("A|one");
    auto b1 = key_of("B|one");
    auto ab = key_of("AB|one");
    storage.commit_batch({{a2, encoder.encode(uint64_t{2})},
                          {a1, encoder.encode(uint64_t{1})},
                          {b1, encoder.encode(uint64_t{9})},
                          {ab, encoder.encode(uint64_t{5})}},
                         sentinel::storage::committed_state{.height = 1});

    auto prefix = key_of("A|");
    auto rows = storage.list_by_prefix(view_of(prefix));
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0].first, a1);
    EXPECT_EQ(rows[1].first, a2);
    EXPECT_EQ(encoder.decode<uint64_t>(view_of(rows[1].second)), 2u);

    auto none = key_of("C|");
    EXPECT_TRUE(storage.list_by_prefix(view_of(none)).empty());
  }
  sentinel::testing::remove_path(db);
}
