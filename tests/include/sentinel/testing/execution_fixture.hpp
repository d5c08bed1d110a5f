#pragma once

#include <sentinel/blake3/hash.hpp>
#include <sentinel/execution/engine.hpp>
#include <sentinel/schema/audit_request.hpp>
#include <sentinel/schema/primitives.hpp>
#include <sentinel/schema/queue_state.hpp>
#include <sentinel/storage/rocksdb/storage.hpp>
#include <sentinel/testing/common.hpp>
#include <sentinel/testing/execution_harness.hpp>

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace sentinel::testing {

/// Engine on a scratch database, driven one transaction per block.
///
/// Signers are named accounts and strict crypto is off, so every test
/// identity can act directly. Nonces and heights are tracked here.
class execution_fixture final {
 public:
  explicit execution_fixture(const std::string_view db_prefix)
      : db_path_{make_db_path(db_prefix)},
        encoder_{},
        storage_{sentinel::storage::make_storage<
            sentinel::storage::rocksdb_storage_tag>(db_path_)},
        engine_{encoder_, storage_, false} {}

  execution_fixture(const execution_fixture&) = delete;
  execution_fixture& operator=(const execution_fixture&) = delete;
  execution_fixture(execution_fixture&&) = delete;
  execution_fixture& operator=(execution_fixture&&) = delete;

  ~execution_fixture() { remove_path(db_path_); }

  const std::string& db_path() const { return db_path_; }

  scale_encoder_t& encoder() { return encoder_; }

  sentinel::storage::storage<sentinel::storage::rocksdb_storage_tag>&
  storage() {
    return storage_;
  }

  sentinel::execution::engine& engine() { return engine_; }

  sentinel::schema::hash32_t chain_id() const {
    return sentinel::blake3::hash(kTestChainName);
  }

  /// Apply genesis and commit an empty first block so queries see it.
  void start(const sentinel::schema::genesis_t& genesis = make_genesis()) {
    auto root = engine_.init_chain(genesis);
    ASSERT_TRUE(root.has_value());
    (void)engine_.finalize_block(++height_, now_, {});
    (void)engine_.commit();
  }

  sentinel::schema::timestamp_milliseconds_t now() const { return now_; }
  void advance(const sentinel::schema::duration_milliseconds_t delta) {
    now_ += delta;
  }

  uint64_t height() const { return height_; }

  sentinel::schema::transaction_t next_transaction(
      const sentinel::schema::account_id_t& signer,
      const sentinel::schema::transaction_payload_t& payload) {
    return make_transaction(chain_id(), ++nonces_[signer],
                            sentinel::schema::signer_id_t{signer}, payload);
  }

  /// Execute one transaction in its own block at the current time.
  sentinel::schema::transaction_result_t execute(
      const sentinel::schema::account_id_t& signer,
      const sentinel::schema::transaction_payload_t& payload) {
    auto block = engine_.finalize_block(
        ++height_, now_, {encode_transaction(next_transaction(signer, payload))});
    EXPECT_EQ(block.tx_results.size(), 1u);
    (void)engine_.commit();
    return block.tx_results.front();
  }

  sentinel::schema::query_result_t query(
      const std::string_view path,
      const sentinel::schema::bytes_t& data = {}) {
    return engine_.query(
        path, sentinel::schema::bytes_view_t{data.data(), data.size()});
  }

  template <typename T>
  T query_value(const std::string_view path,
                const sentinel::schema::bytes_t& data = {}) {
    auto result = query(path, data);
    EXPECT_EQ(result.code, 0u) << result.log;
    return encoder_.decode<T>(sentinel::schema::bytes_view_t{
        result.value.data(), result.value.size()});
  }

  sentinel::schema::amount_t balance_of(
      const sentinel::schema::account_id_t& account) {
    return sentinel::schema::make_amount(
        query_value<sentinel::schema::amount_bytes_t>("/account/balance",
                                                      encoder_.encode(account)));
  }

  sentinel::schema::amount_t custody_balance() {
    return sentinel::schema::make_amount(
        query_value<sentinel::schema::amount_bytes_t>("/queue/balance"));
  }

  sentinel::schema::audit_request_t request(const uint64_t request_id) {
    return query_value<sentinel::schema::audit_request_t>(
        "/queue/request", encoder_.encode(request_id));
  }

  sentinel::schema::queue_state_t queue_config() {
    return query_value<sentinel::schema::queue_state_t>("/queue/config");
  }

 private:
  std::string db_path_;
  scale_encoder_t encoder_;
  sentinel::storage::storage<sentinel::storage::rocksdb_storage_tag> storage_;
  sentinel::execution::engine engine_;
  std::map<sentinel::schema::account_id_t, uint64_t> nonces_;
  uint64_t height_{};
  sentinel::schema::timestamp_milliseconds_t now_{1'700'000'000'000};
};

}  // namespace sentinel::testing
