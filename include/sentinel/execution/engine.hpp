#pragma once

#include <sentinel/execution/reentrancy_guard.hpp>
#include <sentinel/execution/signature_verifier.hpp>
#include <sentinel/execution/state_view.hpp>
#include <sentinel/execution/transfer_hook.hpp>
#include <sentinel/schema/app_info.hpp>
#include <sentinel/schema/block_result.hpp>
#include <sentinel/schema/commit_result.hpp>
#include <sentinel/schema/encoding/encoder.hpp>
#include <sentinel/schema/genesis.hpp>
#include <sentinel/schema/primitives.hpp>
#include <sentinel/schema/query_result.hpp>
#include <sentinel/schema/transaction.hpp>
#include <sentinel/schema/transaction_result.hpp>
#include <sentinel/storage/rocksdb/storage.hpp>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string_view>
#include <vector>

namespace sentinel::execution {

/// Deterministic audit queue state machine used by the ABCI listener.
///
/// The engine validates transaction envelopes, dispatches payloads to the
/// bank, report registry and request queue, folds successful transactions
/// into the state root, and persists each block with one storage batch.
///
/// All public entry points serialize on one mutex. A call arriving from a
/// transfer hook while a custody payout is running is rejected with
/// reentrant_call instead of blocking.
class engine final {
 public:
  /// `require_strict_crypto` enables real signature verification; when false,
  /// signatures are not checked and named signers are accepted.
  explicit engine(
      sentinel::schema::encoding::encoder<
          sentinel::schema::encoding::scale_encoder_tag>& encoder,
      sentinel::storage::storage<sentinel::storage::rocksdb_storage_tag>&
          storage,
      bool require_strict_crypto = true);

  /// Apply genesis state on first start. Returns the resulting state root,
  /// or std::nullopt when the genesis is invalid. A chain that is already
  /// initialized keeps its persisted state.
  std::optional<sentinel::schema::hash32_t> init_chain(
      const sentinel::schema::genesis_t& genesis);

  /// Admit a transaction for mempool inclusion (CheckTx semantics).
  ///
  /// Performs decode + envelope validation against committed state only.
  sentinel::schema::transaction_result_t check_transaction(
      const sentinel::schema::bytes_view_t& raw_tx);

  /// Validate a transaction in proposal flow (Prepare/ProcessProposal).
  sentinel::schema::transaction_result_t process_proposal_transaction(
      const sentinel::schema::bytes_view_t& raw_tx);

  /// Execute a candidate block at `block_time_ms` and compute its state root.
  ///
  /// Transactions are processed in order; per-tx results are returned even on
  /// failures.
  sentinel::schema::block_result_t finalize_block(
      uint64_t height,
      sentinel::schema::timestamp_milliseconds_t block_time_ms,
      const std::vector<sentinel::schema::bytes_t>& txs);

  /// Persist the finalized block (state writes plus checkpoint) atomically.
  sentinel::schema::commit_result_t commit();

  /// Return application metadata (latest committed height and state_root).
  sentinel::schema::app_info_t info() const;

  /// Execute a read-only query by route against committed state.
  sentinel::schema::query_result_t query(
      std::string_view path,
      const sentinel::schema::bytes_view_t& data);

  /// Install runtime signature verifier callback.
  ///
  /// Ignored when strict-crypto mode is disabled, and when called from
  /// inside a payout hook.
  void set_signature_verifier(signature_verifier_t verifier);

  /// Install the recipient hook consulted by custody payouts. Calls from
  /// inside a running hook are ignored.
  void set_transfer_hook(transfer_hook_t hook);

 private:
  sentinel::schema::transaction_result_t validate_transaction(
      const sentinel::schema::transaction_t& tx,
      const state_view& state,
      std::string_view codespace);
  sentinel::schema::transaction_result_t admit(
      const sentinel::schema::bytes_view_t& raw_tx,
      std::string_view codespace);
  sentinel::schema::transaction_result_t execute_operation(
      const sentinel::schema::transaction_t& tx,
      state_view& state,
      sentinel::schema::timestamp_milliseconds_t now);
  state_view& block_view();
  void load_persisted_state();

  mutable std::mutex mutex_;
  sentinel::schema::encoding::encoder<
      sentinel::schema::encoding::scale_encoder_tag>& encoder_;
  sentinel::storage::storage<sentinel::storage::rocksdb_storage_tag>& storage_;
  int64_t last_committed_height_{};
  sentinel::schema::hash32_t last_committed_state_root_{};
  // Root the next block builds on: the genesis root before the first
  // commit, otherwise the last committed root.
  sentinel::schema::hash32_t working_state_root_{};
  std::optional<int64_t> pending_height_;
  sentinel::schema::hash32_t pending_state_root_{};
  std::unique_ptr<state_view> block_view_;
  std::optional<sentinel::schema::hash32_t> chain_id_;
  bool require_strict_crypto_{true};
  bool signature_verifier_overridden_{false};
  signature_verifier_t signature_verifier_;
  transfer_hook_t transfer_hook_;
  reentrancy_guard reentrancy_guard_;
};

}  // namespace sentinel::execution
