#include <spdlog/spdlog.h>
#include <sentinel/blake3/hash.hpp>
#include <sentinel/common/critical.hpp>
#include <sentinel/crypto/verify.hpp>
#include <sentinel/execution/bank.hpp>
#include <sentinel/execution/engine.hpp>
#include <sentinel/execution/report_registry.hpp>
#include <sentinel/execution/request_queue.hpp>
#include <sentinel/execution/result.hpp>
#include <sentinel/schema/encoding/scale/encoder.hpp>
#include <sentinel/schema/key/engine_keys.hpp>
#include <sentinel/schema/query_error_code.hpp>
#include <iterator>
#include <tuple>
#include <utility>

using namespace sentinel::schema;

namespace {

using encoder_t = sentinel::schema::encoding::encoder<
    sentinel::schema::encoding::scale_encoder_tag>;

constexpr auto kCodespaceQuery = std::string_view{"sentinel.query"};
constexpr auto kGasWanted = int64_t{1000};
constexpr auto kGasUsed = int64_t{750};

hash32_t fold_state_root(const hash32_t& seed,
                         const bytes_view_t& material,
                         const uint64_t height,
                         const uint64_t index,
                         const uint32_t code) {
  auto buffer = bytes_t{};
  buffer.reserve(seed.size() + material.size() + 24);
  buffer.insert(std::end(buffer), std::begin(seed), std::end(seed));
  buffer.insert(std::end(buffer), std::begin(material), std::end(material));

  auto encoder = encoder_t{};
  encoder.encode(std::tuple{height, index, code}, buffer);
  return sentinel::blake3::hash(bytes_view_t{buffer.data(), buffer.size()});
}

std::optional<transaction_t> decode_transaction(const bytes_view_t& raw_tx) {
  if (raw_tx.empty()) {
    return std::nullopt;
  }
  auto encoder = encoder_t{};
  return encoder.try_decode<transaction_t>(raw_tx);
}

transaction_result_t reentrant_call_result(const std::string_view codespace) {
  return sentinel::execution::make_error_result(
      transaction_error_code::reentrant_call, codespace, "reentrant call",
      "engine called from a transfer hook during a payout");
}

query_result_t make_query_error(const query_error_code code,
                                std::string log,
                                const bytes_view_t& data,
                                const int64_t height) {
  auto result = query_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::move(log);
  result.key = make_bytes(data);
  result.height = height;
  result.codespace = std::string{kCodespaceQuery};
  return result;
}

}  // namespace

namespace sentinel::execution {

engine::engine(encoding::encoder<encoding::scale_encoder_tag>& encoder,
               storage::storage<storage::rocksdb_storage_tag>& storage,
               const bool require_strict_crypto)
    : encoder_(encoder),
      storage_(storage),
      require_strict_crypto_(require_strict_crypto) {
  auto lock = std::scoped_lock{mutex_};
  load_persisted_state();
  if (require_strict_crypto_ && !sentinel::crypto::available()) {
    spdlog::warn("OpenSSL lacks ed25519 or EC support; signatures will fail");
  }
  if (!require_strict_crypto_) {
    spdlog::warn("Strict crypto disabled; transaction signatures are ignored");
  }
  spdlog::info("Execution engine ready at height {}", last_committed_height_);
}

std::optional<hash32_t> engine::init_chain(const genesis_t& genesis) {
  if (reentrancy_guard_.held_by_current_thread()) {
    spdlog::error("InitChain rejected: reentrant call");
    return std::nullopt;
  }
  auto lock = std::scoped_lock{mutex_};
  if (chain_id_) {
    spdlog::info("Chain already initialized; keeping persisted state");
    return working_state_root_;
  }
  if (genesis.chain_id.empty() || is_null_account(genesis.owner) ||
      is_null_account(genesis.auditor)) {
    spdlog::error("Invalid genesis: chain id, owner and auditor are required");
    return std::nullopt;
  }

  auto& state = block_view();
  auto chain_id = sentinel::blake3::hash(std::string_view{genesis.chain_id});
  state.put(key::make_chain_id_key(), chain_id);

  auto ledger = bank{state, reentrancy_guard_, transfer_hook_};
  for (const auto& [account, amount] : genesis.balances) {
    ledger.credit(account, amount);
  }
  auto queue = request_queue{state, ledger};
  queue.initialize(genesis);
  auto registry = report_registry{state};
  registry.initialize(genesis.owner, genesis.report_cooldown);
  if (!genesis.auditor_name.empty()) {
    auto registered = registry.register_auditor(
        genesis.owner, register_auditor_t{.auditor = genesis.auditor,
                                          .name = genesis.auditor_name});
    if (registered.code != 0) {
      sentinel::common::critical("failed registering genesis auditor");
    }
  }

  auto root = make_zero_hash();
  auto index = uint64_t{};
  for (const auto& [write_key, write_value] : state.writes()) {
    auto material = write_key;
    if (write_value) {
      material.insert(std::end(material), std::begin(*write_value),
                      std::end(*write_value));
    }
    root = fold_state_root(root, bytes_view_t{material.data(), material.size()},
                           0, index++, 0);
  }

  chain_id_ = chain_id;
  working_state_root_ = root;
  spdlog::info("Applied genesis for chain '{}' with {} balance(s)",
               genesis.chain_id, genesis.balances.size());
  return root;
}

transaction_result_t engine::check_transaction(const bytes_view_t& raw_tx) {
  if (reentrancy_guard_.held_by_current_thread()) {
    return reentrant_call_result(kCodespaceCheckTx);
  }
  auto lock = std::scoped_lock{mutex_};
  return admit(raw_tx, kCodespaceCheckTx);
}

transaction_result_t engine::process_proposal_transaction(
    const bytes_view_t& raw_tx) {
  if (reentrancy_guard_.held_by_current_thread()) {
    return reentrant_call_result(kCodespaceCheckTx);
  }
  auto lock = std::scoped_lock{mutex_};
  return admit(raw_tx, kCodespaceCheckTx);
}

transaction_result_t engine::admit(const bytes_view_t& raw_tx,
                                   const std::string_view codespace) {
  auto tx = decode_transaction(raw_tx);
  if (!tx) {
    return make_error_result(transaction_error_code::invalid_transaction,
                             codespace, "invalid transaction",
                             "failed to decode transaction bytes");
  }
  auto committed = state_view{storage_};
  auto result = validate_transaction(*tx, committed, codespace);
  if (result.code == 0) {
    result.gas_wanted = kGasWanted;
  }
  return result;
}

transaction_result_t engine::validate_transaction(const transaction_t& tx,
                                                  const state_view& state,
                                                  const std::string_view codespace) {
  if (tx.version != 1) {
    return make_error_result(
        transaction_error_code::unsupported_transaction_version, codespace,
        "unsupported transaction version", "expected version 1");
  }
  if (!chain_id_) {
    return make_error_result(transaction_error_code::chain_not_initialized,
                             codespace, "chain not initialized",
                             "InitChain has not been applied");
  }
  if (tx.chain_id != *chain_id_) {
    return make_error_result(transaction_error_code::invalid_chain_id,
                             codespace, "invalid chain id",
                             "transaction targets a different chain");
  }

  auto account = make_account_id(tx.signer);
  auto stored = state.get<uint64_t>(key::make_nonce_key(account)).value_or(0);
  if (tx.nonce != stored + 1) {
    return make_error_result(transaction_error_code::invalid_nonce, codespace,
                             "invalid nonce",
                             "expected nonce " + std::to_string(stored + 1));
  }

  if (require_strict_crypto_) {
    if (std::holds_alternative<named_signer_t>(tx.signer)) {
      return make_error_result(transaction_error_code::invalid_signature_type,
                               codespace, "invalid signature type",
                               "named signers require strict crypto off");
    }
    auto message = make_signing_payload(tx);
    auto message_view = bytes_view_t{message.data(), message.size()};
    auto verified =
        signature_verifier_overridden_
            ? signature_verifier_(message_view, tx.signer, tx.signature)
            : sentinel::crypto::verify_signature(message_view, tx.signer,
                                                 tx.signature);
    if (!verified) {
      return make_error_result(
          transaction_error_code::signature_verification_failed, codespace,
          "signature verification failed", "signature does not match signer");
    }
  }
  return transaction_result_t{};
}

transaction_result_t engine::execute_operation(const transaction_t& tx,
                                               state_view& state,
                                               const timestamp_milliseconds_t now) {
  auto caller = make_account_id(tx.signer);
  auto ledger = bank{state, reentrancy_guard_, transfer_hook_};
  auto queue = request_queue{state, ledger};
  auto registry = report_registry{state};

  return std::visit(
      overloaded{
          [&](const submit_request_t& op) {
            return queue.submit_request(caller, op, now);
          },
          [&](const start_work_t& op) { return queue.start_work(caller, op); },
          [&](const complete_work_t& op) {
            return queue.complete_work(caller, op, now);
          },
          [&](const refund_request_t& op) {
            return queue.refund_request(caller, op, now);
          },
          [&](const set_minimum_fee_t& op) {
            return queue.set_minimum_fee(caller, op);
          },
          [&](const set_refund_timeout_t& op) {
            return queue.set_refund_timeout(caller, op);
          },
          [&](const set_auditor_t& op) {
            return queue.set_auditor(caller, op);
          },
          [&](const grant_fee_exemption_t& op) {
            return queue.grant_fee_exemption(caller, op);
          },
          [&](const withdraw_funds_t& op) {
            return queue.withdraw_funds(caller, op);
          },
          [&](const set_paused_t& op) { return queue.set_paused(caller, op); },
          [&](const transfer_ownership_t& op) {
            // Queue and registry share one owner.
            auto result = queue.transfer_ownership(caller, op);
            if (result.code != 0) {
              return result;
            }
            auto registry_result =
                registry.transfer_ownership(caller, op.new_owner);
            if (registry_result.code != 0) {
              return registry_result;
            }
            return result;
          },
          [&](const transfer_t& op) {
            return ledger.transfer(caller, op.recipient, op.amount);
          },
          [&](const publish_report_t& op) {
            return registry.publish_report(caller, op, now);
          },
          [&](const register_auditor_t& op) {
            return registry.register_auditor(caller, op);
          },
          [&](const revoke_auditor_t& op) {
            return registry.revoke_auditor(caller, op);
          }},
      tx.payload);
}

block_result_t engine::finalize_block(const uint64_t height,
                                      const timestamp_milliseconds_t block_time_ms,
                                      const std::vector<bytes_t>& txs) {
  auto result = block_result_t{};
  result.tx_results.reserve(txs.size());
  if (reentrancy_guard_.held_by_current_thread()) {
    for (size_t i = 0; i < txs.size(); ++i) {
      result.tx_results.push_back(reentrant_call_result(kCodespaceExecute));
    }
    result.state_root = working_state_root_;
    return result;
  }

  auto lock = std::scoped_lock{mutex_};
  auto& block = block_view();
  auto rolling_root = working_state_root_;
  auto applied = size_t{};

  for (size_t i = 0; i < txs.size(); ++i) {
    auto raw = bytes_view_t{txs[i].data(), txs[i].size()};
    auto tx = decode_transaction(raw);
    if (!tx) {
      result.tx_results.push_back(make_error_result(
          transaction_error_code::invalid_transaction, kCodespaceExecute,
          "invalid transaction", "failed to decode transaction bytes"));
      continue;
    }
    auto validation = validate_transaction(*tx, block, kCodespaceExecute);
    if (validation.code != 0) {
      result.tx_results.push_back(std::move(validation));
      continue;
    }

    // The nonce is consumed even when execution fails.
    block.put(key::make_nonce_key(make_account_id(tx->signer)), tx->nonce);

    auto tx_state = state_view{&block};
    auto tx_result = execute_operation(*tx, tx_state, block_time_ms);
    if (tx_result.code == 0) {
      tx_state.merge_into_parent();
      ++applied;
    } else {
      spdlog::debug("Transaction {} at height {} failed: {} ({})", i, height,
                    tx_result.log, tx_result.info);
    }
    tx_result.gas_wanted = kGasWanted;
    tx_result.gas_used = kGasUsed;
    rolling_root =
        fold_state_root(rolling_root, raw, height, i, tx_result.code);
    result.tx_results.push_back(std::move(tx_result));
  }

  pending_height_ = static_cast<int64_t>(height);
  pending_state_root_ = rolling_root;
  result.state_root = rolling_root;
  spdlog::info("Finalized block {} with {}/{} applied transaction(s)", height,
               applied, txs.size());
  return result;
}

commit_result_t engine::commit() {
  if (reentrancy_guard_.held_by_current_thread()) {
    spdlog::error("Commit rejected: reentrant call");
    return commit_result_t{.committed_height = last_committed_height_,
                           .state_root = last_committed_state_root_};
  }
  auto lock = std::scoped_lock{mutex_};
  if (pending_height_) {
    auto writes = block_view_ ? block_view_->take_writes()
                              : std::vector<storage::write_entry_t>{};
    storage_.commit_batch(writes,
                          storage::committed_state{
                              .height = *pending_height_,
                              .state_root = pending_state_root_});
    last_committed_height_ = *pending_height_;
    last_committed_state_root_ = pending_state_root_;
    working_state_root_ = pending_state_root_;
    pending_height_.reset();
    block_view_.reset();
  }

  return commit_result_t{.retain_height = 0,
                         .committed_height = last_committed_height_,
                         .state_root = last_committed_state_root_};
}

app_info_t engine::info() const {
  auto result = app_info_t{};
  if (reentrancy_guard_.held_by_current_thread()) {
    spdlog::warn("Info requested from a transfer hook; returning defaults");
    return result;
  }
  auto lock = std::scoped_lock{mutex_};
  result.last_block_height = last_committed_height_;
  result.last_block_state_root = last_committed_state_root_;
  return result;
}

query_result_t engine::query(const std::string_view path,
                             const bytes_view_t& data) {
  if (reentrancy_guard_.held_by_current_thread()) {
    return make_query_error(query_error_code::reentrant_call, "reentrant call",
                            data, 0);
  }
  auto lock = std::scoped_lock{mutex_};
  auto height = last_committed_height_;

  auto result = query_result_t{};
  result.key = make_bytes(data);
  result.height = height;
  result.codespace = std::string{kCodespaceQuery};

  if (path == "/engine/info") {
    result.value =
        encoder_.encode(std::tuple{height, last_committed_state_root_});
    return result;
  }
  if (!chain_id_) {
    return make_query_error(query_error_code::chain_not_initialized,
                            "chain not initialized", data, height);
  }

  auto committed = state_view{storage_};
  auto ledger = bank{committed, reentrancy_guard_, transfer_hook_};
  auto queue = request_queue{committed, ledger};
  auto registry = report_registry{committed};

  auto account = std::optional<account_id_t>{};
  auto id = std::optional<uint64_t>{};
  auto invalid_key = [&](std::string_view expected) {
    return make_query_error(query_error_code::invalid_key,
                            "invalid key: expected " + std::string{expected},
                            data, height);
  };
  auto not_found = [&](std::string_view what) {
    return make_query_error(query_error_code::not_found,
                            std::string{what} + " not found", data, height);
  };

  if (path == "/engine/nonce" || path == "/account/balance" ||
      path == "/queue/by_requester" || path == "/queue/fee_exempt" ||
      path == "/registry/by_target" || path == "/registry/auditor") {
    account = encoder_.try_decode<account_id_t>(data);
    if (!account) {
      return invalid_key("20 byte account");
    }
  }
  if (path == "/queue/request" || path == "/registry/report") {
    id = encoder_.try_decode<uint64_t>(data);
    if (!id) {
      return invalid_key("u64 id");
    }
  }

  if (path == "/engine/nonce") {
    result.value = encoder_.encode(
        committed.get<uint64_t>(key::make_nonce_key(*account)).value_or(0));
  } else if (path == "/account/balance") {
    result.value = encoder_.encode(make_amount_bytes(ledger.balance_of(*account)));
  } else if (path == "/queue/request") {
    auto request = queue.get_request(*id);
    if (!request) {
      return not_found("request");
    }
    result.value = encoder_.encode(*request);
  } else if (path == "/queue/pending") {
    result.value = encoder_.encode(queue.list_pending());
  } else if (path == "/queue/by_requester") {
    result.value = encoder_.encode(queue.list_by_requester(*account));
  } else if (path == "/queue/balance") {
    result.value = encoder_.encode(make_amount_bytes(queue.custody_balance()));
  } else if (path == "/queue/config") {
    auto state = queue.load_state();
    if (!state) {
      return not_found("queue config");
    }
    result.value = encoder_.encode(*state);
  } else if (path == "/queue/fee_exempt") {
    result.value = encoder_.encode(queue.is_fee_exempt(*account));
  } else if (path == "/registry/report") {
    auto report = registry.get_report(*id);
    if (!report) {
      return not_found("report");
    }
    result.value = encoder_.encode(*report);
  } else if (path == "/registry/count") {
    result.value = encoder_.encode(registry.audited_contracts_count());
  } else if (path == "/registry/by_target") {
    result.value = encoder_.encode(registry.list_reports_for_target(*account));
  } else if (path == "/registry/auditor") {
    auto auditor = registry.get_auditor(*account);
    if (!auditor) {
      return not_found("auditor");
    }
    result.value = encoder_.encode(*auditor);
  } else if (path == "/registry/disclaimer") {
    result.value =
        encoder_.encode(std::string{report_registry::disclaimer()});
  } else {
    return make_query_error(query_error_code::unsupported_path,
                            "unsupported path", data, height);
  }
  return result;
}

void engine::set_signature_verifier(signature_verifier_t verifier) {
  if (reentrancy_guard_.held_by_current_thread()) {
    spdlog::error("Signature verifier update rejected: reentrant call");
    return;
  }
  auto lock = std::scoped_lock{mutex_};
  signature_verifier_ = std::move(verifier);
  signature_verifier_overridden_ = static_cast<bool>(signature_verifier_);
}

void engine::set_transfer_hook(transfer_hook_t hook) {
  if (reentrancy_guard_.held_by_current_thread()) {
    spdlog::error("Transfer hook update rejected: reentrant call");
    return;
  }
  auto lock = std::scoped_lock{mutex_};
  transfer_hook_ = std::move(hook);
}

state_view& engine::block_view() {
  if (!block_view_) {
    block_view_ = std::make_unique<state_view>(storage_);
  }
  return *block_view_;
}

void engine::load_persisted_state() {
  spdlog::debug("Loading persisted engine state");
  if (auto committed = storage_.load_committed_state()) {
    last_committed_height_ = committed->height;
    last_committed_state_root_ = committed->state_root;
    working_state_root_ = committed->state_root;
  }
  auto chain_key = key::make_chain_id_key();
  chain_id_ = storage_.get<hash32_t>(
      encoder_, bytes_view_t{chain_key.data(), chain_key.size()});
}

}  // namespace sentinel::execution
