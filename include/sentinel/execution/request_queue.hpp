#pragma once

#include <sentinel/execution/bank.hpp>
#include <sentinel/execution/state_view.hpp>
#include <sentinel/schema/audit_request.hpp>
#include <sentinel/schema/genesis.hpp>
#include <sentinel/schema/queue_state.hpp>
#include <sentinel/schema/transaction.hpp>
#include <sentinel/schema/transaction_result.hpp>
#include <optional>
#include <vector>

namespace sentinel::execution {

/// Escrow request queue.
///
/// Lifecycle: pending -> in_progress -> completed, pending -> completed,
/// pending -> refunded. Completed and refunded are terminal. Deposits sit in
/// the bank's custody account from submission until a refund or an owner
/// withdrawal; completion leaves them in custody.
///
/// Every mutating call assumes it runs on a per-transaction state view and
/// may leave partial writes behind when it returns an error. The engine
/// discards the view in that case.
class request_queue final {
 public:
  request_queue(state_view& state, bank& ledger);

  void initialize(const sentinel::schema::genesis_t& genesis);
  std::optional<sentinel::schema::queue_state_t> load_state() const;

  sentinel::schema::transaction_result_t submit_request(
      const sentinel::schema::account_id_t& caller,
      const sentinel::schema::submit_request_t& operation,
      sentinel::schema::timestamp_milliseconds_t now);
  sentinel::schema::transaction_result_t start_work(
      const sentinel::schema::account_id_t& caller,
      const sentinel::schema::start_work_t& operation);
  sentinel::schema::transaction_result_t complete_work(
      const sentinel::schema::account_id_t& caller,
      const sentinel::schema::complete_work_t& operation,
      sentinel::schema::timestamp_milliseconds_t now);
  sentinel::schema::transaction_result_t refund_request(
      const sentinel::schema::account_id_t& caller,
      const sentinel::schema::refund_request_t& operation,
      sentinel::schema::timestamp_milliseconds_t now);

  sentinel::schema::transaction_result_t set_minimum_fee(
      const sentinel::schema::account_id_t& caller,
      const sentinel::schema::set_minimum_fee_t& operation);
  sentinel::schema::transaction_result_t set_refund_timeout(
      const sentinel::schema::account_id_t& caller,
      const sentinel::schema::set_refund_timeout_t& operation);
  sentinel::schema::transaction_result_t set_auditor(
      const sentinel::schema::account_id_t& caller,
      const sentinel::schema::set_auditor_t& operation);
  sentinel::schema::transaction_result_t grant_fee_exemption(
      const sentinel::schema::account_id_t& caller,
      const sentinel::schema::grant_fee_exemption_t& operation);
  /// Sweeps all of custody. Pending deposits are not reserved, so refunds
  /// after a sweep can fail with transfer_failed.
  sentinel::schema::transaction_result_t withdraw_funds(
      const sentinel::schema::account_id_t& caller,
      const sentinel::schema::withdraw_funds_t& operation);
  sentinel::schema::transaction_result_t set_paused(
      const sentinel::schema::account_id_t& caller,
      const sentinel::schema::set_paused_t& operation);
  sentinel::schema::transaction_result_t transfer_ownership(
      const sentinel::schema::account_id_t& caller,
      const sentinel::schema::transfer_ownership_t& operation);

  std::optional<sentinel::schema::audit_request_t> get_request(
      sentinel::schema::request_id_t request_id) const;
  /// Full scan of every request id, recomputed on each call.
  std::vector<sentinel::schema::request_id_t> list_pending() const;
  std::vector<sentinel::schema::request_id_t> list_by_requester(
      const sentinel::schema::account_id_t& requester) const;
  bool is_fee_exempt(const sentinel::schema::account_id_t& target) const;
  sentinel::schema::amount_t custody_balance() const;

 private:
  sentinel::schema::queue_state_t require_state() const;
  void save_state(const sentinel::schema::queue_state_t& queue);
  void save_request(const sentinel::schema::audit_request_t& request);

  state_view& state_;
  bank& bank_;
};

}  // namespace sentinel::execution
