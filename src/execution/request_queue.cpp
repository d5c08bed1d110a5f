#include <spdlog/spdlog.h>
#include <sentinel/common/critical.hpp>
#include <sentinel/execution/request_queue.hpp>
#include <sentinel/execution/result.hpp>
#include <sentinel/schema/key/engine_keys.hpp>
#include <limits>

using namespace sentinel::schema;

namespace sentinel::execution {

namespace {

transaction_result_t unauthorized(const std::string_view info) {
  return make_error_result(transaction_error_code::unauthorized,
                           kCodespaceQueue, "unauthorized", std::string{info});
}

transaction_result_t request_not_found(const request_id_t request_id) {
  return make_error_result(transaction_error_code::not_found, kCodespaceQueue,
                           "request not found",
                           "request id " + std::to_string(request_id));
}

transaction_result_t invalid_state(const audit_request_t& request) {
  return make_error_result(
      transaction_error_code::invalid_state, kCodespaceQueue,
      "invalid request state",
      "request " + std::to_string(request.id) + " is " +
          std::string{to_string(request.status)});
}

transaction_result_t invalid_input(const std::string_view info) {
  return make_error_result(transaction_error_code::invalid_input,
                           kCodespaceQueue, "invalid input",
                           std::string{info});
}

transaction_result_t with_event(transaction_event_t event) {
  auto result = transaction_result_t{};
  result.events.push_back(std::move(event));
  return result;
}

bool refund_window_elapsed(const audit_request_t& request,
                           const duration_milliseconds_t refund_timeout,
                           const timestamp_milliseconds_t now) {
  // A timeout large enough to overflow is never reached.
  if (refund_timeout >
      std::numeric_limits<timestamp_milliseconds_t>::max() -
          request.requested_at) {
    return false;
  }
  return now >= request.requested_at + refund_timeout;
}

}  // namespace

request_queue::request_queue(state_view& state, bank& ledger)
    : state_(state), bank_(ledger) {}

void request_queue::initialize(const genesis_t& genesis) {
  save_state(queue_state_t{.owner = genesis.owner,
                           .auditor = genesis.auditor,
                           .minimum_fee = genesis.minimum_fee,
                           .refund_timeout = genesis.refund_timeout});
  for (const auto& target : genesis.fee_exempt_targets) {
    state_.put(key::make_fee_exempt_key(target), true);
  }
}

std::optional<queue_state_t> request_queue::load_state() const {
  return state_.get<queue_state_t>(key::make_queue_config_key());
}

queue_state_t request_queue::require_state() const {
  auto queue = load_state();
  if (!queue) {
    sentinel::common::critical("queue state missing after genesis");
  }
  return *queue;
}

void request_queue::save_state(const queue_state_t& queue) {
  state_.put(key::make_queue_config_key(), queue);
}

void request_queue::save_request(const audit_request_t& request) {
  state_.put(key::make_request_key(request.id), request);
}

transaction_result_t request_queue::submit_request(
    const account_id_t& caller,
    const submit_request_t& operation,
    const timestamp_milliseconds_t now) {
  if (is_null_account(operation.target_address)) {
    return invalid_input("target address must be non-null");
  }
  auto queue = require_state();
  if (queue.paused) {
    return make_error_result(transaction_error_code::contract_paused,
                             kCodespaceQueue, "queue paused",
                             "submissions are suspended");
  }
  if (!is_fee_exempt(operation.target_address) &&
      operation.deposit < queue.minimum_fee) {
    return make_error_result(
        transaction_error_code::insufficient_payment, kCodespaceQueue,
        "insufficient payment",
        "deposit below minimum fee " + to_string(queue.minimum_fee));
  }
  if (!bank_.deposit_to_custody(caller, operation.deposit)) {
    return make_error_result(transaction_error_code::insufficient_funds,
                             kCodespaceQueue, "insufficient funds",
                             "balance does not cover deposit");
  }

  auto request = audit_request_t{.id = queue.request_count + 1,
                                 .requester = caller,
                                 .target_address = operation.target_address,
                                 .payment = operation.deposit,
                                 .status = request_status_t::pending,
                                 .requested_at = now};
  queue.request_count = request.id;
  queue.total_fees_collected += operation.deposit;
  save_request(request);
  state_.put(key::make_requester_index_key(caller, request.id), request.id);
  save_state(queue);

  auto encoder = state_view::encoder_t{};
  auto result = with_event(make_event(
      "audit_requested", {{"request_id", to_event_value(request.id)},
                          {"requester", to_event_value(caller)},
                          {"target", to_event_value(request.target_address)},
                          {"deposit", to_event_value(request.payment)}}));
  result.data = encoder.encode(request.id);
  spdlog::debug("Request {} submitted by {} with deposit {}", request.id,
                to_event_value(caller), to_string(request.payment));
  return result;
}

transaction_result_t request_queue::start_work(
    const account_id_t& caller,
    const start_work_t& operation) {
  if (caller != require_state().auditor) {
    return unauthorized("caller is not the auditor");
  }
  auto request = get_request(operation.request_id);
  if (!request) {
    return request_not_found(operation.request_id);
  }
  if (request->status != request_status_t::pending) {
    return invalid_state(*request);
  }
  request->status = request_status_t::in_progress;
  save_request(*request);
  return with_event(
      make_event("work_started", {{"request_id", to_event_value(request->id)},
                                  {"auditor", to_event_value(caller)}}));
}

transaction_result_t request_queue::complete_work(
    const account_id_t& caller,
    const complete_work_t& operation,
    const timestamp_milliseconds_t now) {
  if (caller != require_state().auditor) {
    return unauthorized("caller is not the auditor");
  }
  auto request = get_request(operation.request_id);
  if (!request) {
    return request_not_found(operation.request_id);
  }
  if (is_terminal(request->status)) {
    return invalid_state(*request);
  }
  if (operation.report_id == 0) {
    return invalid_input("report id must be non-zero");
  }
  request->status = request_status_t::completed;
  request->completed_at = now;
  request->report_id = operation.report_id;
  save_request(*request);
  return with_event(make_event(
      "work_completed", {{"request_id", to_event_value(request->id)},
                         {"report_id", to_event_value(request->report_id)}}));
}

transaction_result_t request_queue::refund_request(
    const account_id_t& caller,
    const refund_request_t& operation,
    const timestamp_milliseconds_t now) {
  auto request = get_request(operation.request_id);
  if (!request) {
    return request_not_found(operation.request_id);
  }
  if (request->status != request_status_t::pending) {
    return invalid_state(*request);
  }
  auto queue = require_state();
  if (!refund_window_elapsed(*request, queue.refund_timeout, now)) {
    return make_error_result(transaction_error_code::timeout_not_reached,
                             kCodespaceQueue, "refund timeout not reached",
                             "refund window has not elapsed");
  }
  if (caller != request->requester && caller != queue.owner) {
    return unauthorized("caller is neither requester nor owner");
  }

  auto amount = request->payment;
  request->status = request_status_t::refunded;
  request->payment = 0;
  save_request(*request);

  if (amount > 0) {
    if (queue.total_fees_collected < amount) {
      sentinel::common::critical("fee counter below outstanding deposit");
    }
    queue.total_fees_collected -= amount;
    save_state(queue);
    auto payout = bank_.pay_out(request->requester, amount, kCodespaceQueue);
    if (payout.code != 0) {
      return payout;
    }
  }

  return with_event(make_event(
      "request_refunded", {{"request_id", to_event_value(request->id)},
                           {"requester", to_event_value(request->requester)},
                           {"amount", to_event_value(amount)}}));
}

transaction_result_t request_queue::set_minimum_fee(
    const account_id_t& caller,
    const set_minimum_fee_t& operation) {
  auto queue = require_state();
  if (caller != queue.owner) {
    return unauthorized("caller is not the owner");
  }
  queue.minimum_fee = operation.minimum_fee;
  save_state(queue);
  return with_event(make_event(
      "minimum_fee_updated",
      {{"minimum_fee", to_event_value(operation.minimum_fee)}}));
}

transaction_result_t request_queue::set_refund_timeout(
    const account_id_t& caller,
    const set_refund_timeout_t& operation) {
  auto queue = require_state();
  if (caller != queue.owner) {
    return unauthorized("caller is not the owner");
  }
  queue.refund_timeout = operation.refund_timeout;
  save_state(queue);
  return with_event(make_event(
      "refund_timeout_updated",
      {{"refund_timeout_ms", to_event_value(operation.refund_timeout)}}));
}

transaction_result_t request_queue::set_auditor(
    const account_id_t& caller,
    const set_auditor_t& operation) {
  auto queue = require_state();
  if (caller != queue.owner) {
    return unauthorized("caller is not the owner");
  }
  if (is_null_account(operation.auditor)) {
    return invalid_input("auditor must be non-null");
  }
  auto previous = queue.auditor;
  queue.auditor = operation.auditor;
  save_state(queue);
  return with_event(
      make_event("auditor_updated",
                 {{"previous_auditor", to_event_value(previous)},
                  {"auditor", to_event_value(operation.auditor)}}));
}

transaction_result_t request_queue::grant_fee_exemption(
    const account_id_t& caller,
    const grant_fee_exemption_t& operation) {
  if (caller != require_state().owner) {
    return unauthorized("caller is not the owner");
  }
  state_.put(key::make_fee_exempt_key(operation.target_address), true);
  return with_event(make_event(
      "fee_exemption_granted",
      {{"target", to_event_value(operation.target_address)}}));
}

transaction_result_t request_queue::withdraw_funds(
    const account_id_t& caller,
    const withdraw_funds_t& operation) {
  if (caller != require_state().owner) {
    return unauthorized("caller is not the owner");
  }
  if (is_null_account(operation.recipient)) {
    return invalid_input("recipient must be non-null");
  }
  auto amount = bank_.custody_balance();
  if (amount == 0) {
    return make_error_result(transaction_error_code::no_balance,
                             kCodespaceQueue, "no balance",
                             "custody account is empty");
  }
  auto payout = bank_.pay_out(operation.recipient, amount, kCodespaceQueue);
  if (payout.code != 0) {
    return payout;
  }
  spdlog::warn("Owner withdrew {} from custody to {}", to_string(amount),
               to_event_value(operation.recipient));
  return with_event(
      make_event("funds_withdrawn",
                 {{"recipient", to_event_value(operation.recipient)},
                  {"amount", to_event_value(amount)}}));
}

transaction_result_t request_queue::set_paused(
    const account_id_t& caller,
    const set_paused_t& operation) {
  auto queue = require_state();
  if (caller != queue.owner) {
    return unauthorized("caller is not the owner");
  }
  queue.paused = operation.paused;
  save_state(queue);
  return with_event(make_event(operation.paused ? "paused" : "unpaused",
                               {{"account", to_event_value(caller)}}));
}

transaction_result_t request_queue::transfer_ownership(
    const account_id_t& caller,
    const transfer_ownership_t& operation) {
  auto queue = require_state();
  if (caller != queue.owner) {
    return unauthorized("caller is not the owner");
  }
  if (is_null_account(operation.new_owner)) {
    return invalid_input("new owner must be non-null");
  }
  queue.owner = operation.new_owner;
  save_state(queue);
  return with_event(
      make_event("ownership_transferred",
                 {{"previous_owner", to_event_value(caller)},
                  {"new_owner", to_event_value(operation.new_owner)}}));
}

std::optional<audit_request_t> request_queue::get_request(
    const request_id_t request_id) const {
  auto queue = load_state();
  if (!queue || request_id == 0 || request_id > queue->request_count) {
    return std::nullopt;
  }
  auto request = state_.get<audit_request_t>(key::make_request_key(request_id));
  if (!request) {
    sentinel::common::critical("request record missing below request count");
  }
  return request;
}

std::vector<request_id_t> request_queue::list_pending() const {
  auto out = std::vector<request_id_t>{};
  auto queue = load_state();
  if (!queue) {
    return out;
  }
  for (auto id = request_id_t{1}; id <= queue->request_count; ++id) {
    auto request = get_request(id);
    if (request && request->status == request_status_t::pending) {
      out.push_back(id);
    }
  }
  return out;
}

std::vector<request_id_t> request_queue::list_by_requester(
    const account_id_t& requester) const {
  auto prefix = key::make_requester_index_prefix(requester);
  auto out = std::vector<request_id_t>{};
  for (const auto& entry :
       state_.list_by_prefix(bytes_view_t{prefix.data(), prefix.size()})) {
    auto id = key::parse_index_suffix(
        bytes_view_t{entry.first.data(), entry.first.size()});
    if (!id) {
      sentinel::common::critical("malformed requester index key");
    }
    out.push_back(*id);
  }
  return out;
}

bool request_queue::is_fee_exempt(const account_id_t& target) const {
  return state_.get<bool>(key::make_fee_exempt_key(target)).value_or(false);
}

amount_t request_queue::custody_balance() const {
  return bank_.custody_balance();
}

}  // namespace sentinel::execution
