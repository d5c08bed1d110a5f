#include <spdlog/spdlog.h>
#include <sentinel/blake3/hash.hpp>
#include <sentinel/common/critical.hpp>
#include <sentinel/execution/bank.hpp>
#include <sentinel/execution/result.hpp>
#include <sentinel/schema/key/engine_keys.hpp>
#include <algorithm>
#include <exception>
#include <limits>

using namespace sentinel::schema;

namespace sentinel::execution {

account_id_t make_custody_account() {
  static const auto custody = [] {
    auto digest = sentinel::blake3::hash(
        std::string_view{"sentinel.request_queue.custody"});
    auto account = account_id_t{};
    std::copy(std::end(digest) - account.size(), std::end(digest),
              std::begin(account));
    return account;
  }();
  return custody;
}

bank::bank(state_view& state,
           reentrancy_guard& guard,
           const transfer_hook_t& hook)
    : state_(state), guard_(guard), hook_(hook) {}

amount_t bank::balance_of(const account_id_t& account) const {
  auto stored = state_.get<amount_bytes_t>(key::make_balance_key(account));
  if (!stored) {
    return amount_t{};
  }
  return make_amount(*stored);
}

amount_t bank::custody_balance() const {
  return balance_of(make_custody_account());
}

void bank::set_balance(const account_id_t& account, const amount_t& amount) {
  auto balance_key = key::make_balance_key(account);
  if (amount == 0) {
    state_.erase(bytes_view_t{balance_key.data(), balance_key.size()});
    return;
  }
  state_.put(balance_key, make_amount_bytes(amount));
}

void bank::credit(const account_id_t& account, const amount_t& amount) {
  auto current = balance_of(account);
  if (amount > std::numeric_limits<amount_t>::max() - current) {
    sentinel::common::critical("native balance overflow");
  }
  set_balance(account, current + amount);
}

bool bank::debit(const account_id_t& account, const amount_t& amount) {
  auto current = balance_of(account);
  if (current < amount) {
    return false;
  }
  set_balance(account, current - amount);
  return true;
}

transaction_result_t bank::transfer(const account_id_t& from,
                                    const account_id_t& to,
                                    const amount_t& amount) {
  if (is_null_account(to) || to == make_custody_account()) {
    return make_error_result(transaction_error_code::invalid_input,
                             kCodespaceBank, "invalid recipient",
                             "recipient must be a non-null user account");
  }
  if (!debit(from, amount)) {
    return make_error_result(transaction_error_code::insufficient_funds,
                             kCodespaceBank, "insufficient funds",
                             "balance does not cover transfer amount");
  }
  credit(to, amount);

  auto result = transaction_result_t{};
  result.events.push_back(make_event(
      "transfer", {{"sender", to_event_value(from)},
                   {"recipient", to_event_value(to)},
                   {"amount", to_event_value(amount)}}));
  return result;
}

bool bank::deposit_to_custody(const account_id_t& from, const amount_t& amount) {
  if (!debit(from, amount)) {
    return false;
  }
  credit(make_custody_account(), amount);
  return true;
}

transaction_result_t bank::pay_out(const account_id_t& to,
                                   const amount_t& amount,
                                   const std::string_view codespace) {
  auto custody = make_custody_account();
  if (balance_of(custody) < amount) {
    spdlog::warn("Custody payout of {} to {} exceeds custody balance",
                 to_string(amount), to_event_value(to));
    return make_error_result(transaction_error_code::transfer_failed,
                             codespace, "transfer failed",
                             "custody balance does not cover payout");
  }

  if (hook_) {
    auto accepted = false;
    try {
      auto scope = reentrancy_guard::scope{guard_};
      accepted = hook_(to, amount);
    } catch (const std::exception& e) {
      spdlog::warn("Transfer hook raised for payout to {}: {}",
                   to_event_value(to), e.what());
    }
    if (!accepted) {
      return make_error_result(transaction_error_code::transfer_failed,
                               codespace, "transfer failed",
                               "recipient rejected payment");
    }
  }

  if (!debit(custody, amount)) {
    sentinel::common::critical("custody balance changed during payout");
  }
  credit(to, amount);
  return transaction_result_t{};
}

}  // namespace sentinel::execution
