#pragma once

#include <sentinel/execution/reentrancy_guard.hpp>
#include <sentinel/execution/state_view.hpp>
#include <sentinel/execution/transfer_hook.hpp>
#include <sentinel/schema/primitives.hpp>
#include <sentinel/schema/transaction_result.hpp>
#include <string_view>

namespace sentinel::execution {

/// Reserved identity holding escrowed request deposits.
sentinel::schema::account_id_t make_custody_account();

/// Native balances over a state view.
///
/// Inbound moves (transfers, deposits into custody) only touch state.
/// Outbound payouts from custody also run the transfer hook, with the
/// reentrancy guard held, before crediting the recipient.
class bank final {
 public:
  bank(state_view& state,
       reentrancy_guard& guard,
       const transfer_hook_t& hook);

  sentinel::schema::amount_t balance_of(
      const sentinel::schema::account_id_t& account) const;
  sentinel::schema::amount_t custody_balance() const;

  void credit(const sentinel::schema::account_id_t& account,
              const sentinel::schema::amount_t& amount);
  /// False (and no change) when the account cannot cover `amount`.
  [[nodiscard]] bool debit(const sentinel::schema::account_id_t& account,
                           const sentinel::schema::amount_t& amount);

  sentinel::schema::transaction_result_t transfer(
      const sentinel::schema::account_id_t& from,
      const sentinel::schema::account_id_t& to,
      const sentinel::schema::amount_t& amount);

  /// Move `amount` from `from` into custody. False when `from` is short.
  [[nodiscard]] bool deposit_to_custody(
      const sentinel::schema::account_id_t& from,
      const sentinel::schema::amount_t& amount);

  /// Pay `amount` out of custody. Fails with transfer_failed (reported under
  /// `codespace`) when custody is short or the hook rejects the payment.
  sentinel::schema::transaction_result_t pay_out(
      const sentinel::schema::account_id_t& to,
      const sentinel::schema::amount_t& amount,
      std::string_view codespace);

 private:
  void set_balance(const sentinel::schema::account_id_t& account,
                   const sentinel::schema::amount_t& amount);

  state_view& state_;
  reentrancy_guard& guard_;
  const transfer_hook_t& hook_;
};

}  // namespace sentinel::execution
