#pragma once

#include <cstdint>

namespace sentinel::schema {

enum class transaction_error_code : uint32_t {
  invalid_transaction = 1,
  unsupported_transaction_version = 2,
  invalid_chain_id = 3,
  invalid_nonce = 4,
  invalid_signature_type = 5,
  signature_verification_failed = 6,
  chain_not_initialized = 7,
  reentrant_call = 8,
  invalid_input = 10,
  insufficient_payment = 11,
  not_found = 12,
  invalid_state = 13,
  unauthorized = 14,
  timeout_not_reached = 15,
  transfer_failed = 16,
  no_balance = 17,
  insufficient_funds = 18,
  contract_paused = 19,
  invalid_report = 20,
  report_cooldown_active = 21,
};

}  // namespace sentinel::schema
