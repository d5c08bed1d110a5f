#pragma once

#include <sentinel/schema/primitives.hpp>
#include <functional>

namespace sentinel::execution {

/// Called before an outbound payout from custody is credited. Returning false
/// rejects the payment and fails the operation that triggered it.
using transfer_hook_t =
    std::function<bool(const sentinel::schema::account_id_t& recipient,
                       const sentinel::schema::amount_t& amount)>;

}  // namespace sentinel::execution
