#pragma once
#include <sentinel/schema/primitives.hpp>
#include <sentinel/schema/queue_state.hpp>
#include <sentinel/schema/registry_state.hpp>
#include <string>
#include <utility>
#include <vector>

// Schema type: genesis.
// Initial state applied once by InitChain: owner and auditor identities, queue
// policy, registry cooldown, opening balances and fee exempt targets.
namespace sentinel::schema {

// 5 * 10^18 base units.
inline constexpr auto kDefaultMinimumFeeDecimal = "5000000000000000000";

template <uint16_t Version>
struct genesis;

template <>
struct genesis<1> final {
  uint16_t version{1};
  std::string chain_id;
  account_id_t owner{};
  account_id_t auditor{};
  amount_t minimum_fee{kDefaultMinimumFeeDecimal};
  duration_milliseconds_t refund_timeout{kDefaultRefundTimeout};
  duration_milliseconds_t report_cooldown{kDefaultReportCooldown};
  std::vector<std::pair<account_id_t, amount_t>> balances;
  std::vector<account_id_t> fee_exempt_targets;
  // Registered as authorized in the report registry under this name; empty
  // skips registration.
  std::string auditor_name{"sentinel"};
};

using genesis_t = genesis<1>;

}  // namespace sentinel::schema
