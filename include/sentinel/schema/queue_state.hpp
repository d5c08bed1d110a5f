#pragma once
#include <sentinel/schema/primitives.hpp>

// Schema type: queue state.
// Escrow workflow: scalar configuration and counters of the request queue.
namespace sentinel::schema {

inline constexpr auto kDefaultRefundTimeout =
    duration_milliseconds_t{7ull * 24 * 60 * 60 * 1000};

template <uint16_t Version>
struct queue_state;

template <>
struct queue_state<1> final {
  uint16_t version{1};
  account_id_t owner{};
  account_id_t auditor{};
  amount_t minimum_fee{};
  duration_milliseconds_t refund_timeout{kDefaultRefundTimeout};
  bool paused{};
  request_id_t request_count{};
  // Informational: deposits received minus refunds paid. Custody itself is
  // the balance of the custody account.
  amount_t total_fees_collected{};
};

using queue_state_t = queue_state<1>;

}  // namespace sentinel::schema
