#pragma once
#include <sentinel/schema/primitives.hpp>

// Schema type: withdraw funds.
// Escrow workflow: owner sweeps the whole custody balance to a recipient.
// Not reconciled against pending requests.
namespace sentinel::schema {

template <uint16_t Version>
struct withdraw_funds;

template <>
struct withdraw_funds<1> final {
  uint16_t version{1};
  account_id_t recipient{};
};

using withdraw_funds_t = withdraw_funds<1>;

}  // namespace sentinel::schema
