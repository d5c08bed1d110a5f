#pragma once
#include <sentinel/schema/primitives.hpp>

namespace sentinel::schema {

template <uint16_t Version>
struct grant_fee_exemption;

template <>
struct grant_fee_exemption<1> final {
  uint16_t version{1};
  account_id_t target_address{};
};

using grant_fee_exemption_t = grant_fee_exemption<1>;

}  // namespace sentinel::schema
