#pragma once
#include <sentinel/schema/primitives.hpp>

namespace sentinel::schema {

template <uint16_t Version>
struct set_minimum_fee;

template <>
struct set_minimum_fee<1> final {
  uint16_t version{1};
  amount_t minimum_fee{};
};

using set_minimum_fee_t = set_minimum_fee<1>;

}  // namespace sentinel::schema
