#pragma once
#include <sentinel/schema/primitives.hpp>

namespace sentinel::schema {

template <uint16_t Version>
struct transfer;

template <>
struct transfer<1> final {
  uint16_t version{1};
  account_id_t recipient{};
  amount_t amount{};
};

using transfer_t = transfer<1>;

}  // namespace sentinel::schema
