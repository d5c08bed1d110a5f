#pragma once
#include <sentinel/schema/primitives.hpp>

namespace sentinel::schema {

template <uint16_t Version>
struct transfer_ownership;

template <>
struct transfer_ownership<1> final {
  uint16_t version{1};
  account_id_t new_owner{};
};

using transfer_ownership_t = transfer_ownership<1>;

}  // namespace sentinel::schema
