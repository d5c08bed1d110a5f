#pragma once
#include <sentinel/schema/primitives.hpp>

namespace sentinel::schema {

template <uint16_t Version>
struct set_auditor;

template <>
struct set_auditor<1> final {
  uint16_t version{1};
  account_id_t auditor{};
};

using set_auditor_t = set_auditor<1>;

}  // namespace sentinel::schema
