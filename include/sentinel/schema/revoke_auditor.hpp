#pragma once
#include <sentinel/schema/primitives.hpp>

namespace sentinel::schema {

template <uint16_t Version>
struct revoke_auditor;

template <>
struct revoke_auditor<1> final {
  uint16_t version{1};
  account_id_t auditor{};
};

using revoke_auditor_t = revoke_auditor<1>;

}  // namespace sentinel::schema
