#pragma once
#include <sentinel/schema/primitives.hpp>
#include <string>
namespace sentinel::schema {

template <uint16_t Version>
struct register_auditor;

template <>
struct register_auditor<1> final {
  uint16_t version{1};
  account_id_t auditor{};
  std::string name;
};

using register_auditor_t = register_auditor<1>;

}  // namespace sentinel::schema
