#pragma once
#include <sentinel/schema/primitives.hpp>
#include <string>

namespace sentinel::schema {

template <uint16_t Version>
struct auditor_record;

template <>
struct auditor_record<1> final {
  uint16_t version{1};
  account_id_t auditor{};
  bool authorized{};
  std::string name;
};

using auditor_record_t = auditor_record<1>;

}  // namespace sentinel::schema
