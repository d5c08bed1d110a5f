#pragma once
#include <sentinel/schema/primitives.hpp>

// Schema type: complete work.
// Escrow workflow: auditor closes a request with the identifier of the report
// it published to the registry. The identifier is not cross-checked.
namespace sentinel::schema {

template <uint16_t Version>
struct complete_work;

template <>
struct complete_work<1> final {
  uint16_t version{1};
  request_id_t request_id{};
  report_id_t report_id{};
};

using complete_work_t = complete_work<1>;

}  // namespace sentinel::schema
