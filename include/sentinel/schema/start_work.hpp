#pragma once
#include <sentinel/schema/primitives.hpp>

namespace sentinel::schema {

template <uint16_t Version>
struct start_work;

template <>
struct start_work<1> final {
  uint16_t version{1};
  request_id_t request_id{};
};

using start_work_t = start_work<1>;

}  // namespace sentinel::schema
