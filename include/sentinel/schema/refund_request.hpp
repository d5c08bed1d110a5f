#pragma once
#include <sentinel/schema/primitives.hpp>

namespace sentinel::schema {

template <uint16_t Version>
struct refund_request;

template <>
struct refund_request<1> final {
  uint16_t version{1};
  request_id_t request_id{};
};

using refund_request_t = refund_request<1>;

}  // namespace sentinel::schema
