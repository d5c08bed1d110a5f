#pragma once
#include <sentinel/schema/primitives.hpp>

namespace sentinel::schema {

template <uint16_t Version>
struct set_refund_timeout;

template <>
struct set_refund_timeout<1> final {
  uint16_t version{1};
  duration_milliseconds_t refund_timeout{};
};

using set_refund_timeout_t = set_refund_timeout<1>;

}  // namespace sentinel::schema
