#pragma once

#include <cstdint>

namespace sentinel::schema {

enum class query_error_code : uint32_t {
  invalid_key = 1,
  not_found = 2,
  unsupported_path = 3,
  reentrant_call = 4,
  chain_not_initialized = 5,
};

}  // namespace sentinel::schema
