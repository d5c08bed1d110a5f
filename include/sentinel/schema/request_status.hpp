#pragma once

#include <sentinel/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>

// Schema type: request status.
// Escrow workflow: pending is the only initial state; completed and refunded
// are terminal.
namespace sentinel::schema {

enum class request_status_t : uint8_t {
  pending = 0,
  in_progress = 1,
  completed = 2,
  refunded = 3
};

inline constexpr auto kRequestStatusMappings =
    std::array{std::pair<std::string_view, request_status_t>{
                   "pending", request_status_t::pending},
               std::pair<std::string_view, request_status_t>{
                   "in_progress", request_status_t::in_progress},
               std::pair<std::string_view, request_status_t>{
                   "completed", request_status_t::completed},
               std::pair<std::string_view, request_status_t>{
                   "refunded", request_status_t::refunded}};

inline constexpr std::string_view to_string(const request_status_t value) {
  return to_string(value, kRequestStatusMappings).value_or("unknown");
}

inline constexpr bool is_terminal(const request_status_t value) {
  return value == request_status_t::completed ||
         value == request_status_t::refunded;
}

}  // namespace sentinel::schema
