#pragma once
#include <sentinel/schema/primitives.hpp>

// Schema type: registry state.
// Registry workflow: owner, report counter and publication cooldown.
namespace sentinel::schema {

inline constexpr auto kDefaultReportCooldown = duration_milliseconds_t{60'000};
inline constexpr auto kMaxReportScore = uint8_t{100};
inline constexpr auto kMaxIssueCount = uint32_t{10'000};

template <uint16_t Version>
struct registry_state;

template <>
struct registry_state<1> final {
  uint16_t version{1};
  account_id_t owner{};
  report_id_t report_count{};
  duration_milliseconds_t report_cooldown{kDefaultReportCooldown};
};

using registry_state_t = registry_state<1>;

}  // namespace sentinel::schema
