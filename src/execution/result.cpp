#include <sentinel/execution/result.hpp>
#include <algorithm>
#include <array>

using namespace sentinel::schema;

namespace sentinel::execution {

namespace {

constexpr auto kIndexedKeys = std::array<std::string_view, 5>{
    "request_id", "report_id", "requester", "auditor", "target"};

}  // namespace

transaction_result_t make_error_result(const transaction_error_code code,
                                       const std::string_view codespace,
                                       std::string log,
                                       std::string info) {
  auto result = transaction_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::move(log);
  result.info = std::move(info);
  result.codespace = std::string{codespace};
  return result;
}

transaction_event_t make_event(
    std::string type,
    std::initializer_list<std::pair<std::string_view, std::string>>
        attributes) {
  auto event = transaction_event_t{.type = std::move(type)};
  event.attributes.reserve(attributes.size());
  for (const auto& [key, value] : attributes) {
    event.attributes.push_back(transaction_event_attribute_t{
        .key = std::string{key},
        .value = value,
        .index = std::ranges::find(kIndexedKeys, key) != std::end(kIndexedKeys)});
  }
  return event;
}

std::string to_event_value(const account_id_t& account) {
  return "0x" + to_hex(bytes_view_t{account.data(), account.size()});
}

std::string to_event_value(const amount_t& amount) {
  return to_string(amount);
}

std::string to_event_value(const uint64_t value) {
  return std::to_string(value);
}

}  // namespace sentinel::execution
