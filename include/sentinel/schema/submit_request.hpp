#pragma once
#include <sentinel/schema/primitives.hpp>

// Schema type: submit request.
// Escrow workflow: requester deposits funds for an audit of target_address.
// The deposit moves from the signer's balance into queue custody.
namespace sentinel::schema {

template <uint16_t Version>
struct submit_request;

template <>
struct submit_request<1> final {
  uint16_t version{1};
  account_id_t target_address{};
  amount_t deposit{};
};

using submit_request_t = submit_request<1>;

}  // namespace sentinel::schema
