#pragma once
#include <strongbox/schema/primitives.hpp>

// Schema type: deposit.
// Ledger workflow: credits the signer with `amount` of `asset_id`, then pulls
// the funds from the signer.
namespace strongbox::schema {

template <uint16_t Version>
struct deposit;

template <>
struct deposit<1> final {
  uint16_t version{1};
  asset_id_t asset_id{};
  amount_t amount;
};

using deposit_t = deposit<1>;

}  // namespace strongbox::schema
