#pragma once
#include <strongbox/schema/primitives.hpp>

// Schema type: withdraw.
// Ledger workflow: debits the signer by `amount` of `asset_id`, then pushes
// the funds to the signer.
namespace strongbox::schema {

template <uint16_t Version>
struct withdraw;

template <>
struct withdraw<1> final {
  uint16_t version{1};
  asset_id_t asset_id{};
  amount_t amount;
};

using withdraw_t = withdraw<1>;

}  // namespace strongbox::schema
