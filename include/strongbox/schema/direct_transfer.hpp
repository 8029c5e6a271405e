#pragma once
#include <strongbox/schema/primitives.hpp>

// Schema type: direct transfer.
// Ledger workflow: value sent to the ledger outside deposit. Always rejected.
namespace strongbox::schema {

template <uint16_t Version>
struct direct_transfer;

template <>
struct direct_transfer<1> final {
  uint16_t version{1};
  asset_id_t asset_id{};
  amount_t amount;
};

using direct_transfer_t = direct_transfer<1>;

}  // namespace strongbox::schema
