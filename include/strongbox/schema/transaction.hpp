#pragma once
#include <strongbox/schema/deposit.hpp>
#include <strongbox/schema/direct_transfer.hpp>
#include <strongbox/schema/primitives.hpp>
#include <strongbox/schema/register_asset.hpp>
#include <strongbox/schema/set_capacity_limit.hpp>
#include <strongbox/schema/set_withdraw_limit.hpp>
#include <strongbox/schema/upsert_role_assignment.hpp>
#include <strongbox/schema/withdraw.hpp>
#include <variant>

namespace strongbox::schema {

using transaction_payload_t = std::variant<deposit_t,
                                           withdraw_t,
                                           register_asset_t,
                                           set_capacity_limit_t,
                                           set_withdraw_limit_t,
                                           upsert_role_assignment_t,
                                           direct_transfer_t>;

template <uint16_t Version>
struct transaction;

template <>
struct transaction<1> final {
  uint16_t version{1};
  principal_id_t signer{};
  transaction_payload_t payload{};
};

using transaction_t = transaction<1>;

}  // namespace strongbox::schema
