#pragma once
#include <strongbox/schema/primitives.hpp>

// Schema type: set withdraw limit.
// Ledger workflow: replaces the per-withdrawal ceiling, in asset units.
namespace strongbox::schema {

template <uint16_t Version>
struct set_withdraw_limit;

template <>
struct set_withdraw_limit<1> final {
  uint16_t version{1};
  amount_t limit;
};

using set_withdraw_limit_t = set_withdraw_limit<1>;

}  // namespace strongbox::schema
