#pragma once
#include <strongbox/schema/primitives.hpp>

// Schema type: limits.
// Ledger workflow: capacity is compared against the mark-to-market value of
// all holdings; the withdraw limit is a flat ceiling in asset units.
namespace strongbox::schema {

template <uint16_t Version>
struct limits;

template <>
struct limits<1> final {
  uint16_t version{1};
  value_t capacity_limit;
  amount_t withdraw_limit;
};

using limits_t = limits<1>;

}  // namespace strongbox::schema
