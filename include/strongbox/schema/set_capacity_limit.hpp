#pragma once
#include <strongbox/schema/primitives.hpp>

// Schema type: set capacity limit.
// Ledger workflow: replaces the ceiling on aggregate held value, in common
// denomination.
namespace strongbox::schema {

template <uint16_t Version>
struct set_capacity_limit;

template <>
struct set_capacity_limit<1> final {
  uint16_t version{1};
  value_t limit;
};

using set_capacity_limit_t = set_capacity_limit<1>;

}  // namespace strongbox::schema
