#pragma once
#include <strongbox/schema/primitives.hpp>

namespace strongbox::schema {

template <uint16_t Version>
struct operation_counters;

template <>
struct operation_counters<1> final {
  uint16_t version{1};
  uint64_t deposits{};
  uint64_t withdrawals{};
};

using operation_counters_t = operation_counters<1>;

}  // namespace strongbox::schema
