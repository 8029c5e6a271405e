#pragma once
#include <strongbox/schema/primitives.hpp>

// Schema type: committed state.
// Ledger workflow: sequence number of the last executed transaction and the
// digest of every transaction applied so far.
namespace strongbox::schema {

template <uint16_t Version>
struct committed_state;

template <>
struct committed_state<1> final {
  uint16_t version{1};
  uint64_t sequence{};
  hash32_t state_root{};
};

using committed_state_t = committed_state<1>;

}  // namespace strongbox::schema
