#pragma once

#include <strongbox/schema/primitives.hpp>
#include <cstdint>

// Schema type: history entry.
// Ledger workflow: audit row storing the executed transaction bytes and the
// result code, successful or not.
namespace strongbox::schema {

template <uint16_t Version>
struct history_entry;

template <>
struct history_entry<1> final {
  uint16_t version{1};
  uint64_t sequence{};
  uint32_t code{};
  bytes_t tx;
};

using history_entry_t = history_entry<1>;

}  // namespace strongbox::schema
