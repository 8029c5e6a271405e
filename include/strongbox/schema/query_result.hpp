#pragma once

#include <strongbox/schema/primitives.hpp>
#include <cstdint>
#include <string>

// Schema type: query result.
// Ledger workflow: read API envelope returning SCALE-encoded output, the key
// echo, the sequence it was read at, and error metadata.
namespace strongbox::schema {

template <uint16_t Version>
struct query_result;

template <>
struct query_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  std::string log;
  std::string info;
  bytes_t key;
  bytes_t value;
  uint64_t sequence{};
  std::string codespace;
};

using query_result_t = query_result<1>;

}  // namespace strongbox::schema
