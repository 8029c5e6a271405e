#pragma once

#include <strongbox/schema/primitives.hpp>
#include <strongbox/schema/transaction_event.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace strongbox::schema {

template <uint16_t Version>
struct transaction_result;

template <>
struct transaction_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  std::string log;
  std::string info;
  std::string codespace;
  std::vector<transaction_event_t> events;
};

using transaction_result_t = transaction_result<1>;

}  // namespace strongbox::schema
