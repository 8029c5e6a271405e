#pragma once

#include <strongbox/schema/primitives.hpp>
#include <cstdint>
#include <string>

namespace strongbox::schema {

template <uint16_t Version>
struct app_info;

template <>
struct app_info<1> final {
  std::string data{"strongbox-ledger"};
  std::string version{"0.1.0"};
  uint64_t last_sequence{};
  hash32_t state_root{};
};

using app_info_t = app_info<1>;

}  // namespace strongbox::schema
