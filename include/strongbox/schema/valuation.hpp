#pragma once

#include <strongbox/schema/primitives.hpp>
#include <strongbox/schema/transaction_error_code.hpp>

// Schema type: valuation.
// Ledger workflow: common-denomination value of a holding. A nonzero `code`
// is the transaction_error_code that prevented the valuation.
namespace strongbox::schema {

template <uint16_t Version>
struct valuation;

template <>
struct valuation<1> final {
  uint16_t version{1};
  uint32_t code{};
  value_t value;
};

using valuation_t = valuation<1>;

inline valuation_t make_valuation_error(const transaction_error_code code) {
  return valuation_t{.code = static_cast<uint32_t>(code), .value = 0};
}

}  // namespace strongbox::schema
