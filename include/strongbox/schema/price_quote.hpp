#pragma once
#include <strongbox/schema/primitives.hpp>

// Schema type: price quote.
// Ledger workflow: latest answer of a price feed; `price` carries `decimals`
// fractional digits.
namespace strongbox::schema {

template <uint16_t Version>
struct price_quote;

template <>
struct price_quote<1> final {
  uint16_t version{1};
  price_t price;
  uint8_t decimals{};
};

using price_quote_t = price_quote<1>;

}  // namespace strongbox::schema
