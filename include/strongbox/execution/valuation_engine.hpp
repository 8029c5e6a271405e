#pragma once

#include <strongbox/execution/asset_metadata.hpp>
#include <strongbox/execution/asset_registry.hpp>
#include <strongbox/execution/price_oracle.hpp>
#include <strongbox/schema/valuation.hpp>
#include <cstdint>

namespace strongbox::execution {

/// Converts asset amounts into the common denomination.
///
/// value = amount * price * 10^common_decimals
///         / 10^(asset_decimals + price_decimals)
///
/// The product is formed before the division in an unbounded integer, so no
/// precision is lost and no intermediate overflows; only a final value wider
/// than 256 bits is rejected.
class valuation_engine final {
 public:
  valuation_engine(const asset_registry& registry,
                   const price_oracle& oracle,
                   const asset_metadata& metadata,
                   uint8_t common_decimals);

  strongbox::schema::valuation_t value_of(
      const strongbox::schema::asset_id_t& asset_id,
      const strongbox::schema::amount_t& amount) const;

 private:
  const asset_registry& registry_;
  const price_oracle& oracle_;
  const asset_metadata& metadata_;
  uint8_t common_decimals_{};
};

}  // namespace strongbox::execution
