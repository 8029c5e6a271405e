#pragma once

#include <strongbox/schema/price_quote.hpp>
#include <strongbox/schema/primitives.hpp>
#include <optional>

namespace strongbox::execution {

/// External price feed lookup.
class price_oracle {
 public:
  virtual ~price_oracle() = default;

  /// Latest answer of the feed, or std::nullopt if the feed is unknown.
  virtual std::optional<strongbox::schema::price_quote_t> latest_price(
      const strongbox::schema::price_source_id_t& source) const = 0;
};

}  // namespace strongbox::execution
