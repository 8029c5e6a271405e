#pragma once

#include <strongbox/schema/primitives.hpp>
#include <cstdint>
#include <optional>

namespace strongbox::execution {

/// Token metadata lookup. Not consulted for the native currency.
class asset_metadata {
 public:
  virtual ~asset_metadata() = default;

  virtual std::optional<uint8_t> decimals(
      const strongbox::schema::asset_id_t& asset_id) const = 0;
};

}  // namespace strongbox::execution
