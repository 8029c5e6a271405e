#pragma once

#include <strongbox/schema/primitives.hpp>
#include <cstdint>

namespace strongbox::execution {

/// Decimals of the native currency; never looked up.
inline constexpr uint8_t kNativeAssetDecimals = 18;

/// Runtime options of the ledger engine.
///
/// `capacity_limit`, `withdraw_limit` and `deployer` only seed a fresh
/// database; once bootstrapped, limits and roles change through transactions.
struct engine_config final {
  strongbox::schema::principal_id_t deployer{};
  uint8_t common_decimals{6};
  uint32_t max_registered_assets{16};
  strongbox::schema::value_t capacity_limit{0};
  strongbox::schema::amount_t withdraw_limit{0};
};

}  // namespace strongbox::execution
