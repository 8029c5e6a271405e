#include <spdlog/spdlog.h>
#include <strongbox/execution/config.hpp>
#include <strongbox/execution/valuation_engine.hpp>

#include <limits>

using namespace strongbox::schema;

namespace {

using wide_int_t = boost::multiprecision::cpp_int;

wide_int_t pow10(const unsigned exponent) {
  return wide_int_t{boost::multiprecision::pow(wide_int_t{10}, exponent)};
}

}  // namespace

namespace strongbox::execution {

valuation_engine::valuation_engine(const asset_registry& registry,
                                   const price_oracle& oracle,
                                   const asset_metadata& metadata,
                                   const uint8_t common_decimals)
    : registry_{registry},
      oracle_{oracle},
      metadata_{metadata},
      common_decimals_{common_decimals} {}

valuation_t valuation_engine::value_of(const asset_id_t& asset_id,
                                       const amount_t& amount) const {
  auto source = registry_.lookup(asset_id);
  if (!source) {
    return make_valuation_error(transaction_error_code::asset_not_registered);
  }

  // A zero or negative answer means a stale or broken feed. It must never be
  // read as "worth nothing", or the capacity check would admit any amount.
  auto quote = oracle_.latest_price(*source);
  if (!quote || quote->price <= 0) {
    spdlog::warn("Price feed {} returned no usable price for asset {}",
                 to_hex(*source), to_hex(asset_id));
    return make_valuation_error(transaction_error_code::invalid_price);
  }

  auto asset_decimals = std::optional<uint8_t>{kNativeAssetDecimals};
  if (asset_id != kNativeAssetId) {
    asset_decimals = metadata_.decimals(asset_id);
  }
  if (!asset_decimals) {
    return make_valuation_error(
        transaction_error_code::asset_metadata_missing);
  }

  auto numerator = wide_int_t{amount} * wide_int_t{quote->price} *
                   pow10(common_decimals_);
  auto denominator = pow10(static_cast<unsigned>(*asset_decimals) +
                           static_cast<unsigned>(quote->decimals));
  auto value = wide_int_t{numerator / denominator};
  if (value > wide_int_t{std::numeric_limits<value_t>::max()}) {
    return make_valuation_error(transaction_error_code::arithmetic_overflow);
  }
  return valuation_t{.value = value.convert_to<value_t>()};
}

}  // namespace strongbox::execution
