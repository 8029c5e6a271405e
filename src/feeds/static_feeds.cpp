#include <spdlog/spdlog.h>
#include <strongbox/feeds/static_feeds.hpp>

using namespace strongbox::schema;

namespace strongbox::feeds {

void static_price_oracle::set_price(const price_source_id_t& source,
                                    const price_quote_t& quote) {
  quotes_[source] = quote;
}

std::optional<price_quote_t> static_price_oracle::latest_price(
    const price_source_id_t& source) const {
  auto it = quotes_.find(source);
  if (it == std::end(quotes_)) {
    return std::nullopt;
  }
  return it->second;
}

void static_asset_metadata::set_decimals(const asset_id_t& asset_id,
                                         const uint8_t decimals) {
  decimals_[asset_id] = decimals;
}

std::optional<uint8_t> static_asset_metadata::decimals(
    const asset_id_t& asset_id) const {
  auto it = decimals_.find(asset_id);
  if (it == std::end(decimals_)) {
    return std::nullopt;
  }
  return it->second;
}

bool book_entry_transfer::pull_from(const principal_id_t& principal,
                                    const asset_id_t& asset_id,
                                    const amount_t& amount) {
  spdlog::info("Received {} of asset {} from {}", amount.str(),
               to_hex(asset_id), to_hex(principal));
  return true;
}

bool book_entry_transfer::push_to(const principal_id_t& principal,
                                  const asset_id_t& asset_id,
                                  const amount_t& amount) {
  spdlog::info("Sent {} of asset {} to {}", amount.str(), to_hex(asset_id),
               to_hex(principal));
  return true;
}

}  // namespace strongbox::feeds
