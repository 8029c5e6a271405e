#pragma once

#include <strongbox/execution/asset_metadata.hpp>
#include <strongbox/execution/external_transfer.hpp>
#include <strongbox/execution/price_oracle.hpp>
#include <strongbox/schema/price_quote.hpp>
#include <strongbox/schema/primitives.hpp>
#include <cstdint>
#include <map>
#include <optional>

// Configured collaborators for running the ledger standalone: prices and
// decimals come from the command line, transfers are book entries.
namespace strongbox::feeds {

class static_price_oracle final : public strongbox::execution::price_oracle {
 public:
  void set_price(const strongbox::schema::price_source_id_t& source,
                 const strongbox::schema::price_quote_t& quote);

  std::optional<strongbox::schema::price_quote_t> latest_price(
      const strongbox::schema::price_source_id_t& source) const override;

 private:
  std::map<strongbox::schema::price_source_id_t,
           strongbox::schema::price_quote_t>
      quotes_;
};

class static_asset_metadata final
    : public strongbox::execution::asset_metadata {
 public:
  void set_decimals(const strongbox::schema::asset_id_t& asset_id,
                    uint8_t decimals);

  std::optional<uint8_t> decimals(
      const strongbox::schema::asset_id_t& asset_id) const override;

 private:
  std::map<strongbox::schema::asset_id_t, uint8_t> decimals_;
};

/// Accepts every transfer; custody is tracked by the ledger alone.
class book_entry_transfer final
    : public strongbox::execution::external_transfer {
 public:
  bool pull_from(const strongbox::schema::principal_id_t& principal,
                 const strongbox::schema::asset_id_t& asset_id,
                 const strongbox::schema::amount_t& amount) override;

  bool push_to(const strongbox::schema::principal_id_t& principal,
               const strongbox::schema::asset_id_t& asset_id,
               const strongbox::schema::amount_t& amount) override;
};

}  // namespace strongbox::feeds
