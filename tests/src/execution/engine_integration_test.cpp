#include <strongbox/execution/engine.hpp>
#include <strongbox/schema/encoding/scale/encoder.hpp>
#include <strongbox/schema/query_error_code.hpp>
#include <strongbox/testing/ledger_fixture.hpp>
#include <gtest/gtest.h>

#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

namespace {

using encoder_t = strongbox::schema::encoding::encoder<
    strongbox::schema::encoding::scale_encoder_tag>;
using strongbox::schema::amount_t;
using strongbox::schema::kNativeAssetId;
using strongbox::schema::price_t;
using strongbox::schema::role_id_t;
using strongbox::schema::transaction_error_code;
using strongbox::testing::ledger_fixture;
using strongbox::testing::make_hash;
using strongbox::testing::make_principal;
using strongbox::testing::units;

const auto kNativeFeed = make_hash(90);
const auto kToken = make_hash(10);
const auto kTokenFeed = make_hash(91);

uint32_t code_of(const transaction_error_code code) {
  return static_cast<uint32_t>(code);
}

strongbox::execution::engine_config capacity_config() {
  auto config = ledger_fixture::default_config();
  config.capacity_limit = units(50'000, 6);
  config.withdraw_limit = units(100, 18);
  return config;
}

/// Registers the native asset at 2,000 and a 6 decimal token at 1.
void configure_assets(ledger_fixture& fixture) {
  fixture.oracle().set(kNativeFeed, price_t{"200000000000"}, 8);
  fixture.oracle().set(kTokenFeed, price_t{100'000'000}, 8);
  fixture.metadata().set(kToken, 6);
  auto& engine = fixture.engine();
  ASSERT_EQ(
      engine.register_asset(fixture.deployer(), kNativeAssetId, kNativeFeed)
          .code,
      0u);
  ASSERT_EQ(engine.register_asset(fixture.deployer(), kToken, kTokenFeed).code,
            0u);
}

template <typename T>
T decode_value(const strongbox::schema::query_result_t& result) {
  auto encoder = encoder_t{};
  return encoder.decode<T>(strongbox::schema::bytes_view_t{
      result.value.data(), result.value.size()});
}

}  // namespace

TEST(engine_integration, fresh_ledger_seeds_deployer_and_limits) {
  auto fixture = ledger_fixture{"strongbox_engine_bootstrap", capacity_config()};
  auto& engine = fixture.engine();

  EXPECT_TRUE(engine.has_role(fixture.deployer(), role_id_t::admin));
  EXPECT_TRUE(engine.has_role(fixture.deployer(), role_id_t::operator_));
  EXPECT_EQ(engine.capacity_limit(), units(50'000, 6));
  EXPECT_EQ(engine.withdraw_limit(), units(100, 18));
  EXPECT_TRUE(engine.registered_assets().empty());

  auto info = engine.info();
  EXPECT_EQ(info.last_sequence, 0u);
  EXPECT_EQ(info.state_root, strongbox::schema::make_zero_hash());
}

TEST(engine_integration, capacity_scenario_is_mark_to_market) {
  auto fixture = ledger_fixture{"strongbox_engine_capacity", capacity_config()};
  configure_assets(fixture);
  auto& engine = fixture.engine();
  auto alice = make_principal(5);

  auto first = engine.deposit(alice, kNativeAssetId, units(20, 18));
  ASSERT_EQ(first.code, 0u) << first.info;
  EXPECT_EQ(engine.total_value().value, units(40'000, 6));

  auto second = engine.deposit(alice, kNativeAssetId, units(6, 18));
  EXPECT_EQ(second.code, code_of(transaction_error_code::capacity_exceeded));
  EXPECT_EQ(second.log, "capacity_exceeded");
  EXPECT_EQ(engine.balance_of(alice, kNativeAssetId), units(20, 18));
  EXPECT_EQ(engine.held(kNativeAssetId), units(20, 18));

  // Same request at a lower price fits.
  fixture.oracle().set(kNativeFeed, price_t{"150000000000"}, 8);
  auto third = engine.deposit(alice, kNativeAssetId, units(6, 18));
  EXPECT_EQ(third.code, 0u);
  EXPECT_EQ(engine.balance_of(alice, kNativeAssetId), units(26, 18));
}

TEST(engine_integration, broken_feed_blocks_deposits) {
  auto fixture = ledger_fixture{"strongbox_engine_feed", capacity_config()};
  configure_assets(fixture);
  auto& engine = fixture.engine();

  fixture.oracle().set(kNativeFeed, price_t{0}, 8);
  auto result = engine.deposit(make_principal(5), kNativeAssetId, units(1, 18));
  EXPECT_EQ(result.code, code_of(transaction_error_code::invalid_price));
  EXPECT_EQ(fixture.transfer().pulls, 0u);

  auto unknown = engine.deposit(make_principal(5), make_hash(55), amount_t{1});
  EXPECT_EQ(unknown.code, code_of(transaction_error_code::asset_not_registered));
}

TEST(engine_integration, withdraw_limit_is_a_flat_ceiling) {
  auto config = capacity_config();
  config.withdraw_limit = units(10, 6);
  auto fixture = ledger_fixture{"strongbox_engine_withdraw_limit", config};
  configure_assets(fixture);
  auto& engine = fixture.engine();
  auto alice = make_principal(5);

  ASSERT_EQ(engine.deposit(alice, kToken, units(100, 6)).code, 0u);
  auto over = engine.withdraw(alice, kToken, units(15, 6));
  EXPECT_EQ(over.code, code_of(transaction_error_code::withdraw_limit_exceeded));
  EXPECT_EQ(engine.balance_of(alice, kToken), units(100, 6));
  EXPECT_EQ(fixture.transfer().pushes, 0u);

  EXPECT_EQ(engine.withdraw(alice, kToken, units(10, 6)).code, 0u);
  EXPECT_EQ(engine.balance_of(alice, kToken), units(90, 6));
  EXPECT_EQ(fixture.transfer().pushes, 1u);
}

TEST(engine_integration, deposit_withdraw_round_trip) {
  auto fixture = ledger_fixture{"strongbox_engine_round_trip", capacity_config()};
  configure_assets(fixture);
  auto& engine = fixture.engine();
  auto alice = make_principal(5);

  ASSERT_EQ(engine.deposit(alice, kToken, units(40, 6)).code, 0u);
  ASSERT_EQ(engine.withdraw(alice, kToken, units(40, 6)).code, 0u);
  EXPECT_EQ(engine.balance_of(alice, kToken), amount_t{0});
  EXPECT_EQ(engine.held(kToken), amount_t{0});
  EXPECT_EQ(engine.total_value().value, amount_t{0});

  auto counters = engine.counters_of(alice);
  EXPECT_EQ(counters.deposits, 1u);
  EXPECT_EQ(counters.withdrawals, 1u);
}

TEST(engine_integration, zero_amounts_and_overdraw_are_rejected) {
  auto fixture = ledger_fixture{"strongbox_engine_zero", capacity_config()};
  configure_assets(fixture);
  auto& engine = fixture.engine();
  auto alice = make_principal(5);

  EXPECT_EQ(engine.deposit(alice, kToken, amount_t{0}).code,
            code_of(transaction_error_code::nothing_to_deposit));
  EXPECT_EQ(engine.withdraw(alice, kToken, amount_t{0}).code,
            code_of(transaction_error_code::nothing_to_withdraw));
  EXPECT_EQ(engine.withdraw(alice, kToken, amount_t{1}).code,
            code_of(transaction_error_code::insufficient_balance));
  EXPECT_EQ(engine.value_of(kToken, amount_t{0}).value, amount_t{0});
  EXPECT_EQ(fixture.transfer().pulls, 0u);
  EXPECT_EQ(fixture.transfer().pushes, 0u);
}

TEST(engine_integration, failed_inbound_transfer_leaves_no_trace) {
  auto fixture = ledger_fixture{"strongbox_engine_failed_pull", capacity_config()};
  configure_assets(fixture);
  auto& engine = fixture.engine();
  auto alice = make_principal(5);
  auto events = std::vector<strongbox::schema::transaction_event_t>{};
  engine.set_event_sink(
      [&](const strongbox::schema::transaction_event_t& event) {
        events.push_back(event);
      });

  fixture.transfer().fail_pull = true;
  auto result = engine.deposit(alice, kToken, units(5, 6));
  EXPECT_EQ(result.code, code_of(transaction_error_code::failed_transfer));
  EXPECT_TRUE(result.events.empty());
  EXPECT_TRUE(events.empty());
  EXPECT_EQ(fixture.transfer().pulls, 1u);
  EXPECT_EQ(engine.balance_of(alice, kToken), amount_t{0});
  EXPECT_EQ(engine.held(kToken), amount_t{0});
  EXPECT_EQ(engine.counters_of(alice).deposits, 0u);
}

TEST(engine_integration, failed_outbound_transfer_restores_balance) {
  auto fixture = ledger_fixture{"strongbox_engine_failed_push", capacity_config()};
  configure_assets(fixture);
  auto& engine = fixture.engine();
  auto alice = make_principal(5);

  ASSERT_EQ(engine.deposit(alice, kToken, units(5, 6)).code, 0u);
  fixture.transfer().fail_push = true;
  auto result = engine.withdraw(alice, kToken, units(5, 6));
  EXPECT_EQ(result.code, code_of(transaction_error_code::failed_transfer));
  EXPECT_EQ(engine.balance_of(alice, kToken), units(5, 6));
  EXPECT_EQ(engine.held(kToken), units(5, 6));
  EXPECT_EQ(engine.counters_of(alice).withdrawals, 0u);
}

TEST(engine_integration, reentrant_withdraw_sees_debited_balance) {
  auto fixture = ledger_fixture{"strongbox_engine_reenter_push", capacity_config()};
  configure_assets(fixture);
  auto& engine = fixture.engine();
  auto alice = make_principal(5);
  ASSERT_EQ(engine.deposit(alice, kToken, units(10, 6)).code, 0u);

  auto nested = std::optional<strongbox::schema::transaction_result_t>{};
  fixture.transfer().on_push = [&](const strongbox::schema::principal_id_t&,
                                   const strongbox::schema::asset_id_t&,
                                   const amount_t&) {
    if (!nested) {
      nested = engine.withdraw(alice, kToken, units(10, 6));
    }
  };

  auto outer = engine.withdraw(alice, kToken, units(10, 6));
  EXPECT_EQ(outer.code, 0u);
  ASSERT_TRUE(nested.has_value());
  EXPECT_EQ(nested->code, code_of(transaction_error_code::insufficient_balance));
  EXPECT_EQ(fixture.transfer().pushes, 1u);
  EXPECT_EQ(engine.balance_of(alice, kToken), amount_t{0});
  EXPECT_EQ(engine.counters_of(alice).withdrawals, 1u);
}

TEST(engine_integration, reentrant_calls_during_transfer_are_rejected) {
  auto fixture = ledger_fixture{"strongbox_engine_reenter_pull", capacity_config()};
  configure_assets(fixture);
  auto& engine = fixture.engine();
  auto alice = make_principal(5);
  ASSERT_EQ(engine.deposit(alice, kToken, units(10, 6)).code, 0u);

  auto nested = std::vector<strongbox::schema::transaction_result_t>{};
  fixture.transfer().on_pull = [&](const strongbox::schema::principal_id_t&,
                                   const strongbox::schema::asset_id_t&,
                                   const amount_t&) {
    if (nested.empty()) {
      nested.push_back(engine.withdraw(alice, kToken, units(12, 6)));
      nested.push_back(engine.deposit(alice, kToken, units(1, 6)));
    }
  };

  // The credit is visible to the callback, so the nested withdraw passes the
  // balance check and is stopped by the guard.
  auto outer = engine.deposit(alice, kToken, units(5, 6));
  EXPECT_EQ(outer.code, 0u);
  ASSERT_EQ(nested.size(), 2u);
  EXPECT_EQ(nested[0].code, code_of(transaction_error_code::reentrant_call));
  EXPECT_EQ(nested[1].code, code_of(transaction_error_code::reentrant_call));
  EXPECT_EQ(engine.balance_of(alice, kToken), units(15, 6));
  EXPECT_EQ(fixture.transfer().pulls, 2u);

  // Guard is released once the outer call returns.
  fixture.transfer().on_pull = nullptr;
  EXPECT_EQ(engine.deposit(alice, kToken, units(1, 6)).code, 0u);
}

TEST(engine_integration, throwing_transfer_unwinds_the_operation) {
  auto fixture = ledger_fixture{"strongbox_engine_throwing_push", capacity_config()};
  configure_assets(fixture);
  auto& engine = fixture.engine();
  auto alice = make_principal(5);
  ASSERT_EQ(engine.deposit(alice, kToken, units(40, 6)).code, 0u);
  auto sequence = engine.info().last_sequence;

  auto events = std::vector<strongbox::schema::transaction_event_t>{};
  engine.set_event_sink(
      [&](const strongbox::schema::transaction_event_t& event) {
        events.push_back(event);
      });
  fixture.transfer().on_push = [](const strongbox::schema::principal_id_t&,
                                  const strongbox::schema::asset_id_t&,
                                  const amount_t&) {
    throw std::runtime_error{"transfer backend unavailable"};
  };

  EXPECT_THROW(engine.withdraw(alice, kToken, units(5, 6)), std::runtime_error);
  EXPECT_EQ(engine.balance_of(alice, kToken), units(40, 6));
  EXPECT_EQ(engine.held(kToken), units(40, 6));
  EXPECT_EQ(engine.counters_of(alice).withdrawals, 0u);
  EXPECT_EQ(engine.info().last_sequence, sequence);
  EXPECT_TRUE(events.empty());

  // The next operation reaches storage and the sink again.
  fixture.transfer().on_push = nullptr;
  ASSERT_EQ(engine.deposit(alice, kToken, units(2, 6)).code, 0u);
  ASSERT_EQ(events.size(), 1u);
  EXPECT_EQ(events[0].type, "deposited");

  fixture.reopen();
  EXPECT_EQ(fixture.engine().balance_of(alice, kToken), units(42, 6));
  EXPECT_EQ(fixture.engine().held(kToken), units(42, 6));
  EXPECT_EQ(fixture.engine().info().last_sequence, sequence + 1);
}

TEST(engine_integration, failed_outer_operation_discards_nested_changes) {
  auto fixture = ledger_fixture{"strongbox_engine_nested_rollback", capacity_config()};
  configure_assets(fixture);
  auto& engine = fixture.engine();
  auto alice = make_principal(5);
  ASSERT_EQ(engine.deposit(alice, kToken, units(10, 6)).code, 0u);
  auto sequence = engine.info().last_sequence;
  auto root = engine.info().state_root;

  auto events = std::vector<strongbox::schema::transaction_event_t>{};
  engine.set_event_sink(
      [&](const strongbox::schema::transaction_event_t& event) {
        events.push_back(event);
      });
  auto nested = std::vector<strongbox::schema::transaction_result_t>{};
  fixture.transfer().on_push = [&](const strongbox::schema::principal_id_t&,
                                   const strongbox::schema::asset_id_t&,
                                   const amount_t&) {
    nested.push_back(engine.set_capacity_limit(fixture.deployer(), units(1, 6)));
    nested.push_back(
        engine.register_asset(fixture.deployer(), make_hash(12), make_hash(92)));
  };
  fixture.transfer().fail_push = true;

  auto outer = engine.withdraw(alice, kToken, units(5, 6));
  EXPECT_EQ(outer.code, code_of(transaction_error_code::failed_transfer));
  ASSERT_EQ(nested.size(), 2u);
  EXPECT_EQ(nested[0].code, 0u);
  EXPECT_EQ(nested[1].code, 0u);

  EXPECT_EQ(engine.capacity_limit(), units(50'000, 6));
  EXPECT_EQ(engine.registered_assets().size(), 2u);
  EXPECT_FALSE(engine.price_source_of(make_hash(12)).has_value());
  EXPECT_EQ(engine.balance_of(alice, kToken), units(10, 6));
  EXPECT_TRUE(events.empty());

  // Only the outer row survives.
  EXPECT_EQ(engine.info().last_sequence, sequence + 1);
  EXPECT_EQ(engine.info().state_root, root);
  auto history = engine.history(sequence + 1, sequence + 10);
  ASSERT_EQ(history.size(), 1u);
  EXPECT_EQ(history[0].sequence, sequence + 1);
  EXPECT_EQ(history[0].code, code_of(transaction_error_code::failed_transfer));
}

TEST(engine_integration, balances_equal_credits_minus_debits_across_users) {
  auto fixture = ledger_fixture{"strongbox_engine_multi_user", capacity_config()};
  configure_assets(fixture);
  auto& engine = fixture.engine();
  auto alice = make_principal(5);
  auto bob = make_principal(6);
  auto carol = make_principal(7);

  struct step {
    strongbox::schema::principal_id_t principal;
    strongbox::schema::asset_id_t asset_id;
    bool deposit;
    amount_t amount;
  };
  auto steps = std::vector<step>{
      {alice, kToken, true, units(100, 6)},
      {bob, kNativeAssetId, true, units(2, 18)},
      {carol, kToken, true, units(250, 6)},
      {alice, kToken, false, units(30, 6)},
      {bob, kNativeAssetId, false, units(3, 18)},
      {carol, kToken, false, units(250, 6)},
      {bob, kToken, true, units(10, 6)},
      {alice, kNativeAssetId, true, units(1, 18)},
      {carol, kToken, false, units(1, 6)},
      {alice, kNativeAssetId, false, units(1, 18)},
      {bob, kNativeAssetId, false, units(1, 18)},
  };

  using position_t = std::pair<strongbox::schema::principal_id_t,
                               strongbox::schema::asset_id_t>;
  auto expected = std::map<position_t, amount_t>{};
  auto deposits = std::map<strongbox::schema::principal_id_t, uint64_t>{};
  auto withdrawals = std::map<strongbox::schema::principal_id_t, uint64_t>{};
  auto rejected = 0u;
  for (const auto& [principal, asset_id, deposit, amount] : steps) {
    auto result = deposit ? engine.deposit(principal, asset_id, amount)
                          : engine.withdraw(principal, asset_id, amount);
    if (result.code != 0) {
      EXPECT_EQ(result.code,
                code_of(transaction_error_code::insufficient_balance));
      ++rejected;
      continue;
    }
    auto& balance = expected[position_t{principal, asset_id}];
    if (deposit) {
      balance += amount;
      ++deposits[principal];
    } else {
      balance -= amount;
      ++withdrawals[principal];
    }
  }
  EXPECT_EQ(rejected, 2u);

  for (const auto& asset_id : {kToken, kNativeAssetId}) {
    auto held = amount_t{0};
    for (const auto& principal : {alice, bob, carol}) {
      auto balance = expected[position_t{principal, asset_id}];
      EXPECT_EQ(engine.balance_of(principal, asset_id), balance);
      held += balance;
    }
    EXPECT_EQ(engine.held(asset_id), held);
  }
  for (const auto& principal : {alice, bob, carol}) {
    EXPECT_EQ(engine.counters_of(principal).deposits, deposits[principal]);
    EXPECT_EQ(engine.counters_of(principal).withdrawals, withdrawals[principal]);
  }
  EXPECT_EQ(engine.held(kToken), units(80, 6));
  EXPECT_EQ(engine.held(kNativeAssetId), units(1, 18));
}

TEST(engine_integration, direct_transfer_is_rejected) {
  auto fixture = ledger_fixture{"strongbox_engine_direct", capacity_config()};
  configure_assets(fixture);
  auto& engine = fixture.engine();

  auto result =
      engine.receive_direct_transfer(make_principal(5), kNativeAssetId, amount_t{1});
  EXPECT_EQ(result.code, code_of(transaction_error_code::invalid_direct_transfer));
  EXPECT_EQ(engine.held(kNativeAssetId), amount_t{0});
}

TEST(engine_integration, administration_requires_roles) {
  auto fixture = ledger_fixture{"strongbox_engine_roles", capacity_config()};
  auto& engine = fixture.engine();
  auto stranger = make_principal(7);
  auto unauthorized = code_of(transaction_error_code::unauthorized);

  EXPECT_EQ(engine.register_asset(stranger, kToken, kTokenFeed).code,
            unauthorized);
  EXPECT_EQ(engine.set_capacity_limit(stranger, amount_t{1}).code, unauthorized);
  EXPECT_EQ(engine.set_withdraw_limit(stranger, amount_t{1}).code, unauthorized);
  EXPECT_EQ(engine
                .upsert_role_assignment(
                    stranger, strongbox::schema::upsert_role_assignment_t{
                                  .subject = stranger, .role = role_id_t::admin})
                .code,
            unauthorized);

  // Admin grants operator; the new operator can configure limits.
  ASSERT_EQ(engine
                .upsert_role_assignment(
                    fixture.deployer(),
                    strongbox::schema::upsert_role_assignment_t{
                        .subject = stranger, .role = role_id_t::operator_})
                .code,
            0u);
  EXPECT_EQ(engine.set_withdraw_limit(stranger, amount_t{7}).code, 0u);
  EXPECT_EQ(engine.withdraw_limit(), amount_t{7});

  // Revocation applies to the next operation.
  ASSERT_EQ(engine
                .upsert_role_assignment(
                    fixture.deployer(),
                    strongbox::schema::upsert_role_assignment_t{
                        .subject = stranger,
                        .role = role_id_t::operator_,
                        .enabled = false})
                .code,
            0u);
  EXPECT_FALSE(engine.has_role(stranger, role_id_t::operator_));
  EXPECT_EQ(engine.set_capacity_limit(stranger, amount_t{1}).code, unauthorized);
}

TEST(engine_integration, registry_bound_is_enforced) {
  auto config = capacity_config();
  config.max_registered_assets = 2;
  auto fixture = ledger_fixture{"strongbox_engine_registry", config};
  configure_assets(fixture);
  auto& engine = fixture.engine();

  auto result = engine.register_asset(fixture.deployer(), make_hash(12),
                                      make_hash(92));
  EXPECT_EQ(result.code, code_of(transaction_error_code::capacity_exceeded));
  EXPECT_EQ(engine.registered_assets().size(), 2u);
  EXPECT_EQ(engine.register_asset(fixture.deployer(), kToken, make_hash(93))
                .code,
            0u);
  EXPECT_EQ(engine.price_source_of(kToken), make_hash(93));
}

TEST(engine_integration, events_reach_the_sink_only_on_success) {
  auto fixture = ledger_fixture{"strongbox_engine_events", capacity_config()};
  auto& engine = fixture.engine();
  auto events = std::vector<strongbox::schema::transaction_event_t>{};
  engine.set_event_sink(
      [&](const strongbox::schema::transaction_event_t& event) {
        events.push_back(event);
      });
  configure_assets(fixture);
  auto alice = make_principal(5);

  ASSERT_EQ(events.size(), 2u);
  EXPECT_EQ(events[0].type, "asset_configured");

  ASSERT_EQ(engine.deposit(alice, kToken, units(3, 6)).code, 0u);
  ASSERT_EQ(events.size(), 3u);
  EXPECT_EQ(events[2].type, "deposited");
  ASSERT_EQ(events[2].attributes.size(), 3u);
  EXPECT_EQ(events[2].attributes[0].key, "principal");
  EXPECT_EQ(events[2].attributes[0].value,
            strongbox::schema::to_hex(alice));
  EXPECT_EQ(events[2].attributes[2].value, "3000000");

  EXPECT_NE(engine.withdraw(alice, kToken, units(4, 6)).code, 0u);
  EXPECT_EQ(events.size(), 3u);

  ASSERT_EQ(engine.set_capacity_limit(fixture.deployer(), units(1, 6)).code, 0u);
  ASSERT_EQ(events.size(), 4u);
  EXPECT_EQ(events[3].type, "capacity_limit_changed");
}

TEST(engine_integration, history_and_state_root_track_every_transaction) {
  auto fixture = ledger_fixture{"strongbox_engine_history", capacity_config()};
  configure_assets(fixture);
  auto& engine = fixture.engine();
  auto alice = make_principal(5);

  auto before = engine.info();
  EXPECT_EQ(before.last_sequence, 2u);

  EXPECT_NE(engine.withdraw(alice, kToken, amount_t{1}).code, 0u);
  auto after_failure = engine.info();
  EXPECT_EQ(after_failure.last_sequence, 3u);
  EXPECT_EQ(after_failure.state_root, before.state_root);

  ASSERT_EQ(engine.deposit(alice, kToken, amount_t{1}).code, 0u);
  auto after_success = engine.info();
  EXPECT_EQ(after_success.last_sequence, 4u);
  EXPECT_NE(after_success.state_root, before.state_root);

  auto history = engine.history(3, 4);
  ASSERT_EQ(history.size(), 2u);
  EXPECT_EQ(history[0].sequence, 3u);
  EXPECT_EQ(history[0].code,
            code_of(transaction_error_code::insufficient_balance));
  EXPECT_EQ(history[1].sequence, 4u);
  EXPECT_EQ(history[1].code, 0u);

  auto encoder = encoder_t{};
  auto tx = encoder.decode<strongbox::schema::transaction_t>(
      strongbox::schema::bytes_view_t{history[1].tx.data(),
                                      history[1].tx.size()});
  EXPECT_EQ(tx.signer, alice);
  ASSERT_TRUE(std::holds_alternative<strongbox::schema::deposit_t>(tx.payload));
}

TEST(engine_integration, raw_transactions_are_checked_before_execution) {
  auto fixture = ledger_fixture{"strongbox_engine_raw", capacity_config()};
  configure_assets(fixture);
  auto& engine = fixture.engine();

  auto garbage = strongbox::schema::bytes_t{0xff};
  EXPECT_EQ(engine.check_transaction(strongbox::schema::bytes_view_t{garbage})
                .code,
            code_of(transaction_error_code::invalid_transaction));
  EXPECT_EQ(engine.execute(strongbox::schema::bytes_view_t{garbage}).code,
            code_of(transaction_error_code::invalid_transaction));

  auto encoder = encoder_t{};
  auto tx = strongbox::schema::transaction_t{
      .version = 2,
      .signer = make_principal(5),
      .payload = strongbox::schema::deposit_t{.asset_id = kToken,
                                              .amount = amount_t{1}}};
  auto future = encoder.encode(tx);
  EXPECT_EQ(engine.execute(strongbox::schema::bytes_view_t{future}).code,
            code_of(transaction_error_code::unsupported_transaction_version));

  tx.version = 1;
  auto current = encoder.encode(tx);
  EXPECT_EQ(engine.check_transaction(strongbox::schema::bytes_view_t{current})
                .code,
            0u);
  EXPECT_EQ(engine.execute(strongbox::schema::bytes_view_t{current}).code, 0u);
  EXPECT_EQ(engine.balance_of(make_principal(5), kToken), amount_t{1});
  EXPECT_EQ(engine.info().last_sequence, 3u);
}

TEST(engine_integration, state_survives_reopen) {
  auto fixture = ledger_fixture{"strongbox_engine_reopen", capacity_config()};
  configure_assets(fixture);
  auto alice = make_principal(5);
  ASSERT_EQ(fixture.engine().deposit(alice, kToken, units(8, 6)).code, 0u);
  ASSERT_EQ(
      fixture.engine().set_withdraw_limit(fixture.deployer(), units(2, 6)).code,
      0u);
  auto info = fixture.engine().info();

  fixture.reopen();
  auto& engine = fixture.engine();
  EXPECT_EQ(engine.balance_of(alice, kToken), units(8, 6));
  EXPECT_EQ(engine.counters_of(alice).deposits, 1u);
  EXPECT_EQ(engine.withdraw_limit(), units(2, 6));
  EXPECT_EQ(engine.registered_assets().size(), 2u);
  EXPECT_EQ(engine.info().last_sequence, info.last_sequence);
  EXPECT_EQ(engine.info().state_root, info.state_root);
  EXPECT_EQ(engine.history(0, info.last_sequence).size(),
            static_cast<std::size_t>(info.last_sequence));
}

TEST(engine_integration, query_routes) {
  auto fixture = ledger_fixture{"strongbox_engine_query", capacity_config()};
  configure_assets(fixture);
  auto& engine = fixture.engine();
  auto alice = make_principal(5);
  ASSERT_EQ(engine.deposit(alice, kNativeAssetId, units(1, 18)).code, 0u);
  auto encoder = encoder_t{};

  auto balance_key = encoder.encode(std::tuple{alice, kNativeAssetId});
  auto balance = engine.query(
      "/ledger/balance", strongbox::schema::bytes_view_t{balance_key});
  ASSERT_EQ(balance.code, 0u);
  EXPECT_EQ(decode_value<amount_t>(balance), units(1, 18));
  EXPECT_EQ(balance.sequence, 3u);

  auto total = engine.query("/valuation/total", {});
  ASSERT_EQ(total.code, 0u);
  EXPECT_EQ(decode_value<amount_t>(total), units(2'000, 6));

  auto capacity = engine.query("/limits/capacity", {});
  EXPECT_EQ(decode_value<amount_t>(capacity), units(50'000, 6));

  auto assets = engine.query("/registry/assets", {});
  auto listed = decode_value<strongbox::schema::registered_assets_t>(assets);
  ASSERT_EQ(listed.size(), 2u);
  EXPECT_EQ(listed[0], kNativeAssetId);

  auto info = engine.query("/engine/info", {});
  auto decoded =
      decode_value<std::tuple<uint64_t, strongbox::schema::hash32_t>>(info);
  EXPECT_EQ(std::get<0>(decoded), 3u);

  auto missing_key = encoder.encode(make_hash(66));
  auto missing = engine.query(
      "/registry/asset", strongbox::schema::bytes_view_t{missing_key});
  EXPECT_EQ(missing.code, static_cast<uint32_t>(
                              strongbox::schema::query_error_code::not_found));

  fixture.oracle().set(kNativeFeed, price_t{-1}, 8);
  auto broken = engine.query("/valuation/total", {});
  EXPECT_EQ(broken.code,
            static_cast<uint32_t>(
                strongbox::schema::query_error_code::valuation_failed));
  EXPECT_EQ(broken.info, "invalid_price");

  auto bad_key = engine.query("/ledger/counters", {});
  EXPECT_EQ(bad_key.code, static_cast<uint32_t>(
                              strongbox::schema::query_error_code::invalid_key));
  auto unknown = engine.query("/nope", {});
  EXPECT_EQ(unknown.code,
            static_cast<uint32_t>(
                strongbox::schema::query_error_code::unsupported_path));
}
