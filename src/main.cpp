#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <strongbox/execution/engine.hpp>
#include <strongbox/feeds/static_feeds.hpp>
#include <strongbox/storage/rocksdb/storage.hpp>
#include <fstream>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

using namespace strongbox::schema;

namespace {

inline constexpr auto kDefaultDeployer = std::string_view{
    "0000000000000000000000000000000000000000000000000000000000000001"};

hash32_t parse_id(const std::string_view text, const std::string_view what) {
  if (text == "native") {
    return kNativeAssetId;
  }
  auto id = try_make_hash32(text);
  if (!id) {
    throw std::invalid_argument{std::string{what} +
                                " must be 64 hex characters: " +
                                std::string{text}};
  }
  return *id;
}

amount_t parse_amount(const std::string_view text) {
  auto amount = try_make_amount(text);
  if (!amount) {
    throw std::invalid_argument{"invalid amount: " + std::string{text}};
  }
  return *amount;
}

uint8_t parse_decimals(const std::string_view text) {
  auto decimals = parse_amount(text);
  if (decimals > 77) {
    throw std::invalid_argument{"decimals out of range: " + std::string{text}};
  }
  return decimals.convert_to<uint8_t>();
}

uint64_t parse_sequence(const std::string_view text) {
  auto sequence = try_make_sequence(text);
  if (!sequence) {
    throw std::invalid_argument{"invalid sequence: " + std::string{text}};
  }
  return *sequence;
}

// SOURCE=PRICE:DECIMALS
void add_price(strongbox::feeds::static_price_oracle& oracle,
               const std::string& option) {
  auto eq = option.find('=');
  auto colon = option.rfind(':');
  if (eq == std::string::npos || colon == std::string::npos || colon < eq) {
    throw std::invalid_argument{"expected SOURCE=PRICE:DECIMALS, got " + option};
  }
  auto source = parse_id(std::string_view{option}.substr(0, eq), "price source");
  auto price = boost::multiprecision::cpp_int{
      parse_amount(std::string_view{option}.substr(eq + 1, colon - eq - 1))};
  auto decimals = parse_decimals(std::string_view{option}.substr(colon + 1));
  oracle.set_price(source, price_quote_t{.price = price.convert_to<price_t>(),
                                         .decimals = decimals});
}

// ASSET=DECIMALS
void add_decimals(strongbox::feeds::static_asset_metadata& metadata,
                  const std::string& option) {
  auto eq = option.find('=');
  if (eq == std::string::npos) {
    throw std::invalid_argument{"expected ASSET=DECIMALS, got " + option};
  }
  metadata.set_decimals(
      parse_id(std::string_view{option}.substr(0, eq), "asset"),
      parse_decimals(std::string_view{option}.substr(eq + 1)));
}

const std::string& argument(const std::vector<std::string>& args,
                            const std::size_t index,
                            const std::string_view name) {
  if (index >= args.size()) {
    throw std::invalid_argument{"missing argument <" + std::string{name} + ">"};
  }
  return args[index];
}

int print_result(const transaction_result_t& result) {
  if (result.code == 0) {
    std::cout << "ok: " << result.info << std::endl;
  } else {
    std::cout << "rejected (" << result.code << " " << result.log
              << "): " << result.info << std::endl;
  }
  for (const auto& event : result.events) {
    std::cout << "  event " << event.type;
    for (const auto& attribute : event.attributes) {
      std::cout << " " << attribute.key << "=" << attribute.value;
    }
    std::cout << std::endl;
  }
  return result.code == 0 ? 0 : 2;
}

int print_valuation(const valuation_t& valued) {
  if (valued.code != 0) {
    std::cout << "valuation failed: "
              << to_string(static_cast<transaction_error_code>(valued.code))
              << std::endl;
    return 2;
  }
  std::cout << valued.value.str() << std::endl;
  return 0;
}

int run_command(strongbox::execution::engine& engine,
                const principal_id_t& caller,
                const std::string& command,
                const std::vector<std::string>& args) {
  if (command == "deposit") {
    return print_result(engine.deposit(
        caller, parse_id(argument(args, 0, "asset"), "asset"),
        parse_amount(argument(args, 1, "amount"))));
  }
  if (command == "withdraw") {
    return print_result(engine.withdraw(
        caller, parse_id(argument(args, 0, "asset"), "asset"),
        parse_amount(argument(args, 1, "amount"))));
  }
  if (command == "register-asset") {
    return print_result(engine.register_asset(
        caller, parse_id(argument(args, 0, "asset"), "asset"),
        parse_id(argument(args, 1, "price-source"), "price source")));
  }
  if (command == "set-capacity") {
    return print_result(engine.set_capacity_limit(
        caller, parse_amount(argument(args, 0, "limit"))));
  }
  if (command == "set-withdraw-limit") {
    return print_result(engine.set_withdraw_limit(
        caller, parse_amount(argument(args, 0, "limit"))));
  }
  if (command == "grant" || command == "revoke") {
    auto role = try_from_string<role_id_t>(argument(args, 1, "role"));
    if (!role) {
      throw std::invalid_argument{"role must be admin or operator"};
    }
    return print_result(engine.upsert_role_assignment(
        caller, upsert_role_assignment_t{
                    .subject = parse_id(argument(args, 0, "subject"),
                                        "subject"),
                    .role = *role,
                    .enabled = command == "grant"}));
  }
  if (command == "balance") {
    auto principal = args.size() > 1 ? parse_id(args[1], "principal") : caller;
    std::cout << engine
                     .balance_of(principal,
                                 parse_id(argument(args, 0, "asset"), "asset"))
                     .str()
              << std::endl;
    return 0;
  }
  if (command == "counters") {
    auto principal = args.empty() ? caller : parse_id(args[0], "principal");
    auto counters = engine.counters_of(principal);
    std::cout << "deposits=" << counters.deposits
              << " withdrawals=" << counters.withdrawals << std::endl;
    return 0;
  }
  if (command == "value") {
    return print_valuation(
        engine.value_of(parse_id(argument(args, 0, "asset"), "asset"),
                        parse_amount(argument(args, 1, "amount"))));
  }
  if (command == "total") {
    return print_valuation(engine.total_value());
  }
  if (command == "assets") {
    for (const auto& asset_id : engine.registered_assets()) {
      auto source = engine.price_source_of(asset_id);
      std::cout << to_hex(asset_id) << " "
                << (source ? to_hex(*source) : std::string{"-"}) << " held="
                << engine.held(asset_id).str() << std::endl;
    }
    return 0;
  }
  if (command == "limits") {
    auto limits = engine.limits();
    std::cout << "capacity=" << limits.capacity_limit.str()
              << " withdraw=" << limits.withdraw_limit.str() << std::endl;
    return 0;
  }
  if (command == "info") {
    auto info = engine.info();
    std::cout << info.data << " " << info.version
              << " sequence=" << info.last_sequence
              << " state_root=" << to_hex(info.state_root) << std::endl;
    return 0;
  }
  if (command == "history") {
    auto from = args.empty() ? uint64_t{0} : parse_sequence(args[0]);
    auto to = args.size() > 1 ? parse_sequence(args[1])
                              : std::numeric_limits<uint64_t>::max();
    for (const auto& entry : engine.history(from, to)) {
      std::cout << entry.sequence << " code=" << entry.code
                << " tx=" << to_hex(entry.tx) << std::endl;
    }
    return 0;
  }
  throw std::invalid_argument{"unknown command: " + command};
}

}  // namespace

int main(int argc, char* argv[]) {
  auto db_path = std::string{};
  auto config_path = std::string{};
  auto log_file = std::string{};
  auto caller_hex = std::string{};
  auto deployer_hex = std::string{};
  auto common_decimals = unsigned{};
  auto max_assets = uint32_t{};
  auto capacity_limit = std::string{};
  auto withdraw_limit = std::string{};
  auto prices = std::vector<std::string>{};
  auto decimals = std::vector<std::string>{};
  auto command = std::string{};
  auto command_args = std::vector<std::string>{};

  auto vm = boost::program_options::variables_map{};
  auto description = boost::program_options::options_description{"Strongbox"};
  description.add_options()("help,h", "Show the help message")(
      "db-path,d",
      boost::program_options::value<std::string>(&db_path)->default_value(
          "strongbox.db"),
      "RocksDB directory holding the ledger")(
      "config,c", boost::program_options::value<std::string>(&config_path),
      "Options file (key=value per line)")(
      "log-file",
      boost::program_options::value<std::string>(&log_file)->default_value(
          "strongbox.log"),
      "Log file path")(
      "caller", boost::program_options::value<std::string>(&caller_hex),
      "Signer of the command (64 hex), defaults to the deployer")(
      "deployer",
      boost::program_options::value<std::string>(&deployer_hex)->default_value(
          std::string{kDefaultDeployer}),
      "Initial admin and operator of a fresh ledger (64 hex)")(
      "common-decimals",
      boost::program_options::value<unsigned>(&common_decimals)
          ->default_value(6),
      "Decimals of the common valuation unit")(
      "max-assets",
      boost::program_options::value<uint32_t>(&max_assets)->default_value(16),
      "Upper bound on registered assets")(
      "capacity-limit",
      boost::program_options::value<std::string>(&capacity_limit)
          ->default_value("0"),
      "Initial capacity limit in common units")(
      "withdraw-limit",
      boost::program_options::value<std::string>(&withdraw_limit)
          ->default_value("0"),
      "Initial per-operation withdraw limit in asset units")(
      "price",
      boost::program_options::value<std::vector<std::string>>(&prices)
          ->composing(),
      "Price feed answer SOURCE=PRICE:DECIMALS")(
      "decimals",
      boost::program_options::value<std::vector<std::string>>(&decimals)
          ->composing(),
      "Token decimals ASSET=N")("verbose,v", "Enable verbose output");

  auto hidden = boost::program_options::options_description{};
  hidden.add_options()("command",
                       boost::program_options::value<std::string>(&command))(
      "args",
      boost::program_options::value<std::vector<std::string>>(&command_args));
  auto all = boost::program_options::options_description{};
  all.add(description).add(hidden);
  auto positional = boost::program_options::positional_options_description{};
  positional.add("command", 1).add("args", -1);

  try {
    boost::program_options::store(
        boost::program_options::command_line_parser(argc, argv)
            .options(all)
            .positional(positional)
            .run(),
        vm);
    if (vm.contains("config")) {
      auto file = std::ifstream{vm["config"].as<std::string>()};
      if (!file) {
        throw std::invalid_argument{"cannot open config file " +
                                    vm["config"].as<std::string>()};
      }
      boost::program_options::store(
          boost::program_options::parse_config_file(file, description), vm);
    }
    boost::program_options::notify(vm);
  } catch (const std::exception& e) {
    std::cerr << e.what() << std::endl << description << std::endl;
    return 1;
  }

  if (vm.contains("help") || command.empty()) {
    std::cout << "Usage: strongbox [options] <command> [args...]\n"
              << "Commands: deposit, withdraw, register-asset, set-capacity,\n"
              << "  set-withdraw-limit, grant, revoke, balance, counters,\n"
              << "  value, total, assets, limits, info, history\n"
              << description << std::endl;
    return vm.contains("help") ? 0 : 1;
  }

  spdlog::init_thread_pool(8192, 1);
  auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false);
  auto logger = std::make_shared<spdlog::async_logger>(
      "strongbox", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(vm.contains("verbose") ? spdlog::level::debug
                                           : spdlog::level::warn);

  auto exit_code = 0;
  try {
    auto config = strongbox::execution::engine_config{};
    config.deployer = parse_id(deployer_hex, "deployer");
    if (common_decimals > 77) {
      throw std::invalid_argument{"common decimals out of range"};
    }
    config.common_decimals = static_cast<uint8_t>(common_decimals);
    config.max_registered_assets = max_assets;
    config.capacity_limit = parse_amount(capacity_limit);
    config.withdraw_limit = parse_amount(withdraw_limit);

    auto oracle = strongbox::feeds::static_price_oracle{};
    for (const auto& price : prices) {
      add_price(oracle, price);
    }
    auto metadata = strongbox::feeds::static_asset_metadata{};
    for (const auto& entry : decimals) {
      add_decimals(metadata, entry);
    }
    auto transfer = strongbox::feeds::book_entry_transfer{};

    auto caller = caller_hex.empty() ? config.deployer
                                     : parse_id(caller_hex, "caller");

    auto storage = strongbox::storage::make_storage<
        strongbox::storage::rocksdb_storage_tag>(db_path);
    auto engine = strongbox::execution::engine{storage, config, oracle,
                                                metadata, transfer};
    exit_code = run_command(engine, caller, command, command_args);
  } catch (const std::invalid_argument& e) {
    std::cerr << e.what() << std::endl;
    exit_code = 1;
  }

  spdlog::shutdown();
  return exit_code;
}
