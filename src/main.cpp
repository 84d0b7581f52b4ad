#include <boost/program_options.hpp>
#include <mandate/common/critical.hpp>
#include <mandate/registry/authorization_resolver.hpp>
#include <mandate/registry/delegation_store.hpp>
#include <mandate/schema/delegation_type.hpp>
#include <mandate/schema/encoding/scale/encoder.hpp>
#include <mandate/storage/rocksdb/storage.hpp>
#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace {

namespace po = boost::program_options;

using encoder_t = mandate::schema::encoding::encoder<
    mandate::schema::encoding::scale_encoder_tag>;
using store_t =
    mandate::registry::delegation_store<mandate::storage::rocksdb_storage_tag>;
using resolver_t = mandate::registry::authorization_resolver<
    mandate::storage::rocksdb_storage_tag>;

void configure_logging(const std::string& level, const std::string& log_file) {
  spdlog::init_thread_pool(8192, 1);

  auto sinks = std::vector<spdlog::sink_ptr>{
      std::make_shared<spdlog::sinks::stderr_color_sink_mt>()};
  if (!log_file.empty()) {
    sinks.push_back(
        std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false));
  }

  auto logger = std::make_shared<spdlog::async_logger>(
      "mandate", std::begin(sinks), std::end(sinks), spdlog::thread_pool(),
      spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(spdlog::level::from_str(level));
}

mandate::schema::address_t get_address(const po::variables_map& vm,
                                       const std::string& name) {
  if (!vm.contains(name)) {
    mandate::common::critical("missing required address argument --" + name);
  }
  auto address =
      mandate::schema::try_make_address(vm[name].as<std::string>());
  if (!address) {
    mandate::common::critical("--" + name + " must be a 20-byte hex address");
  }
  return *address;
}

mandate::schema::hash32_t get_hash32(const po::variables_map& vm,
                                     const std::string& name) {
  if (!vm.contains(name)) {
    return mandate::schema::make_zero_hash();
  }
  auto hash = mandate::schema::try_make_hash32(vm[name].as<std::string>());
  if (!hash) {
    mandate::common::critical("--" + name + " must be a 32-byte hex value");
  }
  return *hash;
}

mandate::schema::uint256_t get_uint256(const po::variables_map& vm,
                                       const std::string& name) {
  if (!vm.contains(name)) {
    return 0;
  }
  auto value = mandate::schema::try_parse_uint256(vm[name].as<std::string>());
  if (!value) {
    mandate::common::critical("--" + name +
                              " must be a decimal integer below 2^256");
  }
  return *value;
}

mandate::schema::delegation_type_t get_type(const po::variables_map& vm) {
  if (!vm.contains("type")) {
    mandate::common::critical("missing required argument --type");
  }
  auto name = vm["type"].as<std::string>();
  auto type =
      mandate::schema::try_from_string<mandate::schema::delegation_type_t>(
          name);
  if (!type) {
    mandate::common::critical("--type must be all|contract|erc721|erc20|erc1155");
  }
  return *type;
}

void print_record(const mandate::schema::delegation_record_t& record) {
  std::cout << mandate::schema::to_string(record.type) << " from=0x"
            << mandate::schema::to_hex(record.from) << " to=0x"
            << mandate::schema::to_hex(record.to) << " contract=0x"
            << mandate::schema::to_hex(record.contract)
            << " token_id=" << mandate::schema::from_word(record.token_id)
            << " rights=0x" << mandate::schema::to_hex(record.rights)
            << " amount=" << mandate::schema::from_word(record.amount)
            << " enabled=" << (record.enabled ? "true" : "false") << '\n';
}

int print_result(const mandate::schema::delegation_result_t& result) {
  if (result.code != 0) {
    std::cerr << result.codespace << " code " << result.code << ": "
              << result.log << " (" << result.info << ")\n";
    return static_cast<int>(result.code);
  }
  std::cout << "0x" << mandate::schema::to_hex(result.identity) << '\n';
  return 0;
}

int set_delegation(store_t& store,
                   const po::variables_map& vm,
                   const bool enable) {
  auto caller = get_address(vm, "caller");
  auto request = mandate::schema::set_delegation_t{
      .type = get_type(vm),
      .from = caller,
      .to = get_address(vm, "to"),
      .contract = vm.contains("contract") ? get_address(vm, "contract")
                                          : mandate::schema::address_t{},
      .token_id = get_uint256(vm, "token-id"),
      .rights = get_hash32(vm, "rights"),
      .amount = get_uint256(vm, "amount"),
      .enable = enable};
  return print_result(store.set_delegation(caller, request));
}

int check(const resolver_t& resolver, const po::variables_map& vm) {
  auto to = get_address(vm, "to");
  auto from = get_address(vm, "from");
  auto rights = get_hash32(vm, "rights");
  auto type = vm.contains("type") ? get_type(vm)
                                  : mandate::schema::delegation_type_t::erc721;
  if (type == mandate::schema::delegation_type_t::none) {
    mandate::common::critical(
        "--type must be all|contract|erc721|erc20|erc1155");
  }
  switch (type) {
    case mandate::schema::delegation_type_t::all:
      std::cout << std::boolalpha
                << resolver.check_delegate_for_all(to, from, rights) << '\n';
      return 0;
    case mandate::schema::delegation_type_t::contract:
      std::cout << std::boolalpha
                << resolver.check_delegate_for_contract(
                       to, from, get_address(vm, "contract"), rights)
                << '\n';
      return 0;
    case mandate::schema::delegation_type_t::erc20:
      std::cout << resolver.check_delegate_for_erc20(
                       to, from, get_address(vm, "contract"), rights)
                << '\n';
      return 0;
    case mandate::schema::delegation_type_t::erc1155:
      std::cout << resolver.check_delegate_for_erc1155(
                       to, from, get_address(vm, "contract"),
                       get_uint256(vm, "token-id"), rights)
                << '\n';
      return 0;
    case mandate::schema::delegation_type_t::erc721:
    case mandate::schema::delegation_type_t::none:
      break;
  }
  std::cout << std::boolalpha
            << resolver.check(to, from, get_address(vm, "contract"),
                              get_uint256(vm, "token-id"), rights)
            << '\n';
  return 0;
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  mandate delegate --caller A --type T --to B [scope]\n"
            << "  mandate revoke --caller A --type T --to B [scope]\n"
            << "  mandate revoke-all --caller A\n"
            << "  mandate check --to B --from A [--type T] [scope]\n"
            << "  mandate outgoing --from A\n"
            << "  mandate incoming --to B\n"
            << "  mandate read --identity H\n\n";
  std::cout << options << '\n';
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto db_path = std::string{};
  auto log_level = std::string{};
  auto log_file = std::string{};

  auto options = po::options_description{"mandate options"};
  options.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command),
      "delegate|revoke|revoke-all|check|outgoing|incoming|read")(
      "db-path", po::value<std::string>(&db_path)->default_value("mandate.db"),
      "RocksDB directory")(
      "log-level", po::value<std::string>(&log_level)->default_value("info"),
      "trace|debug|info|warn|error|critical|off")(
      "log-file", po::value<std::string>(&log_file)->default_value(""),
      "optional log file")("caller", po::value<std::string>(),
                           "authenticated vault address hex")(
      "type", po::value<std::string>(),
      "all|contract|erc721|erc20|erc1155")("from", po::value<std::string>(),
                                           "vault address hex")(
      "to", po::value<std::string>(), "delegate address hex")(
      "contract", po::value<std::string>(), "contract address hex")(
      "token-id", po::value<std::string>(), "token id (decimal)")(
      "rights", po::value<std::string>(), "32-byte rights hex, zero if absent")(
      "amount", po::value<std::string>(), "amount (decimal)")(
      "identity", po::value<std::string>(), "32-byte delegation identity hex");

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  auto vm = po::variables_map{};
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(options)
                  .positional(positional)
                  .run(),
              vm);
    po::notify(vm);
  } catch (const po::error& ex) {
    std::cerr << ex.what() << '\n';
    print_help(options);
    return 1;
  }

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return 0;
  }

  configure_logging(log_level, log_file);

  auto encoder = encoder_t{};
  auto storage =
      mandate::storage::make_storage<mandate::storage::rocksdb_storage_tag>(
          db_path);
  auto store = store_t{encoder, storage};
  auto resolver = resolver_t{store};
  store.set_event_sink([](const mandate::schema::delegation_event_t& event) {
    for (const auto& attribute : event.attributes) {
      spdlog::debug("{} {}={}", event.type, attribute.key, attribute.value);
    }
  });

  auto status = 0;
  if (command == "delegate") {
    status = set_delegation(store, vm, true);
  } else if (command == "revoke") {
    status = set_delegation(store, vm, false);
  } else if (command == "revoke-all") {
    for (const auto& identity :
         store.revoke_all_outgoing(get_address(vm, "caller"))) {
      std::cout << "0x" << mandate::schema::to_hex(identity) << '\n';
    }
  } else if (command == "check") {
    status = check(resolver, vm);
  } else if (command == "outgoing") {
    for (const auto& record :
         store.get_outgoing_delegations(get_address(vm, "from"))) {
      print_record(record);
    }
  } else if (command == "incoming") {
    for (const auto& record :
         store.get_incoming_delegations(get_address(vm, "to"))) {
      print_record(record);
    }
  } else if (command == "read") {
    print_record(store.read_record(get_hash32(vm, "identity")));
  } else {
    std::cerr << "unknown command '" << command << "'\n";
    print_help(options);
    status = 1;
  }

  spdlog::shutdown();
  return status;
}
