#include <boost/program_options.hpp>
#include <equimint/cli/options.hpp>

#include <algorithm>
#include <exception>
#include <fstream>
#include <sstream>
#include <utility>

namespace equimint::cli {

namespace {

namespace po = boost::program_options;

inline constexpr auto kLogLevels =
    std::array<std::string_view, 7>{"trace", "debug", "info",    "warn",
                                    "error", "critical", "off"};

po::options_description make_config_options() {
  auto options = po::options_description{"configuration"};
  options.add_options()(
      "db-path", po::value<std::string>()->default_value("equimint.db"),
      "RocksDB directory")(
      "log-level", po::value<std::string>()->default_value("info"),
      "trace|debug|info|warn|error|critical|off")(
      "log-file", po::value<std::string>()->default_value(""),
      "also log to this file")(
      "group-size", po::value<uint32_t>()->default_value(3),
      "addresses per payee")(
      "domain-name", po::value<std::string>()->default_value("equimint"),
      "signing domain name")(
      "domain-version", po::value<std::string>()->default_value("1"),
      "signing domain version")(
      "chain-id", po::value<std::string>()->default_value("1"),
      "signing domain chain id")(
      "verifying-contract",
      po::value<std::string>()->default_value(
          "0x0000000000000000000000000000000000000000"),
      "signing domain contract address")(
      "authority", po::value<std::string>(),
      "address allowed to sign vouchers")(
      "forward-proceeds", po::value<bool>()->default_value(false),
      "receive redemption payments into the equity ledger");
  return options;
}

po::options_description make_command_options() {
  auto options = po::options_description{"command"};
  options.add_options()("help,h", "show help")(
      "config", po::value<std::string>(), "INI configuration file")(
      "command", po::value<std::string>(), "command to run")(
      "payee", po::value<std::vector<std::string>>()->composing(),
      "comma separated addresses of one payee, repeatable")(
      "shares", po::value<std::vector<std::string>>()->composing(),
      "share count of one payee, repeatable")(
      "from", po::value<std::string>(), "sender address")(
      "caller", po::value<std::string>(), "caller address")(
      "requester", po::value<std::string>(), "requester address")(
      "payee-index", po::value<uint32_t>(), "payee index")(
      "amount", po::value<std::string>(), "received amount")(
      "asset-id", po::value<std::string>(), "voucher asset id")(
      "min-price", po::value<std::string>(), "voucher minimum price")(
      "metadata", po::value<std::string>(), "voucher metadata reference")(
      "signature", po::value<std::string>(), "65-byte voucher signature hex")(
      "payment", po::value<std::string>(), "redemption payment");
  return options;
}

bool require(const po::variables_map& vm,
             const std::string& name,
             std::string& error) {
  if (!vm.contains(name)) {
    error = "missing required option --" + name;
    return false;
  }
  return true;
}

std::optional<equimint::schema::address_t> read_address(
    const po::variables_map& vm,
    const std::string& name,
    std::string& error) {
  if (!require(vm, name, error)) {
    return std::nullopt;
  }
  auto address =
      equimint::schema::try_make_address(vm[name].as<std::string>());
  if (!address.has_value()) {
    error = "--" + name + " is not a 20-byte hex address";
  }
  return address;
}

std::optional<equimint::schema::amount_t> read_amount(
    const po::variables_map& vm,
    const std::string& name,
    std::string& error) {
  if (!require(vm, name, error)) {
    return std::nullopt;
  }
  auto value = equimint::schema::try_parse_uint256(vm[name].as<std::string>());
  if (!value.has_value()) {
    error = "--" + name + " is not a 256-bit unsigned integer";
  }
  return value;
}

std::optional<equimint::schema::payee_addresses_t> parse_payee(
    const std::string& text,
    std::string& error) {
  auto addresses = equimint::schema::payee_addresses_t{};
  auto stream = std::istringstream{text};
  auto item = std::string{};
  while (std::getline(stream, item, ',')) {
    auto address = equimint::schema::try_make_address(item);
    if (!address.has_value()) {
      error = "invalid payee address '" + item + "'";
      return std::nullopt;
    }
    addresses.push_back(address.value());
  }
  return addresses;
}

bool read_voucher(const po::variables_map& vm,
                  equimint::schema::voucher_t& voucher,
                  std::string& error) {
  auto asset_id = read_amount(vm, "asset-id", error);
  if (!asset_id.has_value()) {
    return false;
  }
  auto min_price = read_amount(vm, "min-price", error);
  if (!min_price.has_value()) {
    return false;
  }
  if (!require(vm, "metadata", error)) {
    return false;
  }
  voucher.asset_id = asset_id.value();
  voucher.min_price = min_price.value();
  voucher.metadata_ref = vm["metadata"].as<std::string>();
  return true;
}

bool read_command_arguments(const po::variables_map& vm,
                            settings& out,
                            std::string& error) {
  switch (out.action) {
    case command::equity_init: {
      if (vm.contains("payee")) {
        for (const auto& text : vm["payee"].as<std::vector<std::string>>()) {
          auto payee = parse_payee(text, error);
          if (!payee.has_value()) {
            return false;
          }
          out.payees.push_back(std::move(payee.value()));
        }
      }
      if (vm.contains("shares")) {
        for (const auto& text : vm["shares"].as<std::vector<std::string>>()) {
          auto shares = equimint::schema::try_parse_uint256(text);
          if (!shares.has_value()) {
            error = "invalid share count '" + text + "'";
            return false;
          }
          out.shares.push_back(shares.value());
        }
      }
      return true;
    }
    case command::equity_receive: {
      auto from = read_address(vm, "from", error);
      if (!from.has_value()) {
        return false;
      }
      auto amount = read_amount(vm, "amount", error);
      if (!amount.has_value()) {
        return false;
      }
      out.account = from.value();
      out.amount = amount.value();
      return true;
    }
    case command::equity_rotate: {
      auto caller = read_address(vm, "caller", error);
      if (!caller.has_value() || !require(vm, "payee-index", error)) {
        return false;
      }
      out.account = caller.value();
      out.payee_index = vm["payee-index"].as<uint32_t>();
      return true;
    }
    case command::equity_release:
      if (!require(vm, "payee-index", error)) {
        return false;
      }
      out.payee_index = vm["payee-index"].as<uint32_t>();
      return true;
    case command::equity_show:
      return true;
    case command::voucher_digest:
      return read_voucher(vm, out.voucher, error);
    case command::redeem: {
      if (!out.authority.has_value()) {
        error = "redeem requires --authority";
        return false;
      }
      auto requester = read_address(vm, "requester", error);
      if (!requester.has_value() || !read_voucher(vm, out.voucher, error)) {
        return false;
      }
      if (!require(vm, "signature", error)) {
        return false;
      }
      auto signature =
          equimint::schema::try_from_hex(vm["signature"].as<std::string>());
      if (!signature.has_value()) {
        error = "--signature is not valid hex";
        return false;
      }
      auto payment = read_amount(vm, "payment", error);
      if (!payment.has_value()) {
        return false;
      }
      out.account = requester.value();
      out.voucher.signature = std::move(signature.value());
      out.amount = payment.value();
      return true;
    }
  }
  error = "unsupported command";
  return false;
}

}  // namespace

std::optional<settings> parse_options(const int argc,
                                      const char* const argv[],
                                      std::string& error) {
  auto config_options = make_config_options();
  auto all_options = make_command_options();
  all_options.add(config_options);
  auto positional = po::positional_options_description{};
  positional.add("command", 1);

  auto vm = po::variables_map{};
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(all_options)
                  .positional(positional)
                  .run(),
              vm);
    if (vm.contains("config")) {
      auto path = vm["config"].as<std::string>();
      auto file = std::ifstream{path};
      if (!file) {
        error = "cannot read configuration file '" + path + "'";
        return std::nullopt;
      }
      po::store(po::parse_config_file(file, config_options), vm);
    }
    po::notify(vm);
  } catch (const po::error& ex) {
    error = ex.what();
    return std::nullopt;
  }

  auto out = settings{};
  if (vm.contains("help")) {
    out.help = true;
    return out;
  }

  if (!vm.contains("command")) {
    error = "missing command";
    return std::nullopt;
  }
  auto action = equimint::schema::from_string(vm["command"].as<std::string>(),
                                              kCommandMappings);
  if (!action.has_value()) {
    error = "unknown command '" + vm["command"].as<std::string>() + "'";
    return std::nullopt;
  }
  out.action = action.value();

  out.db_path = vm["db-path"].as<std::string>();
  out.log_level = vm["log-level"].as<std::string>();
  if (std::find(std::begin(kLogLevels), std::end(kLogLevels), out.log_level) ==
      std::end(kLogLevels)) {
    error = "unknown log level '" + out.log_level + "'";
    return std::nullopt;
  }
  out.log_file = vm["log-file"].as<std::string>();
  out.group_size = vm["group-size"].as<uint32_t>();
  out.forward_proceeds = vm["forward-proceeds"].as<bool>();

  out.domain.name = vm["domain-name"].as<std::string>();
  out.domain.domain_version = vm["domain-version"].as<std::string>();
  auto chain_id = read_amount(vm, "chain-id", error);
  if (!chain_id.has_value()) {
    return std::nullopt;
  }
  out.domain.chain_id = chain_id.value();
  auto contract = read_address(vm, "verifying-contract", error);
  if (!contract.has_value()) {
    return std::nullopt;
  }
  out.domain.verifying_contract = contract.value();
  if (vm.contains("authority")) {
    auto authority = read_address(vm, "authority", error);
    if (!authority.has_value()) {
      return std::nullopt;
    }
    out.authority = authority;
  }

  if (!read_command_arguments(vm, out, error)) {
    return std::nullopt;
  }
  return out;
}

std::string usage() {
  auto all_options = make_command_options();
  all_options.add(make_config_options());
  auto stream = std::ostringstream{};
  stream << "Commands: "
         << equimint::schema::join_names(kCommandMappings, ", ") << "\n\n"
         << "Usage:\n"
         << "  equimint equity-init --payee A,B,C [--payee ...] --shares N "
            "[--shares ...]\n"
         << "  equimint equity-receive --from ADDR --amount N\n"
         << "  equimint equity-rotate --caller ADDR --payee-index I\n"
         << "  equimint equity-release --payee-index I\n"
         << "  equimint equity-show\n"
         << "  equimint voucher-digest --asset-id N --min-price N --metadata "
            "URI\n"
         << "  equimint redeem --requester ADDR --asset-id N --min-price N "
            "--metadata URI --signature HEX --payment N\n\n";
  stream << all_options << '\n';
  return stream.str();
}

}  // namespace equimint::cli
