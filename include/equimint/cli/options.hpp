#pragma once

#include <equimint/schema/enum_string.hpp>
#include <equimint/schema/payee.hpp>
#include <equimint/schema/primitives.hpp>
#include <equimint/schema/signing_domain.hpp>
#include <equimint/schema/voucher.hpp>
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace equimint::cli {

enum class command : uint8_t {
  equity_init = 0,
  equity_receive = 1,
  equity_rotate = 2,
  equity_release = 3,
  equity_show = 4,
  voucher_digest = 5,
  redeem = 6
};

inline constexpr auto kCommandMappings = std::array{
    std::pair<std::string_view, command>{"equity-init", command::equity_init},
    std::pair<std::string_view, command>{"equity-receive",
                                         command::equity_receive},
    std::pair<std::string_view, command>{"equity-rotate",
                                         command::equity_rotate},
    std::pair<std::string_view, command>{"equity-release",
                                         command::equity_release},
    std::pair<std::string_view, command>{"equity-show", command::equity_show},
    std::pair<std::string_view, command>{"voucher-digest",
                                         command::voucher_digest},
    std::pair<std::string_view, command>{"redeem", command::redeem}};

inline constexpr std::string_view to_string(const command value) {
  return equimint::schema::to_string(value, kCommandMappings)
      .value_or("unknown");
}

/// Resolved command line and configuration file settings.
struct settings final {
  bool help{};
  command action{command::equity_show};

  std::string db_path{"equimint.db"};
  std::string log_level{"info"};
  std::string log_file;
  uint32_t group_size{3};
  equimint::schema::signing_domain_t domain;
  std::optional<equimint::schema::address_t> authority;
  bool forward_proceeds{};

  std::vector<equimint::schema::payee_addresses_t> payees;
  std::vector<equimint::schema::shares_t> shares;
  /// Sender, caller or requester depending on the command.
  equimint::schema::address_t account{};
  equimint::schema::payee_index_t payee_index{};
  /// Received amount or redemption payment depending on the command.
  equimint::schema::amount_t amount{};
  equimint::schema::voucher_t voucher;
};

/// Parse `argv` and the optional `--config` file. Command line values take
/// precedence over file values. Returns std::nullopt and sets `error` on
/// invalid or missing input.
std::optional<settings> parse_options(int argc,
                                      const char* const argv[],
                                      std::string& error);

std::string usage();

}  // namespace equimint::cli
