#include <spdlog/spdlog.h>
#include <equimint/cli/commands.hpp>
#include <equimint/equity/ledger.hpp>
#include <equimint/minting/asset_registry.hpp>
#include <equimint/minting/mint_authority.hpp>
#include <equimint/minting/signature_verifier.hpp>
#include <equimint/schema/encoding/scale/encoder.hpp>
#include <equimint/storage/rocksdb/storage.hpp>

#include <memory>
#include <string>

using namespace equimint::schema;

namespace equimint::cli {

namespace {

using storage_t = equimint::storage::rocksdb_storage_t;

void print_rejection(const operation_result_t& result, std::ostream& err) {
  err << "rejected: "
      << equimint::schema::to_string(static_cast<error_code>(result.code))
      << " (" << result.codespace << "): " << result.log;
  if (!result.info.empty()) {
    err << " [" << result.info << "]";
  }
  err << '\n';
}

void print_events(const operation_result_t& result, std::ostream& out) {
  for (const auto& event : result.events) {
    out << "event " << event.sequence << ' ' << event.type;
    for (const auto& attribute : event.attributes) {
      out << ' ' << attribute.key << '=' << attribute.value;
    }
    out << '\n';
  }
}

int finish(const operation_result_t& result,
           std::ostream& out,
           std::ostream& err) {
  if (!result.ok()) {
    print_rejection(result, err);
    return kExitRejected;
  }
  print_events(result, out);
  return kExitOk;
}

std::unique_ptr<equimint::equity::ledger> open_ledger(
    encoding::scale_encoder_t& encoder,
    storage_t& storage,
    std::ostream& err) {
  auto ledger = equimint::equity::ledger::open(encoder, storage);
  if (!ledger) {
    err << "no equity configuration; run equity-init first\n";
  }
  return ledger;
}

int show_equity(const equimint::equity::ledger& ledger, std::ostream& out) {
  out << "payees " << ledger.payee_count() << '\n'
      << "group_size " << ledger.group_size() << '\n'
      << "total_shares " << ledger.total_shares().str() << '\n'
      << "total_received " << ledger.total_received().str() << '\n'
      << "total_released " << ledger.total_released().str() << '\n'
      << "held " << ledger.held().str() << '\n';
  for (payee_index_t index = 0; index < ledger.payee_count(); ++index) {
    auto payee = ledger.payee(index).value();
    out << "payee " << index << " shares=" << payee.shares.str()
        << " released=" << payee.released.str()
        << " releasable=" << ledger.releasable(index).value().str()
        << " enabled=" << payee.enabled_index << ' '
        << equimint::schema::to_string(payee.addresses[payee.enabled_index])
        << '\n';
  }
  return kExitOk;
}

int redeem(const settings& options,
           encoding::scale_encoder_t& encoder,
           storage_t& storage,
           std::ostream& out,
           std::ostream& err) {
  auto assets = equimint::minting::asset_registry{encoder, storage};
  auto authority_address = options.authority.value();
  auto authority = equimint::minting::mint_authority{
      encoder, storage, assets, options.domain,
      [authority_address] { return authority_address; }};

  auto result = authority.redeem(options.account, options.voucher,
                                 options.amount);
  if (!result.ok()) {
    print_rejection(result, err);
    return kExitRejected;
  }
  out << "asset_id " << from_word(make_hash32(result.data)).str() << '\n';
  print_events(result, out);

  if (options.forward_proceeds) {
    auto ledger = open_ledger(encoder, storage, err);
    if (!ledger) {
      spdlog::warn("Proceeds of asset {} not forwarded: no equity ledger",
                   options.voucher.asset_id.str());
      return kExitOk;
    }
    auto forwarded =
        ledger->receive(options.domain.verifying_contract, options.amount);
    return finish(forwarded, out, err);
  }
  return kExitOk;
}

}  // namespace

int run(const settings& options, std::ostream& out, std::ostream& err) {
  if (options.action == command::voucher_digest) {
    out << equimint::schema::to_string(
               equimint::minting::voucher_digest(options.domain,
                                                 options.voucher))
        << '\n';
    return kExitOk;
  }

  auto encoder = encoding::scale_encoder_t{};
  auto storage =
      equimint::storage::make_storage<equimint::storage::rocksdb_storage_tag>(
          options.db_path);

  switch (options.action) {
    case command::equity_init: {
      auto result = operation_result_t{};
      auto ledger = equimint::equity::ledger::create(
          encoder, storage, options.payees, options.shares,
          options.group_size, result);
      if (ledger) {
        out << "payees " << ledger->payee_count() << '\n';
      }
      return finish(result, out, err);
    }
    case command::equity_receive: {
      auto ledger = open_ledger(encoder, storage, err);
      if (!ledger) {
        return kExitRejected;
      }
      return finish(ledger->receive(options.account, options.amount), out,
                    err);
    }
    case command::equity_rotate: {
      auto ledger = open_ledger(encoder, storage, err);
      if (!ledger) {
        return kExitRejected;
      }
      return finish(
          ledger->use_next_address(options.account, options.payee_index), out,
          err);
    }
    case command::equity_release: {
      auto ledger = open_ledger(encoder, storage, err);
      if (!ledger) {
        return kExitRejected;
      }
      auto result = ledger->release(options.payee_index);
      if (result.ok()) {
        out << "released " << from_word(make_hash32(result.data)).str()
            << '\n';
      }
      return finish(result, out, err);
    }
    case command::equity_show: {
      auto ledger = open_ledger(encoder, storage, err);
      if (!ledger) {
        return kExitRejected;
      }
      return show_equity(*ledger, out);
    }
    case command::redeem:
      return redeem(options, encoder, storage, out, err);
    case command::voucher_digest:
      break;
  }
  return kExitOk;
}

}  // namespace equimint::cli
