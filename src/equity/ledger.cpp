#include <spdlog/spdlog.h>
#include <equimint/common/critical.hpp>
#include <equimint/equity/ledger.hpp>
#include <equimint/schema/key/keys.hpp>
#include <equimint/storage/event_journal.hpp>
#include <iterator>
#include <string>
#include <tuple>
#include <utility>

using namespace equimint::schema;

namespace equimint::equity {

namespace {

using config_row_t =
    std::tuple<uint32_t, std::vector<payee_addresses_t>, std::vector<word_t>>;
using payee_row_t = std::tuple<word_t, uint32_t>;
using totals_row_t = std::tuple<word_t, word_t>;

funds_transfer_t make_default_transfer() {
  return [](const address_t&, const amount_t&) { return true; };
}

std::string join_addresses(const payee_addresses_t& addresses) {
  auto joined = std::string{};
  for (const auto& address : addresses) {
    if (!joined.empty()) {
      joined += ',';
    }
    joined += to_string(address);
  }
  return joined;
}

}  // namespace

std::unique_ptr<ledger> ledger::create(encoding::scale_encoder_t& encoder,
                                       equimint::storage::rocksdb_storage_t& storage,
                                       std::vector<payee_addresses_t> groups,
                                       std::vector<shares_t> shares,
                                       const uint32_t group_size,
                                       operation_result_t& result) {
  if (storage.get<config_row_t>(encoder, key::make_equity_config_key())
          .has_value()) {
    result = make_error(error_code::already_initialized, kEquityCodespace,
                        "equity configuration already exists");
    spdlog::warn("Refusing to overwrite existing equity configuration");
    return nullptr;
  }

  auto registry = share_registry::create(std::move(groups), std::move(shares),
                                         group_size, result);
  if (!registry.has_value()) {
    spdlog::warn("Rejected equity configuration: {} ({})", result.log,
                 result.info);
    return nullptr;
  }

  auto instance = std::unique_ptr<ledger>{
      new ledger{encoder, storage, std::move(registry.value())}};
  auto lock = std::scoped_lock{instance->mutex_};

  auto share_words = std::vector<word_t>{};
  for (const auto& value : instance->registry_.shares()) {
    share_words.push_back(to_word(value));
  }
  auto entries = std::vector<equimint::storage::key_value_entry_t>{};
  entries.emplace_back(
      key::make_equity_config_key(),
      encoder.encode(config_row_t{group_size, instance->registry_.groups(),
                                  share_words}));
  entries.push_back(instance->make_totals_entry());

  auto events = std::vector<event_t>{};
  for (payee_index_t index = 0; index < instance->registry_.payee_count();
       ++index) {
    entries.push_back(instance->make_payee_entry(index));
    events.push_back(instance->make_event(
        "payee_added",
        {make_attribute("payee_index", std::to_string(index), true),
         make_attribute("addresses",
                        join_addresses(instance->registry_.groups()[index])),
         make_attribute("shares", instance->registry_.shares()[index].str())}));
  }
  instance->commit(std::move(entries), events);

  spdlog::info("Equity ledger created with {} payee(s), {} total share(s), "
               "group size {}",
               instance->registry_.payee_count(),
               instance->registry_.total_shares().str(), group_size);

  result = operation_result_t{};
  result.info = "equity_initialized";
  result.events = std::move(events);
  return instance;
}

std::unique_ptr<ledger> ledger::open(encoding::scale_encoder_t& encoder,
                                     equimint::storage::rocksdb_storage_t& storage) {
  auto config =
      storage.get<config_row_t>(encoder, key::make_equity_config_key());
  if (!config.has_value()) {
    spdlog::debug("No persisted equity configuration");
    return nullptr;
  }

  auto& [group_size, groups, share_words] = config.value();
  auto shares = std::vector<shares_t>{};
  for (const auto& word : share_words) {
    shares.push_back(from_word(word));
  }
  auto validation = operation_result_t{};
  auto registry = share_registry::create(std::move(groups), std::move(shares),
                                         group_size, validation);
  if (!registry.has_value()) {
    spdlog::error("Persisted equity configuration is invalid: {}",
                  validation.log);
    equimint::common::critical("invalid persisted equity configuration");
  }

  auto instance = std::unique_ptr<ledger>{
      new ledger{encoder, storage, std::move(registry.value())}};
  auto lock = std::scoped_lock{instance->mutex_};
  instance->load_persisted_state();
  spdlog::info("Equity ledger loaded with {} payee(s), {} released of {} "
               "received",
               instance->registry_.payee_count(),
               instance->distributor_.total_released().str(),
               instance->distributor_.total_received().str());
  return instance;
}

ledger::ledger(encoding::scale_encoder_t& encoder,
               equimint::storage::rocksdb_storage_t& storage,
               share_registry registry)
    : encoder_{encoder},
      storage_{storage},
      registry_{std::move(registry)},
      rotation_{registry_},
      distributor_{registry_.payee_count()},
      transfer_{make_default_transfer()} {}

void ledger::set_funds_transfer(funds_transfer_t transfer) {
  auto lock = std::scoped_lock{mutex_};
  transfer_ = transfer ? std::move(transfer) : make_default_transfer();
}

operation_result_t ledger::receive(const address_t& sender,
                                   const amount_t& amount) {
  auto lock = std::scoped_lock{mutex_};
  auto result = distributor_.receive(amount);
  if (!result.ok()) {
    spdlog::warn("Rejected payment of {} from {}: {}", amount.str(),
                 to_string(sender), result.log);
    return result;
  }

  auto event = make_event("payment_received",
                          {make_attribute("from", to_string(sender), true),
                           make_attribute("amount", amount.str())});
  commit({make_totals_entry()}, {event});
  spdlog::info("Received {} from {}", amount.str(), to_string(sender));

  result.info = "payment_received";
  result.events.push_back(std::move(event));
  return result;
}

operation_result_t ledger::use_next_address(const address_t& caller,
                                            const payee_index_t payee_index) {
  auto lock = std::scoped_lock{mutex_};
  auto result = rotation_.advance(registry_, caller, payee_index);
  if (!result.ok()) {
    spdlog::warn("Rejected address rotation of payee {} by {}: {}",
                 payee_index, to_string(caller), result.log);
    return result;
  }

  auto enabled = rotation_.enabled_index(payee_index).value();
  auto address = rotation_.enabled_address(registry_, payee_index).value();
  auto event = make_event(
      "address_rotated",
      {make_attribute("payee_index", std::to_string(payee_index), true),
       make_attribute("enabled_index", std::to_string(enabled)),
       make_attribute("address", to_string(address)),
       make_attribute("caller", to_string(caller))});
  commit({make_payee_entry(payee_index)}, {event});
  spdlog::info("Payee {} now receives at {} (address {} of {})", payee_index,
               to_string(address), enabled + 1, registry_.group_size());

  result.info = "address_rotated";
  result.events.push_back(std::move(event));
  return result;
}

operation_result_t ledger::release(const payee_index_t payee_index) {
  auto lock = std::scoped_lock{mutex_};
  auto commits_before = commit_count_;
  auto destination = address_t{};
  // The hook may replace transfer_ through set_funds_transfer while it runs.
  auto transfer = transfer_;
  auto result = operation_result_t{};
  try {
    result = distributor_.release(registry_, rotation_, payee_index, transfer,
                                  destination);
  } catch (...) {
    if (commit_count_ != commits_before) {
      commit({make_payee_entry(payee_index), make_totals_entry()}, {});
    }
    throw;
  }
  if (!result.ok()) {
    // A nested call from the transfer may have persisted the provisional
    // accounting; put the restored values back on disk.
    if (has_error(result, error_code::transfer_rejected) &&
        commit_count_ != commits_before) {
      commit({make_payee_entry(payee_index), make_totals_entry()}, {});
    }
    spdlog::warn("Rejected release to payee {}: {}", payee_index, result.log);
    return result;
  }

  auto amount = from_word(make_hash32(result.data));
  auto event = make_event(
      "payment_released",
      {make_attribute("payee_index", std::to_string(payee_index), true),
       make_attribute("to", to_string(destination), true),
       make_attribute("amount", amount.str())});
  commit({make_payee_entry(payee_index), make_totals_entry()}, {event});
  spdlog::info("Released {} to payee {} at {}", amount.str(), payee_index,
               to_string(destination));

  result.info = "payment_released";
  result.events.push_back(std::move(event));
  return result;
}

std::size_t ledger::payee_count() const {
  auto lock = std::scoped_lock{mutex_};
  return registry_.payee_count();
}

uint32_t ledger::group_size() const {
  auto lock = std::scoped_lock{mutex_};
  return registry_.group_size();
}

shares_t ledger::total_shares() const {
  auto lock = std::scoped_lock{mutex_};
  return registry_.total_shares();
}

amount_t ledger::total_released() const {
  auto lock = std::scoped_lock{mutex_};
  return distributor_.total_released();
}

amount_t ledger::total_received() const {
  auto lock = std::scoped_lock{mutex_};
  return distributor_.total_received();
}

amount_t ledger::held() const {
  auto lock = std::scoped_lock{mutex_};
  return distributor_.held();
}

std::optional<shares_t> ledger::shares(const payee_index_t payee_index) const {
  auto lock = std::scoped_lock{mutex_};
  return registry_.shares_of(payee_index);
}

std::optional<amount_t> ledger::released(
    const payee_index_t payee_index) const {
  auto lock = std::scoped_lock{mutex_};
  return distributor_.released(payee_index);
}

std::optional<amount_t> ledger::releasable(
    const payee_index_t payee_index) const {
  auto lock = std::scoped_lock{mutex_};
  return distributor_.releasable(registry_, payee_index);
}

std::optional<payee_addresses_t> ledger::payee_addresses(
    const payee_index_t payee_index) const {
  auto lock = std::scoped_lock{mutex_};
  return registry_.addresses_of(payee_index);
}

std::optional<uint32_t> ledger::enabled_index(
    const payee_index_t payee_index) const {
  auto lock = std::scoped_lock{mutex_};
  return rotation_.enabled_index(payee_index);
}

std::optional<address_t> ledger::enabled_address(
    const payee_index_t payee_index) const {
  auto lock = std::scoped_lock{mutex_};
  return rotation_.enabled_address(registry_, payee_index);
}

std::optional<payee_t> ledger::payee(const payee_index_t payee_index) const {
  auto lock = std::scoped_lock{mutex_};
  if (!registry_.contains(payee_index)) {
    return std::nullopt;
  }
  auto view = payee_t{};
  view.index = payee_index;
  view.addresses = registry_.groups()[payee_index];
  view.shares = registry_.shares()[payee_index];
  view.released = distributor_.released(payee_index).value();
  view.enabled_index = rotation_.enabled_index(payee_index).value();
  return view;
}

std::vector<event_t> ledger::events() const {
  auto lock = std::scoped_lock{mutex_};
  return events_;
}

event_t ledger::make_event(const char* type,
                           std::vector<event_attribute_t> attributes) {
  auto event = event_t{};
  event.sequence = next_event_sequence_++;
  event.type = type;
  event.attributes = std::move(attributes);
  return event;
}

equimint::storage::key_value_entry_t ledger::make_payee_entry(
    const payee_index_t payee_index) const {
  return equimint::storage::key_value_entry_t{
      key::make_payee_key(payee_index),
      encoder_.encode(
          payee_row_t{to_word(distributor_.released(payee_index).value()),
                      rotation_.enabled_index(payee_index).value()})};
}

equimint::storage::key_value_entry_t ledger::make_totals_entry() const {
  return equimint::storage::key_value_entry_t{
      key::make_equity_totals_key(),
      encoder_.encode(totals_row_t{to_word(distributor_.held()),
                                   to_word(distributor_.total_released())})};
}

void ledger::commit(std::vector<equimint::storage::key_value_entry_t> entries,
                    const std::vector<event_t>& events) {
  for (const auto& event : events) {
    entries.push_back(equimint::storage::make_event_entry(
        encoder_, key::make_equity_event_key(event.sequence), event));
  }
  storage_.commit(entries);
  events_.insert(std::end(events_), std::begin(events), std::end(events));
  ++commit_count_;
}

void ledger::load_persisted_state() {
  spdlog::debug("Loading persisted equity state");
  auto totals =
      storage_.get<totals_row_t>(encoder_, key::make_equity_totals_key());
  if (!totals.has_value()) {
    equimint::common::critical("missing persisted equity totals");
  }

  auto released = std::vector<amount_t>{};
  for (payee_index_t index = 0; index < registry_.payee_count(); ++index) {
    auto row = storage_.get<payee_row_t>(encoder_, key::make_payee_key(index));
    if (!row.has_value()) {
      equimint::common::critical("missing persisted payee row");
    }
    released.push_back(from_word(std::get<0>(row.value())));
    if (!rotation_.restore(index, std::get<1>(row.value()),
                           registry_.group_size())) {
      equimint::common::critical("invalid persisted enabled address index");
    }
  }

  if (!distributor_.restore(from_word(std::get<0>(totals.value())),
                            from_word(std::get<1>(totals.value())),
                            std::move(released))) {
    equimint::common::critical("inconsistent persisted equity totals");
  }

  events_ = equimint::storage::load_events(encoder_, storage_,
                                           key::kEquityEventPrefix);
  if (!events_.empty()) {
    next_event_sequence_ = events_.back().sequence + 1;
  }
  spdlog::debug("Loaded {} payee row(s) and {} event(s)",
                registry_.payee_count(), events_.size());
}

}  // namespace equimint::equity
