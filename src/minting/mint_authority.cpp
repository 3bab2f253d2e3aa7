#include <spdlog/spdlog.h>
#include <equimint/blake3/hash.hpp>
#include <equimint/common/critical.hpp>
#include <equimint/crypto/recover.hpp>
#include <equimint/minting/mint_authority.hpp>
#include <equimint/minting/signature_verifier.hpp>
#include <equimint/schema/key/keys.hpp>
#include <equimint/storage/event_journal.hpp>
#include <algorithm>
#include <iterator>
#include <limits>
#include <utility>

using namespace equimint::schema;

namespace equimint::minting {

namespace {

bytes_t make_word_bytes(const word_t& word) {
  return bytes_t{std::begin(word), std::end(word)};
}

}  // namespace

mint_authority::mint_authority(encoding::scale_encoder_t& encoder,
                               equimint::storage::rocksdb_storage_t& storage,
                               asset_registry& assets,
                               signing_domain_t domain,
                               authority_lookup_t authority)
    : encoder_{encoder},
      storage_{storage},
      assets_{assets},
      domain_{std::move(domain)},
      authority_{std::move(authority)} {
  auto lock = std::scoped_lock{mutex_};
  if (!authority_) {
    equimint::common::critical("mint authority requires an authority lookup");
  }
  load_persisted_state();
  spdlog::info("Mint authority ready for domain '{}' v{} on chain {} ({} "
               "redeemed voucher(s))",
               domain_.name, domain_.domain_version, domain_.chain_id.str(),
               ledger_.size());
}

operation_result_t mint_authority::redeem(const address_t& requester,
                                          const voucher_t& voucher,
                                          const amount_t& payment) {
  auto lock = std::scoped_lock{mutex_};

  auto recover_error = equimint::crypto::recover_error::none;
  auto signer = recover_signer(domain_, voucher, recover_error);
  if (!signer.has_value()) {
    spdlog::warn("Rejecting voucher for asset {}: {}", voucher.asset_id.str(),
                 equimint::crypto::to_string(recover_error));
    return make_error(error_code::invalid_signature_format, kMintCodespace,
                      "invalid signature format",
                      std::string{equimint::crypto::to_string(recover_error)});
  }

  auto authority = authority_();
  if (signer.value() != authority) {
    spdlog::warn("Rejecting voucher for asset {}: signer {} is not allowed",
                 voucher.asset_id.str(), to_string(signer.value()));
    return make_error(error_code::unauthorized_signer, kMintCodespace,
                      "signer is not allowed", to_string(signer.value()));
  }

  if (payment < voucher.min_price) {
    spdlog::warn("Rejecting voucher for asset {}: payment {} below {}",
                 voucher.asset_id.str(), payment.str(),
                 voucher.min_price.str());
    return make_error(error_code::insufficient_payment, kMintCodespace,
                      "insufficient funds to redeem",
                      "minimum price " + voucher.min_price.str());
  }

  auto metadata_hash = equimint::blake3::hash(
      std::string_view{voucher.metadata_ref});
  if (ledger_.contains(metadata_hash)) {
    spdlog::warn("Rejecting voucher for asset {}: metadata '{}' already used",
                 voucher.asset_id.str(), voucher.metadata_ref);
    return make_error(error_code::duplicate_metadata, kMintCodespace,
                      "metadata reference already redeemed",
                      voucher.metadata_ref);
  }

  if (proceeds_ > (std::numeric_limits<amount_t>::max)() - payment) {
    return make_error(error_code::arithmetic_overflow, kMintCodespace,
                      "collected proceeds overflow");
  }

  auto entries = std::vector<equimint::storage::key_value_entry_t>{};
  auto issued = assets_.stage_issue(requester, voucher.asset_id,
                                    voucher.metadata_ref, entries);
  if (!issued.ok()) {
    spdlog::warn("Rejecting voucher for asset {}: {}", voucher.asset_id.str(),
                 issued.log);
    return issued;
  }
  if (!ledger_.mark(metadata_hash, voucher.asset_id)) {
    equimint::common::critical("voucher ledger rejected an unused metadata hash",
                               voucher.metadata_ref);
  }
  proceeds_ += payment;

  auto event = event_t{};
  event.sequence = next_event_sequence_++;
  event.type = "asset_redeemed";
  event.attributes = {make_attribute("asset_id", voucher.asset_id.str(), true),
                      make_attribute("owner", to_string(requester), true),
                      make_attribute("signer", to_string(signer.value())),
                      make_attribute("metadata_hash", to_string(metadata_hash)),
                      make_attribute("payment", payment.str())};

  entries.emplace_back(
      key::make_voucher_used_key(metadata_hash),
      encoder_.encode(to_word(voucher.asset_id)));
  entries.emplace_back(key::make_mint_proceeds_key(),
                       encoder_.encode(to_word(proceeds_)));
  entries.push_back(equimint::storage::make_event_entry(
      encoder_, key::make_mint_event_key(event.sequence), event));
  storage_.commit(entries);
  events_.push_back(event);

  spdlog::info("Redeemed asset {} for {} (payment {})", voucher.asset_id.str(),
               to_string(requester), payment.str());

  auto result = operation_result_t{};
  result.data = make_word_bytes(to_word(voucher.asset_id));
  result.info = "asset_redeemed";
  result.events.push_back(std::move(event));
  return result;
}

hash32_t mint_authority::digest(const voucher_t& voucher) const {
  auto lock = std::scoped_lock{mutex_};
  return voucher_digest(domain_, voucher);
}

bool mint_authority::is_redeemed(const std::string_view metadata_ref) const {
  auto lock = std::scoped_lock{mutex_};
  return ledger_.contains(equimint::blake3::hash(metadata_ref));
}

std::optional<asset_id_t> mint_authority::redeemed_asset(
    const std::string_view metadata_ref) const {
  auto lock = std::scoped_lock{mutex_};
  return ledger_.asset_of(equimint::blake3::hash(metadata_ref));
}

amount_t mint_authority::proceeds() const {
  auto lock = std::scoped_lock{mutex_};
  return proceeds_;
}

const signing_domain_t& mint_authority::domain() const {
  return domain_;
}

std::vector<event_t> mint_authority::events() const {
  auto lock = std::scoped_lock{mutex_};
  return events_;
}

void mint_authority::load_persisted_state() {
  spdlog::debug("Loading persisted redemption state");
  for (const auto& [raw_key, value] : storage_.list_by_prefix(
           make_bytes_view(key::kVoucherUsedKeyPrefix))) {
    auto suffix = key::key_suffix(key::kVoucherUsedKeyPrefix, raw_key);
    auto asset_word = encoder_.try_decode<word_t>(value);
    if (!suffix.has_value() || suffix->size() != hash32_t{}.size() ||
        !asset_word.has_value()) {
      equimint::common::critical("failed to decode redeemed voucher row");
    }
    auto metadata_hash = hash32_t{};
    std::copy(std::begin(suffix.value()), std::end(suffix.value()),
              std::begin(metadata_hash));
    if (!ledger_.mark(metadata_hash, from_word(asset_word.value()))) {
      equimint::common::critical("duplicate redeemed voucher row");
    }
  }

  auto proceeds =
      storage_.get<word_t>(encoder_, key::make_mint_proceeds_key());
  if (proceeds.has_value()) {
    proceeds_ = from_word(proceeds.value());
  }

  events_ = equimint::storage::load_events(encoder_, storage_,
                                           key::kMintEventPrefix);
  if (!events_.empty()) {
    next_event_sequence_ = events_.back().sequence + 1;
  }
  spdlog::debug("Loaded {} redeemed voucher(s) and {} event(s)",
                ledger_.size(), events_.size());
}

}  // namespace equimint::minting
