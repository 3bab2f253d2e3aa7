#include <equimint/equity/address_rotation.hpp>
#include <equimint/equity/payment_distributor.hpp>
#include <equimint/equity/share_registry.hpp>
#include <equimint/schema/error_code.hpp>
#include <equimint/testing/equity.hpp>
#include <gtest/gtest.h>

#include <initializer_list>
#include <limits>
#include <stdexcept>
#include <utility>
#include <vector>

using equimint::equity::address_rotation;
using equimint::equity::payment_distributor;
using equimint::equity::share_registry;
using equimint::schema::address_t;
using equimint::schema::amount_t;
using equimint::schema::error_code;
using equimint::schema::has_error;
using equimint::testing::payee_address;

namespace {

struct distribution final {
  explicit distribution(std::initializer_list<uint64_t> weights)
      : registry{make_registry(weights)},
        rotation{registry},
        distributor{registry.payee_count()} {}

  static share_registry make_registry(std::initializer_list<uint64_t> weights) {
    auto result = equimint::schema::operation_result_t{};
    return share_registry::create(
               equimint::testing::make_payee_groups(weights.size()),
               equimint::testing::make_shares(weights), 3, result)
        .value();
  }

  equimint::schema::operation_result_t release(
      const equimint::schema::payee_index_t index,
      const equimint::equity::funds_transfer_t& transfer) {
    return distributor.release(registry, rotation, index, transfer,
                               destination);
  }

  equimint::schema::operation_result_t release(
      const equimint::schema::payee_index_t index) {
    return release(index, [this](const address_t& to, const amount_t& amount) {
      transfers.emplace_back(to, amount);
      return true;
    });
  }

  share_registry registry;
  address_rotation rotation;
  payment_distributor distributor;
  address_t destination{};
  std::vector<std::pair<address_t, amount_t>> transfers;
};

}  // namespace

TEST(payment_distributor, splits_by_share_and_keeps_dust) {
  auto fixture = distribution{100, 75, 100};
  ASSERT_TRUE(fixture.distributor.receive(1000).ok());

  EXPECT_EQ(fixture.distributor.releasable(fixture.registry, 0).value(),
            amount_t{363});
  EXPECT_EQ(fixture.distributor.releasable(fixture.registry, 1).value(),
            amount_t{272});
  EXPECT_EQ(fixture.distributor.releasable(fixture.registry, 2).value(),
            amount_t{363});

  ASSERT_TRUE(fixture.release(0).ok());
  ASSERT_TRUE(fixture.release(1).ok());
  ASSERT_TRUE(fixture.release(2).ok());

  ASSERT_EQ(fixture.transfers.size(), 3u);
  EXPECT_EQ(fixture.transfers[0],
            std::make_pair(payee_address(0, 0), amount_t{363}));
  EXPECT_EQ(fixture.transfers[1],
            std::make_pair(payee_address(1, 0), amount_t{272}));
  EXPECT_EQ(fixture.transfers[2],
            std::make_pair(payee_address(2, 0), amount_t{363}));
  EXPECT_EQ(fixture.distributor.total_released(), amount_t{998});
  EXPECT_EQ(fixture.distributor.held(), amount_t{2});
  EXPECT_EQ(fixture.distributor.total_received(), amount_t{1000});
}

TEST(payment_distributor, release_reports_amount_word) {
  auto fixture = distribution{1, 1};
  ASSERT_TRUE(fixture.distributor.receive(10).ok());
  auto result = fixture.release(1);
  ASSERT_TRUE(result.ok());
  EXPECT_EQ(equimint::schema::from_word(
                equimint::schema::make_hash32(result.data)),
            amount_t{5});
  EXPECT_EQ(fixture.destination, payee_address(1, 0));
}

TEST(payment_distributor, nothing_due_after_full_release) {
  auto fixture = distribution{1, 1};
  ASSERT_TRUE(fixture.distributor.receive(10).ok());
  ASSERT_TRUE(fixture.release(0).ok());

  auto again = fixture.release(0);
  EXPECT_TRUE(has_error(again, error_code::nothing_due));
  EXPECT_EQ(fixture.distributor.released(0).value(), amount_t{5});
  EXPECT_EQ(fixture.transfers.size(), 1u);
}

TEST(payment_distributor, nothing_due_before_any_receipt) {
  auto fixture = distribution{1, 1};
  EXPECT_TRUE(has_error(fixture.release(0), error_code::nothing_due));
  EXPECT_EQ(fixture.distributor.releasable(fixture.registry, 0).value(),
            amount_t{0});
}

TEST(payment_distributor, later_receipts_accrue_to_earlier_payees) {
  auto fixture = distribution{1, 3};
  ASSERT_TRUE(fixture.distributor.receive(40).ok());
  ASSERT_TRUE(fixture.release(0).ok());
  ASSERT_TRUE(fixture.distributor.receive(40).ok());

  EXPECT_EQ(fixture.distributor.releasable(fixture.registry, 0).value(),
            amount_t{10});
  EXPECT_EQ(fixture.distributor.releasable(fixture.registry, 1).value(),
            amount_t{60});
  ASSERT_TRUE(fixture.release(1).ok());
  EXPECT_EQ(fixture.distributor.released(1).value(), amount_t{60});
  EXPECT_EQ(fixture.distributor.held(), amount_t{10});
}

TEST(payment_distributor, release_pays_enabled_address) {
  auto fixture = distribution{1, 1};
  ASSERT_TRUE(
      fixture.rotation.advance(fixture.registry, payee_address(1, 0), 0).ok());
  ASSERT_TRUE(fixture.distributor.receive(8).ok());
  ASSERT_TRUE(fixture.release(0).ok());
  EXPECT_EQ(fixture.transfers.back().first, payee_address(0, 1));
}

TEST(payment_distributor, refused_transfer_restores_accounting) {
  auto fixture = distribution{1, 1};
  ASSERT_TRUE(fixture.distributor.receive(10).ok());
  auto refused = fixture.release(
      0, [](const address_t&, const amount_t&) { return false; });
  EXPECT_TRUE(has_error(refused, error_code::transfer_rejected));
  EXPECT_EQ(fixture.distributor.released(0).value(), amount_t{0});
  EXPECT_EQ(fixture.distributor.total_released(), amount_t{0});
  EXPECT_EQ(fixture.distributor.held(), amount_t{10});
  EXPECT_EQ(fixture.distributor.releasable(fixture.registry, 0).value(),
            amount_t{5});
}

TEST(payment_distributor, transfer_sees_updated_accounting) {
  auto fixture = distribution{1, 1};
  ASSERT_TRUE(fixture.distributor.receive(10).ok());
  auto seen_held = amount_t{};
  auto seen_released = amount_t{};
  auto result = fixture.release(0, [&](const address_t&, const amount_t&) {
    seen_held = fixture.distributor.held();
    seen_released = fixture.distributor.released(0).value();
    return true;
  });
  ASSERT_TRUE(result.ok());
  EXPECT_EQ(seen_held, amount_t{5});
  EXPECT_EQ(seen_released, amount_t{5});
}

TEST(payment_distributor, bad_index_is_rejected) {
  auto fixture = distribution{1, 1};
  ASSERT_TRUE(fixture.distributor.receive(10).ok());
  EXPECT_TRUE(has_error(fixture.release(2), error_code::bad_payee_index));
  EXPECT_FALSE(
      fixture.distributor.releasable(fixture.registry, 2).has_value());
  EXPECT_FALSE(fixture.distributor.released(2).has_value());
}

TEST(payment_distributor, receive_rejects_overflow) {
  auto fixture = distribution{1, 1};
  const auto max = (std::numeric_limits<amount_t>::max)();
  ASSERT_TRUE(fixture.distributor.receive(max - 1).ok());
  ASSERT_TRUE(fixture.release(0).ok());

  auto overflow = fixture.distributor.receive(2);
  EXPECT_TRUE(has_error(overflow, error_code::arithmetic_overflow));
  EXPECT_EQ(fixture.distributor.total_received(), amount_t{max - 1});
  EXPECT_TRUE(fixture.distributor.receive(1).ok());
  EXPECT_EQ(fixture.distributor.total_received(), max);
}

TEST(payment_distributor, zero_receipt_is_accepted) {
  auto fixture = distribution{1};
  EXPECT_TRUE(fixture.distributor.receive(0).ok());
  EXPECT_EQ(fixture.distributor.held(), amount_t{0});
}

TEST(payment_distributor, restore_checks_consistency) {
  auto fixture = distribution{1, 1};
  EXPECT_FALSE(fixture.distributor.restore(5, 7, {amount_t{3}, amount_t{3}}));
  EXPECT_FALSE(fixture.distributor.restore(5, 6, {amount_t{6}}));
  EXPECT_TRUE(fixture.distributor.restore(5, 6, {amount_t{3}, amount_t{3}}));
  EXPECT_EQ(fixture.distributor.total_received(), amount_t{11});
  EXPECT_EQ(fixture.distributor.releasable(fixture.registry, 0).value(),
            amount_t{2});
}

TEST(payment_distributor, throwing_transfer_is_rejected_and_restored) {
  auto fixture = distribution{1, 1};
  ASSERT_TRUE(fixture.distributor.receive(10).ok());
  auto result = fixture.release(0, [](const address_t&, const amount_t&) -> bool {
    throw std::runtime_error{"hook failed"};
  });
  EXPECT_TRUE(has_error(result, error_code::transfer_rejected));
  EXPECT_EQ(result.info, "hook failed");
  EXPECT_EQ(fixture.distributor.released(0).value(), amount_t{0});
  EXPECT_EQ(fixture.distributor.total_released(), amount_t{0});
  EXPECT_EQ(fixture.distributor.held(), amount_t{10});
}

TEST(payment_distributor, foreign_exception_is_rethrown_after_restore) {
  auto fixture = distribution{1, 1};
  ASSERT_TRUE(fixture.distributor.receive(10).ok());
  EXPECT_THROW(fixture.release(0,
                               [](const address_t&, const amount_t&) -> bool {
                                 throw 7;
                               }),
               int);
  EXPECT_EQ(fixture.distributor.released(0).value(), amount_t{0});
  EXPECT_EQ(fixture.distributor.held(), amount_t{10});
  EXPECT_TRUE(fixture.release(0).ok());
}
