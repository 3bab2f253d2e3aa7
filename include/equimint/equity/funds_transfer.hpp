#pragma once

#include <equimint/schema/primitives.hpp>
#include <functional>

namespace equimint::equity {

/// Push `amount` to `destination`. Returning false means the destination
/// refused the funds.
using funds_transfer_t =
    std::function<bool(const equimint::schema::address_t& destination,
                       const equimint::schema::amount_t& amount)>;

}  // namespace equimint::equity
