#pragma once

#include <equimint/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: error code.
// Failure taxonomy shared by redemption and equity operations: stable numeric
// codes carried in operation results. Zero is reserved for success.
namespace equimint::schema {

enum class error_code : uint32_t {
  // Redemption
  invalid_signature_format = 1,
  unauthorized_signer = 2,
  insufficient_payment = 3,
  duplicate_metadata = 4,
  duplicate_asset_id = 5,
  // Construction
  length_mismatch = 10,
  no_payees = 11,
  bad_address_count = 12,
  zero_address = 13,
  zero_shares = 14,
  arithmetic_overflow = 15,
  already_initialized = 16,
  // Rotation and distribution
  bad_payee_index = 20,
  all_addresses_used = 21,
  caller_not_payee = 22,
  self_rotation_forbidden = 23,
  caller_address_disabled = 24,
  nothing_due = 25,
  transfer_rejected = 26,
};

inline constexpr auto kErrorCodeMappings = std::array{
    std::pair<std::string_view, error_code>{
        "invalid_signature_format", error_code::invalid_signature_format},
    std::pair<std::string_view, error_code>{"unauthorized_signer",
                                            error_code::unauthorized_signer},
    std::pair<std::string_view, error_code>{"insufficient_payment",
                                            error_code::insufficient_payment},
    std::pair<std::string_view, error_code>{"duplicate_metadata",
                                            error_code::duplicate_metadata},
    std::pair<std::string_view, error_code>{"duplicate_asset_id",
                                            error_code::duplicate_asset_id},
    std::pair<std::string_view, error_code>{"length_mismatch",
                                            error_code::length_mismatch},
    std::pair<std::string_view, error_code>{"no_payees",
                                            error_code::no_payees},
    std::pair<std::string_view, error_code>{"bad_address_count",
                                            error_code::bad_address_count},
    std::pair<std::string_view, error_code>{"zero_address",
                                            error_code::zero_address},
    std::pair<std::string_view, error_code>{"zero_shares",
                                            error_code::zero_shares},
    std::pair<std::string_view, error_code>{"arithmetic_overflow",
                                            error_code::arithmetic_overflow},
    std::pair<std::string_view, error_code>{"already_initialized",
                                            error_code::already_initialized},
    std::pair<std::string_view, error_code>{"bad_payee_index",
                                            error_code::bad_payee_index},
    std::pair<std::string_view, error_code>{"all_addresses_used",
                                            error_code::all_addresses_used},
    std::pair<std::string_view, error_code>{"caller_not_payee",
                                            error_code::caller_not_payee},
    std::pair<std::string_view, error_code>{
        "self_rotation_forbidden", error_code::self_rotation_forbidden},
    std::pair<std::string_view, error_code>{
        "caller_address_disabled", error_code::caller_address_disabled},
    std::pair<std::string_view, error_code>{"nothing_due",
                                            error_code::nothing_due},
    std::pair<std::string_view, error_code>{"transfer_rejected",
                                            error_code::transfer_rejected}};

template <>
inline std::optional<error_code> try_from_string<error_code>(
    const std::string_view value) {
  return from_string(value, kErrorCodeMappings);
}

inline constexpr std::string_view to_string(const error_code value) {
  return to_string(value, kErrorCodeMappings).value_or("unknown");
}

}  // namespace equimint::schema
