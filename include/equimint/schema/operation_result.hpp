#pragma once

#include <equimint/schema/error_code.hpp>
#include <equimint/schema/event.hpp>
#include <equimint/schema/primitives.hpp>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace equimint::schema {

inline constexpr auto kMintCodespace = std::string_view{"equimint.mint"};
inline constexpr auto kEquityCodespace = std::string_view{"equimint.equity"};

template <uint16_t Version>
struct operation_result;

template <>
struct operation_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  bytes_t data;
  std::string log;
  std::string info;
  std::string codespace;
  std::vector<event_t> events;

  bool ok() const { return code == 0; }
};

using operation_result_t = operation_result<1>;

inline operation_result_t make_error(const error_code code,
                                     const std::string_view codespace,
                                     std::string log,
                                     std::string info = {}) {
  auto result = operation_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.codespace = std::string{codespace};
  result.log = std::move(log);
  result.info = std::move(info);
  return result;
}

inline bool has_error(const operation_result_t& result,
                      const error_code code) {
  return result.code == static_cast<uint32_t>(code);
}

}  // namespace equimint::schema
