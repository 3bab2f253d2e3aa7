#pragma once
#include <equimint/schema/event.hpp>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

// SCALE layout of a journaled event. Events are persisted as plain tuples so
// the layout does not depend on aggregate reflection in the codec.
namespace equimint::schema::encoding::scale {

using event_attribute_row_t = std::tuple<std::string, std::string, bool>;
using event_row_t = std::tuple<uint16_t,
                               uint64_t,
                               std::string,
                               std::vector<event_attribute_row_t>>;

inline event_row_t to_row(const event_t& event) {
  auto attributes = std::vector<event_attribute_row_t>{};
  attributes.reserve(event.attributes.size());
  for (const auto& attribute : event.attributes) {
    attributes.emplace_back(attribute.key, attribute.value, attribute.index);
  }
  return event_row_t{event.version, event.sequence, event.type,
                     std::move(attributes)};
}

inline event_t from_row(const event_row_t& row) {
  auto event = event_t{};
  event.version = std::get<0>(row);
  event.sequence = std::get<1>(row);
  event.type = std::get<2>(row);
  for (const auto& [key, value, index] : std::get<3>(row)) {
    event.attributes.push_back(
        event_attribute_t{.key = key, .value = value, .index = index});
  }
  return event;
}

}  // namespace equimint::schema::encoding::scale
