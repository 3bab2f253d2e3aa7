#pragma once
#include <equimint/common/critical.hpp>
#include <equimint/schema/encoding/scale/event.hpp>
#include <equimint/schema/event.hpp>
#include <equimint/storage/storage.hpp>
#include <algorithm>
#include <string_view>
#include <utility>
#include <vector>

namespace equimint::storage {

/// Stage one journaled event for a write batch.
template <typename Encoder>
key_value_entry_t make_event_entry(Encoder& encoder,
                                   equimint::schema::bytes_t key,
                                   const equimint::schema::event_t& event) {
  return key_value_entry_t{
      std::move(key),
      encoder.encode(equimint::schema::encoding::scale::to_row(event))};
}

/// Load every event journaled under `prefix`, ordered by sequence.
template <typename Encoder, typename Storage>
std::vector<equimint::schema::event_t> load_events(Encoder& encoder,
                                                   const Storage& storage,
                                                   std::string_view prefix) {
  auto events = std::vector<equimint::schema::event_t>{};
  for (const auto& [key, value] :
       storage.list_by_prefix(equimint::schema::make_bytes_view(prefix))) {
    auto row = encoder.template try_decode<
        equimint::schema::encoding::scale::event_row_t>(value);
    if (!row.has_value()) {
      equimint::common::critical("failed to decode journaled event");
    }
    events.push_back(equimint::schema::encoding::scale::from_row(row.value()));
  }
  // Sequence keys are little-endian, so key order is not sequence order.
  std::sort(std::begin(events), std::end(events),
            [](const auto& lhs, const auto& rhs) {
              return lhs.sequence < rhs.sequence;
            });
  return events;
}

}  // namespace equimint::storage
