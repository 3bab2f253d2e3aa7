#pragma once
#include <equimint/schema/primitives.hpp>
#include <optional>
#include <span>

namespace equimint::schema::encoding {

// The wire library is chosen at build time through the tag type; callers hold
// an `encoder<Tag>` and never touch the library API directly.
template <typename Library>
struct encoder {
  template <typename T>
  equimint::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, equimint::schema::bytes_t& out);

  template <typename T>
  T decode(const equimint::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const equimint::schema::bytes_view_t& bytes);
};

}  // namespace equimint::schema::encoding
