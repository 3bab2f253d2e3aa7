#include <blake3.h>
#include <equimint/blake3/hash.hpp>

namespace equimint::blake3 {

equimint::schema::hash32_t hash(const std::string_view& str) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, str.data(), str.size());
  auto output = equimint::schema::hash32_t{};
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

equimint::schema::hash32_t hash(const std::span<const uint8_t>& bytes) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, bytes.data(), bytes.size());
  auto output = equimint::schema::hash32_t{};
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

equimint::schema::hash32_t hash(
    std::initializer_list<std::span<const uint8_t>> parts) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  for (const auto& part : parts) {
    blake3_hasher_update(&hasher, part.data(), part.size());
  }
  auto output = equimint::schema::hash32_t{};
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

}  // namespace equimint::blake3
