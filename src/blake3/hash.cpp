#include <blake3.h>
#include <mandate/blake3/hash.hpp>

namespace mandate::blake3 {

mandate::schema::hash32_t hash(const std::string_view& str) {
  return hash(mandate::schema::make_bytes_view(str));
}

mandate::schema::hash32_t hash(const mandate::schema::bytes_view_t& bytes) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, bytes.data(), bytes.size());
  static_assert(BLAKE3_OUT_LEN == std::tuple_size_v<mandate::schema::hash32_t>);
  auto output = mandate::schema::hash32_t{};
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

}  // namespace mandate::blake3
