#pragma once
#include <mandate/common/critical.hpp>
#include <mandate/schema/encoding/encoder.hpp>
#include <mandate/schema/encoding/scale/delegation_record.hpp>
#include <mandate/schema/encoding/scale/delegation_type.hpp>
#include <iterator>
#include <scale/scale.hpp>

namespace mandate::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  mandate::schema::bytes_t encode(const T& obj) const;

  template <typename T>
  void encode(const T& obj, mandate::schema::bytes_t& out) const;

  template <typename T>
  T decode(const mandate::schema::bytes_view_t& bytes) const;

  template <typename T>
  std::optional<T> try_decode(const mandate::schema::bytes_view_t& bytes) const;
};

template <typename T>
mandate::schema::bytes_t encoder<scale_encoder_tag>::encode(
    const T& obj) const {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    mandate::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        mandate::schema::bytes_t& out) const {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
T encoder<scale_encoder_tag>::decode(
    const mandate::schema::bytes_view_t& bytes) const {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    mandate::common::critical("failed to decode SCALE bytes");
  }
  return decoded.value();
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const mandate::schema::bytes_view_t& bytes) const {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return decoded.value();
}

}  // namespace mandate::schema::encoding
