/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <array>

#include <fmt/format.h>
#include <boost/functional/hash.hpp>
#include <scale/scale.hpp>

#include "common/buffer_view.hpp"
#include "common/hexutil.hpp"

/**
 * Declares a distinct type over Blob<blob_size>: keys, signatures and ids of
 * the same length that must not be mixed up
 */
#define SINGLETON_BLOB_STRICT_TYPEDEF(space_name, class_name, blob_size)      \
  namespace space_name {                                                      \
    struct class_name : public ::singleton::common::Blob<blob_size> {         \
      using Base = ::singleton::common::Blob<blob_size>;                      \
                                                                              \
      class_name() = default;                                                 \
      explicit class_name(const Base &blob) : Base{blob} {}                   \
                                                                              \
      static ::outcome::result<class_name> fromHex(std::string_view hex) {    \
        return wrap(Base::fromHex(hex));                                      \
      }                                                                       \
                                                                              \
      static ::outcome::result<class_name> fromHexWithPrefix(                 \
          std::string_view hex) {                                             \
        return wrap(Base::fromHexWithPrefix(hex));                            \
      }                                                                       \
                                                                              \
      static ::outcome::result<class_name> fromSpan(                          \
          ::singleton::common::BufferView span) {                             \
        return wrap(Base::fromSpan(span));                                    \
      }                                                                       \
                                                                              \
      friend inline ::scale::ScaleEncoderStream &operator<<(                  \
          ::scale::ScaleEncoderStream &s, const class_name &data) {           \
        return s << static_cast<const Base &>(data);                          \
      }                                                                       \
                                                                              \
      friend inline ::scale::ScaleDecoderStream &operator>>(                  \
          ::scale::ScaleDecoderStream &s, class_name &data) {                 \
        return s >> static_cast<Base &>(data);                                \
      }                                                                       \
                                                                              \
     private:                                                                 \
      static ::outcome::result<class_name> wrap(                              \
          ::outcome::result<Base> blob) {                                     \
        if (not blob) {                                                       \
          return blob.error();                                                \
        }                                                                     \
        return class_name{blob.value()};                                      \
      }                                                                       \
    };                                                                        \
  }                                                                           \
                                                                              \
  template <>                                                                 \
  struct std::hash<space_name::class_name>                                    \
      : std::hash<space_name::class_name::Base> {};                           \
                                                                              \
  template <>                                                                 \
  struct fmt::formatter<space_name::class_name>                               \
      : fmt::formatter<space_name::class_name::Base> {};

namespace singleton::common {

  enum class BlobError { INCORRECT_LENGTH = 1 };

  /**
   * Fixed size byte array: hashes, sr25519 keys and signatures, engine ids
   */
  template <size_t size_>
  class Blob : public std::array<uint8_t, size_> {
    using Array = std::array<uint8_t, size_>;

   public:
    // Next line is required at least for the scale-codec
    static constexpr bool is_static_collection = true;

    constexpr Blob() : Array{} {}

    constexpr explicit Blob(const Array &bytes) : Array{bytes} {}

    static constexpr size_t size() {
      return size_;
    }

    BufferView view() const {
      return {this->data(), size_};
    }

    std::string toHex() const {
      return hex_lower(view());
    }

    /**
     * Blob holding the characters of the string, which has to be exactly
     * size_ long
     */
    static outcome::result<Blob> fromString(std::string_view data) {
      return fromSpan(BufferView{
          // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
          reinterpret_cast<const uint8_t *>(data.data()),
          data.size()});
    }

    static outcome::result<Blob> fromHex(std::string_view hex) {
      OUTCOME_TRY(bytes, unhex(hex));
      return fromSpan(bytes);
    }

    static outcome::result<Blob> fromHexWithPrefix(std::string_view hex) {
      OUTCOME_TRY(bytes, unhexWith0x(hex));
      return fromSpan(bytes);
    }

    static outcome::result<Blob> fromSpan(BufferView bytes) {
      if (bytes.size() != size_) {
        return BlobError::INCORRECT_LENGTH;
      }
      Blob blob;
      std::copy(bytes.begin(), bytes.end(), blob.begin());
      return blob;
    }
  };

  // instantiated once in blob.cpp: engine ids, hashes and keys, signatures
  extern template class Blob<4ul>;
  extern template class Blob<32ul>;
  extern template class Blob<64ul>;

  using Hash256 = Blob<32>;

  template <size_t N>
  inline std::ostream &operator<<(std::ostream &os, const Blob<N> &blob) {
    return os << blob.view();
  }

}  // namespace singleton::common

namespace singleton {
  using common::Hash256;
}  // namespace singleton

template <size_t N>
struct std::hash<singleton::common::Blob<N>> {
  size_t operator()(const singleton::common::Blob<N> &blob) const {
    return boost::hash_range(blob.begin(), blob.end());
  }
};

template <size_t N>
struct fmt::formatter<singleton::common::Blob<N>>
    : singleton::common::BytesFormatter {
  template <typename FormatContext>
  auto format(const singleton::common::Blob<N> &blob, FormatContext &ctx) const
      -> decltype(ctx.out()) {
    return BytesFormatter::format(blob.view(), ctx);
  }
};

OUTCOME_HPP_DECLARE_ERROR(singleton::common, BlobError);
