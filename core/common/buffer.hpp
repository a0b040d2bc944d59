/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <array>
#include <string_view>
#include <vector>

#include <fmt/format.h>
#include <scale/scale.hpp>

#include "common/buffer_view.hpp"

namespace singleton::common {

  /**
   * Owned bytes of arbitrary length: encoded messages, digest payloads,
   * extrinsics. Encodes as a length-prefixed byte sequence.
   */
  class Buffer : public std::vector<uint8_t> {
   public:
    using Base = std::vector<uint8_t>;

    Buffer() = default;
    explicit Buffer(const Base &bytes) : Base(bytes) {}
    Buffer(Base &&bytes) : Base(std::move(bytes)) {}
    Buffer(const BufferView &view) : Base(view.begin(), view.end()) {}

    template <size_t N>
    explicit Buffer(const std::array<uint8_t, N> &bytes)
        : Base(bytes.begin(), bytes.end()) {}

    using Base::Base;
    using Base::operator=;

    /// Appends raw characters, no unhexing is done
    Buffer &put(std::string_view chars) {
      insert(end(), chars.begin(), chars.end());
      return *this;
    }

    Buffer &put(const BufferView &bytes) {
      insert(end(), bytes.begin(), bytes.end());
      return *this;
    }

    BufferView view() const {
      return *this;
    }

    static Buffer fromString(std::string_view chars) {
      return Buffer{}.put(chars);
    }

    friend ::scale::ScaleEncoderStream &operator<<(
        ::scale::ScaleEncoderStream &s, const Buffer &buffer) {
      return s << static_cast<const Base &>(buffer);
    }

    friend ::scale::ScaleDecoderStream &operator>>(
        ::scale::ScaleDecoderStream &s, Buffer &buffer) {
      return s >> static_cast<Base &>(buffer);
    }
  };

  inline std::ostream &operator<<(std::ostream &os, const Buffer &buffer) {
    return os << buffer.view();
  }

  namespace literals {
    /// Bytes of the characters as written, "\x01"_buf is a single byte 1
    inline Buffer operator""_buf(const char *c, size_t s) {
      return Buffer::fromString(std::string_view{c, s});
    }
  }  // namespace literals

}  // namespace singleton::common

template <>
struct fmt::formatter<singleton::common::Buffer>
    : fmt::formatter<singleton::common::BufferView> {};
