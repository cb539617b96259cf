/* vim:set ts=2 sw=2 sts=2 et: */
/**
 * \author     Marcus Holland-Moritz (github@mhxnet.de)
 * \copyright  Copyright (c) Marcus Holland-Moritz
 *
 * This file is part of squish.
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the “Software”), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED “AS IS”, WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 *
 * SPDX-License-Identifier: MIT
 */

#pragma once

#include <bit>
#include <concepts>
#include <cstdint>

namespace squish {

/**
 * Unsigned integer stored in little-endian byte order
 *
 * Objects of this type can be written to and read from the archive
 * byte-for-byte, regardless of the host byte order.
 */
template <std::unsigned_integral T>
class little_endian {
 public:
  static_assert(std::endian::native == std::endian::little ||
                std::endian::native == std::endian::big);

  constexpr little_endian() = default;
  constexpr explicit little_endian(T v) noexcept
      : raw_{swap(v)} {}

  constexpr operator T() const noexcept { return swap(raw_); }

  constexpr T load() const noexcept { return swap(raw_); }

  constexpr little_endian& operator=(T v) noexcept {
    raw_ = swap(v);
    return *this;
  }

 private:
  T raw_{};

  static constexpr T swap(T value) noexcept {
    if constexpr (std::endian::native == std::endian::little ||
                  sizeof(T) == 1) {
      return value;
    } else if constexpr (sizeof(T) == 2) {
      return __builtin_bswap16(value);
    } else if constexpr (sizeof(T) == 4) {
      return __builtin_bswap32(value);
    } else {
      static_assert(sizeof(T) == 8);
      return __builtin_bswap64(value);
    }
  }
};

using uint32le_t = little_endian<uint32_t>;
using uint64le_t = little_endian<uint64_t>;

static_assert(sizeof(uint32le_t) == 4);
static_assert(sizeof(uint64le_t) == 8);

} // namespace squish
