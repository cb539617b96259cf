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

#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <string>

namespace squish {

/**
 * Content digest of a chunk
 *
 * This is used purely as a deduplication key. Two chunks with the same
 * digest are considered identical.
 */
class chunk_digest {
 public:
  static constexpr size_t kSize{16};

  using value_type = std::array<uint8_t, kSize>;

  constexpr chunk_digest() = default;
  explicit constexpr chunk_digest(value_type const& v)
      : value_{v} {}

  static chunk_digest from_bytes(std::span<uint8_t const, kSize> bytes) {
    chunk_digest d;
    std::memcpy(d.value_.data(), bytes.data(), kSize);
    return d;
  }

  uint8_t const* data() const { return value_.data(); }
  uint8_t* data() { return value_.data(); }
  static constexpr size_t size() { return kSize; }

  value_type const& value() const { return value_; }

  std::string hex() const;

  friend auto operator<=>(chunk_digest const&, chunk_digest const&) = default;

 private:
  value_type value_{};
};

struct chunk_digest_hash {
  size_t operator()(chunk_digest const& d) const noexcept {
    // the digest is uniformly distributed already
    size_t h;
    std::memcpy(&h, d.data(), sizeof(h));
    return h;
  }
};

/**
 * Computes chunk digests using XXH3-128
 *
 * This is not a cryptographic hash, it is chosen for throughput. The result
 * is stored in canonical (big-endian) form and thus independent of the host
 * and the process.
 */
class chunk_hasher {
 public:
  static chunk_digest hash(std::span<uint8_t const> data);
  static chunk_digest hash(void const* data, size_t size);
};

} // namespace squish
