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

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace squish {

using byte_buffer = std::vector<uint8_t>;

/**
 * Stateless zstd block codec
 *
 * All methods are safe to call concurrently.
 */
class zstd_codec {
 public:
  static constexpr int kDefaultLevel{15};

  explicit zstd_codec(int level = kDefaultLevel);

  int level() const { return level_; }

  byte_buffer compress(std::span<uint8_t const> data) const;

  /**
   * Decompress a single zstd frame
   *
   * Throws an archive_error with `archive_errc::corrupt_data` if the frame is
   * malformed or if its decompressed size would exceed `max_size`.
   */
  static byte_buffer decompress(std::span<uint8_t const> data, size_t max_size);

  std::string describe() const;

 private:
  int const level_;
};

} // namespace squish
