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

#include <zstd.h>

#include <fmt/format.h>

#include <squish/error.h>
#include <squish/zstd_codec.h>

namespace squish {

zstd_codec::zstd_codec(int level)
    : level_{level} {
  if (level_ < ZSTD_minCLevel() || level_ > ZSTD_maxCLevel()) {
    SQUISH_THROW(runtime_error,
                 fmt::format("invalid zstd compression level: {}", level_));
  }
}

byte_buffer zstd_codec::compress(std::span<uint8_t const> data) const {
  byte_buffer compressed(ZSTD_compressBound(data.size()));
  auto size = ZSTD_compress(compressed.data(), compressed.size(), data.data(),
                            data.size(), level_);
  if (ZSTD_isError(size)) {
    SQUISH_THROW(runtime_error,
                 fmt::format("ZSTD: {}", ZSTD_getErrorName(size)));
  }
  compressed.resize(size);
  compressed.shrink_to_fit();
  return compressed;
}

byte_buffer
zstd_codec::decompress(std::span<uint8_t const> data, size_t max_size) {
  auto const content_size = ZSTD_getFrameContentSize(data.data(), data.size());

  switch (content_size) {
  case ZSTD_CONTENTSIZE_UNKNOWN:
    SQUISH_THROW(archive_error, archive_errc::corrupt_data,
                 "ZSTD content size unknown");

  case ZSTD_CONTENTSIZE_ERROR:
    SQUISH_THROW(archive_error, archive_errc::corrupt_data,
                 "ZSTD content size error");

  default:
    break;
  }

  if (content_size > max_size) {
    SQUISH_THROW(archive_error, archive_errc::corrupt_data,
                 fmt::format("decompressed size {} exceeds limit of {} bytes",
                             content_size, max_size));
  }

  byte_buffer decompressed(content_size);
  auto size = ZSTD_decompress(decompressed.data(), decompressed.size(),
                              data.data(), data.size());

  if (ZSTD_isError(size)) {
    SQUISH_THROW(archive_error, archive_errc::corrupt_data,
                 fmt::format("ZSTD: {}", ZSTD_getErrorName(size)));
  }

  if (size != content_size) {
    SQUISH_THROW(archive_error, archive_errc::corrupt_data,
                 fmt::format("ZSTD: expected {} bytes, got {}", content_size,
                             size));
  }

  return decompressed;
}

std::string zstd_codec::describe() const {
  return fmt::format("zstd [level={}]", level_);
}

} // namespace squish
