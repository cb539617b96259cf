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
#include <memory>
#include <optional>
#include <span>

#include <squish/chunk_hasher.h>
#include <squish/zstd_codec.h>

namespace squish::writer {

/**
 * Concurrent set of chunk digests
 *
 * Decides which caller "owns" a chunk: for every digest, exactly one
 * `insert()` across all threads observes first sight and gets the
 * compressed payload, every other call gets `std::nullopt`.
 */
class chunk_store {
 public:
  struct insert_result {
    chunk_digest digest;
    std::optional<byte_buffer> compressed;
  };

  explicit chunk_store(zstd_codec const& codec);
  ~chunk_store();

  chunk_store(chunk_store const&) = delete;
  chunk_store& operator=(chunk_store const&) = delete;

  /**
   * Hash `data` and, if the digest is new, compress it
   *
   * The membership test-and-set happens before compression, so duplicate
   * chunks are never compressed.
   */
  insert_result insert(std::span<uint8_t const> data);

  /**
   * Atomically add `digest` to the set
   *
   * \returns true if this call added the digest.
   */
  bool insert_if_absent(chunk_digest const& digest);

  /**
   * Number of unique digests
   */
  size_t size() const;

 private:
  class digest_set;

  zstd_codec const& codec_;
  std::unique_ptr<digest_set> set_;
};

} // namespace squish::writer
