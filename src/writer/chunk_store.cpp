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

#include <functional>
#include <mutex>

#include <parallel_hashmap/phmap.h>

#include <squish/writer/chunk_store.h>

namespace squish::writer {

// 16 submaps, each guarded by its own mutex
class chunk_store::digest_set
    : public phmap::parallel_flat_hash_set<
          chunk_digest, chunk_digest_hash, std::equal_to<chunk_digest>,
          std::allocator<chunk_digest>, 4, std::mutex> {};

chunk_store::chunk_store(zstd_codec const& codec)
    : codec_{codec}
    , set_{std::make_unique<digest_set>()} {}

chunk_store::~chunk_store() = default;

bool chunk_store::insert_if_absent(chunk_digest const& digest) {
  // insert() holds the submap lock for the whole lookup-and-insert
  return set_->insert(digest).second;
}

chunk_store::insert_result
chunk_store::insert(std::span<uint8_t const> data) {
  insert_result res{.digest = chunk_hasher::hash(data), .compressed = {}};

  if (insert_if_absent(res.digest)) {
    res.compressed = codec_.compress(data);
  }

  return res;
}

size_t chunk_store::size() const { return set_->size(); }

} // namespace squish::writer
