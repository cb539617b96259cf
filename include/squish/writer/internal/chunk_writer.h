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
#include <iosfwd>
#include <memory>
#include <utility>

#include <squish/chunk_hasher.h>
#include <squish/zstd_codec.h>

namespace squish {

class logger;

namespace writer::internal {

struct chunk_record {
  chunk_digest digest;
  uint64_t original_size{0};
  byte_buffer compressed;
};

/**
 * Single consumer end of the chunk pipeline
 *
 * Any number of producers can `enqueue()` records. A dedicated writer
 * thread owns the output stream and writes the records in the order they
 * are received, so records are never interleaved. The queue is unbounded.
 *
 * `finish()` closes the queue, waits for the writer thread to drain it and
 * rethrows the first error the writer thread encountered. The stream must
 * not be touched by anyone else before `finish()` returns.
 */
class chunk_writer {
 public:
  chunk_writer(logger& lgr, std::ostream& os);

  void enqueue(chunk_record&& rec) { impl_->enqueue(std::move(rec)); }

  void finish() { impl_->finish(); }

  size_t records_written() const { return impl_->records_written(); }
  uint64_t bytes_written() const { return impl_->bytes_written(); }

  class impl {
   public:
    virtual ~impl() = default;

    virtual void enqueue(chunk_record&& rec) = 0;
    virtual void finish() = 0;
    virtual size_t records_written() const = 0;
    virtual uint64_t bytes_written() const = 0;
  };

 private:
  std::unique_ptr<impl> impl_;
};

} // namespace writer::internal
} // namespace squish
