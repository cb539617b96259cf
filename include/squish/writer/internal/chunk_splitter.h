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
#include <filesystem>
#include <memory>

#include <squish/archive_format.h>
#include <squish/file_entry.h>

namespace squish {

class logger;

namespace writer {

class chunk_store;

namespace internal {

class chunk_writer;

/**
 * Splits a file into fixed-size chunks
 *
 * Every chunk is offered to the chunk store; chunks seen for the first time
 * are handed to the chunk writer together with their compressed payload.
 * Safe to use from multiple threads at once.
 */
class chunk_splitter {
 public:
  chunk_splitter(logger& lgr, chunk_store& store, chunk_writer& writer,
                 size_t chunk_size = kChunkSize);

  /**
   * Chunk the file at `path`
   *
   * The returned entry's path is relative to `root`. Throws an archive_error
   * with `path_escapes_root` if `path` is not below `root`.
   */
  file_entry process_file(std::filesystem::path const& path,
                          std::filesystem::path const& root) const {
    return impl_->process_file(path, root);
  }

  class impl {
   public:
    virtual ~impl() = default;

    virtual file_entry
    process_file(std::filesystem::path const& path,
                 std::filesystem::path const& root) const = 0;
  };

 private:
  std::unique_ptr<impl> impl_;
};

/**
 * Path of `path` relative to `root` as stored in the file table
 */
std::string relative_archive_path(std::filesystem::path const& path,
                                  std::filesystem::path const& root);

} // namespace internal
} // namespace writer
} // namespace squish
