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
#include <iosfwd>
#include <memory>
#include <span>

#include <squish/types.h>
#include <squish/writer/archive_writer_options.h>

namespace squish {

class logger;
class progress_sink;

namespace writer {

/**
 * Writes a deduplicated archive to a seekable output stream
 *
 * Construction writes the header, the creation timestamp and a placeholder
 * for the chunk count. `pack()` then chunks all files in parallel, waits
 * for the chunk table to be written, patches the chunk count and appends
 * the file table. An archive_writer can only pack once; after a failure the
 * output is left truncated and unusable.
 */
class archive_writer {
 public:
  archive_writer(logger& lgr, std::ostream& os,
                 archive_writer_options const& options = {});

  /**
   * Pack `files`, all of which must be below `root`
   *
   * \param prog    Optional progress sink, advanced once per file.
   *
   * \returns The number of bytes written to the stream.
   */
  file_size_t pack(std::filesystem::path const& root,
                   std::span<std::filesystem::path const> files,
                   progress_sink* prog = nullptr) {
    return impl_->pack(root, files, prog);
  }

  /**
   * Number of unique chunks seen so far
   */
  size_t unique_chunks() const { return impl_->unique_chunks(); }

  class impl {
   public:
    virtual ~impl() = default;

    virtual file_size_t pack(std::filesystem::path const& root,
                             std::span<std::filesystem::path const> files,
                             progress_sink* prog) = 0;
    virtual size_t unique_chunks() const = 0;
  };

 private:
  std::unique_ptr<impl> impl_;
};

/**
 * Pack `files` below `root` into a new archive at `output`
 *
 * \returns The size of the archive file.
 */
file_size_t pack(logger& lgr, std::filesystem::path const& root,
                 std::filesystem::path const& output,
                 std::span<std::filesystem::path const> files,
                 archive_writer_options const& options = {},
                 progress_sink* prog = nullptr);

} // namespace writer
} // namespace squish
