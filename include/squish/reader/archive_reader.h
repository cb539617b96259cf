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

#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

#include <squish/file_entry.h>
#include <squish/types.h>
#include <squish/reader/archive_reader_options.h>
#include <squish/reader/archive_summary.h>

namespace squish {

class logger;
class progress_sink;

namespace reader {

/**
 * Reads an archive from a seekable input stream
 *
 * The constructor validates the header and indexes the chunk table by
 * seeking past every compressed payload, so opening an archive never
 * decompresses anything. Listing only touches the file table.
 *
 * Not thread-safe; all methods reposition the underlying stream.
 */
class archive_reader {
 public:
  archive_reader(logger& lgr, std::istream& is,
                 archive_reader_options const& options = {});

  std::string const& version() const { return impl_->version(); }
  uint64_t creation_time() const { return impl_->creation_time(); }
  uint64_t unique_chunks() const { return impl_->unique_chunks(); }
  uint32_t file_count() const { return impl_->file_count(); }
  file_size_t archive_size() const { return impl_->archive_size(); }

  /**
   * Summarize the archive without decompressing any chunk
   */
  archive_summary summary() { return impl_->summary(); }

  /**
   * Read the complete file table, including chunk digests
   */
  std::vector<file_entry> read_file_table() {
    return impl_->read_file_table();
  }

  /**
   * Reconstruct all files below `output_root`
   *
   * Missing parent directories are created, existing files overwritten.
   * Every failing file is logged; the first failure is rethrown once all
   * files have been processed.
   */
  void unpack(std::filesystem::path const& output_root,
              progress_sink* prog = nullptr) {
    impl_->unpack(output_root, prog);
  }

  class impl {
   public:
    virtual ~impl() = default;

    virtual std::string const& version() const = 0;
    virtual uint64_t creation_time() const = 0;
    virtual uint64_t unique_chunks() const = 0;
    virtual uint32_t file_count() const = 0;
    virtual file_size_t archive_size() const = 0;
    virtual archive_summary summary() = 0;
    virtual std::vector<file_entry> read_file_table() = 0;
    virtual void unpack(std::filesystem::path const& output_root,
                        progress_sink* prog) = 0;
  };

 private:
  std::unique_ptr<impl> impl_;
};

archive_summary list(logger& lgr, std::filesystem::path const& archive);

void unpack(logger& lgr, std::filesystem::path const& archive,
            std::filesystem::path const& output_root,
            archive_reader_options const& options = {},
            progress_sink* prog = nullptr);

/**
 * Turn a file table path into a path below `output_root`
 *
 * Throws `illegal_utf8` for malformed paths and `path_escapes_root` for
 * absolute paths or paths with ".." components.
 */
std::filesystem::path
output_path_for(std::filesystem::path const& output_root,
                std::string const& archive_path);

} // namespace reader
} // namespace squish
