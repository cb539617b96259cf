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

#include <cerrno>
#include <fstream>
#include <span>
#include <vector>

#include <fmt/format.h>

#include <squish/error.h>
#include <squish/logger.h>
#include <squish/util.h>

#include <squish/writer/chunk_store.h>
#include <squish/writer/internal/chunk_splitter.h>
#include <squish/writer/internal/chunk_writer.h>

namespace squish::writer::internal {

namespace fs = std::filesystem;

namespace {

template <typename LoggerPolicy>
class chunk_splitter_ final : public chunk_splitter::impl {
 public:
  chunk_splitter_(logger& lgr, chunk_store& store, chunk_writer& writer,
                  size_t chunk_size)
      : LOG_PROXY_INIT(lgr)
      , store_{store}
      , writer_{writer}
      , chunk_size_{chunk_size} {
    if (chunk_size_ == 0) {
      SQUISH_THROW(runtime_error, "chunk size must not be zero");
    }
  }

  file_entry process_file(fs::path const& path,
                          fs::path const& root) const override {
    file_entry entry;
    entry.path = relative_archive_path(path, root);

    std::ifstream ifs(path, std::ios::binary);

    if (!ifs) {
      SQUISH_THROW(system_error, fmt::format("cannot open {}", path.string()));
    }

    std::vector<uint8_t> buf(chunk_size_);

    for (;;) {
      ifs.read(reinterpret_cast<char*>(buf.data()), buf.size());

      if (ifs.bad()) {
        SQUISH_THROW(archive_error, archive_errc::io_error,
                     fmt::format("error reading {}", path.string()));
      }

      auto const count = static_cast<size_t>(ifs.gcount());

      if (count == 0) {
        break;
      }

      std::span<uint8_t const> chunk{buf.data(), count};
      auto res = store_.insert(chunk);

      if (res.compressed) {
        LOG_TRACE << entry.path << ": new chunk " << res.digest.hex() << " @ "
                  << entry.size << " [" << count << " -> "
                  << res.compressed->size() << "]";
        writer_.enqueue(chunk_record{.digest = res.digest,
                                     .original_size = count,
                                     .compressed =
                                         std::move(res.compressed).value()});
      } else {
        LOG_TRACE << entry.path << ": duplicate chunk " << res.digest.hex()
                  << " @ " << entry.size;
      }

      entry.chunks.push_back(res.digest);
      entry.size += count;

      if (count < buf.size()) {
        break;
      }
    }

    LOG_DEBUG << entry.path << ": " << entry.size << " bytes in "
              << entry.chunks.size() << " chunk(s)";

    return entry;
  }

 private:
  LOG_PROXY_DECL(LoggerPolicy);
  chunk_store& store_;
  chunk_writer& writer_;
  size_t const chunk_size_;
};

} // namespace

std::string
relative_archive_path(fs::path const& path, fs::path const& root) {
  auto base = root.lexically_normal();

  if (!base.has_filename() && base.has_relative_path()) {
    // "dir/" would otherwise not be a prefix of "dir/file"
    base = base.parent_path();
  }

  auto const rel = path.lexically_normal().lexically_relative(base);

  if (rel.empty() || rel == "." || *rel.begin() == "..") {
    SQUISH_THROW(archive_error, archive_errc::path_escapes_root,
                 fmt::format("{} is not below {}", path.string(),
                             root.string()));
  }

  auto str = path_to_utf8_string(rel);

  if (!is_valid_utf8(str)) {
    SQUISH_THROW(archive_error, archive_errc::illegal_utf8,
                 fmt::format("path is not valid UTF-8: {}", path.string()));
  }

  return str;
}

chunk_splitter::chunk_splitter(logger& lgr, chunk_store& store,
                               chunk_writer& writer, size_t chunk_size)
    : impl_{make_unique_logging_object<impl, chunk_splitter_, logger_policies>(
          lgr, store, writer, chunk_size)} {}

} // namespace squish::writer::internal
