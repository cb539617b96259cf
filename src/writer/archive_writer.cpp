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

#include <atomic>
#include <exception>
#include <fstream>
#include <future>
#include <limits>
#include <mutex>
#include <optional>
#include <vector>

#include <fmt/format.h>

#include <squish/archive_format.h>
#include <squish/error.h>
#include <squish/file_entry.h>
#include <squish/logger.h>
#include <squish/progress_sink.h>
#include <squish/thread_pool.h>
#include <squish/util.h>
#include <squish/zstd_codec.h>

#include <squish/writer/archive_writer.h>
#include <squish/writer/chunk_store.h>
#include <squish/writer/internal/chunk_splitter.h>
#include <squish/writer/internal/chunk_writer.h>

namespace squish::writer {

namespace fs = std::filesystem;

namespace {

void write_file_table(std::ostream& os, std::vector<file_entry> const& files) {
  if (files.size() > std::numeric_limits<uint32_t>::max()) {
    SQUISH_THROW(archive_error, archive_errc::invalid_format,
                 fmt::format("too many files: {}", files.size()));
  }

  write_u32(os, static_cast<uint32_t>(files.size()));

  for (auto const& fe : files) {
    if (fe.path.size() > std::numeric_limits<uint32_t>::max() ||
        fe.chunks.size() > std::numeric_limits<uint32_t>::max()) {
      SQUISH_THROW(archive_error, archive_errc::invalid_format,
                   fmt::format("file too large for archive: {}", fe.path));
    }

    write_u32(os, static_cast<uint32_t>(fe.path.size()));
    write_bytes(os, fe.path);
    write_u64(os, fe.size);
    write_u32(os, static_cast<uint32_t>(fe.chunks.size()));

    for (auto const& digest : fe.chunks) {
      write_bytes(os, std::span<uint8_t const>{digest.data(), digest.size()});
    }
  }
}

template <typename LoggerPolicy>
class archive_writer_ final : public archive_writer::impl {
 public:
  archive_writer_(logger& lgr, std::ostream& os,
                  archive_writer_options const& options)
      : LOG_PROXY_INIT(lgr)
      , lgr_{lgr}
      , os_{os}
      , options_{options}
      , codec_{archive_writer_options::kCompressionLevel}
      , store_{codec_} {
    write_header(os_);
    write_timestamp(os_, current_timestamp());
    chunk_count_offset_ = write_placeholder_u64(os_);
  }

  file_size_t pack(fs::path const& root, std::span<fs::path const> files,
                   progress_sink* prog) override;

  size_t unique_chunks() const override { return store_.size(); }

 private:
  size_t num_workers() const {
    return options_.num_workers > 0 ? options_.num_workers
                                    : hardware_concurrency();
  }

  LOG_PROXY_DECL(LoggerPolicy);
  logger& lgr_;
  std::ostream& os_;
  archive_writer_options const options_;
  zstd_codec const codec_;
  chunk_store store_;
  file_off_t chunk_count_offset_{0};
  bool used_{false};
};

template <typename LoggerPolicy>
file_size_t
archive_writer_<LoggerPolicy>::pack(fs::path const& root,
                                    std::span<fs::path const> files,
                                    progress_sink* prog) {
  if (used_) {
    SQUISH_THROW(runtime_error, "archive writer can only be used once");
  }

  used_ = true;

  auto ti = LOG_CPU_TIMED_INFO;

  LOG_VERBOSE << "packing " << files.size() << " file(s) using "
              << num_workers() << " worker(s), " << codec_.describe();

  if (prog) {
    prog->set_length(files.size());
  }

  internal::chunk_writer cw(lgr_, os_);
  internal::chunk_splitter splitter(lgr_, store_, cw, options_.chunk_size);

  std::vector<file_entry> entries;
  std::mutex error_mx;
  std::exception_ptr first_error;

  {
    std::atomic<bool> failed{false};
    thread_pool pool(lgr_, "packer", num_workers());
    std::vector<std::future<std::optional<file_entry>>> futures;

    futures.reserve(files.size());

    for (auto const& path : files) {
      futures.push_back(pool.submit([&, path]() -> std::optional<file_entry> {
        if (failed.load()) {
          LOG_DEBUG << "skipping " << path << " after earlier failure";
          return std::nullopt;
        }

        try {
          auto fe = splitter.process_file(path, root);
          if (prog) {
            prog->inc(1);
          }
          return fe;
        } catch (std::exception const& e) {
          LOG_ERROR << "failed to pack " << path << ": " << exception_str(e);
          std::lock_guard lock(error_mx);
          if (!first_error) {
            first_error = std::current_exception();
          }
          failed = true;
          throw;
        }
      }));
    }

    entries.reserve(files.size());

    for (auto& f : futures) {
      try {
        if (auto fe = f.get()) {
          entries.push_back(std::move(*fe));
        }
      } catch (std::exception const& e) {
        // already recorded by the worker
        LOG_DEBUG << "worker failed: " << exception_str(e);
      }
    }

    pool.wait();
  }

  // the writer's own error wins, it is the more fundamental one
  cw.finish();

  if (first_error) {
    std::rethrow_exception(first_error);
  }

  SQUISH_CHECK(cw.records_written() == store_.size(),
               "chunk table does not match chunk store");

  patch_u64(os_, chunk_count_offset_, store_.size());
  write_file_table(os_, entries);

  os_.flush();

  if (!os_) {
    SQUISH_THROW(archive_error, archive_errc::io_error,
                 "failed to flush archive");
  }

  auto const size = static_cast<file_size_t>(os_.tellp());

  if (prog) {
    prog->finish();
  }

  ti << "packed " << entries.size() << " file(s) into " << store_.size()
     << " unique chunk(s), " << size_with_unit(size);

  return size;
}

} // namespace

archive_writer::archive_writer(logger& lgr, std::ostream& os,
                               archive_writer_options const& options)
    : impl_{make_unique_logging_object<impl, archive_writer_, logger_policies>(
          lgr, os, options)} {}

file_size_t
pack(logger& lgr, fs::path const& root, fs::path const& output,
     std::span<fs::path const> files, archive_writer_options const& options,
     progress_sink* prog) {
  std::ofstream ofs(output, std::ios::binary | std::ios::trunc);

  if (!ofs) {
    SQUISH_THROW(system_error,
                 fmt::format("cannot create {}", output.string()));
  }

  archive_writer aw(lgr, ofs, options);
  aw.pack(root, files, prog);

  ofs.close();

  if (!ofs) {
    SQUISH_THROW(archive_error, archive_errc::io_error,
                 fmt::format("error closing {}", output.string()));
  }

  return fs::file_size(output);
}

} // namespace squish::writer
