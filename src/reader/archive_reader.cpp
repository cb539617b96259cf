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

#include <exception>
#include <fstream>
#include <future>
#include <istream>
#include <span>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include <folly/ScopeGuard.h>

#include <parallel_hashmap/phmap.h>

#include <squish/archive_format.h>
#include <squish/chunk_hasher.h>
#include <squish/error.h>
#include <squish/logger.h>
#include <squish/progress_sink.h>
#include <squish/thread_pool.h>
#include <squish/util.h>
#include <squish/zstd_codec.h>

#include <squish/reader/archive_reader.h>

namespace squish::reader {

namespace fs = std::filesystem;

namespace {

// digest + original_len + compressed_len
constexpr size_t kMinChunkRecordSize{chunk_digest::kSize + 2 * sizeof(uint64_t)};

using chunk_map =
    phmap::flat_hash_map<chunk_digest, byte_buffer, chunk_digest_hash>;

template <typename LoggerPolicy>
class archive_reader_ final : public archive_reader::impl {
 public:
  archive_reader_(logger& lgr, std::istream& is,
                  archive_reader_options const& options);

  std::string const& version() const override { return version_; }
  uint64_t creation_time() const override { return creation_time_; }
  uint64_t unique_chunks() const override { return unique_chunks_; }
  uint32_t file_count() const override { return file_count_; }
  file_size_t archive_size() const override { return archive_size_; }

  archive_summary summary() override;
  std::vector<file_entry> read_file_table() override;
  void unpack(fs::path const& output_root, progress_sink* prog) override;

 private:
  size_t num_workers() const {
    return options_.num_workers > 0 ? options_.num_workers
                                    : hardware_concurrency();
  }

  void seek(file_off_t offset);
  void check_remaining(uint64_t size, std::string_view what);
  void index_chunk_table();
  file_entry read_file_entry(bool with_digests);
  chunk_map decompress_chunks(thread_pool& pool, progress_sink* prog);

  LOG_PROXY_DECL(LoggerPolicy);
  logger& lgr_;
  std::istream& is_;
  archive_reader_options const options_;
  file_size_t archive_size_{0};
  std::string version_;
  uint64_t creation_time_{0};
  uint64_t unique_chunks_{0};
  uint32_t file_count_{0};
  file_off_t chunk_table_offset_{0};
  file_off_t file_table_offset_{0};
};

template <typename LoggerPolicy>
archive_reader_<LoggerPolicy>::archive_reader_(
    logger& lgr, std::istream& is, archive_reader_options const& options)
    : LOG_PROXY_INIT(lgr)
    , lgr_{lgr}
    , is_{is}
    , options_{options} {
  is_.seekg(0, std::ios::end);
  archive_size_ = static_cast<file_size_t>(stream_offset(is_));
  seek(0);

  version_ = verify_header(is_);
  creation_time_ = read_u64(is_);
  unique_chunks_ = read_u64(is_);
  chunk_table_offset_ = stream_offset(is_);

  index_chunk_table();

  file_table_offset_ = stream_offset(is_);
  file_count_ = read_u32(is_);

  LOG_DEBUG << "archive version " << version_ << ", created "
            << format_creation_date(creation_time_) << ", " << unique_chunks_
            << " chunk(s) @ " << chunk_table_offset_ << ", " << file_count_
            << " file(s) @ " << file_table_offset_ << ", "
            << size_with_unit(archive_size_);
}

template <typename LoggerPolicy>
void archive_reader_<LoggerPolicy>::seek(file_off_t offset) {
  is_.clear();
  is_.seekg(offset, std::ios::beg);

  if (!is_) {
    SQUISH_THROW(archive_error, archive_errc::io_error,
                 fmt::format("failed to seek to offset {}", offset));
  }
}

template <typename LoggerPolicy>
void archive_reader_<LoggerPolicy>::check_remaining(uint64_t size,
                                                    std::string_view what) {
  auto const offset = static_cast<file_size_t>(stream_offset(is_));

  if (offset > archive_size_ || size > archive_size_ - offset) {
    SQUISH_THROW(archive_error, archive_errc::corrupt_data,
                 fmt::format("truncated archive: {} needs {} bytes at offset "
                             "{}, archive size is {}",
                             what, size, offset, archive_size_));
  }
}

template <typename LoggerPolicy>
void archive_reader_<LoggerPolicy>::index_chunk_table() {
  auto ti = LOG_TIMED_DEBUG;

  // cheap sanity check before looping over a bogus count
  auto const offset = static_cast<file_size_t>(stream_offset(is_));
  if (offset > archive_size_ ||
      unique_chunks_ > (archive_size_ - offset) / kMinChunkRecordSize) {
    SQUISH_THROW(archive_error, archive_errc::corrupt_data,
                 fmt::format("chunk count {} exceeds archive size {}",
                             unique_chunks_, archive_size_));
  }

  file_size_t compressed_total{0};

  for (uint64_t i = 0; i < unique_chunks_; ++i) {
    skip_bytes(is_, chunk_digest::kSize);
    read_u64(is_); // original_len
    auto const compressed_len = read_u64(is_);
    check_remaining(compressed_len, "chunk payload");
    skip_bytes(is_, compressed_len);
    compressed_total += compressed_len;
  }

  ti << "indexed " << unique_chunks_ << " chunk(s), "
     << size_with_unit(compressed_total) << " compressed";
}

template <typename LoggerPolicy>
file_entry archive_reader_<LoggerPolicy>::read_file_entry(bool with_digests) {
  file_entry fe;

  auto const path_len = read_u32(is_);
  check_remaining(path_len, "path");
  fe.path = read_string(is_, path_len);

  if (!is_valid_utf8(fe.path)) {
    SQUISH_THROW(archive_error, archive_errc::illegal_utf8,
                 "file table contains a path that is not valid UTF-8");
  }

  fe.size = read_u64(is_);

  auto const chunk_count = read_u32(is_);
  auto const digest_bytes =
      static_cast<uint64_t>(chunk_count) * chunk_digest::kSize;
  check_remaining(digest_bytes, "digest list");

  if (with_digests) {
    fe.chunks.resize(chunk_count);
    for (auto& d : fe.chunks) {
      read_bytes(is_, std::span<uint8_t>{d.data(), d.size()});
    }
  } else {
    skip_bytes(is_, digest_bytes);
  }

  return fe;
}

template <typename LoggerPolicy>
archive_summary archive_reader_<LoggerPolicy>::summary() {
  archive_summary s;

  s.version = version_;
  s.creation_time = creation_time_;
  s.creation_date = format_creation_date(creation_time_);
  s.unique_chunks = unique_chunks_;
  s.archive_size = archive_size_;

  seek(file_table_offset_ + sizeof(uint32_t));

  s.files.reserve(file_count_);

  for (uint32_t i = 0; i < file_count_; ++i) {
    auto fe = read_file_entry(false);
    s.total_original_size += fe.size;
    s.files.push_back(file_info{std::move(fe.path), fe.size});
  }

  s.reduction_percentage =
      reduction_percentage(s.archive_size, s.total_original_size);

  return s;
}

template <typename LoggerPolicy>
std::vector<file_entry> archive_reader_<LoggerPolicy>::read_file_table() {
  std::vector<file_entry> files;

  seek(file_table_offset_ + sizeof(uint32_t));

  files.reserve(file_count_);

  for (uint32_t i = 0; i < file_count_; ++i) {
    files.push_back(read_file_entry(true));
  }

  return files;
}

template <typename LoggerPolicy>
chunk_map
archive_reader_<LoggerPolicy>::decompress_chunks(thread_pool& pool,
                                                 progress_sink* prog) {
  auto ti = LOG_CPU_TIMED_VERBOSE;
  auto const max_size = options_.max_chunk_size;

  std::vector<std::future<std::pair<chunk_digest, byte_buffer>>> futures;
  futures.reserve(unique_chunks_);

  seek(chunk_table_offset_);

  for (uint64_t i = 0; i < unique_chunks_; ++i) {
    chunk_digest digest;
    read_bytes(is_, std::span<uint8_t>{digest.data(), digest.size()});
    auto const original_len = read_u64(is_);
    auto const compressed_len = read_u64(is_);

    if (original_len > max_size) {
      SQUISH_THROW(archive_error, archive_errc::corrupt_data,
                   fmt::format("chunk {} is too large: {} > {}", digest.hex(),
                               original_len, max_size));
    }

    check_remaining(compressed_len, "chunk payload");

    byte_buffer compressed(compressed_len);
    read_bytes(is_, compressed);

    futures.push_back(pool.submit(
        [digest, original_len, max_size, prog,
         compressed = std::move(compressed)] {
          auto data = zstd_codec::decompress(compressed, max_size);

          if (data.size() != original_len) {
            SQUISH_THROW(archive_error, archive_errc::corrupt_data,
                         fmt::format("chunk {}: expected {} bytes, got {}",
                                     digest.hex(), original_len,
                                     data.size()));
          }

          if (prog) {
            prog->inc(1);
          }

          return std::make_pair(digest, std::move(data));
        }));
  }

  chunk_map chunks;
  std::exception_ptr first_error;

  chunks.reserve(unique_chunks_);

  for (auto& f : futures) {
    try {
      auto [digest, data] = f.get();
      if (!chunks.emplace(digest, std::move(data)).second) {
        LOG_WARN << "duplicate chunk " << digest.hex() << " in chunk table";
      }
    } catch (std::exception const& e) {
      LOG_ERROR << exception_str(e);
      if (!first_error) {
        first_error = std::current_exception();
      }
    }
  }

  if (first_error) {
    std::rethrow_exception(first_error);
  }

  ti << "decompressed " << chunks.size() << " chunk(s)";

  return chunks;
}

template <typename LoggerPolicy>
void archive_reader_<LoggerPolicy>::unpack(fs::path const& output_root,
                                           progress_sink* prog) {
  auto ti = LOG_TIMED_INFO;

  if (prog) {
    prog->set_length(unique_chunks_ + file_count_);
  }

  thread_pool pool(lgr_, "unpacker", num_workers());

  auto const chunks = decompress_chunks(pool, prog);
  auto const files = read_file_table();

  // queued jobs reference `chunks` and `files`
  SCOPE_EXIT { pool.stop(); };

  std::vector<std::future<void>> futures;
  futures.reserve(files.size());

  for (auto const& fe : files) {
    futures.push_back(pool.submit([this, &fe, &chunks, &output_root, prog] {
      auto const out = output_path_for(output_root, fe.path);

      std::vector<byte_buffer const*> parts;
      file_size_t total{0};

      parts.reserve(fe.chunks.size());

      for (auto const& digest : fe.chunks) {
        auto it = chunks.find(digest);
        if (it == chunks.end()) {
          SQUISH_THROW(archive_error, archive_errc::missing_chunk,
                       fmt::format("{}: chunk {} not found in archive",
                                   fe.path, digest.hex()));
        }
        parts.push_back(&it->second);
        total += it->second.size();
      }

      if (total != fe.size) {
        SQUISH_THROW(archive_error, archive_errc::corrupt_data,
                     fmt::format("{}: chunks add up to {} bytes, expected {}",
                                 fe.path, total, fe.size));
      }

      if (auto parent = out.parent_path(); !parent.empty()) {
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec) {
          SQUISH_THROW(system_error,
                       fmt::format("cannot create directory {}",
                                   parent.string()),
                       ec);
        }
      }

      std::ofstream ofs(out, std::ios::binary | std::ios::trunc);

      if (!ofs) {
        SQUISH_THROW(system_error,
                     fmt::format("cannot create {}", out.string()));
      }

      for (auto const* p : parts) {
        ofs.write(reinterpret_cast<char const*>(p->data()), p->size());
      }

      ofs.close();

      if (!ofs) {
        SQUISH_THROW(archive_error, archive_errc::io_error,
                     fmt::format("error writing {}", out.string()));
      }

      LOG_TRACE << "extracted " << fe.path << " (" << fe.size << " bytes)";

      if (prog) {
        prog->inc(1);
      }
    }));
  }

  std::exception_ptr first_error;
  size_t failed{0};

  for (auto& f : futures) {
    try {
      f.get();
    } catch (std::exception const& e) {
      LOG_ERROR << exception_str(e);
      ++failed;
      if (!first_error) {
        first_error = std::current_exception();
      }
    }
  }

  if (first_error) {
    LOG_ERROR << "failed to extract " << failed << " of " << files.size()
              << " file(s)";
    std::rethrow_exception(first_error);
  }

  if (prog) {
    prog->finish();
  }

  ti << "unpacked " << files.size() << " file(s) to " << output_root.string();
}

} // namespace

double reduction_percentage(file_size_t archive_size,
                            file_size_t total_original_size) {
  if (total_original_size == 0) {
    return 0.0;
  }

  return (1.0 - static_cast<double>(archive_size) /
                    static_cast<double>(total_original_size)) *
         100.0;
}

fs::path output_path_for(fs::path const& output_root,
                         std::string const& archive_path) {
  if (!is_valid_utf8(archive_path)) {
    SQUISH_THROW(archive_error, archive_errc::illegal_utf8,
                 "file table contains a path that is not valid UTF-8");
  }

  fs::path const rel{std::u8string(archive_path.begin(), archive_path.end())};

  bool escapes = rel.empty() || rel.has_root_path();

  for (auto const& component : rel) {
    if (component == "..") {
      escapes = true;
    }
  }

  if (escapes) {
    SQUISH_THROW(archive_error, archive_errc::path_escapes_root,
                 fmt::format("refusing to extract {} outside of {}",
                             archive_path, output_root.string()));
  }

  return output_root / rel;
}

archive_reader::archive_reader(logger& lgr, std::istream& is,
                               archive_reader_options const& options)
    : impl_{make_unique_logging_object<impl, archive_reader_, logger_policies>(
          lgr, is, options)} {}

namespace {

std::ifstream open_archive(fs::path const& archive) {
  std::ifstream ifs(archive, std::ios::binary);

  if (!ifs) {
    SQUISH_THROW(system_error, fmt::format("cannot open {}", archive.string()));
  }

  return ifs;
}

} // namespace

archive_summary list(logger& lgr, fs::path const& archive) {
  auto ifs = open_archive(archive);
  archive_reader ar(lgr, ifs);
  return ar.summary();
}

void unpack(logger& lgr, fs::path const& archive, fs::path const& output_root,
            archive_reader_options const& options, progress_sink* prog) {
  auto ifs = open_archive(archive);
  archive_reader ar(lgr, ifs, options);
  ar.unpack(output_root, prog);
}

} // namespace squish::reader
