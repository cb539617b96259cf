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

#include <condition_variable>
#include <deque>
#include <exception>
#include <mutex>
#include <ostream>
#include <thread>

#include <fmt/format.h>

#include <folly/system/ThreadName.h>

#include <squish/archive_format.h>
#include <squish/error.h>
#include <squish/logger.h>
#include <squish/util.h>

#include <squish/writer/internal/chunk_writer.h>

namespace squish::writer::internal {

namespace {

template <typename LoggerPolicy>
class chunk_writer_ final : public chunk_writer::impl {
 public:
  chunk_writer_(logger& lgr, std::ostream& os);
  ~chunk_writer_() noexcept override;

  void enqueue(chunk_record&& rec) override;
  void finish() override;

  size_t records_written() const override {
    std::lock_guard lock(mx_);
    return records_written_;
  }

  uint64_t bytes_written() const override {
    std::lock_guard lock(mx_);
    return bytes_written_;
  }

 private:
  void writer_thread();
  void write(chunk_record const& rec);

  LOG_PROXY_DECL(LoggerPolicy);
  std::ostream& os_;
  std::deque<chunk_record> queue_;
  std::mutex mutable mx_;
  std::condition_variable cond_;
  bool closed_{false};
  bool finished_{false};
  std::exception_ptr error_;
  size_t records_written_{0};
  uint64_t bytes_written_{0};
  std::thread writer_thread_;
};

template <typename LoggerPolicy>
chunk_writer_<LoggerPolicy>::chunk_writer_(logger& lgr, std::ostream& os)
    : LOG_PROXY_INIT(lgr)
    , os_(os) {
  writer_thread_ = std::thread(&chunk_writer_::writer_thread, this);
}

template <typename LoggerPolicy>
chunk_writer_<LoggerPolicy>::~chunk_writer_() noexcept {
  if (!finished_) {
    // finish() was never called, so no one is interested in errors
    try {
      {
        std::lock_guard lock(mx_);
        closed_ = true;
      }
      cond_.notify_one();
      writer_thread_.join();
    } catch (...) {
      SQUISH_PANIC(
          fmt::format("exception thrown in chunk_writer destructor: {}",
                      exception_str(std::current_exception())));
    }
  }
}

template <typename LoggerPolicy>
void chunk_writer_<LoggerPolicy>::writer_thread() {
  folly::setThreadName("writer");

  for (;;) {
    chunk_record rec;

    {
      std::unique_lock lock(mx_);

      cond_.wait(lock, [this] { return closed_ || !queue_.empty(); });

      if (queue_.empty()) {
        break;
      }

      rec = std::move(queue_.front());
      queue_.pop_front();

      if (error_) {
        // drain, but don't write anything after the first failure
        continue;
      }
    }

    try {
      write(rec);
    } catch (...) {
      LOG_ERROR << "chunk writer failed: "
                << exception_str(std::current_exception());
      std::lock_guard lock(mx_);
      error_ = std::current_exception();
    }
  }

  LOG_DEBUG << "writer thread done";
}

template <typename LoggerPolicy>
void chunk_writer_<LoggerPolicy>::write(chunk_record const& rec) {
  write_bytes(os_, std::span{rec.digest.data(), rec.digest.size()});
  write_u64(os_, rec.original_size);
  write_u64(os_, rec.compressed.size());
  write_bytes(os_, rec.compressed);

  LOG_TRACE << "wrote chunk " << rec.digest.hex() << " ("
            << rec.original_size << " -> " << rec.compressed.size()
            << " bytes)";

  std::lock_guard lock(mx_);
  ++records_written_;
  bytes_written_ += chunk_digest::kSize + 2 * sizeof(uint64_t) +
                    rec.compressed.size();
}

template <typename LoggerPolicy>
void chunk_writer_<LoggerPolicy>::enqueue(chunk_record&& rec) {
  {
    std::lock_guard lock(mx_);

    if (closed_) {
      SQUISH_THROW(archive_error, archive_errc::pipeline_error,
                   "chunk writer has already been closed");
    }

    if (error_) {
      SQUISH_THROW(archive_error, archive_errc::pipeline_error,
                   "chunk writer thread has failed");
    }

    queue_.emplace_back(std::move(rec));
  }

  cond_.notify_one();
}

template <typename LoggerPolicy>
void chunk_writer_<LoggerPolicy>::finish() {
  {
    std::lock_guard lock(mx_);

    if (finished_) {
      return;
    }

    closed_ = true;
    finished_ = true;
  }

  cond_.notify_one();

  writer_thread_.join();

  if (error_) {
    std::rethrow_exception(error_);
  }

  os_.flush();

  if (!os_) {
    SQUISH_THROW(archive_error, archive_errc::io_error,
                 "failed to flush chunk table");
  }
}

} // namespace

chunk_writer::chunk_writer(logger& lgr, std::ostream& os)
    : impl_{make_unique_logging_object<impl, chunk_writer_, logger_policies>(
          lgr, os)} {}

} // namespace squish::writer::internal
