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

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <exception>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

#include <fmt/format.h>

#include <folly/system/ThreadName.h>

#include <squish/error.h>
#include <squish/logger.h>
#include <squish/util.h>

#include <squish/internal/worker_group.h>

namespace squish::internal {

namespace {

template <typename LoggerPolicy>
class worker_group_ final : public worker_group::impl {
 public:
  worker_group_(logger& lgr, char const* group_name, size_t num_workers,
                size_t max_queue_len)
      : LOG_PROXY_INIT(lgr)
      , running_(true)
      , pending_(0)
      , max_queue_len_(max_queue_len) {
    if (num_workers < 1) {
      num_workers = std::max(hardware_concurrency(), 1U);
    }

    if (!group_name) {
      group_name = "worker";
    }

    LOG_DEBUG << "starting " << num_workers << " " << group_name
              << " thread(s)";

    for (size_t i = 0; i < num_workers; ++i) {
      workers_.emplace_back([this, group_name, i] {
        folly::setThreadName(fmt::format("{}{}", group_name, i + 1));
        do_work();
      });
    }
  }

  worker_group_(worker_group_ const&) = delete;
  worker_group_& operator=(worker_group_ const&) = delete;

  /**
   * Stop and destroy a worker group
   */
  ~worker_group_() noexcept override {
    try {
      stop();
    } catch (...) {
      SQUISH_PANIC(
          fmt::format("exception thrown in worker group destructor: {}",
                      exception_str(std::current_exception())));
    }
  }

  /**
   * Stop a worker group
   *
   * Jobs that are already queued will still be run.
   */
  void stop() override {
    if (running_) {
      {
        std::lock_guard lock(mx_);
        running_ = false;
      }

      cond_.notify_all();

      for (auto& w : workers_) {
        w.join();
      }
    }
  }

  /**
   * Wait until all work has been done
   */
  void wait() override {
    if (running_) {
      std::unique_lock lock(mx_);
      wait_.wait(lock, [&] { return pending_ == 0; });
    }
  }

  bool running() const override { return running_; }

  /**
   * Add a new job to the worker group
   *
   * The new job will be dispatched to the first available worker thread.
   *
   * \param job             The job to add to the dispatcher.
   */
  bool add_job(worker_group::job_t&& job) override {
    if (running_) {
      {
        std::unique_lock lock(mx_);
        queue_.wait(lock, [this] { return jobs_.size() < max_queue_len_; });
        jobs_.emplace(std::move(job));
        ++pending_;
      }

      cond_.notify_one();

      return true;
    }

    return false;
  }

  size_t size() const override { return workers_.size(); }

  size_t queue_size() const override {
    std::lock_guard lock(mx_);
    return jobs_.size();
  }

 private:
  void do_work() {
    for (;;) {
      worker_group::job_t job;

      {
        std::unique_lock lock(mx_);

        cond_.wait(lock, [this] { return !jobs_.empty() || !running_; });

        if (jobs_.empty()) {
          break;
        }

        job = std::move(jobs_.front());
        jobs_.pop();
      }

      try {
        job();
      } catch (...) {
        LOG_FATAL << "exception thrown in worker thread: "
                  << exception_str(std::current_exception());
      }

      {
        std::lock_guard lock(mx_);
        --pending_;
      }

      wait_.notify_all();
      queue_.notify_one();
    }
  }

  LOG_PROXY_DECL(LoggerPolicy);
  std::vector<std::thread> workers_;
  std::queue<worker_group::job_t> jobs_;
  std::condition_variable cond_;
  std::condition_variable queue_;
  std::condition_variable wait_;
  mutable std::mutex mx_;
  std::atomic<bool> running_;
  size_t pending_;
  size_t const max_queue_len_;
};

} // namespace

worker_group::worker_group(logger& lgr, char const* group_name,
                           size_t num_workers, size_t max_queue_len)
    : impl_{make_unique_logging_object<impl, worker_group_, logger_policies>(
          lgr, group_name, num_workers, max_queue_len)} {}

} // namespace squish::internal
