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
#include <functional>
#include <future>
#include <limits>
#include <memory>
#include <utility>

namespace squish {

class logger;

namespace internal {

class worker_group;

} // namespace internal

/**
 * A thread pool
 *
 * This class is mostly a wrapper around internal::worker_group as we
 * currently don't want to expose that API directly.
 */
class thread_pool {
 public:
  using job_type = std::function<void()>;

  thread_pool();
  thread_pool(logger& lgr, char const* group_name, size_t num_workers = 1,
              size_t max_queue_len = std::numeric_limits<size_t>::max());

  ~thread_pool();

  thread_pool(thread_pool&&) noexcept;
  thread_pool& operator=(thread_pool&&) noexcept;

  explicit operator bool() const { return static_cast<bool>(wg_); }

  bool add_job(job_type job);

  /**
   * Run `fn` on the pool and return a future for its result
   *
   * Any exception thrown by `fn` is rethrown from `future::get()`.
   */
  template <typename F>
  auto submit(F&& fn) -> std::future<decltype(fn())> {
    auto task = std::make_shared<std::packaged_task<decltype(fn())()>>(
        std::forward<F>(fn));
    auto future = task->get_future();
    add_job([task = std::move(task)] { (*task)(); });
    return future;
  }

  void stop();
  void wait();
  bool running() const;
  size_t size() const;

 private:
  std::unique_ptr<internal::worker_group> wg_;
};

} // namespace squish
