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
#include <mutex>
#include <string>

#include <squish/progress_sink.h>

namespace squish::tool {

struct iolayer;

/**
 * One-line progress bar on the error stream
 *
 * Renders `<label> [=====>    ] done/total` and clears the line again on
 * `finish()`. Does nothing unless the error stream is a fancy terminal.
 */
class console_progress final : public progress_sink {
 public:
  console_progress(iolayer const& iol, std::string label);
  ~console_progress() override;

  void set_length(uint64_t length) override;
  void inc(uint64_t delta) override;
  void finish() override;

  uint64_t done() const;

 private:
  // requires mx_ to be held
  void draw();

  iolayer const& iol_;
  std::string const label_;
  bool const enabled_;
  mutable std::mutex mx_;
  uint64_t length_{0};
  uint64_t done_{0};
  size_t last_width_{0};
  bool visible_{false};
  bool finished_{false};
};

std::string render_progress_bar(size_t width, double frac);

} // namespace squish::tool
