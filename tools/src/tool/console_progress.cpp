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
#include <ostream>
#include <utility>

#include <fmt/format.h>

#include <squish/terminal.h>
#include <squish/tool/console_progress.h>
#include <squish/tool/iolayer.h>

namespace squish::tool {

std::string render_progress_bar(size_t width, double frac) {
  frac = std::clamp(frac, 0.0, 1.0);

  auto const full = static_cast<size_t>(width * frac);
  std::string rv;

  rv.reserve(width);

  for (size_t i = 0; i < width; ++i) {
    if (i < full) {
      rv += '=';
    } else if (i == full) {
      rv += '>';
    } else {
      rv += ' ';
    }
  }

  return rv;
}

console_progress::console_progress(iolayer const& iol, std::string label)
    : iol_{iol}
    , label_{std::move(label)}
    , enabled_{iol.term->is_tty(iol.err) && iol.term->is_fancy()} {}

console_progress::~console_progress() {
  if (visible_ && !finished_) {
    iol_.err << iol_.term->carriage_return() << iol_.term->clear_line();
  }
}

void console_progress::set_length(uint64_t length) {
  std::lock_guard lock(mx_);
  length_ = length;
  draw();
}

void console_progress::inc(uint64_t delta) {
  std::lock_guard lock(mx_);
  done_ += delta;
  draw();
}

void console_progress::finish() {
  std::lock_guard lock(mx_);

  if (visible_) {
    iol_.err << iol_.term->carriage_return() << iol_.term->clear_line();
    iol_.err.flush();
    visible_ = false;
  }

  finished_ = true;
}

uint64_t console_progress::done() const {
  std::lock_guard lock(mx_);
  return done_;
}

void console_progress::draw() {
  if (!enabled_ || finished_ || length_ == 0) {
    return;
  }

  auto const frac = static_cast<double>(done_) / length_;
  auto const counter = fmt::format("{}/{}", done_, length_);
  auto const term_width = iol_.term->width();
  auto const fixed = label_.size() + counter.size() + 4;
  auto const bar_width =
      term_width > fixed + 10 ? std::min<size_t>(term_width - fixed, 40) : 10;

  // throttle redraws for long runs of tiny increments
  auto const width = static_cast<size_t>(bar_width * frac);
  if (visible_ && width == last_width_ && done_ != length_ &&
      done_ % 64 != 0) {
    return;
  }

  last_width_ = width;

  iol_.err << iol_.term->carriage_return() << label_ << " ["
           << iol_.term->colored(render_progress_bar(bar_width, frac),
                                 termcolor::CYAN)
           << "] " << counter;
  iol_.err.flush();

  visible_ = true;
}

} // namespace squish::tool
