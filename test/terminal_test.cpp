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

#include <sstream>

#include <gtest/gtest.h>

#include <squish/terminal_ansi.h>

#include "test_helpers.h"

using namespace squish;

TEST(terminal, ansi_color) {
  EXPECT_EQ("\033[0m", terminal_ansi::color_impl(termcolor::NORMAL));
  EXPECT_EQ("\033[31m", terminal_ansi::color_impl(termcolor::RED));
  EXPECT_EQ("\033[32m", terminal_ansi::color_impl(termcolor::GREEN));
  EXPECT_EQ("\033[90m", terminal_ansi::color_impl(termcolor::GRAY));
  EXPECT_EQ("\033[1;31m", terminal_ansi::color_impl(termcolor::BOLD_RED));
  EXPECT_EQ("\033[2;35m", terminal_ansi::color_impl(termcolor::DIM_MAGENTA));

  terminal_ansi term;
  terminal const& t = term;

  EXPECT_EQ("\033[0m", t.color(termcolor::NORMAL));
  EXPECT_EQ("\033[36m", t.color(termcolor::CYAN));
}

TEST(terminal, ansi_colored) {
  terminal_ansi term;
  terminal const& t = term;

  EXPECT_EQ("\033[31mfoo\033[0m", t.colored("foo", termcolor::RED));
  EXPECT_EQ("\033[1;32mfoo\033[0m",
            t.colored("foo", termcolor::BOLD_GREEN, true));
  EXPECT_EQ("foo", t.colored("foo", termcolor::RED, false));
}

TEST(terminal, ansi_string_streams_are_not_ttys) {
  terminal_ansi term;
  std::ostringstream os;

  EXPECT_FALSE(term.is_tty(os));
  EXPECT_GT(term.width(), 0);
}

TEST(terminal, test_terminal_markers) {
  test::test_terminal term;

  EXPECT_EQ("<red>foo<normal>", term.colored("foo", termcolor::RED, true));
  EXPECT_EQ("foo", term.colored("foo", termcolor::RED, false));
  EXPECT_EQ("<cr>", term.carriage_return());
}
