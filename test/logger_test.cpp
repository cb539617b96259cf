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

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <squish/logger.h>

#include "test_helpers.h"
#include "test_logger.h"

using namespace squish;
using ::testing::HasSubstr;
using ::testing::Not;

namespace {

template <typename LoggerPolicy>
void log_all_levels(logger& lgr) {
  LOG_PROXY(LoggerPolicy, lgr);
  LOG_ERROR << "error message";
  LOG_WARN << "warn message";
  LOG_INFO << "info message";
  LOG_VERBOSE << "verbose message";
  LOG_DEBUG << "debug message";
  LOG_TRACE << "trace message";
}

} // namespace

TEST(logger, parse_level) {
  EXPECT_EQ(logger::ERROR, logger::parse_level("error"));
  EXPECT_EQ(logger::TRACE, logger::parse_level("trace"));
  EXPECT_EQ("verbose", logger::level_name(logger::VERBOSE));
  EXPECT_ANY_THROW(logger::parse_level("chatty"));
}

TEST(logger, stream_logger_threshold) {
  std::ostringstream os;
  auto term = std::make_shared<test::test_terminal>();
  stream_logger lgr(term, os, {.threshold = logger::INFO});

  log_all_levels<debug_logger_policy>(lgr);

  auto const out = os.str();

  EXPECT_THAT(out, HasSubstr("E "));
  EXPECT_THAT(out, HasSubstr("error message"));
  EXPECT_THAT(out, HasSubstr("warn message"));
  EXPECT_THAT(out, HasSubstr("info message"));
  EXPECT_THAT(out, Not(HasSubstr("verbose message")));
  EXPECT_THAT(out, Not(HasSubstr("debug message")));
}

TEST(logger, multiline_messages_are_split) {
  std::ostringstream os;
  auto term = std::make_shared<test::test_terminal>();
  stream_logger lgr(term, os, {.threshold = logger::INFO});
  LOG_PROXY(prod_logger_policy, lgr);

  LOG_WARN << "first\nsecond";

  auto const out = os.str();

  EXPECT_THAT(out, ::testing::StartsWith("W "));
  EXPECT_THAT(out, HasSubstr(" first\nW ."));
  EXPECT_THAT(out, HasSubstr(". second\n"));
}

TEST(logger, prod_policy_drops_debug) {
  test::test_logger lgr(logger::TRACE);

  log_all_levels<prod_logger_policy>(lgr);

  EXPECT_EQ(1, lgr.count(logger::VERBOSE));
  EXPECT_EQ(0, lgr.count(logger::DEBUG));
  EXPECT_EQ(0, lgr.count(logger::TRACE));
}

TEST(logger, debug_policy_keeps_trace) {
  test::test_logger lgr(logger::TRACE);

  log_all_levels<debug_logger_policy>(lgr);

  EXPECT_EQ(1, lgr.count(logger::TRACE));
  EXPECT_TRUE(lgr.contains(logger::DEBUG, "debug message"));
}

TEST(logger, timed_entry_reports_elapsed_time) {
  test::test_logger lgr(logger::INFO);
  LOG_PROXY(prod_logger_policy, lgr);

  {
    auto ti = LOG_TIMED_INFO;
    ti << "did something";
  }

  ASSERT_EQ(1, lgr.count(logger::INFO));
  EXPECT_THAT(lgr.get_log().front().output,
              ::testing::StartsWith("did something ["));
}
